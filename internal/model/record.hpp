#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/model/value.hpp"
#include "internal/util/errors.hpp"

namespace pmm::model {

/*
  Typed record model.

  Every metadata entity is a plain struct plus a static schema table that
  lists its attributes in three ordered groups:

    required   - must be supplied, no default
    defaulted  - filled from the declared default when not supplied
    optional   - std::optional member, absent unless supplied

  Construct<T>() builds an entity from positional and named Values (the
  decoded wire form), Serialize() turns it back into an ordered map. Both
  walk the same table, so wire order always equals declaration order.
*/

enum class AttributeGroup : std::uint8_t {
  kRequired  = 0,
  kDefaulted = 1,
  kOptional  = 2,
};

std::string_view ToString(AttributeGroup group);

struct Arguments {
  ValueList positional;
  ValueMap  named;

  static Arguments Positional(ValueList values) {
    return {std::move(values), {}};
  }

  static Arguments Named(ValueMap values) {
    return {{}, std::move(values)};
  }
};

template <typename Record>
struct AttributeBinding {
  std::string          name;
  AttributeGroup       group = AttributeGroup::kRequired;
  std::optional<Value> default_value;

  // Coerces the value to the member's declared type and stores it.
  std::function<void(Record&, const Value&)> assign;
  std::function<bool(const Record&)>         present;
  std::function<Value(const Record&)>        serialize;
};

template <typename Record>
class RecordSchema {
 public:
  using Invariant = std::function<void(const Record&)>;

  RecordSchema(std::string entity, std::vector<AttributeBinding<Record>> attributes, Invariant invariant = {})
      : entity_(std::move(entity)), attributes_(std::move(attributes)), invariant_(std::move(invariant)) {
    for (std::size_t i = 0; i < attributes_.size(); ++i) {
      const auto& attribute = attributes_[i];
      if (i > 0 && attribute.group < attributes_[i - 1].group) {
        throw std::logic_error(entity_ + ": attribute " + attribute.name + " declared out of group order");
      }
      if (!index_.emplace(attribute.name, i).second) {
        throw std::logic_error(entity_ + ": attribute " + attribute.name + " declared twice");
      }
      if (attribute.group != AttributeGroup::kOptional) {
        ++positional_capacity_;
      }
    }
  }

  const std::string& entity() const {
    return entity_;
  }

  const std::vector<AttributeBinding<Record>>& attributes() const {
    return attributes_;
  }

  // Number of attributes that may be given positionally (required + defaulted).
  std::size_t positional_capacity() const {
    return positional_capacity_;
  }

  std::optional<std::size_t> IndexOf(std::string_view name) const {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) return std::nullopt;
    return it->second;
  }

  void CheckInvariant(const Record& record) const {
    if (invariant_) invariant_(record);
  }

 private:
  std::string                                  entity_;
  std::vector<AttributeBinding<Record>>        attributes_;
  Invariant                                    invariant_;
  std::unordered_map<std::string, std::size_t> index_;
  std::size_t                                  positional_capacity_ = 0;
};

// ------------------------------------------------------------
// Scalar coercion
// ------------------------------------------------------------

bool         CoerceBool(const Value& value);
std::int64_t CoerceInt(const Value& value);
double       CoerceReal(const Value& value);
std::string  CoerceString(const Value& value);
ValueMap     CoerceMap(const Value& value);
ValueList    CoerceList(const Value& value);

template <typename T>
struct IsVector : std::false_type {};

template <typename T>
struct IsVector<std::vector<T>> : std::true_type {};

template <typename T>
constexpr bool kIsRecord = requires { T::Schema(); };

template <typename Record>
Record Construct(const Arguments& args);

template <typename Record>
Value Serialize(const Record& record);

template <typename T>
T Coerce(const Value& value) {
  if constexpr (std::is_same_v<T, Value>) {
    return value;
  } else if constexpr (std::is_same_v<T, bool>) {
    return CoerceBool(value);
  } else if constexpr (std::is_same_v<T, std::int64_t>) {
    return CoerceInt(value);
  } else if constexpr (std::is_same_v<T, double>) {
    return CoerceReal(value);
  } else if constexpr (std::is_same_v<T, std::string>) {
    return CoerceString(value);
  } else if constexpr (std::is_same_v<T, ValueMap>) {
    return CoerceMap(value);
  } else if constexpr (std::is_same_v<T, ValueList>) {
    return CoerceList(value);
  } else if constexpr (IsVector<T>::value) {
    T out;
    for (const auto& element : CoerceList(value)) {
      out.push_back(Coerce<typename T::value_type>(element));
    }
    return out;
  } else if constexpr (kIsRecord<T>) {
    if (!value.IsMap()) {
      throw util::TypeMismatch("cannot build " + T::Schema().entity() + " from " + std::string(ToString(value.kind())) + " value");
    }
    return Construct<T>(Arguments::Named(value.AsMap()));
  } else {
    static_assert(kIsRecord<T>, "unsupported attribute type");
  }
}

template <typename T>
Value ToValue(const T& member) {
  if constexpr (kIsRecord<T>) {
    return Serialize(member);
  } else if constexpr (IsVector<T>::value && !std::is_same_v<T, ValueList>) {
    ValueList out;
    out.reserve(member.size());
    for (const auto& element : member) {
      out.push_back(ToValue(element));
    }
    return Value(std::move(out));
  } else {
    return Value(member);
  }
}

// ------------------------------------------------------------
// Bindings
// ------------------------------------------------------------

template <typename Record, typename T>
AttributeBinding<Record> Required(std::string name, T Record::*member) {
  AttributeBinding<Record> binding;
  binding.name      = std::move(name);
  binding.group     = AttributeGroup::kRequired;
  binding.assign    = [member](Record& record, const Value& value) { record.*member = Coerce<T>(value); };
  binding.present   = [](const Record&) { return true; };
  binding.serialize = [member](const Record& record) { return ToValue(record.*member); };
  return binding;
}

template <typename Record, typename T>
AttributeBinding<Record> Defaulted(std::string name, T Record::*member, Value default_value) {
  auto binding          = Required(std::move(name), member);
  binding.group         = AttributeGroup::kDefaulted;
  binding.default_value = std::move(default_value);
  return binding;
}

// Defaulted attribute whose default is none: absent unless supplied.
template <typename Record, typename T>
AttributeBinding<Record> Defaulted(std::string name, std::optional<T> Record::*member, Value default_value) {
  AttributeBinding<Record> binding;
  binding.name          = std::move(name);
  binding.group         = AttributeGroup::kDefaulted;
  binding.default_value = std::move(default_value);
  binding.assign        = [member](Record& record, const Value& value) { record.*member = Coerce<T>(value); };
  binding.present       = [member](const Record& record) { return (record.*member).has_value(); };
  binding.serialize     = [member](const Record& record) { return ToValue(*(record.*member)); };
  return binding;
}

template <typename Record, typename T>
AttributeBinding<Record> Optional(std::string name, std::optional<T> Record::*member) {
  auto binding          = Defaulted(std::move(name), member, Value());
  binding.group         = AttributeGroup::kOptional;
  binding.default_value = std::nullopt;
  return binding;
}

// ------------------------------------------------------------
// Generic builder / serializer
// ------------------------------------------------------------

template <typename Record>
Record Construct(const Arguments& args) {
  const auto& schema     = Record::Schema();
  const auto& attributes = schema.attributes();

  if (args.positional.size() > schema.positional_capacity()) {
    throw util::TooManyArguments("Constructor for " + schema.entity() + " takes at most " + std::to_string(schema.positional_capacity()) +
                                 " positional arguments, " + std::to_string(args.positional.size()) + " given");
  }

  Record            record{};
  std::vector<bool> assigned(attributes.size(), false);

  auto apply = [&](std::size_t index, const Value& value) {
    if (value.IsNone()) return;
    const auto& attribute = attributes[index];
    try {
      attribute.assign(record, value);
    } catch (const util::TypeMismatch& e) {
      throw util::TypeMismatch(schema.entity() + "." + attribute.name + ": " + e.what());
    }
    assigned[index] = true;
  };

  for (std::size_t i = 0; i < args.positional.size(); ++i) {
    apply(i, args.positional[i]);
  }

  // Named arguments are applied last so they win over positional ones.
  for (const auto& [key, value] : args.named) {
    auto index = schema.IndexOf(key);
    if (!index) {
      throw util::UnknownAttribute("Unknown attribute " + key + " for " + schema.entity());
    }
    apply(*index, value);
  }

  for (std::size_t i = 0; i < attributes.size(); ++i) {
    const auto& attribute = attributes[i];
    if (!assigned[i] && attribute.group == AttributeGroup::kDefaulted && attribute.default_value) {
      apply(i, *attribute.default_value);
    }
  }

  for (std::size_t i = 0; i < attributes.size(); ++i) {
    if (!assigned[i] && attributes[i].group == AttributeGroup::kRequired) {
      throw util::MissingRequiredAttribute("Constructor for " + schema.entity() + " missing required argument " + attributes[i].name);
    }
  }

  schema.CheckInvariant(record);
  return record;
}

template <typename Record>
Value Serialize(const Record& record) {
  ValueMap out;
  for (const auto& attribute : Record::Schema().attributes()) {
    if (attribute.present(record)) {
      out.Set(attribute.name, attribute.serialize(record));
    }
  }
  return Value(std::move(out));
}

template <typename Record>
Record Deserialize(const Value& value) {
  return Coerce<Record>(value);
}

} // namespace pmm::model
