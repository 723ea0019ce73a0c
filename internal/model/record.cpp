#include "record.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace pmm::model {

namespace {

[[noreturn]] void ThrowConversion(const Value& value, std::string_view target) {
  throw util::TypeMismatch("cannot convert " + std::string(ToString(value.kind())) + " " + Describe(value) + " to " + std::string(target));
}

std::string_view Trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace

std::string_view ToString(AttributeGroup group) {
  switch (group) {
    case AttributeGroup::kRequired:
      return "required";
    case AttributeGroup::kDefaulted:
      return "defaulted";
    case AttributeGroup::kOptional:
      return "optional";
    default:
      return "unknown";
  }
}

bool CoerceBool(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::kBool:
      return value.AsBool();
    case Value::Kind::kInt:
      return value.AsInt() != 0;
    case Value::Kind::kReal:
      return value.AsReal() != 0.0;
    default:
      ThrowConversion(value, "bool");
  }
}

std::int64_t CoerceInt(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::kInt:
      return value.AsInt();
    case Value::Kind::kBool:
      return value.AsBool() ? 1 : 0;
    case Value::Kind::kReal: {
      const double real = value.AsReal();
      // Truncation toward zero; non-finite and out-of-range values have no integer form.
      if (!std::isfinite(real) || real >= 9223372036854775808.0 || real < -9223372036854775808.0) {
        ThrowConversion(value, "int");
      }
      return static_cast<std::int64_t>(real);
    }
    case Value::Kind::kString: {
      const auto   text   = Trim(value.AsString());
      std::int64_t parsed = 0;
      const char*  begin  = text.data();
      if (!text.empty() && text.front() == '+') ++begin;
      const char* end    = text.data() + text.size();
      auto        result = std::from_chars(begin, end, parsed);
      if (text.empty() || result.ec != std::errc() || result.ptr != end) {
        ThrowConversion(value, "int");
      }
      return parsed;
    }
    default:
      ThrowConversion(value, "int");
  }
}

double CoerceReal(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::kReal:
      return value.AsReal();
    case Value::Kind::kInt:
      return static_cast<double>(value.AsInt());
    case Value::Kind::kBool:
      return value.AsBool() ? 1.0 : 0.0;
    case Value::Kind::kString: {
      const std::string text(Trim(value.AsString()));
      char*             end    = nullptr;
      const double      parsed = std::strtod(text.c_str(), &end);
      if (text.empty() || end == nullptr || *end != '\0') {
        ThrowConversion(value, "real");
      }
      return parsed;
    }
    default:
      ThrowConversion(value, "real");
  }
}

std::string CoerceString(const Value& value) {
  switch (value.kind()) {
    case Value::Kind::kString:
      return value.AsString();
    case Value::Kind::kBool:
      return value.AsBool() ? "true" : "false";
    case Value::Kind::kInt:
      return std::to_string(value.AsInt());
    case Value::Kind::kReal: {
      char buffer[32];
      auto result = std::to_chars(buffer, buffer + sizeof(buffer), value.AsReal());
      std::string text(buffer, result.ptr);
      // Integral reals keep a fractional part so they read back as reals ("1.0").
      if (text.find_first_of(".ein") == std::string::npos) text += ".0";
      return text;
    }
    case Value::Kind::kTimestamp:
      return util::FormatTimePoint(value.AsTimestamp(), "%Y-%m-%d %H:%M:%S");
    default:
      ThrowConversion(value, "string");
  }
}

ValueMap CoerceMap(const Value& value) {
  if (!value.IsMap()) ThrowConversion(value, "map");
  return value.AsMap();
}

ValueList CoerceList(const Value& value) {
  if (!value.IsList()) ThrowConversion(value, "list");
  return value.AsList();
}

} // namespace pmm::model
