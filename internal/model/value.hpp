#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "internal/util/time.hpp"

namespace pmm::model {

class Value;

/*
  Ordered string-keyed map of Values.

  Used for tag maps and for nested maps inside tag values. Keys are unique;
  Set() on an existing key replaces the value in place and keeps its position.
*/
class ValueMap {
 public:
  using Entry          = std::pair<std::string, Value>;
  using const_iterator = std::vector<Entry>::const_iterator;
  using iterator       = std::vector<Entry>::iterator;

  ValueMap() = default;
  ValueMap(std::initializer_list<Entry> entries);

  void         Set(std::string key, Value value);
  const Value* Find(std::string_view key) const;
  Value*       Find(std::string_view key);
  bool         Contains(std::string_view key) const;
  bool         Erase(std::string_view key);

  // Reorders entries by key (byte order, i.e. code point order for UTF-8).
  void SortByKey();

  std::size_t size() const;
  bool        empty() const;

  const_iterator begin() const;
  const_iterator end() const;
  iterator       begin();
  iterator       end();

  friend bool operator==(const ValueMap& a, const ValueMap& b);

 private:
  std::vector<Entry> entries_;
};

using Tags      = ValueMap;
using ValueList = std::vector<Value>;

/*
  Closed tagged variant for "any"-typed attributes and tag values.
*/
class Value {
 public:
  enum class Kind : std::uint8_t {
    kNone = 0,
    kBool,
    kInt,
    kReal,
    kString,
    kTimestamp,
    kList,
    kMap,
  };

  Value() = default;
  Value(std::nullptr_t) {
  }
  Value(bool v) : data_(v) {
  }
  Value(int v) : data_(static_cast<std::int64_t>(v)) {
  }
  Value(std::int64_t v) : data_(v) {
  }
  Value(double v) : data_(v) {
  }
  Value(const char* v) : data_(std::string(v)) {
  }
  Value(std::string v) : data_(std::move(v)) {
  }
  Value(util::TimePoint v) : data_(v) {
  }
  Value(ValueList v) : data_(std::move(v)) {
  }
  Value(ValueMap v) : data_(std::move(v)) {
  }

  Kind kind() const {
    return static_cast<Kind>(data_.index());
  }

  bool IsNone() const {
    return kind() == Kind::kNone;
  }
  bool IsBool() const {
    return kind() == Kind::kBool;
  }
  bool IsInt() const {
    return kind() == Kind::kInt;
  }
  bool IsReal() const {
    return kind() == Kind::kReal;
  }
  bool IsString() const {
    return kind() == Kind::kString;
  }
  bool IsTimestamp() const {
    return kind() == Kind::kTimestamp;
  }
  bool IsList() const {
    return kind() == Kind::kList;
  }
  bool IsMap() const {
    return kind() == Kind::kMap;
  }

  // Accessors throw util::TypeMismatch when the active kind differs.
  bool                   AsBool() const;
  std::int64_t           AsInt() const;
  double                 AsReal() const;
  const std::string&     AsString() const;
  const util::TimePoint& AsTimestamp() const;
  const ValueList&       AsList() const;
  ValueList&             AsList();
  const ValueMap&        AsMap() const;
  ValueMap&              AsMap();

  friend bool operator==(const Value& a, const Value& b) {
    return a.data_ == b.data_;
  }
  friend bool operator!=(const Value& a, const Value& b) {
    return !(a == b);
  }

 private:
  std::variant<std::monostate, bool, std::int64_t, double, std::string, util::TimePoint, ValueList, ValueMap> data_;
};

inline std::size_t ValueMap::size() const {
  return entries_.size();
}
inline bool ValueMap::empty() const {
  return entries_.empty();
}
inline ValueMap::const_iterator ValueMap::begin() const {
  return entries_.begin();
}
inline ValueMap::const_iterator ValueMap::end() const {
  return entries_.end();
}
inline ValueMap::iterator ValueMap::begin() {
  return entries_.begin();
}
inline ValueMap::iterator ValueMap::end() {
  return entries_.end();
}

std::string_view ToString(Value::Kind kind);

// Short human-readable rendering for log lines and error messages.
std::string Describe(const Value& value);

} // namespace pmm::model
