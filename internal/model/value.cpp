#include "value.hpp"

#include <algorithm>
#include <sstream>

#include "internal/util/errors.hpp"

namespace pmm::model {

// ------------------------------------------------------------
// ValueMap
// ------------------------------------------------------------

ValueMap::ValueMap(std::initializer_list<Entry> entries) {
  for (const auto& entry : entries) {
    Set(entry.first, entry.second);
  }
}

void ValueMap::Set(std::string key, Value value) {
  if (auto* existing = Find(key)) {
    *existing = std::move(value);
    return;
  }
  entries_.emplace_back(std::move(key), std::move(value));
}

const Value* ValueMap::Find(std::string_view key) const {
  for (const auto& [k, v] : entries_) {
    if (k == key) return &v;
  }
  return nullptr;
}

Value* ValueMap::Find(std::string_view key) {
  for (auto& [k, v] : entries_) {
    if (k == key) return &v;
  }
  return nullptr;
}

bool ValueMap::Contains(std::string_view key) const {
  return Find(key) != nullptr;
}

bool ValueMap::Erase(std::string_view key) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

void ValueMap::SortByKey() {
  std::stable_sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) { return a.first < b.first; });
}

bool operator==(const ValueMap& a, const ValueMap& b) {
  return a.entries_ == b.entries_;
}

// ------------------------------------------------------------
// Value accessors
// ------------------------------------------------------------

namespace {

[[noreturn]] void ThrowKind(Value::Kind expected, Value::Kind actual) {
  throw util::TypeMismatch("expected " + std::string(ToString(expected)) + " value, got " + std::string(ToString(actual)));
}

} // namespace

bool Value::AsBool() const {
  if (!IsBool()) ThrowKind(Kind::kBool, kind());
  return std::get<bool>(data_);
}

std::int64_t Value::AsInt() const {
  if (!IsInt()) ThrowKind(Kind::kInt, kind());
  return std::get<std::int64_t>(data_);
}

double Value::AsReal() const {
  if (!IsReal()) ThrowKind(Kind::kReal, kind());
  return std::get<double>(data_);
}

const std::string& Value::AsString() const {
  if (!IsString()) ThrowKind(Kind::kString, kind());
  return std::get<std::string>(data_);
}

const util::TimePoint& Value::AsTimestamp() const {
  if (!IsTimestamp()) ThrowKind(Kind::kTimestamp, kind());
  return std::get<util::TimePoint>(data_);
}

const ValueList& Value::AsList() const {
  if (!IsList()) ThrowKind(Kind::kList, kind());
  return std::get<ValueList>(data_);
}

ValueList& Value::AsList() {
  if (!IsList()) ThrowKind(Kind::kList, kind());
  return std::get<ValueList>(data_);
}

const ValueMap& Value::AsMap() const {
  if (!IsMap()) ThrowKind(Kind::kMap, kind());
  return std::get<ValueMap>(data_);
}

ValueMap& Value::AsMap() {
  if (!IsMap()) ThrowKind(Kind::kMap, kind());
  return std::get<ValueMap>(data_);
}

std::string_view ToString(Value::Kind kind) {
  switch (kind) {
    case Value::Kind::kNone:
      return "none";
    case Value::Kind::kBool:
      return "bool";
    case Value::Kind::kInt:
      return "int";
    case Value::Kind::kReal:
      return "real";
    case Value::Kind::kString:
      return "string";
    case Value::Kind::kTimestamp:
      return "timestamp";
    case Value::Kind::kList:
      return "list";
    case Value::Kind::kMap:
      return "map";
    default:
      return "unknown";
  }
}

std::string Describe(const Value& value) {
  std::ostringstream out;
  switch (value.kind()) {
    case Value::Kind::kNone:
      out << "none";
      break;
    case Value::Kind::kBool:
      out << (value.AsBool() ? "true" : "false");
      break;
    case Value::Kind::kInt:
      out << value.AsInt();
      break;
    case Value::Kind::kReal:
      out << value.AsReal();
      break;
    case Value::Kind::kString:
      out << '"' << value.AsString() << '"';
      break;
    case Value::Kind::kTimestamp:
      out << util::FormatTimePoint(value.AsTimestamp(), "%Y-%m-%dT%H:%M:%S");
      break;
    case Value::Kind::kList:
      out << "list[" << value.AsList().size() << "]";
      break;
    case Value::Kind::kMap:
      out << "map[" << value.AsMap().size() << "]";
      break;
  }
  return out.str();
}

} // namespace pmm::model
