#include "date_tags.hpp"

#include "internal/util/time.hpp"

namespace pmm::codec {

using model::Value;

namespace {

std::size_t ConvertValue(Value& value, const std::string& format) {
  if (value.IsTimestamp()) {
    value = Value(util::FormatTimePoint(value.AsTimestamp(), format));
    return 1;
  }
  std::size_t converted = 0;
  if (value.IsList()) {
    for (auto& element : value.AsList()) {
      converted += ConvertValue(element, format);
    }
  } else if (value.IsMap()) {
    converted += ConvertDateTags(value.AsMap(), format);
  }
  return converted;
}

std::size_t InterpretValue(Value& value, const std::string& format) {
  if (value.IsString()) {
    auto parsed = util::ParseTimePoint(value.AsString(), format);
    if (!parsed) return 0;
    value = Value(*parsed);
    return 1;
  }
  std::size_t parsed = 0;
  if (value.IsList()) {
    for (auto& element : value.AsList()) {
      parsed += InterpretValue(element, format);
    }
  } else if (value.IsMap()) {
    parsed += InterpretDateTags(value.AsMap(), format);
  }
  return parsed;
}

} // namespace

std::size_t ConvertDateTags(model::Tags& tags, const std::string& format) {
  std::size_t converted = 0;
  for (auto& [name, value] : tags) {
    converted += ConvertValue(value, format);
  }
  return converted;
}

std::size_t ConvertAllDateTags(model::Metadata& metadata, const std::string& format) {
  std::size_t converted = ConvertDateTags(metadata.tags, format);
  for (auto& field : metadata.fields) {
    converted += ConvertDateTags(field.tags, format);
  }
  return converted;
}

std::size_t InterpretDateTags(model::Tags& tags, const std::string& format) {
  std::size_t parsed = 0;
  for (auto& [name, value] : tags) {
    parsed += InterpretValue(value, format);
  }
  return parsed;
}

std::size_t InterpretAllDateTags(model::Metadata& metadata) {
  if (!metadata.datetagformat || metadata.datetagformat->empty()) {
    return 0;
  }
  const auto& format = *metadata.datetagformat;

  std::size_t parsed = InterpretDateTags(metadata.tags, format);
  for (auto& field : metadata.fields) {
    parsed += InterpretDateTags(field.tags, format);
  }
  return parsed;
}

} // namespace pmm::codec
