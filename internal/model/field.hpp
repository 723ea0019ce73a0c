#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/record.hpp"
#include "internal/model/value.hpp"

namespace pmm::model {

/*
  Canonical column types tracked by the sidecar, independent of how the
  host storage represents the column.
*/
enum class FieldType : std::uint8_t {
  kBoolean = 0,
  kInteger,
  kReal,
  kString,
  kDatestamp,
};

inline constexpr std::array<FieldType, 5> kFieldTypes = {
    FieldType::kBoolean, FieldType::kInteger, FieldType::kReal, FieldType::kString, FieldType::kDatestamp,
};

constexpr std::string_view ToString(FieldType type) {
  switch (type) {
    case FieldType::kBoolean:
      return "boolean";
    case FieldType::kInteger:
      return "integer";
    case FieldType::kReal:
      return "real";
    case FieldType::kString:
      return "string";
    case FieldType::kDatestamp:
    default:
      return "datestamp";
  }
}

std::optional<FieldType> ParseFieldType(std::string_view text);

namespace role {
inline constexpr std::string_view kIndependent = "independent"; // predictor
inline constexpr std::string_view kDependent   = "dependent";   // outcome
inline constexpr std::string_view kTreatment   = "treatment";
inline constexpr std::string_view kWeight      = "weight";
inline constexpr std::string_view kAuxiliary   = "auxiliary";
inline constexpr std::string_view kValidation  = "validation"; // cross-validation partition
inline constexpr std::string_view kIgnore      = "ignore";
inline constexpr std::string_view kUnspecified = "";

bool IsKnown(std::string_view role);
} // namespace role

namespace tag {
inline constexpr std::string_view kCategorical = "categorical";
inline constexpr std::string_view kOrdinal     = "ordinal";
inline constexpr std::string_view kUnique      = "unique";
inline constexpr std::string_view kMaximize    = "maximize";
inline constexpr std::string_view kMinimize    = "minimize";
} // namespace tag

struct Stats {
  std::optional<std::int64_t> nnulls;
  std::optional<std::int64_t> nuniques;
  std::optional<Value>        min;
  std::optional<Value>        max;
  std::optional<double>       mean;

  static const RecordSchema<Stats>& Schema();

  bool operator==(const Stats&) const = default;
};

/*
  Column-level descriptor.

  `type` and `role` are kept as their wire strings; Metadata::Validate()
  checks them against the closed sets above.
*/
struct Field {
  std::string                name;
  std::string                type;
  std::string                role;
  Tags                       tags;
  Stats                      stats;
  std::optional<ValueList>   values;
  std::optional<std::string> longname;
  std::optional<std::string> description;

  static const RecordSchema<Field>& Schema();

  // Fresh field with no tags and empty stats.
  static Field Create(std::string name, FieldType type, std::string_view field_role = role::kUnspecified);

  bool operator==(const Field&) const = default;
};

} // namespace pmm::model
