#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/field.hpp"
#include "internal/model/provenance.hpp"
#include "internal/model/record.hpp"
#include "internal/model/value.hpp"

namespace pmm::model {

inline constexpr std::string_view kPmmVersion           = "0.1";
inline constexpr std::string_view kDefaultDateTagFormat = "%Y-%m-%d %H:%M:%S";

/*
  Dataset-level descriptor: the content of a sidecar file.

  Construction (Construct<Metadata> or Create) enforces the format version
  and fieldcount == fields.size(). Field-level checks (unique names, closed
  type and role sets) run in Validate().
*/
struct Metadata {
  std::string                pmmversion = std::string(kPmmVersion);
  std::string                name;
  std::int64_t               recordcount = 0;
  std::int64_t               fieldcount  = 0;
  std::vector<Field>         fields;
  Tags                       tags;
  std::optional<Data>        data;
  std::optional<std::string> description;
  std::optional<std::string> creator;
  std::optional<std::string> contributor;
  std::optional<std::string> permissions;
  std::optional<std::string> datetagformat;

  static const RecordSchema<Metadata>& Schema();

  // Direct constructor; pmmversion and fieldcount are filled in.
  static Metadata Create(std::string name, std::int64_t recordcount, std::vector<Field> fields, Tags tags = {});

  // Throws FieldCountMismatch / UnsupportedFormatVersion.
  void CheckInvariants() const;

  // Throws DuplicateFieldName / UnknownCanonicalType / UnknownRole.
  void Validate() const;

  const Field* FindField(std::string_view field_name) const;
  Field*       FindField(std::string_view field_name);

  // Throws FieldNotFound.
  const Field& GetField(std::string_view field_name) const;
  Field&       GetField(std::string_view field_name);

  std::vector<std::string> FieldNames() const;

  // Replaces the field with the same name in place, or appends it.
  void AddField(Field field);

  // Returns false when no field had that name.
  bool RemoveField(std::string_view field_name);

  void SetTag(std::string tag_name, Value value = Value());
  void SetFieldTag(std::string_view field_name, std::string tag_name, Value value = Value());

  // Sorts the dataset tag map and every field's tag map by key.
  void SortTags();

  bool operator==(const Metadata&) const = default;
};

} // namespace pmm::model
