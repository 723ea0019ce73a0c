#include "metadata.hpp"

#include <cstdlib>
#include <unordered_map>

#include "internal/util/errors.hpp"

namespace pmm::model {

namespace {

bool SameVersion(const std::string& version) {
  // Versions compare numerically, so "0.10" is accepted as "0.1".
  const char* begin  = version.c_str();
  char*       end    = nullptr;
  const auto  parsed = std::strtod(begin, &end);
  if (version.empty() || end == begin || *end != '\0') {
    return false;
  }
  return parsed == std::strtod(std::string(kPmmVersion).c_str(), nullptr);
}

} // namespace

const RecordSchema<Metadata>& Metadata::Schema() {
  static const RecordSchema<Metadata> schema(
      "Metadata",
      {
          Required("pmmversion", &Metadata::pmmversion),
          Required("name", &Metadata::name),
          Required("recordcount", &Metadata::recordcount),
          Required("fieldcount", &Metadata::fieldcount),
          Required("fields", &Metadata::fields),
          Required("tags", &Metadata::tags),
          Optional("data", &Metadata::data),
          Optional("description", &Metadata::description),
          Optional("creator", &Metadata::creator),
          Optional("contributor", &Metadata::contributor),
          Optional("permissions", &Metadata::permissions),
          Optional("datetagformat", &Metadata::datetagformat),
      },
      [](const Metadata& metadata) { metadata.CheckInvariants(); });
  return schema;
}

Metadata Metadata::Create(std::string name, std::int64_t recordcount, std::vector<Field> fields, Tags tags) {
  Metadata metadata;
  metadata.name        = std::move(name);
  metadata.recordcount = recordcount;
  metadata.fieldcount  = static_cast<std::int64_t>(fields.size());
  metadata.fields      = std::move(fields);
  metadata.tags        = std::move(tags);
  metadata.CheckInvariants();
  return metadata;
}

void Metadata::CheckInvariants() const {
  if (fieldcount != static_cast<std::int64_t>(fields.size())) {
    throw util::FieldCountMismatch("Metadata fieldcount " + std::to_string(fieldcount) + " <> number of fields " + std::to_string(fields.size()));
  }
  if (!SameVersion(pmmversion)) {
    throw util::UnsupportedFormatVersion("Can't handle pmmversion " + pmmversion + " (vs " + std::string(kPmmVersion) + ")");
  }
}

void Metadata::Validate() const {
  std::unordered_map<std::string, int> counts;
  std::string                          duplicates;

  for (const auto& field : fields) {
    if (!ParseFieldType(field.type)) {
      throw util::UnknownCanonicalType("Unknown type " + field.type + " for field " + field.name);
    }
    if (!role::IsKnown(field.role)) {
      throw util::UnknownRole("Unknown role " + field.role + " for field " + field.name);
    }
    if (++counts[field.name] == 2) {
      duplicates += (duplicates.empty() ? "" : " ") + field.name;
    }
  }

  if (!duplicates.empty()) {
    throw util::DuplicateFieldName("Not all field names are unique: " + duplicates);
  }
}

const Field* Metadata::FindField(std::string_view field_name) const {
  for (const auto& field : fields) {
    if (field.name == field_name) return &field;
  }
  return nullptr;
}

Field* Metadata::FindField(std::string_view field_name) {
  for (auto& field : fields) {
    if (field.name == field_name) return &field;
  }
  return nullptr;
}

const Field& Metadata::GetField(std::string_view field_name) const {
  if (const auto* field = FindField(field_name)) return *field;
  throw util::FieldNotFound("No field named " + std::string(field_name) + " in metadata for " + name);
}

Field& Metadata::GetField(std::string_view field_name) {
  if (auto* field = FindField(field_name)) return *field;
  throw util::FieldNotFound("No field named " + std::string(field_name) + " in metadata for " + name);
}

std::vector<std::string> Metadata::FieldNames() const {
  std::vector<std::string> names;
  names.reserve(fields.size());
  for (const auto& field : fields) {
    names.push_back(field.name);
  }
  return names;
}

void Metadata::AddField(Field field) {
  if (auto* existing = FindField(field.name)) {
    *existing = std::move(field);
    return;
  }
  fields.push_back(std::move(field));
  fieldcount = static_cast<std::int64_t>(fields.size());
}

bool Metadata::RemoveField(std::string_view field_name) {
  for (auto it = fields.begin(); it != fields.end(); ++it) {
    if (it->name == field_name) {
      fields.erase(it);
      fieldcount = static_cast<std::int64_t>(fields.size());
      return true;
    }
  }
  return false;
}

void Metadata::SetTag(std::string tag_name, Value value) {
  tags.Set(std::move(tag_name), std::move(value));
}

void Metadata::SetFieldTag(std::string_view field_name, std::string tag_name, Value value) {
  GetField(field_name).tags.Set(std::move(tag_name), std::move(value));
}

void Metadata::SortTags() {
  tags.SortByKey();
  for (auto& field : fields) {
    field.tags.SortByKey();
  }
}

} // namespace pmm::model
