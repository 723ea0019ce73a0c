#include "field.hpp"

namespace pmm::model {

std::optional<FieldType> ParseFieldType(std::string_view text) {
  for (auto type : kFieldTypes) {
    if (ToString(type) == text) return type;
  }
  return std::nullopt;
}

bool role::IsKnown(std::string_view value) {
  return value == kIndependent || value == kDependent || value == kTreatment || value == kWeight || value == kAuxiliary || value == kValidation ||
         value == kIgnore || value == kUnspecified;
}

const RecordSchema<Stats>& Stats::Schema() {
  static const RecordSchema<Stats> schema("Stats", {
                                                       Optional("nnulls", &Stats::nnulls),
                                                       Optional("nuniques", &Stats::nuniques),
                                                       Optional("min", &Stats::min),
                                                       Optional("max", &Stats::max),
                                                       Optional("mean", &Stats::mean),
                                                   });
  return schema;
}

const RecordSchema<Field>& Field::Schema() {
  static const RecordSchema<Field> schema("Field", {
                                                       Required("name", &Field::name),
                                                       Required("type", &Field::type),
                                                       Required("role", &Field::role),
                                                       Required("tags", &Field::tags),
                                                       Required("stats", &Field::stats),
                                                       Optional("values", &Field::values),
                                                       Optional("longname", &Field::longname),
                                                       Optional("description", &Field::description),
                                                   });
  return schema;
}

Field Field::Create(std::string name, FieldType type, std::string_view field_role) {
  Field field;
  field.name = std::move(name);
  field.type = std::string(ToString(type));
  field.role = std::string(field_role);
  return field;
}

} // namespace pmm::model
