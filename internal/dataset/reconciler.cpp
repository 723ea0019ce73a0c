#include "reconciler.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/table/arrow_utils.hpp"
#include "internal/table/type_inference.hpp"

namespace pmm::dataset {

using observability::IntField;
using observability::StringField;

void ResetFieldsFromTable(const arrow::Table& table, model::Metadata& metadata) {
  const auto column_names = table::ColumnNames(table);

  // ------------------------------------------------------------
  // Columns the metadata does not know about
  // ------------------------------------------------------------
  for (int i = 0; i < table.num_columns(); ++i) {
    const auto& name = column_names[static_cast<std::size_t>(i)];
    if (metadata.FindField(name) != nullptr) continue;
    PMM_LOG_DEBUG("Adding field for new column", {StringField("field", name)});
    metadata.AddField(table::CreateField(name, *table.column(i)));
  }

  // ------------------------------------------------------------
  // Fields whose column is gone
  // ------------------------------------------------------------
  const std::unordered_set<std::string> present(column_names.begin(), column_names.end());
  for (const auto& name : metadata.FieldNames()) {
    if (present.count(name) > 0) continue;
    PMM_LOG_DEBUG("Dropping field without column", {StringField("field", name)});
    metadata.RemoveField(name);
  }

  // ------------------------------------------------------------
  // Column order
  // ------------------------------------------------------------
  if (metadata.FieldNames() != column_names) {
    std::unordered_map<std::string, model::Field> by_name;
    for (auto& field : metadata.fields) {
      by_name.emplace(field.name, std::move(field));
    }

    std::vector<model::Field> ordered;
    ordered.reserve(column_names.size());
    for (const auto& name : column_names) {
      ordered.push_back(by_name.at(name));
    }
    metadata.fields = std::move(ordered);
    PMM_LOG_DEBUG("Reordered fields to column order", {IntField("fields", static_cast<std::int64_t>(column_names.size()))});
  }

  metadata.fieldcount  = static_cast<std::int64_t>(metadata.fields.size());
  metadata.recordcount = table.num_rows();
}

void AddMetadataFromOther(model::Metadata& metadata, const model::Metadata& other) {
  for (const auto& field : other.fields) {
    if (metadata.FindField(field.name) == nullptr) {
      metadata.AddField(field);
    }
  }
}

} // namespace pmm::dataset
