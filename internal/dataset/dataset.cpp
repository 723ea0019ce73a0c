#include "dataset.hpp"

#include <arrow/array/util.h>
#include <arrow/type.h>

#include <algorithm>
#include <utility>

#include "internal/dataset/reconciler.hpp"
#include "internal/model/field.hpp"
#include "internal/observability/logging.hpp"
#include "internal/table/arrow_utils.hpp"
#include "internal/table/type_inference.hpp"
#include "internal/util/errors.hpp"

namespace pmm::dataset {

using observability::IntField;
using observability::StringField;

Dataset::Dataset(std::shared_ptr<arrow::Table> table, std::optional<model::Metadata> metadata, std::string name)
    : table_(std::move(table)) {
  if (metadata) {
    metadata_ = std::move(*metadata);
  } else {
    metadata_ = table::CreateMetadata(*table_, std::move(name));
  }
}

void Dataset::SetTable(std::shared_ptr<arrow::Table> table) {
  table_ = std::move(table);
}

void Dataset::AddField(const std::string& name, std::shared_ptr<arrow::ChunkedArray> column, std::string_view type) {
  auto field = table::CreateField(name, *column, type);

  const auto arrow_field = arrow::field(name, column->type());
  const int  index       = table_->schema()->GetFieldIndex(name);
  if (index >= 0) {
    table_ = table::Unwrap(table_->SetColumn(index, arrow_field, std::move(column)));
  } else {
    table_ = table::Unwrap(table_->AddColumn(table_->num_columns(), arrow_field, std::move(column)));
  }

  metadata_.AddField(std::move(field));
  metadata_.recordcount = table_->num_rows();
}

void Dataset::DeclareField(const std::string& name, std::string_view type) {
  const int index = table_->schema()->GetFieldIndex(name);
  if (index < 0) {
    throw util::FieldNotFound("No column " + name + " in dataset " + metadata_.name);
  }

  auto column = table_->column(index);
  auto field  = table::CreateField(name, *column, type);

  if (table::AllNull(*column)) {
    std::shared_ptr<arrow::DataType> recast;
    if (field.type == model::ToString(model::FieldType::kString) && column->type()->id() != arrow::Type::STRING) {
      recast = arrow::utf8();
    } else if (field.type == model::ToString(model::FieldType::kDatestamp) && column->type()->id() != arrow::Type::TIMESTAMP) {
      recast = arrow::timestamp(arrow::TimeUnit::NANO);
    }
    if (recast) {
      PMM_LOG_DEBUG("Recasting all-null column", {StringField("field", name), StringField("storage", recast->ToString())});
      auto array = table::Unwrap(arrow::MakeArrayOfNull(recast, table_->num_rows()));
      table_     = table::Unwrap(table_->SetColumn(index, arrow::field(name, recast), std::make_shared<arrow::ChunkedArray>(array)));
    }
  }

  metadata_.AddField(std::move(field));
}

void Dataset::TagField(std::string_view field_name, std::string tag_name, model::Value value) {
  metadata_.SetFieldTag(field_name, std::move(tag_name), std::move(value));
}

void Dataset::TagDataset(std::string tag_name, model::Value value) {
  metadata_.SetTag(std::move(tag_name), std::move(value));
}

void Dataset::UpdateMetadata() {
  ResetFieldsFromTable(*table_, metadata_);
}

void Dataset::MergeMetadata(const Dataset& other, const std::vector<std::string>& override_fields) {
  for (const auto& field : other.metadata().fields) {
    const bool overridden = std::find(override_fields.begin(), override_fields.end(), field.name) != override_fields.end();
    if (overridden && metadata_.RemoveField(field.name)) {
      PMM_LOG_DEBUG("Overriding field metadata", {StringField("field", field.name)});
    }
  }
  AddMetadataFromOther(metadata_, other.metadata());
  ResetFieldsFromTable(*table_, metadata_);
}

void Dataset::Append(const Dataset& other) {
  arrow::ConcatenateTablesOptions options;
  options.unify_schemas       = true;
  options.field_merge_options  = arrow::Field::MergeOptions::Permissive();

  table_ = table::Unwrap(arrow::ConcatenateTables({table_, other.table()}, options));
  PMM_LOG_DEBUG("Appended rows", {IntField("rows", other.table()->num_rows()), IntField("total", table_->num_rows())});

  AddMetadataFromOther(metadata_, other.metadata());
  ResetFieldsFromTable(*table_, metadata_);
}

} // namespace pmm::dataset
