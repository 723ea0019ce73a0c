#include "type_inference.hpp"

#include <arrow/array.h>
#include <arrow/scalar.h>
#include <arrow/type.h>
#include <arrow/type_traits.h>

#include <vector>

#include "internal/table/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace pmm::table {

namespace {

// Type of the first valid entry, looking through union wrappers.
std::shared_ptr<arrow::DataType> FirstValueType(const arrow::ChunkedArray& column) {
  for (const auto& chunk : column.chunks()) {
    for (int64_t i = 0; i < chunk->length(); ++i) {
      auto scalar = Unwrap(chunk->GetScalar(i));
      while (scalar->is_valid && arrow::is_union(scalar->type->id())) {
        scalar = std::static_pointer_cast<arrow::UnionScalar>(scalar)->child_value();
      }
      if (!scalar->is_valid) continue;
      if (scalar->type->id() == arrow::Type::DICTIONARY) {
        return std::static_pointer_cast<arrow::DictionaryType>(scalar->type)->value_type();
      }
      return scalar->type;
    }
  }
  return nullptr;
}

model::FieldType InferFromValues(const arrow::ChunkedArray& column) {
  auto type = FirstValueType(column);
  if (type && type->id() == arrow::Type::BOOL) return model::FieldType::kBoolean;
  return model::FieldType::kString;
}

} // namespace

model::FieldType InferFieldType(const std::string& name, const arrow::ChunkedArray& column) {
  const auto& type = column.type();
  switch (type->id()) {
    case arrow::Type::BOOL:
      return model::FieldType::kBoolean;

    case arrow::Type::INT8:
    case arrow::Type::INT16:
    case arrow::Type::INT32:
    case arrow::Type::INT64:
    case arrow::Type::UINT8:
    case arrow::Type::UINT16:
    case arrow::Type::UINT32:
    case arrow::Type::UINT64:
      return model::FieldType::kInteger;

    case arrow::Type::HALF_FLOAT:
    case arrow::Type::FLOAT:
    case arrow::Type::DOUBLE:
      return model::FieldType::kReal;

    case arrow::Type::DATE32:
    case arrow::Type::DATE64:
    case arrow::Type::TIMESTAMP:
    case arrow::Type::TIME32:
    case arrow::Type::TIME64:
      return model::FieldType::kDatestamp;

    case arrow::Type::NA:
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
    case arrow::Type::DICTIONARY:
    case arrow::Type::SPARSE_UNION:
    case arrow::Type::DENSE_UNION:
      return InferFromValues(column);

    default:
      throw util::UnknownStorageType("Field " + name + " has unknown storage type " + type->ToString());
  }
}

model::Field CreateField(const std::string& name, const arrow::ChunkedArray& column, std::string_view type_override) {
  if (!type_override.empty()) {
    auto parsed = model::ParseFieldType(type_override);
    if (!parsed) {
      throw util::UnknownType("Unknown pmm type " + std::string(type_override) + " for field " + name);
    }
    return model::Field::Create(name, *parsed);
  }
  return model::Field::Create(name, InferFieldType(name, column));
}

model::Metadata CreateMetadata(const arrow::Table& table, std::string name) {
  std::vector<model::Field> fields;
  fields.reserve(static_cast<std::size_t>(table.num_columns()));
  const auto names = ColumnNames(table);
  for (int i = 0; i < table.num_columns(); ++i) {
    fields.push_back(CreateField(names[static_cast<std::size_t>(i)], *table.column(i)));
  }
  return model::Metadata::Create(std::move(name), table.num_rows(), std::move(fields));
}

} // namespace pmm::table
