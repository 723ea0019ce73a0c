#include "null_sentinel.hpp"

#include <arrow/array.h>
#include <arrow/array/util.h>
#include <arrow/builder.h>
#include <arrow/type.h>

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/table/arrow_utils.hpp"

namespace pmm::table {

namespace {

using observability::StringField;

char TypeChar(const model::Metadata& metadata, const std::string& column_name) {
  const auto* field = metadata.FindField(column_name);
  if (field == nullptr) return 'u';
  if (field->type == model::ToString(model::FieldType::kBoolean)) return 'b';
  if (field->type == model::ToString(model::FieldType::kString)) return 's';
  return 'u';
}

bool IsSentinelCandidate(const arrow::ChunkedArray& column, int64_t num_rows) {
  switch (column.type()->id()) {
    case arrow::Type::NA:
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      return AllNull(column);
    case arrow::Type::BOOL:
      return num_rows == 0;
    default:
      return false;
  }
}

std::shared_ptr<arrow::ChunkedArray> MakeNaNColumn(int64_t num_rows) {
  arrow::DoubleBuilder builder;
  Unwrap(builder.AppendValues(std::vector<double>(static_cast<std::size_t>(num_rows), std::numeric_limits<double>::quiet_NaN())));
  auto array = Unwrap(builder.Finish());
  return std::make_shared<arrow::ChunkedArray>(arrow::ArrayVector{array}, arrow::float64());
}

template <typename ArrayType>
bool ChunkAllNaN(const arrow::Array& chunk) {
  const auto& values = static_cast<const ArrayType&>(chunk);
  for (int64_t i = 0; i < values.length(); ++i) {
    if (values.IsValid(i) && !std::isnan(static_cast<double>(values.Value(i)))) return false;
  }
  return true;
}

// Every entry is NaN or null. Vacuously true for an empty column.
bool AllNaN(const arrow::ChunkedArray& column) {
  for (const auto& chunk : column.chunks()) {
    switch (chunk->type_id()) {
      case arrow::Type::DOUBLE:
        if (!ChunkAllNaN<arrow::DoubleArray>(*chunk)) return false;
        break;
      case arrow::Type::FLOAT:
        if (!ChunkAllNaN<arrow::FloatArray>(*chunk)) return false;
        break;
      default:
        return false;
    }
  }
  return true;
}

bool IsFloating(const arrow::DataType& type) {
  return type.id() == arrow::Type::DOUBLE || type.id() == arrow::Type::FLOAT;
}

// Name without the sentinel suffix and type char. The stripped name may be
// empty: a column called "" encodes as "_∅s".
std::optional<std::string> StripSentinel(const std::string& name) {
  const auto suffix_len = kNullSentinelSuffix.size();
  if (name.size() < suffix_len + 1) return std::nullopt;
  if (name.compare(name.size() - 1 - suffix_len, suffix_len, kNullSentinelSuffix) != 0) return std::nullopt;
  return name.substr(0, name.size() - 1 - suffix_len);
}

} // namespace

std::shared_ptr<arrow::Table> EncodeNullSentinels(const std::shared_ptr<arrow::Table>& table, const model::Metadata& metadata) {
  const auto num_rows = table->num_rows();
  auto       names    = ColumnNames(*table);

  std::vector<std::shared_ptr<arrow::Field>>        fields  = table->schema()->fields();
  std::vector<std::shared_ptr<arrow::ChunkedArray>> columns = table->columns();
  bool                                              changed = false;

  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (!IsSentinelCandidate(*columns[i], num_rows)) continue;

    const auto& name     = names[i];
    auto        alt_name = name + std::string(kNullSentinelSuffix) + TypeChar(metadata, name);

    std::unordered_set<std::string> taken(names.begin(), names.end());
    if (taken.count(alt_name) > 0) {
      PMM_LOG_WARN("Null sentinel name already in use; column left unchanged",
                   {StringField("column", name), StringField("sentinel", alt_name)});
      continue;
    }

    PMM_LOG_DEBUG("Encoding all-null column as sentinel", {StringField("column", name), StringField("sentinel", alt_name)});
    fields[i]  = arrow::field(alt_name, arrow::float64());
    columns[i] = MakeNaNColumn(num_rows);
    names[i]   = alt_name;
    changed    = true;
  }

  if (!changed) return table;
  return arrow::Table::Make(arrow::schema(fields, table->schema()->metadata()), columns, num_rows);
}

std::shared_ptr<arrow::Table> DecodeNullSentinels(const std::shared_ptr<arrow::Table>& table) {
  const auto num_rows = table->num_rows();
  auto       names    = ColumnNames(*table);

  std::vector<std::shared_ptr<arrow::Field>>        fields  = table->schema()->fields();
  std::vector<std::shared_ptr<arrow::ChunkedArray>> columns = table->columns();
  bool                                              changed = false;

  for (std::size_t i = 0; i < columns.size(); ++i) {
    const auto& name      = names[i];
    const auto  stripped  = StripSentinel(name);
    if (!stripped || !IsFloating(*columns[i]->type()) || !AllNaN(*columns[i])) continue;

    const auto& true_name = *stripped;

    std::unordered_set<std::string> taken(names.begin(), names.end());
    if (taken.count(true_name) > 0) {
      PMM_LOG_WARN("Column for null sentinel already present; sentinel left unchanged",
                   {StringField("column", true_name), StringField("sentinel", name)});
      continue;
    }

    const char type_char = name.back();
    auto       type      = (type_char == 'b' && num_rows == 0) ? arrow::boolean() : arrow::utf8();

    PMM_LOG_DEBUG("Restoring all-null column from sentinel", {StringField("column", true_name), StringField("sentinel", name)});
    auto array = Unwrap(arrow::MakeArrayOfNull(type, num_rows));
    fields[i]  = arrow::field(true_name, type);
    columns[i] = std::make_shared<arrow::ChunkedArray>(arrow::ArrayVector{array}, type);
    names[i]   = true_name;
    changed    = true;
  }

  if (!changed) return table;
  return arrow::Table::Make(arrow::schema(fields, table->schema()->metadata()), columns, num_rows);
}

} // namespace pmm::table
