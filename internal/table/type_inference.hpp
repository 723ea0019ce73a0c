#pragma once

#include <arrow/chunked_array.h>
#include <arrow/table.h>

#include <string>
#include <string_view>

#include "internal/model/field.hpp"
#include "internal/model/metadata.hpp"

namespace pmm::table {

/*
  Maps Arrow storage types onto the canonical field types.

      bool                          → boolean
      int8..uint64                  → integer
      half_float / float / double   → real
      date32 / date64 / timestamp   → datestamp
      time32 / time64               → datestamp
      null / utf8 / large_utf8      → boolean when the first non-null
      dictionary / union              value is a boolean, else string

  Any other storage type raises util::UnknownStorageType.
*/
model::FieldType InferFieldType(const std::string& name, const arrow::ChunkedArray& column);

/*
  Field with the inferred type, or with type_override when it is non-empty.
  An override outside the canonical set raises util::UnknownType.
*/
model::Field CreateField(const std::string& name, const arrow::ChunkedArray& column, std::string_view type_override = {});

// Metadata describing every column of the table, in column order.
model::Metadata CreateMetadata(const arrow::Table& table, std::string name);

} // namespace pmm::table
