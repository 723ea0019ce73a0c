#pragma once

#include <arrow/chunked_array.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/table.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace pmm::table {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

inline std::vector<std::string> ColumnNames(const arrow::Table& table) {
  return table.schema()->field_names();
}

// True when the column has no valid (non-null) entry, including zero length.
inline bool AllNull(const arrow::ChunkedArray& column) {
  return column.null_count() == column.length();
}

} // namespace pmm::table
