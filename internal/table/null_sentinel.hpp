#pragma once

#include <arrow/table.h>

#include <memory>
#include <string_view>

#include "internal/model/metadata.hpp"

namespace pmm::table {

/*
  Null-sentinel codec.

  Feather cannot round-trip a string column with no valid entries (it comes
  back as a null-typed column with no canonical type) nor a zero-row bool
  column. Before writing, such a column `c` is replaced in place by an
  all-NaN float64 column named

      c + kNullSentinelSuffix + type_char      ('b' boolean, 's' string, 'u' other)

  and DecodeNullSentinels() restores it after reading. A column is left
  unchanged when its sentinel name is already taken (encode) or when its
  recovered name is already taken (decode).
*/
inline constexpr std::string_view kNullSentinelSuffix = "_\xE2\x88\x85"; // "_∅"

std::shared_ptr<arrow::Table> EncodeNullSentinels(const std::shared_ptr<arrow::Table>& table, const model::Metadata& metadata);

std::shared_ptr<arrow::Table> DecodeNullSentinels(const std::shared_ptr<arrow::Table>& table);

} // namespace pmm::table
