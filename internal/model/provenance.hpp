#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/record.hpp"

namespace pmm::model {

/*
  Provenance of a dataset: the flat file it was originally derived from.

  Purely informational. Nothing here is checked against the live table.
*/

struct FlatFileFormat {
  std::string                encoding       = "UTF-8";
  std::string                separator      = ",";
  std::string                quote          = "\"";
  std::string                escape         = "\\";
  std::string                nullmarker     = "";
  std::int64_t               headerrowcount = 1;
  std::optional<std::string> dateformat;

  static const RecordSchema<FlatFileFormat>& Schema();

  bool operator==(const FlatFileFormat&) const = default;
};

struct FlatFile {
  std::string    name;
  FlatFileFormat format;

  static const RecordSchema<FlatFile>& Schema();

  bool operator==(const FlatFile&) const = default;
};

struct Data {
  FlatFile flatfile;

  static const RecordSchema<Data>& Schema();

  bool operator==(const Data&) const = default;
};

} // namespace pmm::model
