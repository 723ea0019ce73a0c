#pragma once

#include <cstddef>
#include <string>

#include "internal/model/metadata.hpp"
#include "internal/model/value.hpp"

namespace pmm::codec {

/*
  Date tag transcoding.

  JSON has no date type, so timestamp-valued tags travel as strings
  formatted with the metadata's datetagformat. Conversion walks nested
  lists and maps inside tag values as well as the top-level entries.
*/

// Timestamps -> formatted strings. Returns the number converted.
std::size_t ConvertDateTags(model::Tags& tags, const std::string& format);

// Dataset tags and every field's tags. Returns the number converted.
std::size_t ConvertAllDateTags(model::Metadata& metadata, const std::string& format);

// Strings matching the format -> timestamps; anything else is left alone.
// Returns the number of values parsed.
std::size_t InterpretDateTags(model::Tags& tags, const std::string& format);

// No-op unless the metadata records a datetagformat.
std::size_t InterpretAllDateTags(model::Metadata& metadata);

} // namespace pmm::codec
