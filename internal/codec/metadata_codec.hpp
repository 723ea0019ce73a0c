#pragma once

#include <string>

#include "internal/model/metadata.hpp"

namespace pmm::codec {

/*
  Metadata <-> sidecar text.

  DumpMetadata transcodes date tags and sorts tag maps on a copy, so the
  live object keeps its timestamps and tag order. The only change made to
  the live metadata is recording datetagformat when dates were written.
*/

std::string DumpMetadata(model::Metadata& metadata);

// Parses, constructs and restores date tags.
model::Metadata LoadsMetadata(const std::string& text);

model::Metadata LoadMetadata(const std::string& path);
void            SaveMetadata(model::Metadata& metadata, const std::string& path);

} // namespace pmm::codec
