#include "metadata_codec.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/codec/date_tags.hpp"
#include "internal/codec/json_codec.hpp"
#include "internal/model/record.hpp"
#include "internal/observability/logging.hpp"

namespace pmm::codec {

using model::Metadata;

std::string DumpMetadata(Metadata& metadata) {
  Metadata   wire   = metadata;
  const auto format = metadata.datetagformat.value_or(std::string(model::kDefaultDateTagFormat));

  if (ConvertAllDateTags(wire, format) > 0) {
    wire.datetagformat     = format;
    metadata.datetagformat = format;
  }
  wire.SortTags();

  return EmitCanonical(model::Serialize(wire));
}

Metadata LoadsMetadata(const std::string& text) {
  auto metadata = model::Deserialize<Metadata>(ParseJson(text));
  InterpretAllDateTags(metadata);
  return metadata;
}

Metadata LoadMetadata(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open sidecar file: " + path);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  auto metadata = LoadsMetadata(buffer.str());
  PMM_LOG_DEBUG("Loaded sidecar",
                {observability::StringField("path", path), observability::StringField("name", metadata.name),
                 observability::IntField("fields", static_cast<std::int64_t>(metadata.fields.size()))});
  return metadata;
}

void SaveMetadata(Metadata& metadata, const std::string& path) {
  const auto text = DumpMetadata(metadata);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open sidecar file for writing: " + path);
  }
  out << text;
  out.close();
  if (!out) {
    throw std::runtime_error("Failed to write sidecar file: " + path);
  }
  PMM_LOG_DEBUG("Saved sidecar", {observability::StringField("path", path), observability::StringField("name", metadata.name)});
}

} // namespace pmm::codec
