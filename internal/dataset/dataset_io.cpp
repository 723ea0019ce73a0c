#include "dataset_io.hpp"

#include <filesystem>
#include <optional>
#include <system_error>

#include "internal/codec/metadata_codec.hpp"
#include "internal/dataset/reconciler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/table/null_sentinel.hpp"
#include "internal/table/type_inference.hpp"

namespace pmm::dataset {

using observability::IntField;
using observability::StringField;

namespace {

constexpr std::string_view kFeatherExtension = ".feather";
constexpr std::string_view kSidecarExtension = ".pmm";

void RemoveIfExists(const std::string& path) {
  std::error_code ec;
  if (std::filesystem::remove(path, ec)) {
    PMM_LOG_INFO("Removed partially written file", {StringField("path", path)});
  } else if (ec) {
    PMM_LOG_WARN("Could not remove partially written file", {StringField("path", path), StringField("error", ec.message())});
  }
}

} // namespace

SidecarLocation SplitTablePath(const std::string& table_path) {
  const std::filesystem::path path(table_path);
  const auto                  extension = path.extension().string();
  const auto                  body      = table_path.substr(0, table_path.size() - extension.size());

  SidecarLocation location;
  location.dataset_name = path.stem().string();
  if (extension.rfind(kFeatherExtension, 0) == 0) {
    location.sidecar_path = body + std::string(kSidecarExtension) + extension.substr(kFeatherExtension.size());
  } else {
    location.sidecar_path = body + std::string(kSidecarExtension);
  }
  return location;
}

Dataset ReadDataset(table::TableStore& store, const std::string& table_path, bool validate) {
  const auto location = SplitTablePath(table_path);
  auto       table    = store.Read(table_path);

  std::optional<model::Metadata> metadata;
  if (std::filesystem::exists(location.sidecar_path)) {
    metadata = codec::LoadMetadata(location.sidecar_path);
  } else {
    PMM_LOG_DEBUG("No sidecar, inferring metadata", {StringField("path", table_path)});
    metadata = table::CreateMetadata(*table, location.dataset_name);
  }

  if (validate) metadata->Validate();

  Dataset dataset(table::DecodeNullSentinels(table), std::move(metadata));
  dataset.UpdateMetadata();

  PMM_LOG_INFO("Read dataset",
               {StringField("path", table_path), IntField("records", dataset.metadata().recordcount),
                IntField("fields", dataset.metadata().fieldcount)});
  return dataset;
}

void WriteDataset(table::TableStore& store, Dataset& dataset, const std::string& table_path) {
  const auto location = SplitTablePath(table_path);

  dataset.UpdateMetadata();
  auto encoded = table::EncodeNullSentinels(dataset.table(), dataset.metadata());

  try {
    store.Write(encoded, table_path);
    codec::SaveMetadata(dataset.metadata(), location.sidecar_path);
  } catch (const std::exception& e) {
    PMM_LOG_ERROR("Dataset write failed", {StringField("path", table_path), StringField("error", e.what())});
    RemoveIfExists(table_path);
    RemoveIfExists(location.sidecar_path);
    throw;
  }

  PMM_LOG_INFO("Wrote dataset",
               {StringField("path", table_path), StringField("sidecar", location.sidecar_path),
                IntField("records", dataset.metadata().recordcount)});
}

} // namespace pmm::dataset
