#include <iostream>
#include <string>
#include <vector>

#include "internal/codec/metadata_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/dataset/dataset_io.hpp"
#include "internal/observability/logging.hpp"
#include "internal/table/table_store_factory.hpp"

using pmm::config::ConfigLoader;
using pmm::dataset::ReadDataset;
using pmm::dataset::WriteDataset;
using pmm::observability::StringField;

static void Usage() {
  std::cout << "Usage:\n"
            << "  pmmctl [--config <config.yaml>] describe <table>\n"
            << "  pmmctl [--config <config.yaml>] update <table>\n"
            << "  pmmctl [--config <config.yaml>] tag <table> <tag> [value]\n"
            << "  pmmctl [--config <config.yaml>] tag-field <table> <field> <tag> [value]\n"
            << "  pmmctl [--config <config.yaml>] declare <table> <field> <boolean|integer|real|string|datestamp>\n";
}

// Tag value from the command line; no value means a bare tag.
static pmm::model::Value TagValue(const std::vector<std::string>& args, std::size_t index) {
  if (index >= args.size()) return {};
  return pmm::model::Value(args[index]);
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.size() < 2) {
    Usage();
    return 1;
  }

  const std::string cmd        = args[0];
  const std::string table_path = args[1];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? ConfigLoader::Defaults() : ConfigLoader::LoadFromYaml(config_path);
    pmm::observability::InitializeLogging(config);

    auto       store    = pmm::table::TableStoreFactory::Build(config.sidecar());
    const bool validate = !config.sidecar().has_validate_on_load() || config.sidecar().validate_on_load();

    // ------------------------------------------------------------

    if (cmd == "describe") {
      auto dataset = ReadDataset(*store, table_path, validate);
      std::cout << pmm::codec::DumpMetadata(dataset.metadata()) << "\n";
      pmm::observability::ShutdownLogging();
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "update") {
      auto dataset = ReadDataset(*store, table_path, validate);
      WriteDataset(*store, dataset, table_path);
      pmm::observability::ShutdownLogging();
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "tag") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }
      auto dataset = ReadDataset(*store, table_path, validate);
      dataset.TagDataset(args[2], TagValue(args, 3));
      WriteDataset(*store, dataset, table_path);
      pmm::observability::ShutdownLogging();
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "tag-field") {
      if (args.size() < 4) {
        Usage();
        return 1;
      }
      auto dataset = ReadDataset(*store, table_path, validate);
      dataset.TagField(args[2], args[3], TagValue(args, 4));
      WriteDataset(*store, dataset, table_path);
      pmm::observability::ShutdownLogging();
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "declare") {
      if (args.size() < 4) {
        Usage();
        return 1;
      }
      auto dataset = ReadDataset(*store, table_path, validate);
      dataset.DeclareField(args[2], args[3]);
      WriteDataset(*store, dataset, table_path);
      pmm::observability::ShutdownLogging();
      return 0;
    }
  } catch (const std::exception& e) {
    PMM_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    pmm::observability::ShutdownLogging();
    return 2;
  }

  Usage();
  return 1;
}
