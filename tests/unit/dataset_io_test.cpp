#include "internal/dataset/dataset_io.hpp"

#include <arrow/api.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/codec/metadata_codec.hpp"
#include "internal/table/feather_table_store.hpp"
#include "internal/table/table_store_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "tests/unit/table_test_utils.hpp"

namespace {

using pmm::dataset::Dataset;
using pmm::dataset::ReadDataset;
using pmm::dataset::SplitTablePath;
using pmm::dataset::WriteDataset;
using pmm::model::Value;
using pmm::testing::DoubleColumn;
using pmm::testing::Int64Column;
using pmm::testing::MakeTable;
using pmm::testing::StringColumn;

std::filesystem::path TestDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "pmm_dataset_io_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

// Writes a partial table file, then fails.
class FailingTableStore : public pmm::table::TableStore {
 public:
  std::shared_ptr<arrow::Table> Read(const std::string&) override {
    throw std::runtime_error("read not supported");
  }

  void Write(const std::shared_ptr<arrow::Table>&, const std::string& path) override {
    std::ofstream out(path, std::ios::binary);
    out << "partial";
    out.close();
    throw std::runtime_error("disk full");
  }

  std::string_view Format() const override {
    return "failing";
  }
};

std::shared_ptr<arrow::Table> PeopleTable() {
  return MakeTable({"id", "salary", "notes"},
                   {Int64Column({1, 2, 3}), DoubleColumn({10.0, std::nullopt, 30.0}), StringColumn({std::nullopt, std::nullopt, std::nullopt})});
}

void TestSplitTablePath() {
  auto feather = SplitTablePath("data/people.feather");
  assert(feather.sidecar_path == "data/people.pmm");
  assert(feather.dataset_name == "people");

  assert(SplitTablePath("data/people.feather2").sidecar_path == "data/people.pmm2");
  assert(SplitTablePath("people.arrow").sidecar_path == "people.pmm");
  assert(SplitTablePath("runs.v1/people").sidecar_path == "runs.v1/people.pmm");
  assert(SplitTablePath("runs.v1/people").dataset_name == "people");
}

void TestFactory() {
  assert(pmm::table::TableStoreFactory::Build("")->Format() == "feather");
  assert(pmm::table::TableStoreFactory::Build("feather")->Format() == "feather");

  bool thrown = false;
  try {
    pmm::table::TableStoreFactory::Build("parquet");
  } catch (const pmm::util::TableUnavailable&) {
    thrown = true;
  }
  assert(thrown);
}

void TestWriteThenReadRoundTrips() {
  const auto dir        = TestDir("round_trip");
  const auto table_path = (dir / "people.feather").string();
  const auto created    = pmm::util::MakeTimePoint(2016, 3, 1);

  pmm::table::FeatherTableStore store;
  Dataset                       dataset(PeopleTable(), std::nullopt, "people");
  dataset.TagField("salary", "maximize");
  dataset.TagDataset("created", Value(created));

  WriteDataset(store, dataset, table_path);
  assert(std::filesystem::exists(table_path));
  assert(std::filesystem::exists(dir / "people.pmm"));
  assert(dataset.metadata().datetagformat.has_value());

  // The stored table carries the sentinel column, not the all-null one.
  auto stored = store.Read(table_path);
  assert(stored->GetColumnByName("notes") == nullptr);
  assert(stored->num_columns() == 3);

  auto loaded = ReadDataset(store, table_path);
  assert(loaded.table()->Equals(*dataset.table()));
  assert(loaded.metadata() == dataset.metadata());
  assert(loaded.metadata().tags.Find("created")->AsTimestamp() == created);
  assert(loaded.metadata().GetField("notes").type == "string");

  // Re-saving unchanged metadata reproduces the sidecar byte for byte.
  const auto         sidecar = (dir / "people.pmm").string();
  std::ifstream      in(sidecar, std::ios::binary);
  std::ostringstream before;
  before << in.rdbuf();
  assert(pmm::codec::DumpMetadata(loaded.metadata()) == before.str());

  std::filesystem::remove_all(dir);
}

void TestReadWithoutSidecarInfersAndNeverWrites() {
  const auto dir        = TestDir("no_sidecar");
  const auto table_path = (dir / "scores.feather").string();

  pmm::table::FeatherTableStore store;
  store.Write(MakeTable({"score"}, {DoubleColumn({0.5})}), table_path);

  auto dataset = ReadDataset(store, table_path);
  assert(dataset.metadata().name == "scores");
  assert(dataset.metadata().GetField("score").type == "real");
  assert(dataset.metadata().recordcount == 1);
  assert(!std::filesystem::exists(dir / "scores.pmm"));

  std::filesystem::remove_all(dir);
}

void TestReadValidatesSidecar() {
  const auto dir        = TestDir("invalid_sidecar");
  const auto table_path = (dir / "people.feather").string();

  pmm::table::FeatherTableStore store;
  Dataset                       dataset(PeopleTable(), std::nullopt, "people");
  WriteDataset(store, dataset, table_path);

  auto broken             = dataset.metadata();
  broken.fields[0].type   = "float";
  const auto sidecar_path = (dir / "people.pmm").string();
  pmm::codec::SaveMetadata(broken, sidecar_path);

  bool thrown = false;
  try {
    ReadDataset(store, table_path);
  } catch (const pmm::util::UnknownCanonicalType&) {
    thrown = true;
  }
  assert(thrown);

  auto unchecked = ReadDataset(store, table_path, false);
  assert(unchecked.metadata().fields[0].type == "float");

  std::filesystem::remove_all(dir);
}

void TestFailedWriteRemovesBothFiles() {
  const auto dir          = TestDir("failed_write");
  const auto table_path   = (dir / "people.feather").string();
  const auto sidecar_path = (dir / "people.pmm").string();

  std::ofstream stale(sidecar_path);
  stale << "{}";
  stale.close();

  FailingTableStore store;
  Dataset           dataset(PeopleTable(), std::nullopt, "people");

  bool thrown = false;
  try {
    WriteDataset(store, dataset, table_path);
  } catch (const std::runtime_error& e) {
    thrown = std::string(e.what()) == "disk full";
  }
  assert(thrown);
  assert(!std::filesystem::exists(table_path));
  assert(!std::filesystem::exists(sidecar_path));

  std::filesystem::remove_all(dir);
}

void TestFailedRenameRemovesTempFile() {
  const auto dir        = TestDir("failed_rename");
  const auto table_path = dir / "people.feather";

  // A non-empty directory in the way makes the final rename fail.
  std::filesystem::create_directories(table_path / "occupied");

  pmm::table::FeatherTableStore store;
  bool                          thrown = false;
  try {
    store.Write(PeopleTable(), table_path.string());
  } catch (const std::filesystem::filesystem_error&) {
    thrown = true;
  }
  assert(thrown);
  assert(!std::filesystem::exists(table_path.string() + ".tmp"));
  assert(std::filesystem::is_directory(table_path / "occupied"));

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestSplitTablePath();
  TestFactory();
  TestWriteThenReadRoundTrips();
  TestReadWithoutSidecarInfersAndNeverWrites();
  TestReadValidatesSidecar();
  TestFailedWriteRemovesBothFiles();
  TestFailedRenameRemovesTempFile();

  std::cout << "dataset_io_test: PASS\n";
  return 0;
}
