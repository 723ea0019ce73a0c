#include "feather_table_store.hpp"

#include <arrow/io/file.h>
#include <arrow/ipc/feather.h>

#include <filesystem>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/table/arrow_utils.hpp"

namespace pmm::table {

/*
  Read entire table from a Feather (v1 or v2) file.
*/
std::shared_ptr<arrow::Table> FeatherTableStore::Read(const std::string& path) {
  auto file   = Unwrap(arrow::io::ReadableFile::Open(path));
  auto reader = Unwrap(arrow::ipc::feather::Reader::Open(file));

  std::shared_ptr<arrow::Table> table;
  Unwrap(reader->Read(&table));
  return table;
}

/*
  Atomic write:
      write tmp → close → rename
*/
void FeatherTableStore::Write(const std::shared_ptr<arrow::Table>& table, const std::string& path) {
  const auto tmp_path = path + ".tmp";

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(arrow::ipc::feather::WriteTable(*table, out.get(), arrow::ipc::feather::WriteProperties::Defaults()));
    Unwrap(out->Close());
    std::filesystem::rename(tmp_path, path);
  } catch (const std::exception& e) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    PMM_LOG_WARN("Feather write failed", {observability::StringField("path", path), observability::StringField("error", e.what())});
    throw;
  }
}

} // namespace pmm::table
