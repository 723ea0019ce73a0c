#pragma once

#include <arrow/table.h>

#include <memory>
#include <string>
#include <string_view>

namespace pmm::table {

/*
  Host table system abstraction.

  The metadata core only ever reads a whole table or writes a whole table;
  it never looks at storage internals beyond column names and Arrow types.

  Implementations:
    FEATHER  → Arrow IPC / Feather files on the local filesystem
*/

class TableStore {
 public:
  virtual ~TableStore() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  /*
    Read the table stored at path. Throws on I/O or format errors.
  */
  virtual std::shared_ptr<arrow::Table> Read(const std::string& path) = 0;

  // ------------------------------------------------------------------
  // Write
  // ------------------------------------------------------------------
  /*
    Persist the table at path, replacing any existing file.

    A failed write must not leave a partially written file at path.
  */
  virtual void Write(const std::shared_ptr<arrow::Table>& table, const std::string& path) = 0;

  // ------------------------------------------------------------------
  // Format name
  // ------------------------------------------------------------------
  virtual std::string_view Format() const = 0;
};

using TableStorePtr = std::shared_ptr<TableStore>;

} // namespace pmm::table
