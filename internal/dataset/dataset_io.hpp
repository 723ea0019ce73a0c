#pragma once

#include <string>

#include "internal/dataset/dataset.hpp"
#include "internal/table/table_store.hpp"

namespace pmm::dataset {

/*
  Sidecar location for a table file.

      data/foo.feather   → data/foo.pmm        name "foo"
      data/foo.feather2  → data/foo.pmm2       name "foo"
      data/foo.arrow     → data/foo.pmm        name "foo"
      data/foo           → data/foo.pmm        name "foo"
*/
struct SidecarLocation {
  std::string sidecar_path;
  std::string dataset_name;
};

SidecarLocation SplitTablePath(const std::string& table_path);

/*
  Reads the table and its sidecar (metadata is inferred when there is no
  sidecar), restores null-sentinel columns and reconciles. Never writes.
*/
Dataset ReadDataset(table::TableStore& store, const std::string& table_path, bool validate = true);

/*
  Reconciles, writes the table (with null sentinels) and then the sidecar.
  On failure both files are removed and the error is rethrown.
*/
void WriteDataset(table::TableStore& store, Dataset& dataset, const std::string& table_path);

} // namespace pmm::dataset
