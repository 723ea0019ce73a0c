#pragma once

#include <arrow/chunked_array.h>
#include <arrow/table.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/metadata.hpp"
#include "internal/model/value.hpp"

namespace pmm::dataset {

/*
  A table paired with the metadata that describes it.

  The table is owned through a shared_ptr so that reads and Arrow
  transforms can share buffers; the metadata is owned by value. Mutating
  operations keep both in step. Not thread-safe.
*/
class Dataset {
 public:
  // Metadata is inferred from the table when none is given.
  explicit Dataset(std::shared_ptr<arrow::Table> table, std::optional<model::Metadata> metadata = std::nullopt, std::string name = {});

  const std::shared_ptr<arrow::Table>& table() const {
    return table_;
  }

  const model::Metadata& metadata() const {
    return metadata_;
  }

  model::Metadata& metadata() {
    return metadata_;
  }

  /*
    Swaps the table without touching the metadata, e.g. after joining
    columns in from another table. Call UpdateMetadata() or
    MergeMetadata() afterwards.
  */
  void SetTable(std::shared_ptr<arrow::Table> table);

  // ------------------------------------------------------------
  // Fields
  // ------------------------------------------------------------

  // Adds or replaces the column and declares it (inferred when type is empty).
  void AddField(const std::string& name, std::shared_ptr<arrow::ChunkedArray> column, std::string_view type = {});

  /*
    (Re)declares the field for an existing column. A column without valid
    entries is recast to utf8 / timestamp storage when declared string /
    datestamp, so its storage agrees with the declaration.
  */
  void DeclareField(const std::string& name, std::string_view type = {});

  void TagField(std::string_view field_name, std::string tag_name, model::Value value = {});
  void TagDataset(std::string tag_name, model::Value value = {});

  // ------------------------------------------------------------
  // Reconciliation
  // ------------------------------------------------------------

  void UpdateMetadata();

  /*
    Brings in field metadata from `other`. Fields named in override_fields
    take the other dataset's declaration; every other field this dataset
    already declares is kept.
  */
  void MergeMetadata(const Dataset& other, const std::vector<std::string>& override_fields = {});

  // Appends the other dataset's rows, unifying the two schemas.
  void Append(const Dataset& other);

 private:
  std::shared_ptr<arrow::Table> table_;
  model::Metadata               metadata_;
};

} // namespace pmm::dataset
