#pragma once

#include <arrow/table.h>

#include "internal/model/metadata.hpp"

namespace pmm::dataset {

/*
  Brings metadata back in line with the table it describes:

    - columns without a field get a freshly inferred field
    - fields without a column are dropped
    - fields are reordered to column order
    - fieldcount / recordcount are refreshed

  Idempotent; fields that survive keep their tags, stats and role.
*/
void ResetFieldsFromTable(const arrow::Table& table, model::Metadata& metadata);

/*
  Appends every field of `other` whose name `metadata` does not have yet.
  Dataset tags are not merged.
*/
void AddMetadataFromOther(model::Metadata& metadata, const model::Metadata& other);

} // namespace pmm::dataset
