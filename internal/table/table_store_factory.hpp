#pragma once

#include "config/config.pb.h"
#include "table_store.hpp"

namespace pmm::table {

/*
  Builds the host table store named by configuration.

      auto store = TableStoreFactory::Build(config.sidecar());
      auto table = store->Read("foo.feather");

  An unknown or unavailable format raises util::TableUnavailable.
*/

class TableStoreFactory {
 public:
  static TableStorePtr Build(const pmm::runtime::config::SidecarConfig& cfg);
  static TableStorePtr Build(std::string_view format);
};

} // namespace pmm::table
