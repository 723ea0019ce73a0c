#include "table_store_factory.hpp"

#include <string>

#include "feather_table_store.hpp"
#include "internal/util/errors.hpp"

namespace pmm::table {

TableStorePtr TableStoreFactory::Build(const pmm::runtime::config::SidecarConfig& cfg) {
  return Build(cfg.table_format());
}

TableStorePtr TableStoreFactory::Build(std::string_view format) {
  if (format.empty() || format == "feather") {
    return std::make_shared<FeatherTableStore>();
  }
  throw util::TableUnavailable("Table format '" + std::string(format) + "' is not available");
}

} // namespace pmm::table
