#pragma once

#include "table_store.hpp"

namespace pmm::table {

class FeatherTableStore : public TableStore {
 public:
  std::shared_ptr<arrow::Table> Read(const std::string& path) override;
  void                          Write(const std::shared_ptr<arrow::Table>& table, const std::string& path) override;

  std::string_view Format() const override {
    return "feather";
  }
};

} // namespace pmm::table
