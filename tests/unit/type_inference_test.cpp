#include "internal/table/type_inference.hpp"

#include <arrow/api.h>

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/unit/table_test_utils.hpp"

namespace {

using pmm::model::FieldType;
using pmm::table::CreateField;
using pmm::table::CreateMetadata;
using pmm::table::InferFieldType;
using pmm::testing::BoolColumn;
using pmm::testing::Chunked;
using pmm::testing::DoubleColumn;
using pmm::testing::Int64Column;
using pmm::testing::MakeTable;
using pmm::testing::NullColumn;
using pmm::testing::StringColumn;
using pmm::testing::Unwrap;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestFixedStorageTypes() {
  assert(InferFieldType("b", *BoolColumn({true, false})) == FieldType::kBoolean);
  assert(InferFieldType("i", *Int64Column({1, 2})) == FieldType::kInteger);
  assert(InferFieldType("r", *DoubleColumn({1.5, std::nullopt})) == FieldType::kReal);

  arrow::UInt8Builder small;
  Unwrap(small.Append(3));
  assert(InferFieldType("u", *Chunked(Unwrap(small.Finish()))) == FieldType::kInteger);

  arrow::TimestampBuilder stamps(arrow::timestamp(arrow::TimeUnit::NANO), arrow::default_memory_pool());
  Unwrap(stamps.Append(1456833600000000000LL));
  assert(InferFieldType("t", *Chunked(Unwrap(stamps.Finish()))) == FieldType::kDatestamp);

  arrow::Date32Builder dates;
  Unwrap(dates.Append(16861));
  assert(InferFieldType("d", *Chunked(Unwrap(dates.Finish()))) == FieldType::kDatestamp);
}

void TestUntypedStorageUsesFirstValue() {
  assert(InferFieldType("s", *StringColumn({std::nullopt, "a"})) == FieldType::kString);
  assert(InferFieldType("n", *NullColumn(4)) == FieldType::kString);
  assert(InferFieldType("e", *StringColumn({})) == FieldType::kString);

  arrow::StringDictionaryBuilder dictionary;
  Unwrap(dictionary.Append("red"));
  Unwrap(dictionary.Append("blue"));
  assert(InferFieldType("c", *Chunked(Unwrap(dictionary.Finish()))) == FieldType::kString);

  // Mixed column whose first value is a boolean.
  arrow::Int8Builder type_ids;
  Unwrap(type_ids.AppendValues(std::vector<int8_t>{0, 1}));
  auto bools   = BoolColumn({true, std::nullopt})->chunk(0);
  auto strings = StringColumn({std::nullopt, "x"})->chunk(0);
  auto mixed   = Unwrap(arrow::SparseUnionArray::Make(*Unwrap(type_ids.Finish()), {bools, strings}));
  assert(InferFieldType("m", *Chunked(mixed)) == FieldType::kBoolean);
}

void TestUnsupportedStorageIsRejected() {
  arrow::ListBuilder lists(arrow::default_memory_pool(), std::make_shared<arrow::Int64Builder>());
  Unwrap(lists.Append());
  auto column = Chunked(Unwrap(lists.Finish()));
  assert(Throws<pmm::util::UnknownStorageType>([&] { (void)InferFieldType("l", *column); }));
}

void TestOverrides() {
  auto column = Int64Column({0, 1, 1});

  auto field = CreateField("flag", *column, "boolean");
  assert(field.type == "boolean");
  assert(field.role.empty());
  assert(field.tags.empty());

  assert(CreateField("flag", *column).type == "integer");
  assert(Throws<pmm::util::UnknownType>([&] { (void)CreateField("flag", *column, "float"); }));
}

void TestCreateMetadataFollowsColumnOrder() {
  auto table = MakeTable({"id", "name", "score"}, {Int64Column({1, 2}), StringColumn({"a", "b"}), DoubleColumn({0.5, 1.5})});

  auto metadata = CreateMetadata(*table, "scores");
  assert(metadata.name == "scores");
  assert(metadata.recordcount == 2);
  assert(metadata.fieldcount == 3);
  assert(metadata.fields[0].type == "integer");
  assert(metadata.fields[1].type == "string");
  assert(metadata.fields[2].type == "real");
  metadata.Validate();
}

} // namespace

int main() {
  TestFixedStorageTypes();
  TestUntypedStorageUsesFirstValue();
  TestUnsupportedStorageIsRejected();
  TestOverrides();
  TestCreateMetadataFollowsColumnOrder();

  std::cout << "type_inference_test: PASS\n";
  return 0;
}
