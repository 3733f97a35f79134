#include "minitest.hpp"
#include "app/Filter.hpp"

using nfsgaze::model::DeltaRecord;

static std::vector<DeltaRecord> records(std::initializer_list<const char*> names) {
  std::vector<DeltaRecord> out;
  for (const char* n : names) {
    DeltaRecord d{};
    d.operation = n;
    d.delta_ops = 1;
    out.push_back(d);
  }
  return out;
}

TEST(operations_list_parses_and_trims) {
  auto s = nfsgaze::app::parse_operations_list(" READ , WRITE , GETATTR ");
  ASSERT_EQ(s.size(), 3u);
  ASSERT_TRUE(s.contains("READ"));
  ASSERT_TRUE(s.contains("WRITE"));
  ASSERT_TRUE(s.contains("GETATTR"));
}

TEST(operations_list_empty_and_blank) {
  ASSERT_TRUE(nfsgaze::app::parse_operations_list("").empty());
  ASSERT_TRUE(nfsgaze::app::parse_operations_list("   ").empty());
  auto s = nfsgaze::app::parse_operations_list("READ,,WRITE,");
  ASSERT_EQ(s.size(), 2u);
}

TEST(filter_empty_set_keeps_everything) {
  auto in = records({"ACCESS", "READ", "WRITE"});
  auto out = nfsgaze::app::filter_operations(in, {});
  ASSERT_EQ(out.size(), 3u);
}

TEST(filter_keeps_named_in_order) {
  auto out = nfsgaze::app::filter_operations(records({"ACCESS", "GETATTR", "READ", "WRITE"}), {"WRITE", "ACCESS"});
  ASSERT_EQ(out.size(), 2u);
  ASSERT_EQ(out[0].operation, "ACCESS");
  ASSERT_EQ(out[1].operation, "WRITE");
}

TEST(filter_is_case_sensitive) {
  auto out = nfsgaze::app::filter_operations(records({"READ"}), {"read"});
  ASSERT_TRUE(out.empty());
}

TEST(filter_unknown_name_matches_nothing) {
  auto out = nfsgaze::app::filter_operations(records({"READ", "WRITE"}), {"COMMIT"});
  ASSERT_TRUE(out.empty());
}

TEST(operation_filter_object) {
  nfsgaze::app::OperationFilterSpec spec{};
  spec.names = nfsgaze::app::parse_operations_list("READ");
  nfsgaze::app::OperationFilter f(spec);
  ASSERT_TRUE(!f.empty());
  auto out = f.apply(records({"GETATTR", "READ"}));
  ASSERT_EQ(out.size(), 1u);
  ASSERT_EQ(out[0].operation, "READ");

  nfsgaze::app::OperationFilter all(nfsgaze::app::OperationFilterSpec{});
  ASSERT_TRUE(all.empty());
  ASSERT_EQ(all.apply(records({"GETATTR", "READ"})).size(), 2u);
}
