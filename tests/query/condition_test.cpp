/**
 * @file condition_test.cpp
 * @brief Tests for Value, fetch conditions and row filtering
 */

#include <gtest/gtest.h>

#include "catalog/catalog_rows.hpp"
#include "query/condition.hpp"
#include "query/row_filter.hpp"
#include "query/value.hpp"
#include "test_utils.hpp"

namespace schemata {
namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Value Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST(ValueTest, NullValue) {
  Value v;
  EXPECT_TRUE(v.is_null());
  EXPECT_FALSE(v.try_int64().has_value());
  EXPECT_EQ(v.to_string(), "NULL");
}

TEST(ValueTest, TypedAccessors) {
  EXPECT_EQ(Value(int64_t{7}).try_int64().value(), 7);
  EXPECT_TRUE(Value(true).try_bool().value());
  EXPECT_EQ(Value("abc").try_string().value(), "abc");
  EXPECT_FALSE(Value("abc").try_int64().has_value());
}

TEST(ValueTest, FromOptional) {
  EXPECT_TRUE(Value::from_optional(std::optional<int64_t>()).is_null());
  EXPECT_EQ(Value::from_optional(std::optional<int64_t>(3)), Value(3));
  EXPECT_TRUE(Value::from_optional(std::optional<std::string>()).is_null());
}

TEST(ValueTest, SqlLiterals) {
  EXPECT_EQ(Value(42).to_string(), "42");
  EXPECT_EQ(Value(false).to_string(), "FALSE");
  EXPECT_EQ(Value("").to_string(), "''");
  EXPECT_EQ(Value("it's").to_string(), "'it''s'");
}

TEST(ValueTest, CompareSortsNullFirst) {
  EXPECT_LT(Value().compare(Value(1)), 0);
  EXPECT_GT(Value(1).compare(Value()), 0);
  EXPECT_EQ(Value().compare(Value()), 0);
  EXPECT_LT(Value(1).compare(Value(2)), 0);
  EXPECT_GT(Value("b").compare(Value("a")), 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Condition Tests
// ─────────────────────────────────────────────────────────────────────────────

TEST(ConditionTest, EqualityMatches) {
  EqualityCondition cond("TABLE_NAME", Value("Users"));
  EXPECT_TRUE(cond.matches(Value("Users")));
  EXPECT_FALSE(cond.matches(Value("Orders")));
  EXPECT_FALSE(cond.matches(Value()));
  EXPECT_EQ(cond.to_sql(), "TABLE_NAME = 'Users'");
}

TEST(ConditionTest, EqualityWithNullMeansIsNull) {
  EqualityCondition cond("ORDINAL_POSITION", Value());
  EXPECT_TRUE(cond.matches(Value()));
  EXPECT_FALSE(cond.matches(Value(1)));
  EXPECT_EQ(cond.to_sql(), "ORDINAL_POSITION IS NULL");
}

TEST(ConditionTest, InequalityWithNullMeansIsNotNull) {
  InequalityCondition cond("ORDINAL_POSITION", Value());
  EXPECT_FALSE(cond.matches(Value()));
  EXPECT_TRUE(cond.matches(Value(1)));
  EXPECT_EQ(cond.to_sql(), "ORDINAL_POSITION IS NOT NULL");
}

TEST(ConditionTest, InequalityExcludesNullCells) {
  InequalityCondition cond("INDEX_STATE", Value("READ_WRITE"));
  EXPECT_TRUE(cond.matches(Value("WRITE_ONLY")));
  EXPECT_FALSE(cond.matches(Value("READ_WRITE")));
  EXPECT_FALSE(cond.matches(Value()));
  EXPECT_EQ(cond.to_sql(), "INDEX_STATE != 'READ_WRITE'");
}

TEST(ConditionTest, ConditionsToSql) {
  ConditionList conditions;
  conditions.push_back(
      std::make_unique<EqualityCondition>("TABLE_CATALOG", Value("")));
  conditions.push_back(
      std::make_unique<InequalityCondition>("ORDINAL_POSITION", Value()));
  conditions.push_back(std::make_unique<OrderByCondition>("ORDINAL_POSITION",
                                                          OrderType::ASC));

  EXPECT_EQ(conditions_to_sql(conditions),
            "WHERE TABLE_CATALOG = '' AND ORDINAL_POSITION IS NOT NULL "
            "ORDER BY ORDINAL_POSITION ASC");
  EXPECT_EQ(conditions_to_sql(ConditionList{}), "");
}

TEST(ConditionTest, CloneConditions) {
  ConditionList conditions;
  conditions.push_back(
      std::make_unique<EqualityCondition>("TABLE_NAME", Value("Users")));
  conditions.push_back(std::make_unique<OrderByCondition>(
      std::vector<OrderByCondition::OrderKey>{
          {"TABLE_NAME", OrderType::ASC}, {"INDEX_NAME", OrderType::DESC}}));

  ConditionList copy = clone_conditions(conditions);
  ASSERT_EQ(copy.size(), 2u);
  EXPECT_EQ(conditions_to_sql(copy), conditions_to_sql(conditions));
  EXPECT_EQ(copy[1]->to_sql(), "TABLE_NAME ASC, INDEX_NAME DESC");
}

// ─────────────────────────────────────────────────────────────────────────────
// Row Filter Tests
// ─────────────────────────────────────────────────────────────────────────────

class RowFilterTest : public ::testing::Test {
protected:
  void SetUp() override {
    rows_.push_back(test::index_column_row("Users", "ByName", "email", 2));
    rows_.push_back(
        test::index_column_row("Users", "ByName", "id", std::nullopt));
    rows_.push_back(test::index_column_row("Users", "ByName", "name", 1));
    rows_.push_back(test::index_column_row("Orders", "PRIMARY_KEY", "id", 1));
  }

  std::vector<IndexColumnSchemaRow> rows_;
};

TEST_F(RowFilterTest, NoConditionsKeepsOrder) {
  std::vector<IndexColumnSchemaRow> out;
  ASSERT_TRUE(filter_rows(rows_, ConditionList{}, &out).ok());
  ASSERT_EQ(out.size(), 4u);
  EXPECT_EQ(out[0].column_name, "email");
  EXPECT_EQ(out[3].table_name, "Orders");
}

TEST_F(RowFilterTest, FiltersAndSorts) {
  ConditionList conditions;
  conditions.push_back(
      std::make_unique<EqualityCondition>("TABLE_NAME", Value("Users")));
  conditions.push_back(
      std::make_unique<InequalityCondition>("ORDINAL_POSITION", Value()));
  conditions.push_back(std::make_unique<OrderByCondition>("ORDINAL_POSITION",
                                                          OrderType::ASC));

  std::vector<IndexColumnSchemaRow> out;
  ASSERT_TRUE(filter_rows(rows_, conditions, &out).ok());
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].column_name, "name");
  EXPECT_EQ(out[1].column_name, "email");
}

TEST_F(RowFilterTest, NullSortsFirstAscendingLastDescending) {
  ConditionList asc;
  asc.push_back(std::make_unique<EqualityCondition>("INDEX_NAME",
                                                    Value("ByName")));
  asc.push_back(std::make_unique<OrderByCondition>("ORDINAL_POSITION",
                                                   OrderType::ASC));
  std::vector<IndexColumnSchemaRow> out;
  ASSERT_TRUE(filter_rows(rows_, asc, &out).ok());
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].column_name, "id");
  EXPECT_EQ(out[2].column_name, "email");

  ConditionList desc;
  desc.push_back(std::make_unique<EqualityCondition>("INDEX_NAME",
                                                     Value("ByName")));
  desc.push_back(std::make_unique<OrderByCondition>("ORDINAL_POSITION",
                                                    OrderType::DESC));
  ASSERT_TRUE(filter_rows(rows_, desc, &out).ok());
  ASSERT_EQ(out.size(), 3u);
  EXPECT_EQ(out[0].column_name, "email");
  EXPECT_EQ(out[2].column_name, "id");
}

TEST_F(RowFilterTest, UnknownColumnIsRejected) {
  ConditionList conditions;
  conditions.push_back(
      std::make_unique<EqualityCondition>("NO_SUCH_COLUMN", Value(1)));

  std::vector<IndexColumnSchemaRow> out;
  Status status = filter_rows(rows_, conditions, &out);
  EXPECT_EQ(status.code(), StatusCode::kInvalidArgument);

  ConditionList order;
  order.push_back(
      std::make_unique<OrderByCondition>("NO_SUCH_COLUMN", OrderType::ASC));
  EXPECT_EQ(filter_rows(rows_, order, &out).code(),
            StatusCode::kInvalidArgument);
}

TEST_F(RowFilterTest, NullOutputIsRejected) {
  // Row cannot be deduced from nullptr
  EXPECT_EQ(
      filter_rows<IndexColumnSchemaRow>(rows_, ConditionList{}, nullptr).code(),
      StatusCode::kInvalidArgument);
}

} // namespace
} // namespace schemata
