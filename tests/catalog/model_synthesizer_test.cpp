/**
 * @file model_synthesizer_test.cpp
 * @brief Unit tests for Model and ModelSynthesizer
 */

#include <gtest/gtest.h>

#include "catalog/catalog_reader.hpp"
#include "catalog/model_synthesizer.hpp"
#include "test_utils.hpp"

namespace schemata {
namespace {

TableSchemaMap users_tables() {
  TableSchemaMap tables;
  tables["Users"]["id"] = Field(FieldType::INT64, false);
  tables["Users"]["name"] = Field(FieldType::STRING);
  return tables;
}

IndexMap users_indexes() {
  IndexMap indexes;
  IndexInfo pk;
  pk.columns = {"id"};
  pk.type = "PRIMARY_KEY";
  pk.unique = true;
  indexes["Users"]["PRIMARY_KEY"] = pk;
  return indexes;
}

// ─────────────────────────────────────────────────────────────────────────────
// Model
// ─────────────────────────────────────────────────────────────────────────────

TEST(ModelTest, Accessors) {
  ColumnMap schema{{"id", Field(FieldType::INT64, false)},
                   {"name", Field(FieldType::STRING)}};
  IndexInfo by_name;
  by_name.columns = {"name"};
  by_name.type = "INDEX";
  Model model("Users", schema, {"id"}, {{"ByName", by_name}});

  EXPECT_EQ(model.table(), "Users");
  EXPECT_EQ(model.schema().size(), 2u);
  EXPECT_EQ(model.primary_index_keys(), std::vector<std::string>({"id"}));
  EXPECT_TRUE(model.has_column("name"));
  EXPECT_FALSE(model.has_column("email"));
  ASSERT_NE(model.find_column("id"), nullptr);
  EXPECT_FALSE(model.find_column("id")->nullable());
  EXPECT_EQ(model.find_column("email"), nullptr);
  EXPECT_TRUE(model.is_primary_key_column("id"));
  EXPECT_FALSE(model.is_primary_key_column("name"));
  ASSERT_NE(model.find_index("ByName"), nullptr);
  EXPECT_EQ(model.find_index("PRIMARY_KEY"), nullptr);
}

// ─────────────────────────────────────────────────────────────────────────────
// synthesize
// ─────────────────────────────────────────────────────────────────────────────

TEST(ModelSynthesizerTest, SynthesizesUsers) {
  ModelMap models;
  ASSERT_TRUE(
      ModelSynthesizer::synthesize(users_tables(), users_indexes(), &models)
          .ok());

  ASSERT_EQ(models.size(), 1u);
  const Model &users = models.at("Users");
  EXPECT_EQ(users.table(), "Users");
  EXPECT_EQ(users.schema(), users_tables()["Users"]);
  EXPECT_EQ(users.primary_index_keys(), std::vector<std::string>({"id"}));
  EXPECT_TRUE(users.indexes().empty());
}

TEST(ModelSynthesizerTest, CompositeKeyKeepsOrder) {
  TableSchemaMap tables;
  tables["Events"]["day"] = Field(FieldType::DATE, false);
  tables["Events"]["seq"] = Field(FieldType::INT64, false);
  tables["Events"]["payload"] = Field(FieldType::BYTES);
  IndexMap indexes;
  indexes["Events"]["PRIMARY_KEY"].columns = {"seq", "day"};
  indexes["Events"]["PRIMARY_KEY"].type = "PRIMARY_KEY";

  ModelMap models;
  ASSERT_TRUE(ModelSynthesizer::synthesize(tables, indexes, &models).ok());
  EXPECT_EQ(models.at("Events").primary_index_keys(),
            std::vector<std::string>({"seq", "day"}));
}

TEST(ModelSynthesizerTest, SecondaryIndexesExcludePrimaryKey) {
  IndexMap indexes = users_indexes();
  indexes["Users"]["ByName"].columns = {"name"};
  indexes["Users"]["ByName"].type = "INDEX";

  ModelMap models;
  ASSERT_TRUE(
      ModelSynthesizer::synthesize(users_tables(), indexes, &models).ok());
  const Model &users = models.at("Users");
  ASSERT_EQ(users.indexes().size(), 1u);
  EXPECT_EQ(users.indexes().count("ByName"), 1u);
}

TEST(ModelSynthesizerTest, EmptySchemaYieldsNoModels) {
  ModelMap models;
  ASSERT_TRUE(ModelSynthesizer::synthesize({}, {}, &models).ok());
  EXPECT_TRUE(models.empty());
}

TEST(ModelSynthesizerTest, IndexesOfTablesWithoutColumnsAreIgnored) {
  IndexMap indexes = users_indexes();
  indexes["Dropped"]["PRIMARY_KEY"].columns = {"id"};

  ModelMap models;
  ASSERT_TRUE(
      ModelSynthesizer::synthesize(users_tables(), indexes, &models).ok());
  EXPECT_EQ(models.size(), 1u);
}

TEST(ModelSynthesizerTest, MissingPrimaryKeyFails) {
  TableSchemaMap tables = users_tables();
  tables["Orphan"]["x"] = Field(FieldType::INT64);

  ModelMap models;
  models.emplace("Previous", Model("Previous", {}, {}));
  Status status =
      ModelSynthesizer::synthesize(tables, users_indexes(), &models);
  EXPECT_TRUE(status.is_missing_primary_key());

  // No partial result is published
  ASSERT_EQ(models.size(), 1u);
  EXPECT_EQ(models.count("Previous"), 1u);
}

TEST(ModelSynthesizerTest, TableWithOnlySecondaryIndexesFails) {
  IndexMap indexes;
  indexes["Users"]["ByName"].columns = {"name"};

  ModelMap models;
  EXPECT_TRUE(ModelSynthesizer::synthesize(users_tables(), indexes, &models)
                  .is_missing_primary_key());
}

// ─────────────────────────────────────────────────────────────────────────────
// load
// ─────────────────────────────────────────────────────────────────────────────

TEST(ModelSynthesizerTest, LoadReadsColumnsThenIndexes) {
  test::FakeCatalogSource source;
  source.add_users_table();
  CatalogReader reader(&source);

  ModelMap models;
  ASSERT_TRUE(ModelSynthesizer::load(reader, nullptr, &models).ok());
  EXPECT_EQ(models.at("Users").primary_index_keys(),
            std::vector<std::string>({"id"}));

  ASSERT_EQ(source.requests.size(), 4u);
  EXPECT_EQ(source.requests[0].rfind("information_schema.columns", 0), 0u);
  EXPECT_EQ(source.requests[3].rfind("information_schema.indexes", 0), 0u);
}

TEST(ModelSynthesizerTest, LoadIsRepeatable) {
  test::FakeCatalogSource source;
  source.add_users_table();
  CatalogReader reader(&source);

  ModelMap first;
  ModelMap second;
  ASSERT_TRUE(ModelSynthesizer::load(reader, nullptr, &first).ok());
  ASSERT_TRUE(ModelSynthesizer::load(reader, nullptr, &second).ok());
  EXPECT_EQ(first, second);
}

TEST(ModelSynthesizerTest, LoadPropagatesReadFailure) {
  test::FakeCatalogSource source;
  source.add_users_table();
  source.fail_fetch(1, Status::CatalogRead("unavailable"));
  CatalogReader reader(&source);

  ModelMap models;
  EXPECT_TRUE(ModelSynthesizer::load(reader, nullptr, &models)
                  .is_catalog_read());
  EXPECT_TRUE(models.empty());
}

} // namespace
} // namespace schemata
