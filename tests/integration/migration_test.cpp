/**
 * @file migration_test.cpp
 * @brief End-to-end tests: DatabaseMetadata driving an EmulatedDatabase
 */

#include <gtest/gtest.h>

#include "schemata/schemata.hpp"

#include "emulator/emulated_database.hpp"

namespace schemata {
namespace {

class MigrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    CreateTableUpdate users("Users",
                            {{"id", Field(FieldType::INT64, false)},
                             {"name", Field(FieldType::STRING)}},
                            {"id"});
    ASSERT_TRUE(metadata_.create_table(users).ok());
  }

  const Model &model(const std::string &table) {
    models_.clear();
    Status status = metadata_.models(&models_);
    EXPECT_TRUE(status.ok()) << status.to_string();
    auto it = models_.find(table);
    EXPECT_NE(it, models_.end()) << table;
    return it->second;
  }

  EmulatedDatabase db_;
  DatabaseMetadata metadata_{&db_, &db_};
  ModelMap models_;
};

TEST_F(MigrationTest, CreatedTableBecomesModel) {
  const Model &users = model("Users");
  EXPECT_EQ(users.table(), "Users");
  EXPECT_EQ(users.schema().size(), 2u);
  EXPECT_EQ(users.schema().at("id"), Field(FieldType::INT64, false));
  EXPECT_EQ(users.schema().at("name"), Field(FieldType::STRING));
  EXPECT_EQ(users.primary_index_keys(), std::vector<std::string>({"id"}));
  EXPECT_TRUE(users.indexes().empty());
}

TEST_F(MigrationTest, CatalogRelationsAreNotModels) {
  model("Users");
  EXPECT_EQ(models_.size(), 1u);
  EXPECT_EQ(models_.count("COLUMNS"), 0u);

  DatabaseMetadata system(&db_, &db_,
                          CatalogNamespace{"", config::kInformationSchema});
  ModelMap system_models;
  ASSERT_TRUE(system.models(&system_models).ok());
  EXPECT_EQ(system_models.size(), 3u);
  EXPECT_EQ(system_models.at("INDEX_COLUMNS").primary_index_keys(),
            std::vector<std::string>({"TABLE_CATALOG", "TABLE_SCHEMA",
                                      "TABLE_NAME", "INDEX_NAME",
                                      "COLUMN_NAME"}));
}

TEST_F(MigrationTest, ColumnLifecycle) {
  SchemaChangeResult result;
  ASSERT_TRUE(metadata_
                  .column_update(AddColumn("Users", "email",
                                           Field(FieldType::STRING)),
                                 &result)
                  .ok());
  EXPECT_EQ(result.state, SchemaChangeState::SUBMITTED);
  EXPECT_EQ(result.operation.schema_version, db_.current_version());
  EXPECT_TRUE(model("Users").has_column("email"));

  ASSERT_TRUE(metadata_
                  .column_update(AlterColumn("Users", "email",
                                             Field(FieldType::BYTES, false)))
                  .ok());
  EXPECT_EQ(*model("Users").find_column("email"),
            Field(FieldType::BYTES, false));

  ASSERT_TRUE(metadata_.column_update(DropColumn("Users", "email")).ok());
  EXPECT_FALSE(model("Users").has_column("email"));
}

TEST_F(MigrationTest, BoundedLengthRoundTrip) {
  ASSERT_TRUE(metadata_
                  .column_update(AddColumn(
                      "Users", "code",
                      Field(FieldType::STRING, true, false, 1024)))
                  .ok());
  EXPECT_EQ(*model("Users").find_column("code"),
            Field(FieldType::STRING, true, false, 1024));

  SchemaChangeResult result;
  ASSERT_TRUE(metadata_
                  .column_update(AlterColumn("Users", "code",
                                             Field(FieldType::STRING)),
                                 &result)
                  .ok());
  EXPECT_EQ(result.ddl[0], "ALTER TABLE Users ALTER COLUMN code STRING(MAX)");
  EXPECT_EQ(*model("Users").find_column("code"), Field(FieldType::STRING));
}

TEST_F(MigrationTest, IndexLifecycle) {
  ASSERT_TRUE(metadata_
                  .column_update(AddColumn("Users", "email",
                                           Field(FieldType::STRING)))
                  .ok());

  CreateIndex::Options options;
  options.unique = true;
  options.storing = {"email"};
  ASSERT_TRUE(metadata_
                  .index_update(
                      CreateIndex("Users", "ByName", {"name"}, options))
                  .ok());

  const IndexInfo *by_name = model("Users").find_index("ByName");
  ASSERT_NE(by_name, nullptr);
  EXPECT_EQ(by_name->columns, std::vector<std::string>({"name"}));
  EXPECT_EQ(by_name->stored_columns, std::vector<std::string>({"email"}));
  EXPECT_TRUE(by_name->unique);
  EXPECT_EQ(by_name->state, std::optional<std::string>("READ_WRITE"));

  // Stored column is protected by validation before any submission
  size_t updates = db_.update_count();
  SchemaChangeResult result;
  EXPECT_TRUE(metadata_.column_update(DropColumn("Users", "email"), &result)
                  .is_invalid_schema_change());
  EXPECT_EQ(result.state, SchemaChangeState::REJECTED);
  EXPECT_EQ(db_.update_count(), updates);

  ASSERT_TRUE(metadata_.index_update(DropIndex("Users", "ByName")).ok());
  EXPECT_TRUE(model("Users").indexes().empty());
}

TEST_F(MigrationTest, IndexNameCollisionAcrossTablesIsRejectedBeforeSubmission) {
  ASSERT_TRUE(
      metadata_.index_update(CreateIndex("Users", "ByName", {"name"})).ok());
  ASSERT_TRUE(metadata_
                  .create_table(CreateTableUpdate(
                      "Orders",
                      {{"id", Field(FieldType::INT64, false)},
                       {"name", Field(FieldType::STRING)}},
                      {"id"}))
                  .ok());

  size_t updates = db_.update_count();
  SchemaChangeResult result;
  Status status = metadata_.index_update(
      CreateIndex("Orders", "ByName", {"name"}), &result);
  EXPECT_TRUE(status.is_invalid_schema_change()) << status.to_string();
  EXPECT_EQ(result.state, SchemaChangeState::REJECTED);

  EXPECT_TRUE(metadata_
                  .create_table(CreateTableUpdate(
                      "ByName", {{"id", Field(FieldType::INT64, false)}},
                      {"id"}))
                  .is_invalid_schema_change());
  EXPECT_EQ(db_.update_count(), updates);
}

TEST_F(MigrationTest, CompositeKeyOrderSurvivesRoundTrip) {
  ASSERT_TRUE(metadata_
                  .create_table(CreateTableUpdate(
                      "Orders",
                      {{"placed", Field(FieldType::TIMESTAMP)},
                       {"user_id", Field(FieldType::INT64, false)},
                       {"order_id", Field(FieldType::INT64, false)}},
                      {"user_id", "order_id"}))
                  .ok());
  ASSERT_TRUE(metadata_
                  .index_update(CreateIndex("Orders", "ByPlaced",
                                            {"placed", "user_id"}))
                  .ok());

  const Model &orders = model("Orders");
  EXPECT_EQ(orders.primary_index_keys(),
            std::vector<std::string>({"user_id", "order_id"}));
  EXPECT_EQ(orders.find_index("ByPlaced")->columns,
            std::vector<std::string>({"placed", "user_id"}));
}

TEST_F(MigrationTest, DatabaseRejectionLeavesDdlEmitted) {
  ASSERT_TRUE(
      metadata_.index_update(CreateIndex("Users", "ByName", {"name"})).ok());

  // Changing the type of an indexed column passes validation but is refused
  // by the database.
  SchemaChangeResult result;
  Status status = metadata_.column_update(
      AlterColumn("Users", "name", Field(FieldType::BYTES)), &result);
  EXPECT_TRUE(status.is_submission());
  EXPECT_EQ(result.state, SchemaChangeState::DDL_EMITTED);
  ASSERT_EQ(result.ddl.size(), 1u);
  EXPECT_EQ(result.ddl[0], "ALTER TABLE Users ALTER COLUMN name BYTES(MAX)");
  EXPECT_EQ(*model("Users").find_column("name"), Field(FieldType::STRING));
}

TEST_F(MigrationTest, PreconditionFailuresDoNotSubmit) {
  size_t updates = db_.update_count();

  EXPECT_TRUE(metadata_
                  .column_update(AddColumn("Orders", "note",
                                           Field(FieldType::STRING)))
                  .is_unknown_table());
  EXPECT_TRUE(metadata_
                  .create_table(CreateTableUpdate(
                      "Users", {{"id", Field(FieldType::INT64, false)}},
                      {"id"}))
                  .is_table_already_exists());

  size_t fetches = db_.fetch_count();
  EXPECT_TRUE(metadata_.create_table(DropColumn("Users", "name"))
                  .is_type_mismatch());
  EXPECT_EQ(db_.fetch_count(), fetches);

  EXPECT_EQ(db_.update_count(), updates);
}

TEST_F(MigrationTest, CatalogFailureRejectsMigration) {
  db_.fail_next_fetch(Status::CatalogRead("unavailable"));
  SchemaChangeResult result;
  Status status = metadata_.column_update(
      AddColumn("Users", "email", Field(FieldType::STRING)), &result);
  EXPECT_TRUE(status.is_catalog_read());
  EXPECT_EQ(result.state, SchemaChangeState::REJECTED);
  EXPECT_FALSE(model("Users").has_column("email"));
}

TEST_F(MigrationTest, ReadsWithinSnapshotAreConsistent) {
  auto txn = db_.begin_snapshot();

  ASSERT_TRUE(metadata_
                  .column_update(AddColumn("Users", "email",
                                           Field(FieldType::STRING)))
                  .ok());

  ModelMap pinned;
  ASSERT_TRUE(metadata_.models(txn.get(), &pinned).ok());
  EXPECT_FALSE(pinned.at("Users").has_column("email"));

  // Validation runs against the pinned snapshot, where email is absent
  EXPECT_TRUE(metadata_
                  .column_update(DropColumn("Users", "email"), nullptr,
                                 txn.get())
                  .is_invalid_schema_change());
}

TEST(VersionTest, VersionString) {
  EXPECT_STREQ(version(), "0.1.0");
  EXPECT_EQ(version_major(), 0);
  EXPECT_EQ(version_minor(), 1);
}

} // namespace
} // namespace schemata
