/**
 * @file schema_update_test.cpp
 * @brief Unit tests for schema update validation and DDL rendering
 */

#include <gtest/gtest.h>

#include "schema/column_update.hpp"
#include "schema/create_table_update.hpp"
#include "schema/index_update.hpp"

namespace schemata {
namespace {

/// Users(id INT64 NOT NULL, name STRING(MAX), email STRING(MAX),
///       tags ARRAY<STRING(MAX)>, avatar BYTES(MAX))
/// PRIMARY KEY (id), INDEX ByEmail (email) STORING (name)
Model users_model() {
  ColumnMap schema{{"id", Field(FieldType::INT64, false)},
                   {"name", Field(FieldType::STRING)},
                   {"email", Field(FieldType::STRING)},
                   {"tags", Field(FieldType::STRING, true, true)},
                   {"avatar", Field(FieldType::BYTES)}};
  IndexInfo by_email;
  by_email.columns = {"email"};
  by_email.type = "INDEX";
  by_email.state = "READ_WRITE";
  by_email.stored_columns = {"name"};
  return Model("Users", schema, {"id"}, {{"ByEmail", by_email}});
}

// ─────────────────────────────────────────────────────────────────────────────
// Kinds and identifiers
// ─────────────────────────────────────────────────────────────────────────────

TEST(SchemaUpdateTest, Kinds) {
  EXPECT_EQ(AddColumn("T", "c", Field(FieldType::INT64)).kind(),
            SchemaUpdateKind::COLUMN);
  EXPECT_EQ(DropColumn("T", "c").kind(), SchemaUpdateKind::COLUMN);
  EXPECT_EQ(CreateTableUpdate("T", {}, {}).kind(),
            SchemaUpdateKind::CREATE_TABLE);
  EXPECT_EQ(DropIndex("T", "i").kind(), SchemaUpdateKind::INDEX);
  EXPECT_STREQ(schema_update_kind_to_string(SchemaUpdateKind::INDEX),
               "IndexUpdate");
}

TEST(SchemaUpdateTest, ValidateIdentifier) {
  EXPECT_TRUE(validate_identifier("Column", "user_id2").ok());
  EXPECT_TRUE(validate_identifier("Column", "").is_invalid_schema_change());
  EXPECT_TRUE(validate_identifier("Column", "2fast").is_invalid_schema_change());
  EXPECT_TRUE(validate_identifier("Column", "_x").is_invalid_schema_change());
  EXPECT_TRUE(validate_identifier("Column", "a-b").is_invalid_schema_change());
  EXPECT_TRUE(validate_identifier("Column", "a b").is_invalid_schema_change());
  EXPECT_TRUE(validate_identifier("Column", std::string(128, 'a')).ok());
  EXPECT_TRUE(validate_identifier("Column", std::string(129, 'a'))
                  .is_invalid_schema_change());
}

TEST(SchemaUpdateTest, ModelMustMatchTable) {
  Model users = users_model();
  EXPECT_TRUE(DropColumn("Orders", "name").validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(DropColumn("Users", "name").validate(nullptr)
                  .is_invalid_schema_change());
}

// ─────────────────────────────────────────────────────────────────────────────
// AddColumn
// ─────────────────────────────────────────────────────────────────────────────

TEST(AddColumnTest, ValidAdd) {
  Model users = users_model();
  AddColumn add("Users", "age", Field(FieldType::INT64));
  EXPECT_TRUE(add.validate(&users).ok());
  EXPECT_EQ(add.ddl(&users), "ALTER TABLE Users ADD COLUMN age INT64");

  AddColumn bounded("Users", "code", Field(FieldType::BYTES, true, false, 16));
  EXPECT_TRUE(bounded.validate(&users).ok());
  EXPECT_EQ(bounded.ddl(&users), "ALTER TABLE Users ADD COLUMN code BYTES(16)");

  AddColumn array("Users", "scores", Field(FieldType::FLOAT64, true, true));
  EXPECT_TRUE(array.validate(&users).ok());
  EXPECT_EQ(array.ddl(&users),
            "ALTER TABLE Users ADD COLUMN scores ARRAY<FLOAT64>");
}

TEST(AddColumnTest, Rejections) {
  Model users = users_model();
  EXPECT_TRUE(AddColumn("Users", "name", Field(FieldType::STRING))
                  .validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(AddColumn("Users", "age", Field(FieldType::INT64, false))
                  .validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(AddColumn("Users", "age", Field())
                  .validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(AddColumn("Users", "bad name", Field(FieldType::INT64))
                  .validate(&users)
                  .is_invalid_schema_change());
}

// ─────────────────────────────────────────────────────────────────────────────
// AlterColumn
// ─────────────────────────────────────────────────────────────────────────────

TEST(AlterColumnTest, ValidAlterations) {
  Model users = users_model();

  AlterColumn not_null("Users", "name", Field(FieldType::STRING, false));
  EXPECT_TRUE(not_null.validate(&users).ok());
  EXPECT_EQ(not_null.ddl(&users),
            "ALTER TABLE Users ALTER COLUMN name STRING(MAX) NOT NULL");

  AlterColumn to_string("Users", "avatar", Field(FieldType::STRING));
  EXPECT_TRUE(to_string.validate(&users).ok());
  EXPECT_EQ(to_string.ddl(&users),
            "ALTER TABLE Users ALTER COLUMN avatar STRING(MAX)");
}

TEST(AlterColumnTest, Rejections) {
  Model users = users_model();
  // Unknown column
  EXPECT_TRUE(AlterColumn("Users", "age", Field(FieldType::INT64))
                  .validate(&users)
                  .is_invalid_schema_change());
  // Key column
  EXPECT_TRUE(AlterColumn("Users", "id", Field(FieldType::INT64))
                  .validate(&users)
                  .is_invalid_schema_change());
  // Incompatible type
  EXPECT_TRUE(AlterColumn("Users", "name", Field(FieldType::INT64))
                  .validate(&users)
                  .is_invalid_schema_change());
  // Array-ness change
  EXPECT_TRUE(AlterColumn("Users", "tags", Field(FieldType::STRING))
                  .validate(&users)
                  .is_invalid_schema_change());
  // No-op
  EXPECT_TRUE(AlterColumn("Users", "name", Field(FieldType::STRING))
                  .validate(&users)
                  .is_invalid_schema_change());
}

TEST(AlterColumnTest, BoundedLengthChanges) {
  ColumnMap schema{{"id", Field(FieldType::INT64, false)},
                   {"s", Field(FieldType::STRING, true, false, 1024)}};
  Model table("T", schema, {"id"}, {});

  AlterColumn widen("T", "s", Field(FieldType::STRING));
  EXPECT_TRUE(widen.validate(&table).ok());
  EXPECT_EQ(widen.ddl(&table), "ALTER TABLE T ALTER COLUMN s STRING(MAX)");

  AlterColumn narrow("T", "s", Field(FieldType::STRING, true, false, 64));
  EXPECT_TRUE(narrow.validate(&table).ok());
  EXPECT_EQ(narrow.ddl(&table), "ALTER TABLE T ALTER COLUMN s STRING(64)");

  EXPECT_TRUE(AlterColumn("T", "s", Field(FieldType::STRING, true, false, 1024))
                  .validate(&table)
                  .is_invalid_schema_change());
  EXPECT_TRUE(AlterColumn("T", "s", Field(FieldType::STRING, true, false, 0))
                  .validate(&table)
                  .is_invalid_schema_change());
}

// ─────────────────────────────────────────────────────────────────────────────
// DropColumn
// ─────────────────────────────────────────────────────────────────────────────

TEST(DropColumnTest, ValidDrop) {
  Model users = users_model();
  DropColumn drop("Users", "avatar");
  EXPECT_TRUE(drop.validate(&users).ok());
  EXPECT_EQ(drop.ddl(&users), "ALTER TABLE Users DROP COLUMN avatar");
}

TEST(DropColumnTest, Rejections) {
  Model users = users_model();
  EXPECT_TRUE(
      DropColumn("Users", "age").validate(&users).is_invalid_schema_change());
  EXPECT_TRUE(
      DropColumn("Users", "id").validate(&users).is_invalid_schema_change());
  // Index key column and stored column
  EXPECT_TRUE(
      DropColumn("Users", "email").validate(&users).is_invalid_schema_change());
  EXPECT_TRUE(
      DropColumn("Users", "name").validate(&users).is_invalid_schema_change());
}

// ─────────────────────────────────────────────────────────────────────────────
// CreateTableUpdate
// ─────────────────────────────────────────────────────────────────────────────

TEST(CreateTableUpdateTest, ValidCreate) {
  CreateTableUpdate create(
      "Orders",
      {{"user_id", Field(FieldType::INT64, false)},
       {"order_id", Field(FieldType::INT64, false)},
       {"total", Field(FieldType::FLOAT64)},
       {"items", Field(FieldType::STRING, true, true)},
       {"code", Field(FieldType::STRING, false, false, 8)}},
      {"user_id", "order_id"});

  EXPECT_TRUE(create.validate(nullptr).ok());
  EXPECT_EQ(create.ddl(nullptr),
            "CREATE TABLE Orders (user_id INT64 NOT NULL, order_id INT64 NOT "
            "NULL, total FLOAT64, items ARRAY<STRING(MAX)>, code STRING(8) NOT "
            "NULL) PRIMARY KEY (user_id, order_id)");
}

TEST(CreateTableUpdateTest, Rejections) {
  Model users = users_model();
  std::vector<ColumnDefinition> columns{{"id", Field(FieldType::INT64, false)},
                                        {"tags", Field(FieldType::INT64, true, true)}};

  // Existing table
  EXPECT_TRUE(CreateTableUpdate("Users", columns, {"id"})
                  .validate(&users)
                  .is_invalid_schema_change());
  // No columns
  EXPECT_TRUE(CreateTableUpdate("T", {}, {"id"})
                  .validate(nullptr)
                  .is_invalid_schema_change());
  // No primary key
  EXPECT_TRUE(
      CreateTableUpdate("T", columns, {}).validate(nullptr).is_invalid_schema_change());
  // Undeclared key column
  EXPECT_TRUE(CreateTableUpdate("T", columns, {"missing"})
                  .validate(nullptr)
                  .is_invalid_schema_change());
  // Repeated key column
  EXPECT_TRUE(CreateTableUpdate("T", columns, {"id", "id"})
                  .validate(nullptr)
                  .is_invalid_schema_change());
  // Array key column
  EXPECT_TRUE(CreateTableUpdate("T", columns, {"tags"})
                  .validate(nullptr)
                  .is_invalid_schema_change());
  // Duplicate column
  EXPECT_TRUE(CreateTableUpdate("T",
                                {{"id", Field(FieldType::INT64)},
                                 {"id", Field(FieldType::STRING)}},
                                {"id"})
                  .validate(nullptr)
                  .is_invalid_schema_change());
  // Length on an unsized type
  EXPECT_TRUE(CreateTableUpdate("T",
                                {{"id", Field(FieldType::INT64, false, false, 8)}},
                                {"id"})
                  .validate(nullptr)
                  .is_invalid_schema_change());
  // Invalid table name
  EXPECT_TRUE(CreateTableUpdate("1T", columns, {"id"})
                  .validate(nullptr)
                  .is_invalid_schema_change());
}

// ─────────────────────────────────────────────────────────────────────────────
// CreateIndex / DropIndex
// ─────────────────────────────────────────────────────────────────────────────

TEST(CreateIndexTest, ValidCreate) {
  Model users = users_model();

  CreateIndex plain("Users", "ByName", {"name"});
  EXPECT_TRUE(plain.validate(&users).ok());
  EXPECT_EQ(plain.ddl(&users), "CREATE INDEX ByName ON Users (name)");

  CreateIndex::Options options;
  options.unique = true;
  options.null_filtered = true;
  options.storing = {"avatar"};
  CreateIndex full("Users", "ByNameEmail", {"name", "email"}, options);
  EXPECT_TRUE(full.validate(&users).ok());
  EXPECT_EQ(full.ddl(&users),
            "CREATE UNIQUE NULL_FILTERED INDEX ByNameEmail ON Users "
            "(name, email) STORING (avatar)");
}

TEST(CreateIndexTest, Rejections) {
  Model users = users_model();
  EXPECT_TRUE(CreateIndex("Users", "ByEmail", {"email"})
                  .validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(CreateIndex("Users", "PRIMARY_KEY", {"name"})
                  .validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(CreateIndex("Users", "Empty", {})
                  .validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(CreateIndex("Users", "ByAge", {"age"})
                  .validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(CreateIndex("Users", "ByTags", {"tags"})
                  .validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(CreateIndex("Users", "Twice", {"name", "name"})
                  .validate(&users)
                  .is_invalid_schema_change());

  CreateIndex::Options store_key;
  store_key.storing = {"name"};
  EXPECT_TRUE(CreateIndex("Users", "ByName", {"name"}, store_key)
                  .validate(&users)
                  .is_invalid_schema_change());

  CreateIndex::Options store_pk;
  store_pk.storing = {"id"};
  EXPECT_TRUE(CreateIndex("Users", "ByName", {"name"}, store_pk)
                  .validate(&users)
                  .is_invalid_schema_change());

  CreateIndex::Options store_unknown;
  store_unknown.storing = {"age"};
  EXPECT_TRUE(CreateIndex("Users", "ByName", {"name"}, store_unknown)
                  .validate(&users)
                  .is_invalid_schema_change());
}

TEST(CreateIndexTest, NamesAreDatabaseWide) {
  ModelMap models;
  models.emplace("Users", users_model());
  models.emplace("Orders",
                 Model("Orders", {{"id", Field(FieldType::INT64, false)},
                                  {"note", Field(FieldType::STRING)}},
                       {"id"}));

  EXPECT_TRUE(CreateIndex("Orders", "ByNote", {"note"})
                  .validate_names(models)
                  .ok());
  // Index name taken on another table
  EXPECT_TRUE(CreateIndex("Orders", "ByEmail", {"note"})
                  .validate_names(models)
                  .is_invalid_schema_change());
  // Index named like a table
  EXPECT_TRUE(CreateIndex("Orders", "Users", {"note"})
                  .validate_names(models)
                  .is_invalid_schema_change());
  // Table named like an index
  EXPECT_TRUE(CreateTableUpdate("ByEmail",
                                {{"id", Field(FieldType::INT64, false)}},
                                {"id"})
                  .validate_names(models)
                  .is_invalid_schema_change());
  EXPECT_TRUE(CreateTableUpdate("Items",
                                {{"id", Field(FieldType::INT64, false)}},
                                {"id"})
                  .validate_names(models)
                  .ok());
  // Requests that introduce no name
  EXPECT_TRUE(DropColumn("Users", "avatar").validate_names(models).ok());
}

TEST(DropIndexTest, DropAndRejections) {
  Model users = users_model();

  DropIndex drop("Users", "ByEmail");
  EXPECT_TRUE(drop.validate(&users).ok());
  EXPECT_EQ(drop.ddl(&users), "DROP INDEX ByEmail");

  EXPECT_TRUE(DropIndex("Users", "ByName")
                  .validate(&users)
                  .is_invalid_schema_change());
  EXPECT_TRUE(DropIndex("Users", "PRIMARY_KEY")
                  .validate(&users)
                  .is_invalid_schema_change());
}

} // namespace
} // namespace schemata
