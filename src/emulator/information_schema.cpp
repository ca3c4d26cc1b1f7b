/**
 * @file information_schema.cpp
 * @brief InformationSchema implementation
 */

#include "emulator/information_schema.hpp"

namespace schemata {

namespace {

const char *yes_no(bool value) { return value ? "YES" : "NO"; }

ColumnDef column(const char *name, FieldType type, bool nullable = true) {
  return ColumnDef{name, Field(type, nullable)};
}

std::vector<KeyPart> keys(std::initializer_list<const char *> names) {
  std::vector<KeyPart> parts;
  for (const char *name : names) {
    parts.push_back(KeyPart{name, false});
  }
  return parts;
}

std::vector<TableDef> build_catalog_tables() {
  TableDef columns;
  columns.name = "COLUMNS";
  columns.columns = {
      column("TABLE_CATALOG", FieldType::STRING, false),
      column("TABLE_SCHEMA", FieldType::STRING, false),
      column("TABLE_NAME", FieldType::STRING, false),
      column("COLUMN_NAME", FieldType::STRING, false),
      column("ORDINAL_POSITION", FieldType::INT64, false),
      column("IS_NULLABLE", FieldType::STRING),
      column("SPANNER_TYPE", FieldType::STRING),
  };
  columns.primary_key =
      keys({"TABLE_CATALOG", "TABLE_SCHEMA", "TABLE_NAME", "COLUMN_NAME"});

  TableDef indexes;
  indexes.name = "INDEXES";
  indexes.columns = {
      column("TABLE_CATALOG", FieldType::STRING, false),
      column("TABLE_SCHEMA", FieldType::STRING, false),
      column("TABLE_NAME", FieldType::STRING, false),
      column("INDEX_NAME", FieldType::STRING, false),
      column("INDEX_TYPE", FieldType::STRING, false),
      column("PARENT_TABLE_NAME", FieldType::STRING),
      column("IS_UNIQUE", FieldType::BOOL, false),
      column("IS_NULL_FILTERED", FieldType::BOOL, false),
      column("INDEX_STATE", FieldType::STRING),
  };
  indexes.primary_key = keys(
      {"TABLE_CATALOG", "TABLE_SCHEMA", "TABLE_NAME", "INDEX_NAME", "INDEX_TYPE"});

  TableDef index_columns;
  index_columns.name = "INDEX_COLUMNS";
  index_columns.columns = {
      column("TABLE_CATALOG", FieldType::STRING, false),
      column("TABLE_SCHEMA", FieldType::STRING, false),
      column("TABLE_NAME", FieldType::STRING, false),
      column("INDEX_NAME", FieldType::STRING, false),
      column("COLUMN_NAME", FieldType::STRING, false),
      column("ORDINAL_POSITION", FieldType::INT64),
      column("COLUMN_ORDERING", FieldType::STRING),
      column("IS_NULLABLE", FieldType::STRING),
      column("SPANNER_TYPE", FieldType::STRING),
  };
  index_columns.primary_key = keys(
      {"TABLE_CATALOG", "TABLE_SCHEMA", "TABLE_NAME", "INDEX_NAME", "COLUMN_NAME"});

  return {columns, indexes, index_columns};
}

} // namespace

const std::vector<TableDef> &InformationSchema::catalog_tables() {
  static const std::vector<TableDef> tables = build_catalog_tables();
  return tables;
}

InformationSchema::InformationSchema(const SchemaSnapshot &snapshot,
                                     CatalogNamespace ns) {
  for (const auto &table : snapshot.tables()) {
    add_table(table, ns.table_catalog, ns.table_schema);
  }
  for (const auto &table : catalog_tables()) {
    add_table(table, config::kDefaultTableCatalog, config::kInformationSchema);
  }
}

void InformationSchema::add_table(const TableDef &table,
                                  const std::string &table_catalog,
                                  const std::string &table_schema) {
  // information_schema.columns
  int64_t position = 1;
  for (const auto &def : table.columns) {
    ColumnSchemaRow row;
    row.table_catalog = table_catalog;
    row.table_schema = table_schema;
    row.table_name = table.name;
    row.column_name = def.name;
    row.ordinal_position = position++;
    row.is_nullable = yes_no(def.field.nullable());
    row.spanner_type = def.field.type_ddl();
    columns_.push_back(std::move(row));
  }

  auto index_column_row = [&](const std::string &index_name,
                              const ColumnDef &def) {
    IndexColumnSchemaRow row;
    row.table_catalog = table_catalog;
    row.table_schema = table_schema;
    row.table_name = table.name;
    row.index_name = index_name;
    row.column_name = def.name;
    row.is_nullable = yes_no(def.field.nullable());
    row.spanner_type = def.field.type_ddl();
    return row;
  };

  // Secondary indexes
  for (const auto &index : table.indexes) {
    IndexSchemaRow row;
    row.table_catalog = table_catalog;
    row.table_schema = table_schema;
    row.table_name = table.name;
    row.index_name = index.name;
    row.index_type = config::kSecondaryIndexType;
    row.parent_table_name = "";
    row.is_unique = index.unique;
    row.is_null_filtered = index.null_filtered;
    row.index_state = std::string(config::kIndexStateReadWrite);
    indexes_.push_back(std::move(row));

    int64_t key_position = 1;
    for (const auto &part : index.columns) {
      const ColumnDef *def = table.find_column(part.column);
      if (def == nullptr) {
        continue;
      }
      auto key_row = index_column_row(index.name, *def);
      key_row.ordinal_position = key_position++;
      key_row.column_ordering = part.descending ? "DESC" : "ASC";
      key_row.is_nullable =
          yes_no(def->field.nullable() && !index.null_filtered);
      index_columns_.push_back(std::move(key_row));
    }
    for (const auto &name : index.storing) {
      const ColumnDef *def = table.find_column(name);
      if (def == nullptr) {
        continue;
      }
      index_columns_.push_back(index_column_row(index.name, *def));
    }
  }

  // Primary key
  IndexSchemaRow pk;
  pk.table_catalog = table_catalog;
  pk.table_schema = table_schema;
  pk.table_name = table.name;
  pk.index_name = config::kPrimaryKeyIndexName;
  pk.index_type = config::kPrimaryKeyIndexName;
  pk.parent_table_name = "";
  pk.is_unique = true;
  pk.is_null_filtered = false;
  indexes_.push_back(std::move(pk));

  int64_t key_position = 1;
  for (const auto &part : table.primary_key) {
    const ColumnDef *def = table.find_column(part.column);
    if (def == nullptr) {
      continue;
    }
    auto key_row = index_column_row(config::kPrimaryKeyIndexName, *def);
    key_row.ordinal_position = key_position++;
    key_row.column_ordering = part.descending ? "DESC" : "ASC";
    index_columns_.push_back(std::move(key_row));
  }
}

} // namespace schemata
