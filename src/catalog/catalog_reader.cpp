/**
 * @file catalog_reader.cpp
 * @brief CatalogReader implementation
 */

#include "catalog/catalog_reader.hpp"

#include <map>
#include <memory>
#include <utility>

#include "common/logger.hpp"

namespace schemata {

namespace {

using IndexKey = std::pair<std::string, std::string>; // (table, index)

} // namespace

CatalogReader::CatalogReader(CatalogSource *source,
                             CatalogNamespace catalog_namespace)
    : source_(source), namespace_(std::move(catalog_namespace)) {}

ConditionList CatalogReader::namespace_filter() const {
  ConditionList conditions;
  conditions.push_back(std::make_unique<EqualityCondition>(
      config::kTableCatalogColumn, Value(namespace_.table_catalog)));
  conditions.push_back(std::make_unique<EqualityCondition>(
      config::kTableSchemaColumn, Value(namespace_.table_schema)));
  return conditions;
}

// ─────────────────────────────────────────────────────────────────────────────
// Columns
// ─────────────────────────────────────────────────────────────────────────────

Status CatalogReader::read_columns(const Transaction *txn,
                                   TableSchemaMap *out) const {
  if (out == nullptr) {
    return Status::InvalidArgument("Output pointer cannot be null");
  }
  if (source_ == nullptr) {
    return Status::CatalogRead("No catalog source configured");
  }

  std::vector<ColumnSchemaRow> rows;
  SCHEMATA_RETURN_IF_ERROR(
      source_->fetch_columns(txn, namespace_filter(), &rows));

  TableSchemaMap tables;
  for (const auto &row : rows) {
    Field field;
    Status status = row.type(&field);
    if (!status.ok()) {
      return Status::CatalogRead(row.table_name + "." + row.column_name +
                                 ": " + std::string(status.message()));
    }
    tables[row.table_name][row.column_name] = field;
  }

  LOG_DEBUG("Read {} columns across {} tables in namespace {}", rows.size(),
            tables.size(), namespace_.to_string());
  *out = std::move(tables);
  return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Indexes
// ─────────────────────────────────────────────────────────────────────────────

Status CatalogReader::read_indexes(const Transaction *txn,
                                   IndexMap *out) const {
  if (out == nullptr) {
    return Status::InvalidArgument("Output pointer cannot be null");
  }
  if (source_ == nullptr) {
    return Status::CatalogRead("No catalog source configured");
  }

  // Step 1: key columns, ascending by ordinal position. NULL ordinals mark
  // columns that are not part of the key and are skipped here.
  ConditionList key_conditions = namespace_filter();
  key_conditions.push_back(std::make_unique<InequalityCondition>(
      config::kOrdinalPositionColumn, Value()));
  key_conditions.push_back(std::make_unique<OrderByCondition>(
      config::kOrdinalPositionColumn, OrderType::ASC));

  std::vector<IndexColumnSchemaRow> key_rows;
  SCHEMATA_RETURN_IF_ERROR(
      source_->fetch_index_columns(txn, key_conditions, &key_rows));

  std::map<IndexKey, std::vector<std::string>> index_columns;
  for (const auto &row : key_rows) {
    index_columns[{row.table_name, row.index_name}].push_back(row.column_name);
  }

  // Stored columns carry a NULL ordinal.
  ConditionList stored_conditions = namespace_filter();
  stored_conditions.push_back(std::make_unique<EqualityCondition>(
      config::kOrdinalPositionColumn, Value()));

  std::vector<IndexColumnSchemaRow> stored_rows;
  SCHEMATA_RETURN_IF_ERROR(
      source_->fetch_index_columns(txn, stored_conditions, &stored_rows));

  std::map<IndexKey, std::vector<std::string>> stored_columns;
  for (const auto &row : stored_rows) {
    stored_columns[{row.table_name, row.index_name}].push_back(
        row.column_name);
  }

  // Step 2: index rows, joined with the column sequences from step 1.
  std::vector<IndexSchemaRow> index_rows;
  SCHEMATA_RETURN_IF_ERROR(
      source_->fetch_indexes(txn, namespace_filter(), &index_rows));

  IndexMap indexes;
  for (const auto &row : index_rows) {
    IndexKey key{row.table_name, row.index_name};

    IndexInfo info;
    auto cols = index_columns.find(key);
    if (cols != index_columns.end()) {
      info.columns = cols->second;
    }
    auto stored = stored_columns.find(key);
    if (stored != stored_columns.end()) {
      info.stored_columns = stored->second;
    }
    info.type = row.index_type;
    info.unique = row.is_unique;
    info.state = row.index_state;
    info.null_filtered = row.is_null_filtered;

    indexes[row.table_name][row.index_name] = std::move(info);
  }

  LOG_DEBUG("Read {} indexes ({} key column rows, {} stored column rows) in "
            "namespace {}",
            index_rows.size(), key_rows.size(), stored_rows.size(),
            namespace_.to_string());
  *out = std::move(indexes);
  return Status::Ok();
}

} // namespace schemata
