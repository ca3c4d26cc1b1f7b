#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for Schemata
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace schemata {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Catalog Namespace
// ─────────────────────────────────────────────────────────────────────────────

/// TABLE_CATALOG value of user tables (empty means the default catalog)
constexpr const char* kDefaultTableCatalog = "";

/// TABLE_SCHEMA value of user tables (empty means the unqualified schema)
constexpr const char* kDefaultTableSchema = "";

/// Schema holding the catalog relations themselves
constexpr const char* kInformationSchema = "INFORMATION_SCHEMA";

// ─────────────────────────────────────────────────────────────────────────────
// Index Naming
// ─────────────────────────────────────────────────────────────────────────────

/// Reserved index name (and index type) of every table's primary key
constexpr const char* kPrimaryKeyIndexName = "PRIMARY_KEY";

/// Index type of secondary indexes
constexpr const char* kSecondaryIndexType = "INDEX";

/// Index state of a secondary index that is fully built
constexpr const char* kIndexStateReadWrite = "READ_WRITE";

/// Maximum length of a table, column or index name
constexpr size_t kMaxIdentifierLength = 128;

// ─────────────────────────────────────────────────────────────────────────────
// Catalog Relations
// ─────────────────────────────────────────────────────────────────────────────

constexpr const char* kColumnsRelation = "information_schema.columns";
constexpr const char* kIndexesRelation = "information_schema.indexes";
constexpr const char* kIndexColumnsRelation = "information_schema.index_columns";

// ─────────────────────────────────────────────────────────────────────────────
// Catalog Column Names
// ─────────────────────────────────────────────────────────────────────────────

constexpr const char* kTableCatalogColumn = "TABLE_CATALOG";
constexpr const char* kTableSchemaColumn = "TABLE_SCHEMA";
constexpr const char* kTableNameColumn = "TABLE_NAME";
constexpr const char* kColumnNameColumn = "COLUMN_NAME";
constexpr const char* kIndexNameColumn = "INDEX_NAME";
constexpr const char* kOrdinalPositionColumn = "ORDINAL_POSITION";

// ─────────────────────────────────────────────────────────────────────────────
// Emulator
// ─────────────────────────────────────────────────────────────────────────────

/// Version of the empty schema an emulated database starts from
constexpr uint64_t kInitialSchemaVersion = 1;

/// Schema versions an emulated database keeps readable by default
constexpr size_t kMaxRetainedSchemaVersions = 64;

/// Prefix of emulated schema-update operation names
constexpr const char* kOperationNamePrefix = "operations/schema_update_";

}  // namespace config

// ─────────────────────────────────────────────────────────────────────────────
// CatalogNamespace - runtime namespace filter
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Catalog/schema pair used to filter the catalog relations
 *
 * Defaults to the unqualified namespace. Deployments with another naming
 * convention substitute their own values.
 */
struct CatalogNamespace {
    std::string table_catalog = config::kDefaultTableCatalog;
    std::string table_schema = config::kDefaultTableSchema;

    [[nodiscard]] bool is_default() const noexcept;

    /// "catalog.schema" with empty parts shown as <default>
    [[nodiscard]] std::string to_string() const;
};

}  // namespace schemata
