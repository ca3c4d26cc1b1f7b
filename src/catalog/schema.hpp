#pragma once

/**
 * @file schema.hpp
 * @brief Normalized schema maps folded from the catalog relations
 */

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "catalog/field.hpp"

namespace schemata {

/// column_name -> type (no ordering guarantee)
using ColumnMap = std::unordered_map<std::string, Field>;

/// table_name -> columns
using TableSchemaMap = std::unordered_map<std::string, ColumnMap>;

/**
 * @brief One index as reconstructed from the catalog
 */
struct IndexInfo {
  std::vector<std::string> columns; ///< Key columns by ascending ordinal
  std::string type;                 ///< "PRIMARY_KEY" or "INDEX"
  bool unique = false;
  std::optional<std::string> state; ///< Absent for PRIMARY_KEY
  bool null_filtered = false;
  std::vector<std::string> stored_columns; ///< Non-key (STORING) columns

  bool operator==(const IndexInfo &other) const {
    return columns == other.columns && type == other.type &&
           unique == other.unique && state == other.state &&
           null_filtered == other.null_filtered &&
           stored_columns == other.stored_columns;
  }
  bool operator!=(const IndexInfo &other) const { return !(*this == other); }
};

/// index_name -> index
using TableIndexMap = std::unordered_map<std::string, IndexInfo>;

/// table_name -> index_name -> index
using IndexMap = std::unordered_map<std::string, TableIndexMap>;

} // namespace schemata
