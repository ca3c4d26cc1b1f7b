#pragma once

/**
 * @file model.hpp
 * @brief Per-table model descriptor synthesized from the catalog
 */

#include <string>
#include <unordered_map>
#include <vector>

#include "catalog/schema.hpp"

namespace schemata {

/**
 * @brief Read-only handle over one table's metadata
 *
 * One concrete type serves every table; the table is identified by table().
 * Descriptors are built fresh on every ModelSynthesizer run and are never
 * mutated afterwards.
 */
class Model {
public:
  Model(std::string table, ColumnMap schema,
        std::vector<std::string> primary_index_keys,
        TableIndexMap indexes = {});

  /// Table name
  [[nodiscard]] const std::string &table() const noexcept { return table_; }

  /// column -> type
  [[nodiscard]] const ColumnMap &schema() const noexcept { return schema_; }

  /// Columns of the PRIMARY_KEY index in key order
  [[nodiscard]] const std::vector<std::string> &
  primary_index_keys() const noexcept {
    return primary_index_keys_;
  }

  /// Secondary indexes (PRIMARY_KEY excluded)
  [[nodiscard]] const TableIndexMap &indexes() const noexcept {
    return indexes_;
  }

  [[nodiscard]] bool has_column(const std::string &column) const;

  /// nullptr if the table has no such column
  [[nodiscard]] const Field *find_column(const std::string &column) const;

  [[nodiscard]] bool is_primary_key_column(const std::string &column) const;

  /// nullptr if the table has no such secondary index
  [[nodiscard]] const IndexInfo *find_index(const std::string &index) const;

  bool operator==(const Model &other) const {
    return table_ == other.table_ && schema_ == other.schema_ &&
           primary_index_keys_ == other.primary_index_keys_ &&
           indexes_ == other.indexes_;
  }
  bool operator!=(const Model &other) const { return !(*this == other); }

private:
  std::string table_;
  ColumnMap schema_;
  std::vector<std::string> primary_index_keys_;
  TableIndexMap indexes_;
};

/// table_name -> descriptor
using ModelMap = std::unordered_map<std::string, Model>;

} // namespace schemata
