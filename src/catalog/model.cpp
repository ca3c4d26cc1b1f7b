/**
 * @file model.cpp
 * @brief Model implementation
 */

#include "catalog/model.hpp"

#include <algorithm>

namespace schemata {

Model::Model(std::string table, ColumnMap schema,
             std::vector<std::string> primary_index_keys,
             TableIndexMap indexes)
    : table_(std::move(table)), schema_(std::move(schema)),
      primary_index_keys_(std::move(primary_index_keys)),
      indexes_(std::move(indexes)) {}

bool Model::has_column(const std::string &column) const {
  return schema_.find(column) != schema_.end();
}

const Field *Model::find_column(const std::string &column) const {
  auto it = schema_.find(column);
  return it != schema_.end() ? &it->second : nullptr;
}

bool Model::is_primary_key_column(const std::string &column) const {
  return std::find(primary_index_keys_.begin(), primary_index_keys_.end(),
                   column) != primary_index_keys_.end();
}

const IndexInfo *Model::find_index(const std::string &index) const {
  auto it = indexes_.find(index);
  return it != indexes_.end() ? &it->second : nullptr;
}

} // namespace schemata
