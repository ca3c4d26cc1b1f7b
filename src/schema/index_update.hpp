#pragma once

/**
 * @file index_update.hpp
 * @brief Schema changes to the secondary indexes of an existing table
 */

#include <string>
#include <vector>

#include "schema/schema_update.hpp"

namespace schemata {

/**
 * @brief Base of all index-level changes
 */
class IndexUpdate : public SchemaUpdate {
public:
  IndexUpdate(std::string table, std::string index)
      : SchemaUpdate(SchemaUpdateKind::INDEX, std::move(table)),
        index_(std::move(index)) {}

  [[nodiscard]] const std::string &index() const noexcept { return index_; }

private:
  std::string index_;
};

/**
 * @brief Optional clauses of CREATE INDEX
 */
struct CreateIndexOptions {
  bool unique = false;
  bool null_filtered = false;
  std::vector<std::string> storing; ///< STORING columns
};

/**
 * @brief CREATE [UNIQUE] [NULL_FILTERED] INDEX i ON t (...) [STORING (...)]
 */
class CreateIndex : public IndexUpdate {
public:
  using Options = CreateIndexOptions;

  CreateIndex(std::string table, std::string index,
              std::vector<std::string> columns, Options options = {})
      : IndexUpdate(std::move(table), std::move(index)),
        columns_(std::move(columns)), options_(std::move(options)) {}

  [[nodiscard]] const std::vector<std::string> &columns() const noexcept {
    return columns_;
  }
  [[nodiscard]] const Options &options() const noexcept { return options_; }

  [[nodiscard]] Status validate(const Model *model) const override;
  [[nodiscard]] Status validate_names(const ModelMap &models) const override;
  [[nodiscard]] std::string ddl(const Model *model) const override;

private:
  std::vector<std::string> columns_;
  Options options_;
};

/**
 * @brief DROP INDEX i
 */
class DropIndex : public IndexUpdate {
public:
  DropIndex(std::string table, std::string index)
      : IndexUpdate(std::move(table), std::move(index)) {}

  [[nodiscard]] Status validate(const Model *model) const override;
  [[nodiscard]] std::string ddl(const Model *model) const override;
};

} // namespace schemata
