#pragma once

/**
 * @file ddl_parser.hpp
 * @brief DDL Parser - recursive descent parser for schema statements
 *
 * Supports:
 * - CREATE TABLE t (c TYPE [NOT NULL], ...) PRIMARY KEY (c [ASC|DESC], ...)
 * - DROP TABLE t
 * - ALTER TABLE t ADD COLUMN c TYPE [NOT NULL]
 * - ALTER TABLE t ALTER COLUMN c TYPE [NOT NULL]
 * - ALTER TABLE t DROP COLUMN c
 * - CREATE [UNIQUE] [NULL_FILTERED] INDEX i ON t (c, ...) [STORING (c, ...)]
 * - DROP INDEX i
 *
 * Types: BOOL, INT64, FLOAT64, STRING(n|MAX), BYTES(n|MAX), TIMESTAMP, DATE
 * and ARRAY<...> of any of those.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "common/status.hpp"
#include "ddl/ddl_statement.hpp"
#include "ddl/token.hpp"

namespace schemata {

/**
 * @brief Parse error information
 */
struct ParseError {
  std::string message;
  size_t line = 0;
  size_t column = 0;

  [[nodiscard]] std::string to_string() const {
    return "Parse error at line " + std::to_string(line) + ", column " +
           std::to_string(column) + ": " + message;
  }
};

/**
 * @brief DDL Parser - converts one DDL statement to an AST
 *
 * Usage:
 *   DdlParser parser("ALTER TABLE Users DROP COLUMN email");
 *   std::unique_ptr<DdlStatement> stmt;
 *   auto status = parser.parse(&stmt);
 */
class DdlParser {
public:
  explicit DdlParser(std::string_view ddl);

  /**
   * @brief Parse the input; a single trailing semicolon is allowed
   */
  [[nodiscard]] Status parse(std::unique_ptr<DdlStatement> *result);

  [[nodiscard]] const ParseError &error() const noexcept { return error_; }

private:
  // ─────────────────────────────────────────────────────────────────────────
  // Statement Parsing
  // ─────────────────────────────────────────────────────────────────────────

  std::unique_ptr<DdlStatement> parse_statement();
  std::unique_ptr<CreateTableStatement> parse_create_table();
  std::unique_ptr<CreateIndexStatement> parse_create_index();
  std::unique_ptr<DropTableStatement> parse_drop_table();
  std::unique_ptr<DropIndexStatement> parse_drop_index();
  std::unique_ptr<AlterTableStatement> parse_alter_table();

  // ─────────────────────────────────────────────────────────────────────────
  // Clause Parsing
  // ─────────────────────────────────────────────────────────────────────────

  bool parse_column_def(ColumnDef *column);
  bool parse_type(bool *array, FieldType *type, std::optional<int64_t> *length);
  bool parse_scalar_type(FieldType *type, std::optional<int64_t> *length);
  bool parse_key_list(std::vector<KeyPart> *parts);
  bool parse_name_list(std::vector<std::string> *names);
  bool parse_identifier(const char *what, std::string *name);

  // ─────────────────────────────────────────────────────────────────────────
  // Helpers
  // ─────────────────────────────────────────────────────────────────────────

  // Token navigation
  void advance();
  bool check(TokenType type);
  bool match(TokenType type);
  bool expect(TokenType type, const std::string &msg);

  // Error handling
  void set_error(const std::string &message);

  Lexer lexer_;
  Token current_;
  ParseError error_;
  bool has_error_ = false;
};

} // namespace schemata
