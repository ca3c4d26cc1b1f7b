/**
 * @file ddl_parser.cpp
 * @brief Recursive descent DDL parser implementation
 */

#include "ddl/ddl_parser.hpp"

#include <cctype>
#include <charconv>

namespace schemata {

DdlParser::DdlParser(std::string_view ddl)
    : lexer_(ddl), current_(lexer_.next_token()) {}

Status DdlParser::parse(std::unique_ptr<DdlStatement> *result) {
  if (result == nullptr) {
    return Status::InvalidArgument("Result pointer cannot be null");
  }

  has_error_ = false;
  auto stmt = parse_statement();

  if (!has_error_) {
    match(TokenType::SEMICOLON);
    if (!check(TokenType::END_OF_FILE)) {
      set_error("Unexpected trailing input '" + current_.value + "'");
    }
  }

  if (has_error_) {
    return Status::InvalidArgument(error_.to_string());
  }

  *result = std::move(stmt);
  return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Token Helpers
// ─────────────────────────────────────────────────────────────────────────────

void DdlParser::advance() { current_ = lexer_.next_token(); }

bool DdlParser::check(TokenType type) { return current_.type == type; }

bool DdlParser::match(TokenType type) {
  if (check(type)) {
    advance();
    return true;
  }
  return false;
}

bool DdlParser::expect(TokenType type, const std::string &msg) {
  if (!match(type)) {
    set_error(msg + " (got: " +
              std::string(token_type_to_string(current_.type)) + ")");
    return false;
  }
  return true;
}

void DdlParser::set_error(const std::string &message) {
  if (!has_error_) {
    has_error_ = true;
    error_.message = message;
    error_.line = current_.line;
    error_.column = current_.column;
  }
}

// ─────────────────────────────────────────────────────────────────────────────
// Statement Parsing
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<DdlStatement> DdlParser::parse_statement() {
  if (match(TokenType::CREATE)) {
    if (check(TokenType::TABLE)) {
      return parse_create_table();
    }
    if (check(TokenType::UNIQUE) || check(TokenType::NULL_FILTERED) ||
        check(TokenType::INDEX)) {
      return parse_create_index();
    }
    set_error("Expected TABLE or INDEX after CREATE");
    return nullptr;
  }
  if (match(TokenType::DROP)) {
    if (check(TokenType::TABLE)) {
      return parse_drop_table();
    }
    if (check(TokenType::INDEX)) {
      return parse_drop_index();
    }
    set_error("Expected TABLE or INDEX after DROP");
    return nullptr;
  }
  if (match(TokenType::ALTER)) {
    return parse_alter_table();
  }

  set_error("Expected statement (CREATE, ALTER, DROP)");
  return nullptr;
}

std::unique_ptr<CreateTableStatement> DdlParser::parse_create_table() {
  auto stmt = std::make_unique<CreateTableStatement>();
  expect(TokenType::TABLE, "Expected TABLE");

  if (!parse_identifier("table name", &stmt->table_name)) {
    return nullptr;
  }

  if (!expect(TokenType::LPAREN, "Expected ( after table name")) {
    return nullptr;
  }
  // Column list; a trailing comma before ) is allowed
  while (!check(TokenType::RPAREN)) {
    ColumnDef column;
    if (!parse_column_def(&column)) {
      return nullptr;
    }
    stmt->columns.push_back(std::move(column));
    if (!match(TokenType::COMMA)) {
      break;
    }
  }
  if (!expect(TokenType::RPAREN, "Expected ) after column definitions")) {
    return nullptr;
  }
  if (stmt->columns.empty()) {
    set_error("CREATE TABLE requires at least one column");
    return nullptr;
  }

  if (!expect(TokenType::PRIMARY, "Expected PRIMARY KEY") ||
      !expect(TokenType::KEY, "Expected KEY after PRIMARY")) {
    return nullptr;
  }
  if (!parse_key_list(&stmt->primary_key)) {
    return nullptr;
  }

  return stmt;
}

std::unique_ptr<CreateIndexStatement> DdlParser::parse_create_index() {
  auto stmt = std::make_unique<CreateIndexStatement>();

  if (match(TokenType::UNIQUE)) {
    stmt->unique = true;
  }
  if (match(TokenType::NULL_FILTERED)) {
    stmt->null_filtered = true;
  }
  if (!expect(TokenType::INDEX, "Expected INDEX")) {
    return nullptr;
  }
  if (!parse_identifier("index name", &stmt->index_name)) {
    return nullptr;
  }
  if (!expect(TokenType::ON, "Expected ON after index name")) {
    return nullptr;
  }
  if (!parse_identifier("table name", &stmt->table_name)) {
    return nullptr;
  }
  if (!parse_key_list(&stmt->columns)) {
    return nullptr;
  }

  if (match(TokenType::STORING)) {
    if (!parse_name_list(&stmt->storing)) {
      return nullptr;
    }
  }

  return stmt;
}

std::unique_ptr<DropTableStatement> DdlParser::parse_drop_table() {
  auto stmt = std::make_unique<DropTableStatement>();
  expect(TokenType::TABLE, "Expected TABLE");
  if (!parse_identifier("table name", &stmt->table_name)) {
    return nullptr;
  }
  return stmt;
}

std::unique_ptr<DropIndexStatement> DdlParser::parse_drop_index() {
  auto stmt = std::make_unique<DropIndexStatement>();
  expect(TokenType::INDEX, "Expected INDEX");
  if (!parse_identifier("index name", &stmt->index_name)) {
    return nullptr;
  }
  return stmt;
}

std::unique_ptr<AlterTableStatement> DdlParser::parse_alter_table() {
  auto stmt = std::make_unique<AlterTableStatement>();
  if (!expect(TokenType::TABLE, "Expected TABLE after ALTER")) {
    return nullptr;
  }
  if (!parse_identifier("table name", &stmt->table_name)) {
    return nullptr;
  }

  if (match(TokenType::ADD)) {
    stmt->action = AlterAction::ADD_COLUMN;
  } else if (match(TokenType::ALTER)) {
    stmt->action = AlterAction::ALTER_COLUMN;
  } else if (match(TokenType::DROP)) {
    stmt->action = AlterAction::DROP_COLUMN;
  } else {
    set_error("Expected ADD, ALTER or DROP after table name");
    return nullptr;
  }
  if (!expect(TokenType::COLUMN, "Expected COLUMN")) {
    return nullptr;
  }

  if (stmt->action == AlterAction::DROP_COLUMN) {
    if (!parse_identifier("column name", &stmt->column.name)) {
      return nullptr;
    }
    return stmt;
  }

  if (!parse_column_def(&stmt->column)) {
    return nullptr;
  }
  return stmt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Clause Parsing
// ─────────────────────────────────────────────────────────────────────────────

bool DdlParser::parse_column_def(ColumnDef *column) {
  if (!parse_identifier("column name", &column->name)) {
    return false;
  }

  bool array = false;
  FieldType type = FieldType::INVALID;
  std::optional<int64_t> length;
  if (!parse_type(&array, &type, &length)) {
    return false;
  }

  bool nullable = true;
  if (match(TokenType::NOT)) {
    if (!expect(TokenType::NULL_KEYWORD, "Expected NULL after NOT")) {
      return false;
    }
    nullable = false;
  }

  column->field = Field(type, nullable, array, length);
  return true;
}

bool DdlParser::parse_type(bool *array, FieldType *type,
                           std::optional<int64_t> *length) {
  if (match(TokenType::ARRAY)) {
    if (!expect(TokenType::LT, "Expected < after ARRAY")) {
      return false;
    }
    if (!parse_scalar_type(type, length)) {
      return false;
    }
    if (!expect(TokenType::GT, "Expected > to close ARRAY")) {
      return false;
    }
    *array = true;
    return true;
  }

  *array = false;
  return parse_scalar_type(type, length);
}

bool DdlParser::parse_scalar_type(FieldType *type,
                                  std::optional<int64_t> *length) {
  if (!check(TokenType::IDENTIFIER)) {
    set_error("Expected column type");
    return false;
  }

  std::string upper = current_.value;
  for (char &ch : upper) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }

  *type = FieldType::INVALID;
  *length = std::nullopt;
  for (FieldType candidate :
       {FieldType::BOOL, FieldType::INT64, FieldType::FLOAT64,
        FieldType::STRING, FieldType::BYTES, FieldType::TIMESTAMP,
        FieldType::DATE}) {
    if (field_type_name(candidate) == upper) {
      *type = candidate;
      break;
    }
  }
  if (*type == FieldType::INVALID) {
    set_error("Unknown column type '" + current_.value + "'");
    return false;
  }
  advance();

  if (!is_sized(*type)) {
    return true;
  }

  // STRING and BYTES require a length: (n) or (MAX)
  if (!expect(TokenType::LPAREN, "Expected ( after " + upper)) {
    return false;
  }
  if (check(TokenType::INTEGER_LITERAL)) {
    const std::string &digits = current_.value;
    int64_t value = 0;
    auto [end, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || end != digits.data() + digits.size() ||
        value <= 0) {
      set_error("Length must be a positive integer");
      return false;
    }
    *length = value;
    advance();
  } else if (!match(TokenType::MAX)) {
    set_error("Expected length or MAX");
    return false;
  }
  return expect(TokenType::RPAREN, "Expected ) after length");
}

bool DdlParser::parse_key_list(std::vector<KeyPart> *parts) {
  if (!expect(TokenType::LPAREN, "Expected (")) {
    return false;
  }
  do {
    KeyPart part;
    if (!parse_identifier("key column", &part.column)) {
      return false;
    }
    if (match(TokenType::DESC)) {
      part.descending = true;
    } else {
      match(TokenType::ASC);
    }
    parts->push_back(std::move(part));
  } while (match(TokenType::COMMA));
  return expect(TokenType::RPAREN, "Expected )");
}

bool DdlParser::parse_name_list(std::vector<std::string> *names) {
  if (!expect(TokenType::LPAREN, "Expected (")) {
    return false;
  }
  do {
    std::string name;
    if (!parse_identifier("column name", &name)) {
      return false;
    }
    names->push_back(std::move(name));
  } while (match(TokenType::COMMA));
  return expect(TokenType::RPAREN, "Expected )");
}

bool DdlParser::parse_identifier(const char *what, std::string *name) {
  if (!check(TokenType::IDENTIFIER)) {
    set_error(std::string("Expected ") + what);
    return false;
  }
  *name = current_.value;
  advance();
  return true;
}

} // namespace schemata
