/**
 * @file token.cpp
 * @brief DDL Lexer implementation
 */

#include "ddl/token.hpp"

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// Keyword lookup table
// ─────────────────────────────────────────────────────────────────────────────

const std::unordered_map<std::string, TokenType> Lexer::keywords_ = {
    // Statements
    {"CREATE", TokenType::CREATE},
    {"DROP", TokenType::DROP},
    {"ALTER", TokenType::ALTER},
    {"TABLE", TokenType::TABLE},
    {"INDEX", TokenType::INDEX},
    {"ADD", TokenType::ADD},
    {"COLUMN", TokenType::COLUMN},

    // Clauses
    {"PRIMARY", TokenType::PRIMARY},
    {"KEY", TokenType::KEY},
    {"UNIQUE", TokenType::UNIQUE},
    {"NULL_FILTERED", TokenType::NULL_FILTERED},
    {"ON", TokenType::ON},
    {"STORING", TokenType::STORING},
    {"NOT", TokenType::NOT},
    {"NULL", TokenType::NULL_KEYWORD},
    {"ASC", TokenType::ASC},
    {"DESC", TokenType::DESC},
    {"ARRAY", TokenType::ARRAY},
    {"MAX", TokenType::MAX},
};

const char *token_type_to_string(TokenType type) {
  switch (type) {
  case TokenType::CREATE:
    return "CREATE";
  case TokenType::DROP:
    return "DROP";
  case TokenType::ALTER:
    return "ALTER";
  case TokenType::TABLE:
    return "TABLE";
  case TokenType::INDEX:
    return "INDEX";
  case TokenType::ADD:
    return "ADD";
  case TokenType::COLUMN:
    return "COLUMN";
  case TokenType::PRIMARY:
    return "PRIMARY";
  case TokenType::KEY:
    return "KEY";
  case TokenType::UNIQUE:
    return "UNIQUE";
  case TokenType::NULL_FILTERED:
    return "NULL_FILTERED";
  case TokenType::ON:
    return "ON";
  case TokenType::STORING:
    return "STORING";
  case TokenType::NOT:
    return "NOT";
  case TokenType::NULL_KEYWORD:
    return "NULL";
  case TokenType::ASC:
    return "ASC";
  case TokenType::DESC:
    return "DESC";
  case TokenType::ARRAY:
    return "ARRAY";
  case TokenType::MAX:
    return "MAX";
  case TokenType::LPAREN:
    return "LPAREN";
  case TokenType::RPAREN:
    return "RPAREN";
  case TokenType::COMMA:
    return "COMMA";
  case TokenType::SEMICOLON:
    return "SEMICOLON";
  case TokenType::LT:
    return "LT";
  case TokenType::GT:
    return "GT";
  case TokenType::INTEGER_LITERAL:
    return "INTEGER_LITERAL";
  case TokenType::IDENTIFIER:
    return "IDENTIFIER";
  case TokenType::END_OF_FILE:
    return "END_OF_FILE";
  case TokenType::INVALID:
    return "INVALID";
  }
  return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Lexer Implementation
// ─────────────────────────────────────────────────────────────────────────────

Lexer::Lexer(std::string_view ddl) : ddl_(ddl) {}

Token Lexer::next_token() {
  // Return cached peek if available
  if (has_peeked_) {
    has_peeked_ = false;
    return std::move(peeked_token_);
  }

  skip_whitespace();

  if (pos_ >= ddl_.size()) {
    return Token(TokenType::END_OF_FILE, "", line_, column_);
  }

  char c = current_char();

  if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
    return scan_identifier_or_keyword();
  }
  if (c == '`') {
    return scan_quoted_identifier();
  }
  if (std::isdigit(static_cast<unsigned char>(c))) {
    return scan_number();
  }
  return scan_symbol();
}

Token Lexer::peek_token() {
  if (!has_peeked_) {
    peeked_token_ = next_token();
    has_peeked_ = true;
  }
  return peeked_token_;
}

char Lexer::current_char() const noexcept {
  return pos_ < ddl_.size() ? ddl_[pos_] : '\0';
}

char Lexer::peek_char(size_t offset) const noexcept {
  size_t idx = pos_ + offset;
  return idx < ddl_.size() ? ddl_[idx] : '\0';
}

void Lexer::advance() {
  if (pos_ < ddl_.size()) {
    if (ddl_[pos_] == '\n') {
      line_++;
      column_ = 1;
    } else {
      column_++;
    }
    pos_++;
  }
}

void Lexer::skip_whitespace() {
  while (pos_ < ddl_.size()) {
    char c = current_char();
    if (std::isspace(static_cast<unsigned char>(c))) {
      advance();
    } else if (c == '-' && peek_char() == '-') {
      skip_line_comment();
    } else if (c == '/' && peek_char() == '*') {
      skip_block_comment();
    } else {
      break;
    }
  }
}

void Lexer::skip_line_comment() {
  // Skip past --
  advance();
  advance();
  while (pos_ < ddl_.size() && current_char() != '\n') {
    advance();
  }
  if (pos_ < ddl_.size()) {
    advance(); // Skip the newline
  }
}

void Lexer::skip_block_comment() {
  // Skip past /*
  advance();
  advance();
  while (pos_ < ddl_.size()) {
    if (current_char() == '*' && peek_char() == '/') {
      advance();
      advance();
      break;
    }
    advance();
  }
}

Token Lexer::scan_identifier_or_keyword() {
  size_t start_col = column_;
  std::string value;

  while (pos_ < ddl_.size()) {
    char c = current_char();
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
      value += c;
      advance();
    } else {
      break;
    }
  }

  // Convert to uppercase for keyword lookup
  std::string upper = value;
  for (char &ch : upper) {
    ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
  }

  auto it = keywords_.find(upper);
  if (it != keywords_.end()) {
    return Token(it->second, value, line_, start_col);
  }

  return Token(TokenType::IDENTIFIER, value, line_, start_col);
}

Token Lexer::scan_quoted_identifier() {
  size_t start_col = column_;
  advance(); // Skip opening backquote

  std::string value;
  while (pos_ < ddl_.size() && current_char() != '`') {
    value += current_char();
    advance();
  }
  if (pos_ >= ddl_.size() || value.empty()) {
    return Token(TokenType::INVALID, "`" + value, line_, start_col);
  }
  advance(); // Skip closing backquote

  // Quoted identifiers are never keywords
  return Token(TokenType::IDENTIFIER, value, line_, start_col);
}

Token Lexer::scan_number() {
  size_t start_col = column_;
  std::string value;

  while (pos_ < ddl_.size() &&
         std::isdigit(static_cast<unsigned char>(current_char()))) {
    value += current_char();
    advance();
  }

  return Token(TokenType::INTEGER_LITERAL, value, line_, start_col);
}

Token Lexer::scan_symbol() {
  size_t start_col = column_;
  char c = current_char();
  advance();

  switch (c) {
  case '(':
    return Token(TokenType::LPAREN, "(", line_, start_col);
  case ')':
    return Token(TokenType::RPAREN, ")", line_, start_col);
  case ',':
    return Token(TokenType::COMMA, ",", line_, start_col);
  case ';':
    return Token(TokenType::SEMICOLON, ";", line_, start_col);
  case '<':
    return Token(TokenType::LT, "<", line_, start_col);
  case '>':
    return Token(TokenType::GT, ">", line_, start_col);
  default:
    return Token(TokenType::INVALID, std::string(1, c), line_, start_col);
  }
}

} // namespace schemata
