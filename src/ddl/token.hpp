#pragma once

/**
 * @file token.hpp
 * @brief DDL Tokenizer/Lexer
 *
 * Converts DDL text into tokens: keywords, identifiers (plain or
 * back-quoted), integer literals and the symbols used by column and key
 * definitions.
 */

#include <cctype>
#include <string>
#include <string_view>
#include <unordered_map>

namespace schemata {

// ─────────────────────────────────────────────────────────────────────────────
// Token Types
// ─────────────────────────────────────────────────────────────────────────────

enum class TokenType {
  // Keywords - statements
  CREATE,
  DROP,
  ALTER,
  TABLE,
  INDEX,
  ADD,
  COLUMN,

  // Keywords - clauses
  PRIMARY,
  KEY,
  UNIQUE,
  NULL_FILTERED,
  ON,
  STORING,
  NOT,
  NULL_KEYWORD,
  ASC,
  DESC,
  ARRAY,
  MAX,

  // Symbols
  LPAREN,    // (
  RPAREN,    // )
  COMMA,     // ,
  SEMICOLON, // ;
  LT,        // <
  GT,        // >

  // Literals
  INTEGER_LITERAL,

  // Identifier
  IDENTIFIER,

  // Special
  END_OF_FILE,
  INVALID,
};

/**
 * @brief Convert token type to string for debugging
 */
[[nodiscard]] const char *token_type_to_string(TokenType type);

// ─────────────────────────────────────────────────────────────────────────────
// Token
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief A single token from the DDL input
 */
struct Token {
  TokenType type = TokenType::INVALID;
  std::string value; // The actual text of the token
  size_t line = 1;   // Line number (1-indexed)
  size_t column = 1; // Column number (1-indexed)

  Token() = default;
  Token(TokenType t, std::string v, size_t l = 1, size_t c = 1)
      : type(t), value(std::move(v)), line(l), column(c) {}

  [[nodiscard]] bool is(TokenType t) const noexcept { return type == t; }

  [[nodiscard]] bool is_keyword() const noexcept {
    return type >= TokenType::CREATE && type <= TokenType::MAX;
  }

  [[nodiscard]] bool is_eof() const noexcept {
    return type == TokenType::END_OF_FILE;
  }
};

// ─────────────────────────────────────────────────────────────────────────────
// Lexer
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief DDL Lexer - converts DDL text into a stream of tokens
 *
 * Usage:
 *   Lexer lexer("DROP INDEX UsersByName");
 *   Token token = lexer.next_token();
 *   while (!token.is_eof()) {
 *       // process token
 *       token = lexer.next_token();
 *   }
 */
class Lexer {
public:
  explicit Lexer(std::string_view ddl);

  /**
   * @brief Get the next token and advance
   */
  Token next_token();

  /**
   * @brief Peek at the next token without consuming it
   */
  Token peek_token();

private:
  // Character navigation
  [[nodiscard]] char current_char() const noexcept;
  [[nodiscard]] char peek_char(size_t offset = 1) const noexcept;
  void advance();
  void skip_whitespace();
  void skip_line_comment();
  void skip_block_comment();

  // Token scanners
  Token scan_identifier_or_keyword();
  Token scan_quoted_identifier();
  Token scan_number();
  Token scan_symbol();

  std::string ddl_;
  size_t pos_ = 0;
  size_t line_ = 1;
  size_t column_ = 1;

  // Cached peek token
  bool has_peeked_ = false;
  Token peeked_token_;

  // Keyword lookup table
  static const std::unordered_map<std::string, TokenType> keywords_;
};

} // namespace schemata
