#pragma once

#include <string>

namespace tsfilter {

enum class TokenType {
  // End of file
  EndOfFile,
  // Lexer failure; Text holds the offending input and ErrorID is set
  Unknown,

  // Identifiers & Literals
  Identifier,
  Number,
  String,

  // Keywords
  KwType,
  KwExtends,
  KwAny,
  KwNever,
  KwLiteral, // LITERAL
  KwChoose,  // CHOOSE
  KwTrue,
  KwFalse,

  // Symbols
  Less,      // <
  Greater,   // >
  Equal,     // =
  Semicolon, // ;
  Comma,     // ,
  Colon,     // :
  Question,  // ?
  Pipe,      // |
  LBrace,
  RBrace, // { }
  LBracket,
  RBracket, // [ ]
  LParen,
  RParen // ( )
};

struct Token {
  TokenType Kind;
  std::string Text; // unescaped contents for String tokens
  int Line;
  int Column;

  std::string toString() const {
    // Debug helper
    return "Token(" + std::to_string((int)Kind) + ", " + Text + ")";
  }

  /// Source-like spelling used in "found '...'" diagnostics.
  std::string spelling() const {
    if (Kind == TokenType::EndOfFile)
      return "<eof>";
    if (Kind == TokenType::String)
      return "\"" + Text + "\"";
    return Text;
  }
};

/// A "Hint:" comment lifted out of the token stream. TokenIndex is the index
/// of the first token that follows the comment.
struct HintComment {
  std::string Text;
  size_t TokenIndex;
  int Line;
};

} // namespace tsfilter
