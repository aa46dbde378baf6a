#include "tsfilter/Lexer.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/ADT/StringRef.h"
#include <unordered_map>

namespace tsfilter {

static std::unordered_map<std::string, TokenType> Keywords = {
    {"type", TokenType::KwType},       {"extends", TokenType::KwExtends},
    {"any", TokenType::KwAny},         {"never", TokenType::KwNever},
    {"LITERAL", TokenType::KwLiteral}, {"CHOOSE", TokenType::KwChoose},
    {"true", TokenType::KwTrue},       {"false", TokenType::KwFalse}};

static const char HintPrefix[] = "Hint:";

Lexer::Lexer(llvm::StringRef source)
    : m_Source(source.data()), m_Current(source.data()),
      m_End(source.data() + source.size()) {}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  m_Hints.clear();
  m_TokenCount = 0;
  while (true) {
    Token t = nextToken();
    tokens.push_back(t);
    ++m_TokenCount;
    if (t.Kind == TokenType::EndOfFile || t.Kind == TokenType::Unknown)
      break;
  }
  return tokens;
}

void Lexer::recordComment(std::string body, int line) {
  llvm::StringRef text = llvm::StringRef(body).trim();
  if (!text.startswith(HintPrefix))
    return;
  text = text.drop_front(sizeof(HintPrefix) - 1).trim();
  m_Hints.push_back({text.str(), m_TokenCount, line});
}

// Returns false on an unterminated block comment.
bool Lexer::skipWhitespace() {
  while (true) {
    char c = peek();
    if (c == ' ' || c == '\r' || c == '\t' || c == '\n') {
      advance();
    } else if (c == '/' && peekNext() == '/') {
      int line = m_Line;
      advance();
      advance();
      const char *start = m_Current;
      while (peek() != '\n' && peek() != '\0')
        advance();
      recordComment(std::string(start, m_Current), line);
    } else if (c == '/' && peekNext() == '*') {
      int line = m_Line;
      advance();
      advance();
      const char *start = m_Current;
      while (!(peek() == '*' && peekNext() == '/')) {
        if (peek() == '\0')
          return false;
        advance();
      }
      std::string body(start, m_Current);
      advance();
      advance();
      recordComment(std::move(body), line);
    } else {
      break;
    }
  }
  return true;
}

Token Lexer::error(DiagID id, std::string text, int line, int col) {
  m_ErrorID = id;
  return Token{TokenType::Unknown, std::move(text), line, col};
}

Token Lexer::nextToken() {
  int line = m_Line;
  int col = m_Column;
  if (!skipWhitespace())
    return error(DiagID::ErrUnterminatedComment, "/*", line, col);

  if (peek() == '\0') {
    if (m_Current != m_End)
      return error(DiagID::ErrUnexpectedChar, "\\0", m_Line, m_Column);
    return Token{TokenType::EndOfFile, "", m_Line, m_Column};
  }

  // Numbers, including a leading minus sign
  if (isDigit(peek()) || (peek() == '-' && isDigit(peekNext())))
    return number();

  // Identifiers & Keywords
  if (isAlpha(peek()))
    return identifier();

  return punctuation();
}

Token Lexer::identifier() {
  const char *start = m_Current;
  int startCol = m_Column;
  int startLine = m_Line;

  while (isAlpha(peek()) || isDigit(peek())) {
    advance();
  }
  std::string text(start, m_Current);

  TokenType kind = TokenType::Identifier;
  auto It = Keywords.find(text);
  if (It != Keywords.end())
    kind = It->second;

  return Token{kind, text, startLine, startCol};
}

Token Lexer::number() {
  const char *start = m_Current;
  int line = m_Line;
  int col = m_Column;

  match('-');
  while (isDigit(peek()))
    advance();
  if (peek() == '.' && isDigit(peekNext())) {
    advance();
    while (isDigit(peek()))
      advance();
  }
  if (peek() == 'e' || peek() == 'E') {
    const char *save = m_Current;
    int saveCol = m_Column;
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      // Not an exponent after all; leave 'e' for the next token.
      m_Current = save;
      m_Column = saveCol;
    }
    while (isDigit(peek()))
      advance();
  }

  return Token{TokenType::Number, std::string(start, m_Current), line, col};
}

Token Lexer::punctuation() {
  int line = m_Line;
  int col = m_Column;
  char c = advance();

  switch (c) {
  case '<':
    return Token{TokenType::Less, "<", line, col};
  case '>':
    return Token{TokenType::Greater, ">", line, col};
  case '=':
    return Token{TokenType::Equal, "=", line, col};
  case ';':
    return Token{TokenType::Semicolon, ";", line, col};
  case ',':
    return Token{TokenType::Comma, ",", line, col};
  case ':':
    return Token{TokenType::Colon, ":", line, col};
  case '?':
    return Token{TokenType::Question, "?", line, col};
  case '|':
    return Token{TokenType::Pipe, "|", line, col};
  case '{':
    return Token{TokenType::LBrace, "{", line, col};
  case '}':
    return Token{TokenType::RBrace, "}", line, col};
  case '[':
    return Token{TokenType::LBracket, "[", line, col};
  case ']':
    return Token{TokenType::RBracket, "]", line, col};
  case '(':
    return Token{TokenType::LParen, "(", line, col};
  case ')':
    return Token{TokenType::RParen, ")", line, col};
  case '"':
  case '\'': {
    Token t = string(c);
    t.Line = line;
    t.Column = col;
    return t;
  }
  default:
    return error(DiagID::ErrUnexpectedChar, std::string(1, c), line, col);
  }
}

// Appends the UTF-8 encoding of a \uXXXX escape. Returns false when fewer
// than four hex digits follow.
static bool appendUnicodeEscape(const char *&cur, std::string &out) {
  unsigned code = 0;
  for (int i = 0; i < 4; ++i) {
    unsigned digit;
    if (llvm::StringRef(cur, 1).getAsInteger(16, digit))
      return false;
    code = code * 16 + digit;
    ++cur;
  }
  char buf[8];
  char *ptr = buf;
  if (!llvm::ConvertCodePointToUTF8(code, ptr))
    return false;
  out.append(buf, ptr);
  return true;
}

Token Lexer::string(char quote) {
  // Already consumed opening quote
  std::string text;
  while (peek() != quote) {
    if (peek() == '\0' || peek() == '\n')
      return error(DiagID::ErrUnterminatedString, text, m_Line, m_Column);
    char c = advance();
    if (c != '\\') {
      text += c;
      continue;
    }
    if (peek() == '\0')
      return error(DiagID::ErrUnterminatedString, text, m_Line, m_Column);
    char next = advance();
    switch (next) {
    case 'n':
      text += '\n';
      break;
    case 't':
      text += '\t';
      break;
    case 'r':
      text += '\r';
      break;
    case 'u': {
      const char *cur = m_Current;
      if (appendUnicodeEscape(cur, text)) {
        while (m_Current != cur)
          advance();
      } else {
        text += next;
      }
      break;
    }
    default:
      // \\, \", \' and anything else map to the escaped character
      text += next;
      break;
    }
  }
  advance(); // Consume closing

  return Token{TokenType::String, text, m_Line, m_Column};
}

} // namespace tsfilter
