#pragma once

#include "tsfilter/DiagnosticEngine.h"
#include "tsfilter/Token.h"
#include "llvm/ADT/StringRef.h"
#include <vector>

namespace tsfilter {

class Lexer {
public:
  // \p source must be followed by a NUL byte, as std::string and
  // MemoryBuffer contents are. A NUL inside it is a lexical error.
  Lexer(llvm::StringRef source);

  // Returns a vector of all tokens, ending in EndOfFile. A lexical error
  // stops the scan with a single Unknown token carrying the diagnostic.
  std::vector<Token> tokenize();

  // Hint comments collected by the last tokenize() call, in source order.
  const std::vector<HintComment> &getHints() const { return m_Hints; }

  // Diagnostic for the Unknown token, if tokenize() hit one.
  DiagID getErrorID() const { return m_ErrorID; }

private:
  const char *m_Source;
  const char *m_Current;
  const char *m_End;
  int m_Line = 1;
  int m_Column = 1;
  size_t m_TokenCount = 0;
  std::vector<HintComment> m_Hints;
  DiagID m_ErrorID = DiagID::NUM_DIAGNOSTICS;

  bool skipWhitespace();
  void recordComment(std::string body, int line);
  Token nextToken();
  Token identifier();
  Token number();
  Token string(char quote);
  Token punctuation();
  Token error(DiagID id, std::string text, int line, int col);

  char peek() const { return *m_Current; }
  char peekNext() const {
    if (*m_Current == '\0')
      return '\0';
    return *(m_Current + 1);
  }
  char advance() {
    char c = *m_Current;
    if (c == '\n') {
      m_Line++;
      m_Column = 1;
    } else {
      m_Column++;
    }
    m_Current++;
    return c;
  }
  bool match(char expected) {
    if (*m_Current == expected) {
      advance();
      return true;
    }
    return false;
  }

  bool isAlpha(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' ||
           c == '$';
  }
  bool isDigit(char c) { return c >= '0' && c <= '9'; }
};

} // namespace tsfilter
