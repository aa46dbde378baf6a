#pragma once

#include "tsfilter/AST.h"
#include "tsfilter/DiagnosticEngine.h"
#include "tsfilter/Lexer.h"
#include "llvm/Support/Error.h"
#include <memory>
#include <string>
#include <vector>

namespace tsfilter {

/// Recursive descent parser for the type-declaration dialect:
///
///   module    := decl*
///   decl      := 'type' NAME params? '=' type ';'?
///   params    := '<' NAME ('extends' type)? (',' ...)* '>'
///   type      := '|'? array ('|' array)*
///   array     := primary ('[' ']')*
///   primary   := STRING | NUMBER | 'any' | 'never' | 'CHOOSE'
///              | 'LITERAL' '<' STRING ',' aliases ',' BOOL '>'
///              | NAME ('<' type (',' type)* '>')?
///              | '{' (field ((',' | ';') field)*)? (',' | ';')? '}'
///              | '(' type ')'
///   field     := NAME '?'? ':' type
///
/// The first error aborts the parse; no partial module is returned.
class Parser {
public:
  Parser(const std::vector<Token> &tokens,
         const std::vector<HintComment> &hints)
      : m_Tokens(tokens), m_Hints(hints), m_Pos(0) {}

  // Top level
  llvm::Expected<Module> parseModule();

private:
  const std::vector<Token> &m_Tokens;
  const std::vector<HintComment> &m_Hints;
  size_t m_Pos;
  size_t m_NextHint = 0;
  // Type parameters of the declaration being parsed, for ParamRef detection.
  const std::vector<TypeParam> *m_Params = nullptr;

  // Helpers
  const Token &peek() const;
  const Token &peekAt(int offset) const;
  const Token &previous() const;
  Token advance();
  bool check(TokenType type) const;
  bool match(TokenType type);
  llvm::Expected<Token> consume(TokenType type, const char *what);
  bool isParamName(const std::string &name) const;

  template <typename... Args>
  llvm::Error error(const Token &tok, DiagID id, Args &&...args) {
    return DiagnosticEngine::makeError(id, tok.Line, tok.Column,
                                       std::forward<Args>(args)...);
  }

  // Declarations
  llvm::Expected<std::shared_ptr<Declaration>> parseDeclaration();
  llvm::Error parseTypeParams(std::vector<TypeParam> &params,
                              const std::string &declName);
  void attachHints(Declaration &decl);

  // Types
  llvm::Expected<TypeRef> parseType();
  llvm::Expected<TypeRef> parseArrayType();
  llvm::Expected<TypeRef> parsePrimary();
  llvm::Expected<TypeRef> parseNamedType();
  llvm::Expected<TypeRef> parseStruct();
  llvm::Expected<TypeRef> parseTemplate();
  llvm::Error parseTypeArgs(std::vector<TypeRef> &args);
};

/// Lex and parse \p source in one step. Lexical errors surface as
/// SchemaError with ErrorKind::Syntax, like parse errors.
llvm::Expected<Module> parseSchema(const std::string &source);

} // namespace tsfilter
