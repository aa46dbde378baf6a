#include "tsfilter/Parser.h"

namespace tsfilter {

const Token &Parser::peek() const {
  if (m_Pos >= m_Tokens.size())
    return m_Tokens.back(); // EOF
  return m_Tokens[m_Pos];
}

const Token &Parser::peekAt(int offset) const {
  if (m_Pos + offset >= m_Tokens.size())
    return m_Tokens.back();
  return m_Tokens[m_Pos + offset];
}

const Token &Parser::previous() const { return m_Tokens[m_Pos - 1]; }

Token Parser::advance() {
  if (m_Pos < m_Tokens.size())
    m_Pos++;
  return previous();
}

bool Parser::check(TokenType type) const {
  if (peek().Kind == TokenType::EndOfFile)
    return false;
  return peek().Kind == type;
}

bool Parser::match(TokenType type) {
  if (check(type)) {
    advance();
    return true;
  }
  return false;
}

llvm::Expected<Token> Parser::consume(TokenType type, const char *what) {
  if (check(type))
    return advance();
  return error(peek(), DiagID::ErrExpected, what, peek().spelling());
}

bool Parser::isParamName(const std::string &name) const {
  if (!m_Params)
    return false;
  for (const TypeParam &P : *m_Params)
    if (P.Name == name)
      return true;
  return false;
}

llvm::Expected<Module> Parser::parseModule() {
  Module module;
  m_NextHint = 0;

  while (peek().Kind != TokenType::EndOfFile) {
    if (!check(TokenType::KwType))
      return error(peek(), DiagID::ErrExpected, "'type'", peek().spelling());
    auto decl = parseDeclaration();
    if (!decl)
      return decl.takeError();
    module.Decls.push_back(std::move(*decl));
  }

  for (; m_NextHint < m_Hints.size(); ++m_NextHint)
    module.TrailingHints.push_back(m_Hints[m_NextHint].Text);
  return std::move(module);
}

// A hint belongs to the first declaration that ends after it.
void Parser::attachHints(Declaration &decl) {
  while (m_NextHint < m_Hints.size() &&
         m_Hints[m_NextHint].TokenIndex < m_Pos) {
    decl.Hints.push_back(m_Hints[m_NextHint].Text);
    ++m_NextHint;
  }
}

llvm::Expected<std::shared_ptr<Declaration>> Parser::parseDeclaration() {
  Token typeTok = advance(); // 'type'

  // CHOOSE may be declared explicitly, e.g. type CHOOSE="CHOOSE";
  if (!check(TokenType::Identifier) && !check(TokenType::KwChoose))
    return error(peek(), DiagID::ErrExpected, "type name", peek().spelling());
  Token name = advance();

  std::vector<TypeParam> params;
  if (check(TokenType::Less)) {
    if (llvm::Error err = parseTypeParams(params, name.Text))
      return std::move(err);
  }

  auto eq = consume(TokenType::Equal, "'='");
  if (!eq)
    return eq.takeError();

  m_Params = &params;
  auto body = parseType();
  m_Params = nullptr;
  if (!body)
    return body.takeError();

  match(TokenType::Semicolon);

  auto decl = std::make_shared<Declaration>(name.Text, std::move(params),
                                            std::move(*body));
  decl->Line = typeTok.Line;
  decl->Column = typeTok.Column;
  attachHints(*decl);
  return decl;
}

llvm::Error Parser::parseTypeParams(std::vector<TypeParam> &params,
                                    const std::string &declName) {
  advance(); // '<'
  // Constraints may mention parameters declared to their left.
  m_Params = &params;
  do {
    auto paramName = consume(TokenType::Identifier, "type parameter name");
    if (!paramName) {
      m_Params = nullptr;
      return paramName.takeError();
    }
    if (isParamName(paramName->Text)) {
      m_Params = nullptr;
      return error(*paramName, DiagID::ErrDuplicateParam, paramName->Text,
                   declName);
    }

    TypeParam param{paramName->Text, nullptr};
    if (match(TokenType::KwExtends)) {
      auto constraint = parseType();
      if (!constraint) {
        m_Params = nullptr;
        return constraint.takeError();
      }
      param.Constraint = std::move(*constraint);
    }
    params.push_back(std::move(param));
  } while (match(TokenType::Comma));
  m_Params = nullptr;

  auto close = consume(TokenType::Greater, "'>'");
  if (!close)
    return close.takeError();
  return llvm::Error::success();
}

llvm::Expected<Module> parseSchema(const std::string &source) {
  Lexer lexer(source);
  std::vector<Token> tokens = lexer.tokenize();
  const Token &last = tokens.back();
  if (last.Kind == TokenType::Unknown)
    return DiagnosticEngine::makeError(lexer.getErrorID(), last.Line,
                                       last.Column, last.Text);

  Parser parser(tokens, lexer.getHints());
  return parser.parseModule();
}

} // namespace tsfilter
