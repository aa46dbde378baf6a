#include "tsfilter/Parser.h"
#include "llvm/ADT/StringSet.h"

namespace tsfilter {

// Struct keys may be spelled as any identifier-like token or a string.
static bool isFieldNameToken(TokenType kind) {
  switch (kind) {
  case TokenType::Identifier:
  case TokenType::String:
  case TokenType::KwType:
  case TokenType::KwExtends:
  case TokenType::KwAny:
  case TokenType::KwNever:
  case TokenType::KwLiteral:
  case TokenType::KwChoose:
  case TokenType::KwTrue:
  case TokenType::KwFalse:
    return true;
  default:
    return false;
  }
}

template <typename T, typename... Args>
static TypeRef makeType(const Token &tok, Args &&...args) {
  auto node = std::make_shared<T>(std::forward<Args>(args)...);
  node->setLocation(tok);
  return node;
}

llvm::Expected<TypeRef> Parser::parseType() {
  Token start = peek();
  match(TokenType::Pipe); // leading '|' is allowed

  std::vector<TypeRef> members;
  do {
    auto member = parseArrayType();
    if (!member)
      return member.takeError();
    // (A|B)|C flattens to A|B|C
    if (const auto *inner = llvm::dyn_cast<UnionType>(member->get()))
      members.insert(members.end(), inner->Members.begin(),
                     inner->Members.end());
    else
      members.push_back(std::move(*member));
  } while (match(TokenType::Pipe));

  if (members.size() == 1)
    return std::move(members.front());
  return makeType<UnionType>(start, std::move(members));
}

llvm::Expected<TypeRef> Parser::parseArrayType() {
  Token start = peek();
  auto type = parsePrimary();
  if (!type)
    return type.takeError();

  TypeRef result = std::move(*type);
  while (check(TokenType::LBracket)) {
    advance();
    auto close = consume(TokenType::RBracket, "']'");
    if (!close)
      return close.takeError();
    result = makeType<ArrayType>(start, std::move(result));
  }
  return result;
}

llvm::Expected<TypeRef> Parser::parsePrimary() {
  const Token &tok = peek();
  switch (tok.Kind) {
  case TokenType::String:
    advance();
    return makeType<LiteralType>(tok, tok.Text);
  case TokenType::Number:
    advance();
    return makeType<LiteralType>(tok, tok.Text, /*numeric=*/true);
  case TokenType::KwAny:
    advance();
    return makeType<SpecialType>(tok, SpecialType::Any);
  case TokenType::KwNever:
    advance();
    return makeType<SpecialType>(tok, SpecialType::Never);
  case TokenType::KwChoose:
    advance();
    return makeType<SpecialType>(tok, SpecialType::Choose);
  case TokenType::KwLiteral:
    return parseTemplate();
  case TokenType::Identifier:
    return parseNamedType();
  case TokenType::LBrace:
    return parseStruct();
  case TokenType::LParen: {
    advance();
    auto inner = parseType();
    if (!inner)
      return inner.takeError();
    auto close = consume(TokenType::RParen, "')'");
    if (!close)
      return close.takeError();
    return std::move(*inner);
  }
  default:
    return error(tok, DiagID::ErrExpectedType, tok.spelling());
  }
}

llvm::Error Parser::parseTypeArgs(std::vector<TypeRef> &args) {
  advance(); // '<'
  do {
    auto arg = parseType();
    if (!arg)
      return arg.takeError();
    args.push_back(std::move(*arg));
  } while (match(TokenType::Comma));

  auto close = consume(TokenType::Greater, "'>'");
  if (!close)
    return close.takeError();
  return llvm::Error::success();
}

llvm::Expected<TypeRef> Parser::parseNamedType() {
  Token name = advance();

  if (isParamName(name.Text)) {
    if (check(TokenType::Less))
      return error(peek(), DiagID::ErrParamWithArgs, name.Text);
    return makeType<ParamRefType>(name, name.Text);
  }

  if (!check(TokenType::Less) && PrimitiveType::isPrimitiveName(name.Text))
    return makeType<PrimitiveType>(name, name.Text);

  std::vector<TypeRef> args;
  if (check(TokenType::Less)) {
    if (llvm::Error err = parseTypeArgs(args))
      return std::move(err);
  }
  return makeType<ReferenceType>(name, name.Text, std::move(args));
}

llvm::Expected<TypeRef> Parser::parseStruct() {
  Token open = advance(); // '{'

  std::vector<Field> fields;
  llvm::StringSet<> seen;
  while (!check(TokenType::RBrace)) {
    if (!isFieldNameToken(peek().Kind))
      return error(peek(), DiagID::ErrExpected, "field name",
                   peek().spelling());
    Token fieldName = advance();
    if (!seen.insert(fieldName.Text).second)
      return error(fieldName, DiagID::ErrDuplicateField, fieldName.Text);

    Field field;
    field.Name = fieldName.Text;
    field.Optional = match(TokenType::Question);

    auto colon = consume(TokenType::Colon, "':' after field name");
    if (!colon)
      return colon.takeError();

    auto type = parseType();
    if (!type)
      return type.takeError();
    field.Type = std::move(*type);
    fields.push_back(std::move(field));

    // Separator is ',' or ';', optional before the closing brace.
    if (!match(TokenType::Comma) && !match(TokenType::Semicolon))
      break;
  }

  auto close = consume(TokenType::RBrace, "'}'");
  if (!close)
    return close.takeError();
  return makeType<StructType>(open, std::move(fields));
}

// LITERAL<"label", ["alias", ...], pinned>
llvm::Expected<TypeRef> Parser::parseTemplate() {
  Token kw = advance();

  auto open = consume(TokenType::Less, "'<' after LITERAL");
  if (!open)
    return open.takeError();
  auto label = consume(TokenType::String, "template label string");
  if (!label)
    return label.takeError();
  auto comma = consume(TokenType::Comma, "','");
  if (!comma)
    return comma.takeError();

  std::vector<std::string> aliases;
  llvm::StringSet<> seen;
  auto addAlias = [&](const std::string &alias) {
    if (seen.insert(alias).second)
      aliases.push_back(alias);
  };
  if (check(TokenType::String)) {
    addAlias(advance().Text);
  } else {
    auto lbr = consume(TokenType::LBracket, "alias string or '['");
    if (!lbr)
      return lbr.takeError();
    if (!check(TokenType::RBracket)) {
      do {
        auto alias = consume(TokenType::String, "alias string");
        if (!alias)
          return alias.takeError();
        addAlias(alias->Text);
      } while (match(TokenType::Comma));
    }
    auto rbr = consume(TokenType::RBracket, "']'");
    if (!rbr)
      return rbr.takeError();
  }

  comma = consume(TokenType::Comma, "','");
  if (!comma)
    return comma.takeError();

  bool pinned;
  if (match(TokenType::KwTrue))
    pinned = true;
  else if (match(TokenType::KwFalse))
    pinned = false;
  else
    return error(peek(), DiagID::ErrExpected, "'true' or 'false'",
                 peek().spelling());

  auto close = consume(TokenType::Greater, "'>'");
  if (!close)
    return close.takeError();
  return makeType<TemplateType>(kw, label->Text, std::move(aliases), pinned);
}

} // namespace tsfilter
