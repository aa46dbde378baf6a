// Copyright (c) 2025 YiZhonghua<zhyi@dpai.com>. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include "tsfilter/Token.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>
#include <string>
#include <vector>

namespace tsfilter {

class TypeExpr;

struct PrintOptions {
  /// Print templates as LITERAL<...> instead of their quoted label, so the
  /// output re-parses to identical TemplateType nodes.
  bool KeepTemplates = false;
};

/// Type expressions are immutable once built and shared between the source
/// graph and every pruned graph derived from it.
using TypeRef = std::shared_ptr<const TypeExpr>;

class TypeExpr {
public:
  enum Kind {
    Reference,
    ParamRef,
    Union,
    Struct,
    Array,
    Literal,
    Special,
    Template,
    Primitive
  };

  int Line = 0;
  int Column = 0;

  explicit TypeExpr(Kind k) : ExprKind(k) {}
  virtual ~TypeExpr() = default;

  Kind getKind() const { return ExprKind; }

  /// Compact dialect text for this expression.
  virtual void print(llvm::raw_ostream &OS,
                     const PrintOptions &Opts) const = 0;
  std::string toString(const PrintOptions &Opts = PrintOptions()) const;

  void setLocation(const Token &tok) {
    Line = tok.Line;
    Column = tok.Column;
  }

private:
  const Kind ExprKind;
};

// --- Names ---

/// Use of a declared name, possibly instantiated: Name<Args>.
class ReferenceType : public TypeExpr {
public:
  std::string Name;
  std::vector<TypeRef> Args;

  ReferenceType(std::string name, std::vector<TypeRef> args = {})
      : TypeExpr(Reference), Name(std::move(name)), Args(std::move(args)) {}
  void print(llvm::raw_ostream &OS, const PrintOptions &Opts) const override;
  static bool classof(const TypeExpr *E) { return E->getKind() == Reference; }
};

/// Use of one of the enclosing declaration's own type parameters.
class ParamRefType : public TypeExpr {
public:
  std::string Name;

  explicit ParamRefType(std::string name)
      : TypeExpr(ParamRef), Name(std::move(name)) {}
  void print(llvm::raw_ostream &OS, const PrintOptions &) const override {
    OS << Name;
  }
  static bool classof(const TypeExpr *E) { return E->getKind() == ParamRef; }
};

/// Built-in scalar types: string, number, boolean, null, undefined, unknown.
class PrimitiveType : public TypeExpr {
public:
  std::string Name;

  explicit PrimitiveType(std::string name)
      : TypeExpr(Primitive), Name(std::move(name)) {}
  void print(llvm::raw_ostream &OS, const PrintOptions &) const override {
    OS << Name;
  }
  static bool classof(const TypeExpr *E) { return E->getKind() == Primitive; }

  static bool isPrimitiveName(const std::string &name);
};

// --- Composite Types ---

class UnionType : public TypeExpr {
public:
  std::vector<TypeRef> Members; // never empty

  explicit UnionType(std::vector<TypeRef> members)
      : TypeExpr(Union), Members(std::move(members)) {}
  void print(llvm::raw_ostream &OS, const PrintOptions &Opts) const override;
  static bool classof(const TypeExpr *E) { return E->getKind() == Union; }
};

struct Field {
  std::string Name;
  bool Optional = false;
  TypeRef Type;
};

class StructType : public TypeExpr {
public:
  std::vector<Field> Fields; // unique names, source order

  explicit StructType(std::vector<Field> fields)
      : TypeExpr(Struct), Fields(std::move(fields)) {}
  void print(llvm::raw_ostream &OS, const PrintOptions &Opts) const override;
  static bool classof(const TypeExpr *E) { return E->getKind() == Struct; }
};

class ArrayType : public TypeExpr {
public:
  TypeRef Element;

  explicit ArrayType(TypeRef element)
      : TypeExpr(Array), Element(std::move(element)) {}
  void print(llvm::raw_ostream &OS, const PrintOptions &Opts) const override;
  static bool classof(const TypeExpr *E) { return E->getKind() == Array; }
};

// --- Literals ---

/// A single string literal, or a numeric literal kept verbatim.
class LiteralType : public TypeExpr {
public:
  std::string Value;
  bool IsNumeric = false;

  LiteralType(std::string value, bool numeric = false)
      : TypeExpr(Literal), Value(std::move(value)), IsNumeric(numeric) {}
  void print(llvm::raw_ostream &OS, const PrintOptions &Opts) const override;
  static bool classof(const TypeExpr *E) { return E->getKind() == Literal; }
};

class SpecialType : public TypeExpr {
public:
  enum SpecialKind { Any, Never, Choose };
  SpecialKind Which;

  explicit SpecialType(SpecialKind which) : TypeExpr(Special), Which(which) {}
  void print(llvm::raw_ostream &OS, const PrintOptions &Opts) const override;
  static bool classof(const TypeExpr *E) { return E->getKind() == Special; }

  bool isAny() const { return Which == Any; }
  bool isNever() const { return Which == Never; }
  bool isChoose() const { return Which == Choose; }
};

/// LITERAL<Label, Aliases, Pinned>: a string literal with extra search terms
/// and an explicit exemption from pruning.
class TemplateType : public TypeExpr {
public:
  std::string Label;
  std::vector<std::string> Aliases; // deduplicated, first-seen order
  bool Pinned = false;

  TemplateType(std::string label, std::vector<std::string> aliases,
               bool pinned)
      : TypeExpr(Template), Label(std::move(label)),
        Aliases(std::move(aliases)), Pinned(pinned) {}
  /// Compact form is the quoted label, exactly like a plain literal.
  void print(llvm::raw_ostream &OS, const PrintOptions &Opts) const override;
  static bool classof(const TypeExpr *E) { return E->getKind() == Template; }
};

// --- Declarations ---

struct TypeParam {
  std::string Name;
  TypeRef Constraint; // null when unconstrained
};

class Declaration {
public:
  std::string Name;
  std::vector<TypeParam> Params;
  TypeRef Body;
  std::vector<std::string> Hints; // "Hint:" comments, prefix stripped
  int Line = 0;
  int Column = 0;

  Declaration(std::string name, std::vector<TypeParam> params, TypeRef body)
      : Name(std::move(name)), Params(std::move(params)),
        Body(std::move(body)) {}

  bool isGeneric() const { return !Params.empty(); }
  int findParam(const std::string &name) const;

  /// "type Name<P extends C,...>=Body;" without hint lines.
  void print(llvm::raw_ostream &OS,
             const PrintOptions &Opts = PrintOptions()) const;
  std::string toString(const PrintOptions &Opts = PrintOptions()) const;
};

using DeclRef = std::shared_ptr<const Declaration>;

/// Parser output: declarations in source order plus hints that trail the
/// last declaration.
struct Module {
  std::vector<std::shared_ptr<Declaration>> Decls;
  std::vector<std::string> TrailingHints;
};

// --- Helpers ---

/// Double-quoted, escaped spelling of a string literal.
std::string quoteString(const std::string &value);

/// Calls \p Fn for every direct child type of \p E (union members, field
/// types, array element, reference arguments).
template <typename FnT> void forEachChild(const TypeExpr &E, FnT &&Fn) {
  switch (E.getKind()) {
  case TypeExpr::Reference:
    for (const TypeRef &Arg : llvm::cast<ReferenceType>(E).Args)
      Fn(*Arg);
    break;
  case TypeExpr::Union:
    for (const TypeRef &M : llvm::cast<UnionType>(E).Members)
      Fn(*M);
    break;
  case TypeExpr::Struct:
    for (const Field &F : llvm::cast<StructType>(E).Fields)
      Fn(*F.Type);
    break;
  case TypeExpr::Array:
    Fn(*llvm::cast<ArrayType>(E).Element);
    break;
  default:
    break;
  }
}

} // namespace tsfilter
