#pragma once

#include "tsfilter/DiagnosticEngine.h"
#include "tsfilter/Printer.h"
#include "tsfilter/Sema.h"
#include "llvm/ADT/Optional.h"
#include "llvm/Support/JSON.h"
#include "gtest/gtest.h"
#include <string>
#include <vector>

namespace tsfilter {
namespace testutil {

inline TypeGraph load(const std::string &Source) {
  auto G = loadSchema(Source);
  if (!G) {
    ADD_FAILURE() << llvm::toString(G.takeError());
    return TypeGraph();
  }
  return std::move(*G);
}

/// Kind of the error in \p E, consuming it. Syntax when E is not a
/// SchemaError.
inline ErrorKind errorKind(llvm::Error E) {
  ErrorKind Kind = ErrorKind::Syntax;
  llvm::handleAllErrors(
      std::move(E), [&](const SchemaError &SE) { Kind = SE.kind(); },
      [&](const llvm::ErrorInfoBase &EI) {
        ADD_FAILURE() << "unexpected error: " << EI.message();
      });
  return Kind;
}

inline std::string printGraph(const TypeGraph &G,
                              PrintOptions Opts = PrintOptions()) {
  std::string Out;
  llvm::raw_string_ostream OS(Out);
  SchemaPrinter(OS, Opts).printModule(G);
  return OS.str();
}

// --- Values ---
//
// A tiny model of "a value of this type" over llvm::json::Value, enough to
// check that pruning only ever removes alternatives.

/// Type arguments in scope while walking a generic body.
struct Binding {
  const Declaration *Decl = nullptr;
  const std::vector<TypeRef> *Args = nullptr;
  const Binding *Outer = nullptr;
};

const int MaxSampleDepth = 24;
// Pruned and compressed schemas nest less deeply than their source.
const int MaxAcceptDepth = 4 * MaxSampleDepth;

inline bool accepts(const TypeGraph &G, const TypeExpr &T,
                    const llvm::json::Value &V, const Binding *Env,
                    int Depth = 0) {
  if (Depth > MaxAcceptDepth)
    return false;

  switch (T.getKind()) {
  case TypeExpr::Literal: {
    const auto &Lit = llvm::cast<LiteralType>(T);
    if (!Lit.IsNumeric)
      return V.getAsString() && *V.getAsString() == Lit.Value;
    double Want;
    return !llvm::StringRef(Lit.Value).getAsDouble(Want) && V.getAsNumber() &&
           *V.getAsNumber() == Want;
  }
  case TypeExpr::Template:
    return V.getAsString() &&
           *V.getAsString() == llvm::cast<TemplateType>(T).Label;
  case TypeExpr::Primitive: {
    const std::string &Name = llvm::cast<PrimitiveType>(T).Name;
    if (Name == "string")
      return V.getAsString().hasValue();
    if (Name == "number")
      return V.getAsNumber().hasValue();
    if (Name == "boolean")
      return V.getAsBoolean().hasValue();
    if (Name == "null" || Name == "undefined")
      return V.getAsNull().hasValue();
    return true; // unknown
  }
  case TypeExpr::Special: {
    const auto &S = llvm::cast<SpecialType>(T);
    if (S.isAny())
      return true;
    if (S.isNever())
      return false;
    return V.getAsString() && *V.getAsString() == "CHOOSE";
  }
  case TypeExpr::Union:
    for (const TypeRef &M : llvm::cast<UnionType>(T).Members)
      if (accepts(G, *M, V, Env, Depth + 1))
        return true;
    return false;
  case TypeExpr::Struct: {
    const llvm::json::Object *O = V.getAsObject();
    if (!O)
      return false;
    const auto &St = llvm::cast<StructType>(T);
    for (const auto &Entry : *O) {
      bool Known = false;
      for (const Field &F : St.Fields)
        Known = Known || llvm::StringRef(Entry.first) == F.Name;
      if (!Known)
        return false;
    }
    for (const Field &F : St.Fields) {
      const llvm::json::Value *FV = O->get(F.Name);
      if (!FV) {
        if (!F.Optional)
          return false;
        continue;
      }
      if (!accepts(G, *F.Type, *FV, Env, Depth + 1))
        return false;
    }
    return true;
  }
  case TypeExpr::Array: {
    const llvm::json::Array *A = V.getAsArray();
    if (!A)
      return false;
    for (const llvm::json::Value &Elt : *A)
      if (!accepts(G, *llvm::cast<ArrayType>(T).Element, Elt, Env, Depth + 1))
        return false;
    return true;
  }
  case TypeExpr::ParamRef: {
    if (!Env)
      return false;
    int Idx = Env->Decl->findParam(llvm::cast<ParamRefType>(T).Name);
    if (Idx < 0)
      return false;
    return accepts(G, *(*Env->Args)[Idx], V, Env->Outer, Depth + 1);
  }
  case TypeExpr::Reference: {
    const auto &Ref = llvm::cast<ReferenceType>(T);
    const Declaration *D = G.lookup(Ref.Name);
    if (!D)
      return false;
    Binding Inner{D, &Ref.Args, Env};
    return accepts(G, *D->Body, V, &Inner, Depth + 1);
  }
  }
  return false;
}

/// One value of \p T, steered by \p Seed. None when the walk found no value
/// within the depth limit.
inline llvm::Optional<llvm::json::Value>
sample(const TypeGraph &G, const TypeExpr &T, const Binding *Env,
       unsigned &Seed, int Depth = 0) {
  if (Depth > MaxSampleDepth)
    return llvm::None;

  switch (T.getKind()) {
  case TypeExpr::Literal: {
    const auto &Lit = llvm::cast<LiteralType>(T);
    if (!Lit.IsNumeric)
      return llvm::json::Value(Lit.Value);
    double D = 0;
    if (llvm::StringRef(Lit.Value).getAsDouble(D))
      return llvm::None;
    return llvm::json::Value(D);
  }
  case TypeExpr::Template:
    return llvm::json::Value(llvm::cast<TemplateType>(T).Label);
  case TypeExpr::Primitive: {
    const std::string &Name = llvm::cast<PrimitiveType>(T).Name;
    if (Name == "number")
      return llvm::json::Value(42);
    if (Name == "boolean")
      return llvm::json::Value(true);
    if (Name == "null" || Name == "undefined")
      return llvm::json::Value(nullptr);
    return llvm::json::Value("text");
  }
  case TypeExpr::Special: {
    const auto &S = llvm::cast<SpecialType>(T);
    if (S.isNever())
      return llvm::None;
    if (S.isChoose())
      return llvm::json::Value("CHOOSE");
    return llvm::json::Value("anything");
  }
  case TypeExpr::Union: {
    const auto &Members = llvm::cast<UnionType>(T).Members;
    unsigned Start = Seed++ % Members.size();
    for (unsigned I = 0; I < Members.size(); ++I) {
      const TypeExpr &M = *Members[(Start + I) % Members.size()];
      if (auto V = sample(G, M, Env, Seed, Depth + 1))
        return V;
    }
    return llvm::None;
  }
  case TypeExpr::Struct: {
    llvm::json::Object O;
    for (const Field &F : llvm::cast<StructType>(T).Fields) {
      if (F.Optional && (Seed++ % 2 == 0))
        continue;
      auto V = sample(G, *F.Type, Env, Seed, Depth + 1);
      if (!V) {
        if (F.Optional)
          continue;
        return llvm::None;
      }
      O[F.Name] = std::move(*V);
    }
    return llvm::json::Value(std::move(O));
  }
  case TypeExpr::Array: {
    llvm::json::Array A;
    if (auto V = sample(G, *llvm::cast<ArrayType>(T).Element, Env, Seed,
                        Depth + 1))
      A.push_back(std::move(*V));
    return llvm::json::Value(std::move(A));
  }
  case TypeExpr::ParamRef: {
    if (!Env)
      return llvm::None;
    int Idx = Env->Decl->findParam(llvm::cast<ParamRefType>(T).Name);
    if (Idx < 0)
      return llvm::None;
    return sample(G, *(*Env->Args)[Idx], Env->Outer, Seed, Depth + 1);
  }
  case TypeExpr::Reference: {
    const auto &Ref = llvm::cast<ReferenceType>(T);
    const Declaration *D = G.lookup(Ref.Name);
    if (!D)
      return llvm::None;
    Binding Inner{D, &Ref.Args, Env};
    return sample(G, *D->Body, &Inner, Seed, Depth + 1);
  }
  }
  return llvm::None;
}

/// Sample of declaration \p Root, which must not be generic.
inline llvm::Optional<llvm::json::Value>
sampleDecl(const TypeGraph &G, llvm::StringRef Root, unsigned Seed) {
  const Declaration *D = G.lookup(Root);
  if (!D)
    return llvm::None;
  return sample(G, *D->Body, nullptr, Seed);
}

inline bool acceptsDecl(const TypeGraph &G, llvm::StringRef Root,
                        const llvm::json::Value &V) {
  const Declaration *D = G.lookup(Root);
  return D && accepts(G, *D->Body, V, nullptr);
}

} // namespace testutil
} // namespace tsfilter
