#include "tsfilter/TypeFilter.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "tsfilter-prune"

namespace tsfilter {

namespace {
using RewriteFn = llvm::function_ref<TypeRef(const TypeExpr &)>;
} // namespace

static TypeRef withLocation(std::shared_ptr<TypeExpr> Node,
                            const TypeExpr &From) {
  Node->Line = From.Line;
  Node->Column = From.Column;
  return Node;
}

/// Rebuild \p E, letting \p Fn replace any node by returning non-null.
/// Replacements are not descended into. A union spliced into a union is
/// flattened.
static TypeRef rewriteType(const TypeRef &E, RewriteFn Fn) {
  if (TypeRef R = Fn(*E))
    return R;

  switch (E->getKind()) {
  case TypeExpr::Reference: {
    const auto &Ref = llvm::cast<ReferenceType>(*E);
    std::vector<TypeRef> Args;
    bool Changed = false;
    for (const TypeRef &Arg : Ref.Args) {
      Args.push_back(rewriteType(Arg, Fn));
      Changed |= Args.back() != Arg;
    }
    if (!Changed)
      return E;
    return withLocation(
        std::make_shared<ReferenceType>(Ref.Name, std::move(Args)), *E);
  }
  case TypeExpr::Union: {
    const auto &U = llvm::cast<UnionType>(*E);
    std::vector<TypeRef> Members;
    bool Changed = false;
    for (const TypeRef &M : U.Members) {
      TypeRef NewM = rewriteType(M, Fn);
      if (NewM == M) {
        Members.push_back(M);
        continue;
      }
      Changed = true;
      if (const auto *Inner = llvm::dyn_cast<UnionType>(NewM.get()))
        Members.insert(Members.end(), Inner->Members.begin(),
                       Inner->Members.end());
      else
        Members.push_back(std::move(NewM));
    }
    if (!Changed)
      return E;
    return withLocation(std::make_shared<UnionType>(std::move(Members)), *E);
  }
  case TypeExpr::Struct: {
    const auto &St = llvm::cast<StructType>(*E);
    std::vector<Field> Fields;
    bool Changed = false;
    for (const Field &F : St.Fields) {
      TypeRef NewType = rewriteType(F.Type, Fn);
      Changed |= NewType != F.Type;
      Fields.push_back(Field{F.Name, F.Optional, std::move(NewType)});
    }
    if (!Changed)
      return E;
    return withLocation(std::make_shared<StructType>(std::move(Fields)), *E);
  }
  case TypeExpr::Array: {
    const auto &A = llvm::cast<ArrayType>(*E);
    TypeRef Elt = rewriteType(A.Element, Fn);
    if (Elt == A.Element)
      return E;
    return withLocation(std::make_shared<ArrayType>(std::move(Elt)), *E);
  }
  default:
    return E;
  }
}

static DeclRef rewriteDecl(const DeclRef &D, RewriteFn Fn) {
  std::vector<TypeParam> Params;
  bool Changed = false;
  for (const TypeParam &P : D->Params) {
    TypeParam NewP{P.Name, P.Constraint};
    if (P.Constraint)
      NewP.Constraint = rewriteType(P.Constraint, Fn);
    Changed |= NewP.Constraint != P.Constraint;
    Params.push_back(std::move(NewP));
  }
  TypeRef Body = rewriteType(D->Body, Fn);
  if (!Changed && Body == D->Body)
    return D;

  auto NewDecl =
      std::make_shared<Declaration>(D->Name, std::move(Params), Body);
  NewDecl->Hints = D->Hints;
  NewDecl->Line = D->Line;
  NewDecl->Column = D->Column;
  return NewDecl;
}

/// \p G without \p Removed, rewritten by \p Fn and cut down to what
/// \p Root reaches.
static TypeGraph rebuild(const TypeGraph &G, llvm::StringRef Root,
                         const llvm::StringSet<> &Removed, RewriteFn Fn) {
  TypeGraph All;
  for (const DeclRef &D : G.decls())
    if (!Removed.count(D->Name))
      All.addDeclaration(rewriteDecl(D, Fn));

  TypeGraph Result;
  for (const Declaration *D : All.reachableFrom(Root))
    Result.addDeclaration(All.lookupRef(D->Name));
  Result.setTrailingHints(G.getTrailingHints());
  return Result;
}

// --- Alias Collapse ---

static const ReferenceType *getAliasTarget(const Declaration &D,
                                           llvm::StringRef Root) {
  if (D.Name == Root || D.isGeneric() || !D.Hints.empty())
    return nullptr;
  const auto *Ref = llvm::dyn_cast<ReferenceType>(D.Body.get());
  if (!Ref || !Ref->Args.empty() || Ref->Name == D.Name)
    return nullptr;
  return Ref;
}

static TypeGraph collapseAliases(const TypeGraph &G, llvm::StringRef Root,
                                 unsigned &NumInlined) {
  llvm::StringMap<std::string> Target;
  for (const DeclRef &D : G.decls())
    if (const ReferenceType *Ref = getAliasTarget(*D, Root))
      Target[D->Name] = Ref->Name;

  // Follow chains to the first declaration that is not an alias. Aliases
  // that only lead back to each other stay.
  llvm::StringMap<std::string> Final;
  llvm::StringSet<> Removed;
  for (const auto &Entry : Target) {
    std::string Cur = Entry.getKey().str();
    llvm::StringSet<> Seen;
    while (Target.count(Cur) && Seen.insert(Cur).second)
      Cur = Target.lookup(Cur);
    if (Target.count(Cur))
      continue;
    Final[Entry.getKey()] = Cur;
    Removed.insert(Entry.getKey());
  }
  if (Final.empty())
    return G;

  NumInlined += Final.size();
  LLVM_DEBUG(llvm::dbgs() << "collapsing " << Final.size() << " alias(es)\n");
  return rebuild(G, Root, Removed, [&](const TypeExpr &E) -> TypeRef {
    const auto *Ref = llvm::dyn_cast<ReferenceType>(&E);
    if (!Ref)
      return nullptr;
    auto It = Final.find(Ref->Name);
    if (It == Final.end())
      return nullptr;
    return withLocation(std::make_shared<ReferenceType>(It->second), E);
  });
}

// --- Generic Inlining ---

static void collectUses(const TypeExpr &E, llvm::StringMap<unsigned> &Uses,
                        llvm::StringMap<const ReferenceType *> &Site) {
  if (const auto *Ref = llvm::dyn_cast<ReferenceType>(&E)) {
    ++Uses[Ref->Name];
    Site[Ref->Name] = Ref;
  }
  forEachChild(E, [&](const TypeExpr &Child) {
    collectUses(Child, Uses, Site);
  });
}

static bool containsParamRef(const TypeExpr &E) {
  if (llvm::isa<ParamRefType>(&E))
    return true;
  bool Found = false;
  forEachChild(E, [&](const TypeExpr &Child) {
    Found = Found || containsParamRef(Child);
  });
  return Found;
}

static bool isSelfReachable(const TypeGraph &G, const Declaration &D) {
  for (const std::string &Name : G.getEdges(D))
    for (const Declaration *R : G.reachableFrom(Name))
      if (R->Name == D.Name)
        return true;
  return false;
}

static TypeRef substitute(const Declaration &D,
                          const std::vector<TypeRef> &Args) {
  return rewriteType(D.Body, [&](const TypeExpr &E) -> TypeRef {
    const auto *P = llvm::dyn_cast<ParamRefType>(&E);
    if (!P)
      return nullptr;
    int Idx = D.findParam(P->Name);
    if (Idx < 0)
      return nullptr;
    return Args[Idx];
  });
}

static bool isInlinableBody(const TypeExpr &E) {
  return llvm::isa<LiteralType>(&E) || llvm::isa<TemplateType>(&E) ||
         llvm::isa<UnionType>(&E) || llvm::isa<StructType>(&E);
}

static TypeGraph inlineGenerics(const TypeGraph &G, llvm::StringRef Root,
                                unsigned &NumInlined) {
  TypeGraph Cur = G;
  while (true) {
    llvm::StringMap<unsigned> Uses;
    llvm::StringMap<const ReferenceType *> Site;
    for (const DeclRef &D : Cur.decls()) {
      for (const TypeParam &P : D->Params)
        if (P.Constraint)
          collectUses(*P.Constraint, Uses, Site);
      collectUses(*D->Body, Uses, Site);
    }

    std::string Victim;
    TypeRef Replacement;
    for (const DeclRef &D : Cur.decls()) {
      if (!D->isGeneric() || D->Name == Root || !D->Hints.empty())
        continue;
      if (Uses.lookup(D->Name) != 1)
        continue;
      const ReferenceType *Use = Site.lookup(D->Name);
      if (llvm::any_of(Use->Args, [](const TypeRef &Arg) {
            return containsParamRef(*Arg);
          }))
        continue;
      if (isSelfReachable(Cur, *D))
        continue;
      TypeRef Body = substitute(*D, Use->Args);
      if (!isInlinableBody(*Body))
        continue;
      Victim = D->Name;
      Replacement = std::move(Body);
      break;
    }
    if (Victim.empty())
      return Cur;

    LLVM_DEBUG(llvm::dbgs() << "inlining generic '" << Victim << "'\n");
    ++NumInlined;
    llvm::StringSet<> Removed;
    Removed.insert(Victim);
    Cur = rebuild(Cur, Root, Removed, [&](const TypeExpr &E) -> TypeRef {
      const auto *Ref = llvm::dyn_cast<ReferenceType>(&E);
      if (Ref && Ref->Name == Victim)
        return Replacement;
      return nullptr;
    });
  }
}

TypeGraph compressPaths(const TypeGraph &G, llvm::StringRef Root,
                        unsigned &NumInlined) {
  TypeGraph Collapsed = collapseAliases(G, Root, NumInlined);
  return inlineGenerics(Collapsed, Root, NumInlined);
}

} // namespace tsfilter
