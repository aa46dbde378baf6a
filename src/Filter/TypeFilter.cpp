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
#include "tsfilter/TypeFilter.h"
#include "tsfilter/DiagnosticEngine.h"
#include "llvm/ADT/BitVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Debug.h"
#include <memory>

#define DEBUG_TYPE "tsfilter-prune"

namespace tsfilter {

namespace {

enum class Mode { Filtered, PassThrough };

enum class InstanceState { InProgress, Kept, Eliminated };

/// Where a type expression is being filtered: the declaration whose body it
/// belongs to, and how that declaration was instantiated.
struct Scope {
  const Declaration &Decl;
  Mode M;
  const llvm::BitVector &Eliminated; // per parameter
};

/// Per-query state of TypeFilter::prune().
class Pruner {
public:
  Pruner(const TypeGraph &G, const LiteralIndex &Index, const LiveSet &Live,
         const llvm::StringSet<> &KnownEliminated)
      : G(G), Index(Index), Live(Live), KnownEliminated(KnownEliminated) {}

  /// Filter \p D under one binding. Returns false when the instance accepts
  /// no value. An instance already on the stack counts as kept.
  bool evaluate(const Declaration &D, Mode M, const llvm::BitVector &Elim);

  /// Instances that were read as kept while on the stack and then turned
  /// out eliminated. Results computed from them are stale.
  const llvm::StringSet<> &getContradicted() const { return Contradicted; }

  /// Body to emit for \p Name, or null if it was never reached.
  TypeRef getBody(llvm::StringRef Name) const;

  PruneStats Stats;

private:
  const TypeGraph &G;
  const LiteralIndex &Index;
  const LiveSet &Live;
  const llvm::StringSet<> &KnownEliminated;

  llvm::StringMap<InstanceState> Memo;
  llvm::StringSet<> ReadInProgress;
  llvm::StringSet<> Contradicted;
  llvm::StringMap<TypeRef> FilteredBodies; // no eliminated parameters
  llvm::StringMap<TypeRef> PassBodies;

  TypeRef filter(const TypeRef &E, const Scope &S);
  TypeRef filterReference(const TypeRef &E, const ReferenceType &Ref,
                          const Scope &S);
  TypeRef filterUnion(const TypeRef &E, const UnionType &U, const Scope &S);
  TypeRef filterStruct(const TypeRef &E, const StructType &St,
                       const Scope &S);
  void linkChoose();
  void visitPassThrough(const TypeExpr &E);
};

std::string instanceKey(const Declaration &D, Mode M,
                        const llvm::BitVector &Elim) {
  std::string Key = D.Name;
  Key += M == Mode::PassThrough ? "#p" : "#f";
  for (unsigned I = 0, E = Elim.size(); I != E; ++I)
    Key += Elim[I] ? '1' : '0';
  return Key;
}

TypeRef makeNever() {
  return std::make_shared<SpecialType>(SpecialType::Never);
}

} // namespace

// --- Instances ---

bool Pruner::evaluate(const Declaration &D, Mode M,
                      const llvm::BitVector &Elim) {
  // Pass-through removes nothing, so parameter elimination is irrelevant.
  llvm::BitVector None(D.Params.size());
  const llvm::BitVector &Mask = M == Mode::PassThrough ? None : Elim;

  std::string Key = instanceKey(D, M, Mask);
  if (KnownEliminated.count(Key)) {
    if (M == Mode::Filtered && Mask.none())
      FilteredBodies[D.Name] = makeNever();
    return false;
  }
  auto Inserted = Memo.try_emplace(Key, InstanceState::InProgress);
  if (!Inserted.second) {
    if (Inserted.first->second == InstanceState::InProgress)
      ReadInProgress.insert(Key);
    return Inserted.first->second != InstanceState::Eliminated;
  }
  ++Stats.InstancesEvaluated;

  // Constraints are emitted as written, so whatever they name must be
  // emitted whole.
  for (const TypeParam &P : D.Params)
    if (P.Constraint)
      visitPassThrough(*P.Constraint);

  Scope S{D, M, Mask};
  TypeRef Body = filter(D.Body, S);
  bool Kept = Body != nullptr;
  Memo[Key] = Kept ? InstanceState::Kept : InstanceState::Eliminated;
  if (!Kept && ReadInProgress.count(Key))
    Contradicted.insert(Key);

  LLVM_DEBUG(llvm::dbgs() << (M == Mode::PassThrough ? "pass " : "filter ")
                          << Key << " -> " << (Kept ? "kept" : "eliminated")
                          << "\n");

  if (M == Mode::PassThrough)
    PassBodies[D.Name] = Body;
  else if (Mask.none())
    FilteredBodies[D.Name] = Kept ? Body : makeNever();
  return Kept;
}

TypeRef Pruner::getBody(llvm::StringRef Name) const {
  auto Pass = PassBodies.find(Name);
  if (Pass != PassBodies.end())
    return Pass->second;
  auto Filtered = FilteredBodies.find(Name);
  if (Filtered != FilteredBodies.end())
    return Filtered->second;
  return nullptr;
}

void Pruner::linkChoose() {
  if (const Declaration *Choose = G.lookup("CHOOSE"))
    evaluate(*Choose, Mode::PassThrough, llvm::BitVector());
}

void Pruner::visitPassThrough(const TypeExpr &E) {
  if (const auto *Ref = llvm::dyn_cast<ReferenceType>(&E)) {
    if (const Declaration *Target = G.lookup(Ref->Name))
      evaluate(*Target, Mode::PassThrough, llvm::BitVector());
  } else if (const auto *Sp = llvm::dyn_cast<SpecialType>(&E)) {
    if (Sp->isChoose())
      linkChoose();
  }
  forEachChild(E, [&](const TypeExpr &Child) { visitPassThrough(Child); });
}

// --- Expressions ---

/// Returns the filtered expression, \p E itself when nothing changed, or
/// null when no value of \p E survives.
TypeRef Pruner::filter(const TypeRef &E, const Scope &S) {
  if (S.M == Mode::PassThrough) {
    visitPassThrough(*E);
    return E;
  }

  switch (E->getKind()) {
  case TypeExpr::Primitive:
    return E;

  case TypeExpr::Special: {
    const auto &Sp = llvm::cast<SpecialType>(*E);
    if (Sp.isNever())
      return nullptr;
    if (Sp.isChoose())
      linkChoose();
    return E;
  }

  case TypeExpr::Literal: {
    const auto &Lit = llvm::cast<LiteralType>(*E);
    if (Lit.IsNumeric)
      return E;
    if (Index.isLive(Live, S.Decl.Name, Lit.Value)) {
      ++Stats.LiteralsKept;
      return E;
    }
    ++Stats.LiteralsRemoved;
    return nullptr;
  }

  case TypeExpr::Template: {
    const auto &T = llvm::cast<TemplateType>(*E);
    if (T.Pinned || Index.isLive(Live, S.Decl.Name, T.Label)) {
      ++Stats.LiteralsKept;
      return E;
    }
    ++Stats.LiteralsRemoved;
    return nullptr;
  }

  case TypeExpr::ParamRef: {
    int Idx = S.Decl.findParam(llvm::cast<ParamRefType>(*E).Name);
    if (Idx >= 0 && S.Eliminated[Idx])
      return nullptr;
    return E;
  }

  case TypeExpr::Reference:
    return filterReference(E, llvm::cast<ReferenceType>(*E), S);

  case TypeExpr::Union:
    return filterUnion(E, llvm::cast<UnionType>(*E), S);

  case TypeExpr::Struct:
    return filterStruct(E, llvm::cast<StructType>(*E), S);

  case TypeExpr::Array: {
    const auto &A = llvm::cast<ArrayType>(*E);
    TypeRef Elt = filter(A.Element, S);
    if (!Elt)
      return nullptr;
    if (Elt == A.Element)
      return E;
    auto Result = std::make_shared<ArrayType>(std::move(Elt));
    Result->Line = E->Line;
    Result->Column = E->Column;
    return Result;
  }
  }
  return E;
}

TypeRef Pruner::filterReference(const TypeRef &E, const ReferenceType &Ref,
                                const Scope &S) {
  const Declaration *Target = G.lookup(Ref.Name);
  if (!Target)
    return E; // rejected at load time

  llvm::BitVector Elim(Ref.Args.size());
  bool Wildcard = false;
  bool Changed = false;
  std::vector<TypeRef> Args;
  Args.reserve(Ref.Args.size());
  for (unsigned I = 0, N = Ref.Args.size(); I != N; ++I) {
    const TypeRef &Arg = Ref.Args[I];
    const auto *Sp = llvm::dyn_cast<SpecialType>(Arg.get());
    if (Sp && Sp->isAny()) {
      Wildcard = true;
      Args.push_back(Arg);
      continue;
    }
    TypeRef NewArg = filter(Arg, S);
    if (!NewArg) {
      Elim.set(I);
      NewArg = makeNever();
    }
    Changed |= NewArg != Arg;
    Args.push_back(std::move(NewArg));
  }

  if (Wildcard) {
    evaluate(*Target, Mode::PassThrough, llvm::BitVector());
  } else {
    if (!evaluate(*Target, Mode::Filtered, Elim))
      return nullptr;
    // The emitted declaration is the unspecialized one.
    if (Elim.any())
      evaluate(*Target, Mode::Filtered, llvm::BitVector(Elim.size()));
  }

  if (!Changed)
    return E;
  auto Result = std::make_shared<ReferenceType>(Ref.Name, std::move(Args));
  Result->Line = E->Line;
  Result->Column = E->Column;
  return Result;
}

TypeRef Pruner::filterUnion(const TypeRef &E, const UnionType &U,
                            const Scope &S) {
  std::vector<TypeRef> Members;
  bool Changed = false;
  for (const TypeRef &M : U.Members) {
    TypeRef NewM = filter(M, S);
    if (!NewM) {
      Changed = true;
      continue;
    }
    Changed |= NewM != M;
    Members.push_back(std::move(NewM));
  }

  if (Members.empty())
    return nullptr;
  if (Members.size() == 1)
    return Members.front();
  if (!Changed)
    return E;
  auto Result = std::make_shared<UnionType>(std::move(Members));
  Result->Line = E->Line;
  Result->Column = E->Column;
  return Result;
}

TypeRef Pruner::filterStruct(const TypeRef &E, const StructType &St,
                             const Scope &S) {
  std::vector<Field> Fields;
  bool Changed = false;
  for (const Field &F : St.Fields) {
    TypeRef NewType = filter(F.Type, S);
    if (!NewType) {
      if (!F.Optional)
        return nullptr;
      Changed = true;
      continue;
    }
    Changed |= NewType != F.Type;
    Fields.push_back(Field{F.Name, F.Optional, std::move(NewType)});
  }

  if (!Changed)
    return E;
  auto Result = std::make_shared<StructType>(std::move(Fields));
  Result->Line = E->Line;
  Result->Column = E->Column;
  return Result;
}

// --- Entry Point ---

llvm::Expected<PrunedSchema> TypeFilter::prune(llvm::StringRef Root,
                                               const LiveSet &Live) const {
  const Declaration *RootDecl = G.lookup(Root);
  if (!RootDecl)
    return DiagnosticEngine::makeError(DiagID::ErrUnknownRoot, 0, 0, Root);

  // Optimistic assumptions over-approximate what is kept, so an instance
  // eliminated under them is eliminated for good. Seed those and walk again
  // until no assumption is contradicted.
  llvm::StringSet<> KnownEliminated;
  std::unique_ptr<Pruner> Walk;
  while (true) {
    Walk = std::make_unique<Pruner>(G, Index, Live, KnownEliminated);
    if (!Walk->evaluate(*RootDecl, Mode::Filtered,
                        llvm::BitVector(RootDecl->Params.size())))
      return DiagnosticEngine::makeError(DiagID::ErrRootEliminated,
                                         RootDecl->Line, RootDecl->Column,
                                         Root);
    if (Walk->getContradicted().empty())
      break;
    for (const auto &Entry : Walk->getContradicted())
      KnownEliminated.insert(Entry.getKey());
    LLVM_DEBUG(llvm::dbgs() << "re-walking with " << KnownEliminated.size()
                            << " instance(s) known eliminated\n");
  }
  Pruner &P = *Walk;

  // Every declaration the walk reached, in source order, with its pruned
  // body. Unchanged declarations are shared with the source graph.
  TypeGraph Reached;
  for (const DeclRef &D : G.decls()) {
    TypeRef Body = P.getBody(D->Name);
    if (!Body)
      continue;
    if (Body == D->Body) {
      Reached.addDeclaration(D);
      continue;
    }
    auto NewDecl = std::make_shared<Declaration>(D->Name, D->Params, Body);
    NewDecl->Hints = D->Hints;
    NewDecl->Line = D->Line;
    NewDecl->Column = D->Column;
    Reached.addDeclaration(std::move(NewDecl));
  }

  // Instances assumed kept inside a cycle can leave declarations that are
  // no longer referenced; keep what the root still reaches.
  PrunedSchema Result;
  Result.Root = Root.str();
  for (const Declaration *D : Reached.reachableFrom(Root))
    Result.Graph.addDeclaration(Reached.lookupRef(D->Name));
  Result.Graph.setTrailingHints(G.getTrailingHints());
  Result.Stats = P.Stats;

  if (Opts.CompressPaths)
    Result.Graph =
        compressPaths(Result.Graph, Root, Result.Stats.DeclsInlined);
  Result.Stats.DeclsEmitted = Result.Graph.size();

  LLVM_DEBUG(llvm::dbgs() << "pruned '" << Root << "': "
                          << Result.Stats.DeclsEmitted << " of " << G.size()
                          << " declarations, " << Result.Stats.LiteralsKept
                          << " literals kept, "
                          << Result.Stats.LiteralsRemoved << " removed\n");
  return std::move(Result);
}

} // namespace tsfilter
