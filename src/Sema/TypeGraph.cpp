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
#include "tsfilter/TypeGraph.h"
#include "llvm/ADT/StringSet.h"
#include <deque>

namespace tsfilter {

bool TypeGraph::addDeclaration(DeclRef D) {
  if (!Symbols.try_emplace(D->Name, Decls.size()).second)
    return false;
  Decls.push_back(std::move(D));
  return true;
}

const Declaration *TypeGraph::lookup(llvm::StringRef Name) const {
  auto It = Symbols.find(Name);
  if (It == Symbols.end())
    return nullptr;
  return Decls[It->second].get();
}

DeclRef TypeGraph::lookupRef(llvm::StringRef Name) const {
  auto It = Symbols.find(Name);
  if (It == Symbols.end())
    return nullptr;
  return Decls[It->second];
}

static void collectEdges(const TypeExpr &E, const TypeGraph &G,
                         llvm::StringSet<> &Seen,
                         std::vector<std::string> &Out) {
  if (const auto *Ref = llvm::dyn_cast<ReferenceType>(&E)) {
    if (Seen.insert(Ref->Name).second)
      Out.push_back(Ref->Name);
  } else if (const auto *S = llvm::dyn_cast<SpecialType>(&E)) {
    if (S->isChoose() && G.contains("CHOOSE") && Seen.insert("CHOOSE").second)
      Out.push_back("CHOOSE");
  }
  forEachChild(E, [&](const TypeExpr &Child) {
    collectEdges(Child, G, Seen, Out);
  });
}

std::vector<std::string> TypeGraph::getEdges(const Declaration &D) const {
  std::vector<std::string> Out;
  llvm::StringSet<> Seen;
  for (const TypeParam &P : D.Params)
    if (P.Constraint)
      collectEdges(*P.Constraint, *this, Seen, Out);
  collectEdges(*D.Body, *this, Seen, Out);
  return Out;
}

std::vector<const Declaration *>
TypeGraph::reachableFrom(llvm::StringRef Root) const {
  std::vector<const Declaration *> Order;
  const Declaration *Start = lookup(Root);
  if (!Start)
    return Order;

  llvm::StringSet<> Visited;
  std::deque<const Declaration *> Worklist;
  Visited.insert(Start->Name);
  Worklist.push_back(Start);
  while (!Worklist.empty()) {
    const Declaration *D = Worklist.front();
    Worklist.pop_front();
    Order.push_back(D);
    for (const std::string &Name : getEdges(*D)) {
      const Declaration *Next = lookup(Name);
      if (Next && Visited.insert(Name).second)
        Worklist.push_back(Next);
    }
  }
  return Order;
}

} // namespace tsfilter
