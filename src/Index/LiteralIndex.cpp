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
#include "tsfilter/LiteralIndex.h"
#include "tsfilter/Normalize.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Debug.h"
#include <algorithm>

#define DEBUG_TYPE "tsfilter-index"

namespace tsfilter {

std::vector<unsigned> LiveSet::ids() const {
  std::vector<unsigned> Out;
  for (unsigned Id : Bits.set_bits())
    Out.push_back(Id);
  return Out;
}

static std::string occurrenceKey(llvm::StringRef DeclName,
                                 llvm::StringRef Value) {
  std::string Key = DeclName.str();
  Key += '\0';
  Key += Value.str();
  return Key;
}

LiteralIndex LiteralIndex::build(const TypeGraph &G) {
  LiteralIndex Index;
  llvm::StringSet<> Visited;
  for (const DeclRef &D : G.decls()) {
    if (!Visited.insert(D->Name).second)
      continue;
    Index.indexType(*D, *D->Body);
  }

  LLVM_DEBUG(llvm::dbgs() << "indexed " << Index.getNumOccurrences()
                          << " occurrences under " << Index.getNumTerms()
                          << " terms from " << G.size() << " declarations\n");
  return Index;
}

unsigned LiteralIndex::addOccurrence(const std::string &DeclName,
                                     const std::string &Value) {
  auto Inserted =
      OccurrenceIds.try_emplace(occurrenceKey(DeclName, Value),
                                static_cast<unsigned>(Occurrences.size()));
  if (Inserted.second) {
    Occurrence Occ;
    Occ.DeclName = DeclName;
    Occ.Value = Value;
    Occurrences.push_back(std::move(Occ));
  }
  return Inserted.first->second;
}

void LiteralIndex::addTerms(unsigned Id, llvm::StringRef Text) {
  llvm::SmallVector<llvm::StringRef, 4> Words;
  splitWords(Text, Words);
  bool OnlyStopWords = !Words.empty() && llvm::all_of(Words, isStopWordToken);

  Occurrence &Occ = Occurrences[Id];
  for (std::string &Term : normalizeText(Text)) {
    if (OnlyStopWords)
      StopWordTerms.insert(Term);
    if (std::find(Occ.Terms.begin(), Occ.Terms.end(), Term) != Occ.Terms.end())
      continue;
    // Ids grow monotonically, so each posting list stays sorted.
    std::vector<unsigned> &List = Postings[Term];
    if (List.empty() || List.back() != Id)
      List.push_back(Id);
    Occ.Terms.push_back(std::move(Term));
  }
}

void LiteralIndex::indexType(const Declaration &D, const TypeExpr &E) {
  if (const auto *Lit = llvm::dyn_cast<LiteralType>(&E)) {
    if (!Lit->IsNumeric) {
      unsigned Id = addOccurrence(D.Name, Lit->Value);
      addTerms(Id, Lit->Value);
    }
  } else if (const auto *T = llvm::dyn_cast<TemplateType>(&E)) {
    unsigned Id = addOccurrence(D.Name, T->Label);
    Occurrences[Id].IsTemplate = true;
    Occurrences[Id].Pinned |= T->Pinned;
    addTerms(Id, T->Label);
    for (const std::string &Alias : T->Aliases)
      addTerms(Id, Alias);
  }
  forEachChild(E, [&](const TypeExpr &Child) { indexType(D, Child); });
}

llvm::Optional<unsigned> LiteralIndex::lookup(llvm::StringRef DeclName,
                                              llvm::StringRef Value) const {
  auto It = OccurrenceIds.find(occurrenceKey(DeclName, Value));
  if (It == OccurrenceIds.end())
    return llvm::None;
  return It->second;
}

llvm::ArrayRef<unsigned> LiteralIndex::getPostings(llvm::StringRef Term) const {
  auto It = Postings.find(Term);
  if (It == Postings.end())
    return {};
  return It->second;
}

bool LiteralIndex::isLive(const LiveSet &Live, llvm::StringRef DeclName,
                          llvm::StringRef Value) const {
  llvm::Optional<unsigned> Id = lookup(DeclName, Value);
  return Id && Live.contains(*Id);
}

void LiteralIndex::dump(llvm::raw_ostream &OS) const {
  std::vector<llvm::StringRef> Terms;
  for (const auto &Entry : Postings)
    Terms.push_back(Entry.getKey());
  std::sort(Terms.begin(), Terms.end());

  for (llvm::StringRef Term : Terms) {
    OS << Term << " ->";
    bool First = true;
    for (unsigned Id : getPostings(Term)) {
      const Occurrence &Occ = Occurrences[Id];
      OS << (First ? " " : ", ") << Occ.DeclName << ":"
         << quoteString(Occ.Value);
      if (Occ.Pinned)
        OS << " (pinned)";
      First = false;
    }
    OS << "\n";
  }
}

} // namespace tsfilter
