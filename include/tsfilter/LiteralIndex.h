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

#include "tsfilter/TypeGraph.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/BitVector.h"
#include "llvm/ADT/Optional.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <vector>

namespace tsfilter {

/// One string literal (or template) inside one declaration. The pair
/// (DeclName, Value) is the occurrence's identity.
struct Occurrence {
  std::string DeclName;
  std::string Value; // display text, never normalized
  bool IsTemplate = false;
  bool Pinned = false;
  std::vector<std::string> Terms; // normalized stems, deduplicated
};

/// LiveSet - the occurrences a query made relevant, as a bit per
/// occurrence id.
class LiveSet {
public:
  LiveSet() = default;
  explicit LiveSet(unsigned NumOccurrences) : Bits(NumOccurrences) {}

  bool contains(unsigned Id) const { return Id < Bits.size() && Bits[Id]; }
  void insert(unsigned Id) {
    if (Id >= Bits.size())
      Bits.resize(Id + 1);
    Bits.set(Id);
  }
  unsigned count() const { return Bits.count(); }
  bool empty() const { return Bits.none(); }

  LiveSet &operator|=(const LiveSet &Other) {
    if (Other.Bits.size() > Bits.size())
      Bits.resize(Other.Bits.size());
    Bits |= Other.Bits;
    return *this;
  }

  /// Ids in ascending order.
  std::vector<unsigned> ids() const;

private:
  llvm::BitVector Bits;
};

/// LiteralIndex - inverted index from normalized term to the literal
/// occurrences that contain it. Built once per graph; read-only afterwards.
class LiteralIndex {
public:
  static LiteralIndex build(const TypeGraph &G);

  llvm::Optional<unsigned> lookup(llvm::StringRef DeclName,
                                  llvm::StringRef Value) const;
  const Occurrence &getOccurrence(unsigned Id) const {
    return Occurrences[Id];
  }
  unsigned getNumOccurrences() const { return Occurrences.size(); }
  unsigned getNumTerms() const { return Postings.size(); }

  /// Occurrence ids indexed under \p Term, ascending. Empty if unknown.
  llvm::ArrayRef<unsigned> getPostings(llvm::StringRef Term) const;

  bool isLive(const LiveSet &Live, llvm::StringRef DeclName,
              llvm::StringRef Value) const;

  /// True when \p Term comes from a label or alias made only of stop words,
  /// such as "A" or "as is". Such terms survive stop-word removal.
  bool isStopWordTerm(llvm::StringRef Term) const {
    return StopWordTerms.count(Term);
  }

  /// One line per term, terms sorted: term -> Decl:"value", ...
  void dump(llvm::raw_ostream &OS) const;

private:
  std::vector<Occurrence> Occurrences;
  llvm::StringMap<unsigned> OccurrenceIds; // "Decl\0Value" -> id
  llvm::StringMap<std::vector<unsigned>> Postings;
  llvm::StringSet<> StopWordTerms;

  unsigned addOccurrence(const std::string &DeclName, const std::string &Value);
  void addTerms(unsigned Id, llvm::StringRef Text);
  void indexType(const Declaration &D, const TypeExpr &E);
};

} // namespace tsfilter
