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

#include "tsfilter/AST.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace tsfilter {

/// TypeGraph - a flat, name-indexed arena of declarations. Every edge is a
/// name, so recursive and mutually recursive types need no owning cycles.
/// A graph handed out by Sema or TypeFilter is never modified again and may
/// be shared freely between threads.
class TypeGraph {
public:
  /// Adds \p D unless its name is taken. Returns false on a clash.
  bool addDeclaration(DeclRef D);

  const Declaration *lookup(llvm::StringRef Name) const;
  DeclRef lookupRef(llvm::StringRef Name) const;
  bool contains(llvm::StringRef Name) const { return Symbols.count(Name); }

  /// Declarations in insertion (source) order.
  const std::vector<DeclRef> &decls() const { return Decls; }
  size_t size() const { return Decls.size(); }

  const std::vector<std::string> &getTrailingHints() const {
    return TrailingHints;
  }
  void setTrailingHints(std::vector<std::string> Hints) {
    TrailingHints = std::move(Hints);
  }

  /// Names of the declarations \p D points at, in the order they appear in
  /// its printed text (constraints, then body). A CHOOSE sentinel counts as
  /// an edge to a declaration named CHOOSE when the graph has one.
  std::vector<std::string> getEdges(const Declaration &D) const;

  /// Declarations reachable from \p Root, in breadth-first discovery order.
  /// Empty when \p Root is not declared.
  std::vector<const Declaration *> reachableFrom(llvm::StringRef Root) const;

private:
  std::vector<DeclRef> Decls;
  llvm::StringMap<unsigned> Symbols;
  std::vector<std::string> TrailingHints;
};

} // namespace tsfilter
