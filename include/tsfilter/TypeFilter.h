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

#include "tsfilter/LiteralIndex.h"
#include "tsfilter/TypeGraph.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <string>

namespace tsfilter {

struct FilterOptions {
  /// Run the path-compression post-pass: collapse parameterless aliases and
  /// inline generics that have a single remaining use.
  bool CompressPaths = false;
};

struct PruneStats {
  unsigned InstancesEvaluated = 0; // (declaration, binding) pairs visited
  unsigned DeclsEmitted = 0;
  unsigned LiteralsKept = 0;
  unsigned LiteralsRemoved = 0;
  unsigned DeclsInlined = 0;
};

/// Result of one query: a fresh graph that shares every unchanged node
/// with the source graph.
struct PrunedSchema {
  TypeGraph Graph;
  std::string Root;
  PruneStats Stats;
};

/// TypeFilter - the pruning engine.
///
/// Walks the graph from a root declaration and keeps only the branches
/// reachable through live literals, pinned templates, CHOOSE and structure
/// that cannot be removed (primitives, numeric literals, required fields).
/// A reference instantiated with `any` turns its target, and everything
/// below it, into pass-through: nothing there is removed.
///
/// prune() is const and keeps all per-query state local, so one TypeFilter
/// may serve any number of concurrent queries.
class TypeFilter {
public:
  TypeFilter(const TypeGraph &G, const LiteralIndex &Index,
             FilterOptions Opts = FilterOptions())
      : G(G), Index(Index), Opts(Opts) {}

  /// Fails with ErrUnknownRoot when \p Root is not declared, and with
  /// ErrRootEliminated when nothing of the root survives \p Live.
  llvm::Expected<PrunedSchema> prune(llvm::StringRef Root,
                                     const LiveSet &Live) const;

private:
  const TypeGraph &G;
  const LiteralIndex &Index;
  FilterOptions Opts;
};

/// Path compression over an already pruned graph. Never changes the set of
/// values accepted from \p Root. Returns the graph restricted to what is
/// still reachable; \p NumInlined counts removed declarations.
TypeGraph compressPaths(const TypeGraph &G, llvm::StringRef Root,
                        unsigned &NumInlined);

} // namespace tsfilter
