#pragma once

#include "tsfilter/AST.h"
#include "tsfilter/TypeFilter.h"
#include "tsfilter/TypeGraph.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <string>

namespace tsfilter {

/// SchemaPrinter - compact dialect output, one declaration per line with
/// its hints above it as `// text` lines.
class SchemaPrinter {
public:
  explicit SchemaPrinter(llvm::raw_ostream &OS,
                         PrintOptions Opts = PrintOptions())
      : OS(OS), Opts(Opts) {}

  /// Every declaration in graph order, then the trailing hints.
  void printModule(const TypeGraph &G);

  /// Declarations reachable from \p Root in first-discovery order, then the
  /// trailing hints.
  void printFrom(const TypeGraph &G, llvm::StringRef Root);

  void printDeclaration(const Declaration &D);

private:
  llvm::raw_ostream &OS;
  PrintOptions Opts;

  void printHint(const std::string &Text);
  void printTrailingHints(const TypeGraph &G);
};

/// Text of a pruned schema, starting at its root.
std::string formatSchema(const PrunedSchema &Schema,
                         PrintOptions Opts = PrintOptions());

} // namespace tsfilter
