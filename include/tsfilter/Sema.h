#pragma once

#include "tsfilter/AST.h"
#include "tsfilter/TypeGraph.h"
#include "llvm/Support/Error.h"
#include <string>

namespace tsfilter {

/// Sema - turns a parsed Module into a validated TypeGraph.
///
/// Checks, in source order, stopping at the first failure:
///   - every declaration name is unique;
///   - every Reference names a declaration;
///   - every Reference passes exactly as many arguments as the target has
///     type parameters.
/// Cycles are legal and left intact.
class Sema {
public:
  Sema() = default;

  /// \brief Run the checks and build the graph. \p M is consumed.
  llvm::Expected<TypeGraph> checkModule(Module &M);

private:
  llvm::Error checkType(const TypeExpr &E, const TypeGraph &G);
};

/// Parse \p Source and build its graph: the whole load-time pipeline.
llvm::Expected<TypeGraph> loadSchema(const std::string &Source);

} // namespace tsfilter
