#include "tsfilter/Sema.h"
#include "tsfilter/DiagnosticEngine.h"
#include "tsfilter/Parser.h"

namespace tsfilter {

llvm::Expected<TypeGraph> Sema::checkModule(Module &M) {
  TypeGraph G;

  // 1. Register every declaration so forward references resolve.
  for (auto &Decl : M.Decls) {
    int Line = Decl->Line;
    int Column = Decl->Column;
    std::string Name = Decl->Name;
    if (!G.addDeclaration(std::move(Decl)))
      return DiagnosticEngine::makeError(DiagID::ErrRedefinition, Line,
                                         Column, Name);
  }
  M.Decls.clear();

  // 2. Resolve names and check arity, in source order.
  for (const DeclRef &Decl : G.decls()) {
    for (const TypeParam &P : Decl->Params) {
      if (P.Constraint)
        if (llvm::Error Err = checkType(*P.Constraint, G))
          return std::move(Err);
    }
    if (llvm::Error Err = checkType(*Decl->Body, G))
      return std::move(Err);
  }

  G.setTrailingHints(std::move(M.TrailingHints));
  return std::move(G);
}

llvm::Error Sema::checkType(const TypeExpr &E, const TypeGraph &G) {
  if (const auto *Ref = llvm::dyn_cast<ReferenceType>(&E)) {
    const Declaration *Target = G.lookup(Ref->Name);
    if (!Target)
      return DiagnosticEngine::makeError(DiagID::ErrUnknownType, Ref->Line,
                                         Ref->Column, Ref->Name);
    if (Target->Params.size() != Ref->Args.size())
      return DiagnosticEngine::makeError(DiagID::ErrArityMismatch, Ref->Line,
                                         Ref->Column, Ref->Name,
                                         Target->Params.size(),
                                         Ref->Args.size());
  }

  llvm::Error Result = llvm::Error::success();
  forEachChild(E, [&](const TypeExpr &Child) {
    if (Result)
      return;
    Result = checkType(Child, G);
  });
  return Result;
}

llvm::Expected<TypeGraph> loadSchema(const std::string &Source) {
  auto M = parseSchema(Source);
  if (!M)
    return M.takeError();
  Sema S;
  return S.checkModule(*M);
}

} // namespace tsfilter
