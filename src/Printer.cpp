#include "tsfilter/Printer.h"

namespace tsfilter {

void SchemaPrinter::printHint(const std::string &Text) {
  OS << "// " << Text << "\n";
}

void SchemaPrinter::printTrailingHints(const TypeGraph &G) {
  for (const std::string &Hint : G.getTrailingHints())
    printHint(Hint);
}

void SchemaPrinter::printDeclaration(const Declaration &D) {
  for (const std::string &Hint : D.Hints)
    printHint(Hint);
  D.print(OS, Opts);
  OS << "\n";
}

void SchemaPrinter::printModule(const TypeGraph &G) {
  for (const DeclRef &D : G.decls())
    printDeclaration(*D);
  printTrailingHints(G);
}

void SchemaPrinter::printFrom(const TypeGraph &G, llvm::StringRef Root) {
  for (const Declaration *D : G.reachableFrom(Root))
    printDeclaration(*D);
  printTrailingHints(G);
}

std::string formatSchema(const PrunedSchema &Schema, PrintOptions Opts) {
  std::string Out;
  llvm::raw_string_ostream OS(Out);
  SchemaPrinter(OS, Opts).printFrom(Schema.Graph, Schema.Root);
  return OS.str();
}

} // namespace tsfilter
