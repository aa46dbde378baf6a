#include "tsfilter/CartLiterals.h"
#include "tsfilter/DiagnosticEngine.h"
#include "tsfilter/LiteralIndex.h"
#include "tsfilter/Printer.h"
#include "tsfilter/QueryMatcher.h"
#include "tsfilter/Sema.h"
#include "tsfilter/TypeFilter.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

using namespace llvm;

namespace {

enum class Fallback { None, Full };

cl::opt<std::string> InputFile(cl::Positional, cl::desc("<schema file>"),
                               cl::init("-"));
cl::opt<std::string> RootName("root", cl::desc("Root declaration"),
                              cl::value_desc("name"), cl::init("Cart"));
cl::opt<std::string> Query("query", cl::desc("Free-text query phrase"),
                           cl::value_desc("text"));
cl::opt<std::string> CartFile("cart",
                              cl::desc("JSON cart whose strings are live"),
                              cl::value_desc("file.json"));
cl::opt<bool> Compress("compress", cl::desc("Compress paths after pruning"));
cl::opt<bool> KeepTemplates("keep-templates",
                            cl::desc("Print templates as LITERAL<...>"));
cl::opt<bool> NoStopWords("no-stop-words",
                          cl::desc("Keep stop words in the query phrase"));
cl::opt<Fallback> OnRootEliminated(
    "fallback", cl::desc("Output when the query eliminates the root"),
    cl::values(clEnumValN(Fallback::None, "none", "print nothing, exit 2"),
               clEnumValN(Fallback::Full, "full",
                          "print the unpruned schema, exit 0")),
    cl::init(Fallback::None));
cl::opt<bool> DumpIndex("dump-index",
                        cl::desc("Print the literal index and exit"));
cl::opt<bool> Verbose("v", cl::desc("Print a summary of each phase"));

} // namespace

static bool loadCart(std::vector<std::string> &Literals) {
  if (CartFile.empty())
    return true;

  auto Buffer = MemoryBuffer::getFile(CartFile);
  if (!Buffer) {
    errs() << CartFile << ": error: " << Buffer.getError().message() << "\n";
    return false;
  }
  Expected<json::Value> Cart = json::parse((*Buffer)->getBuffer());
  if (!Cart) {
    tsfilter::DiagnosticEngine(errs(), CartFile).report(Cart.takeError());
    return false;
  }
  Literals = tsfilter::collectStringLiterals(*Cart);
  return true;
}

int main(int argc, char **argv) {
  cl::ParseCommandLineOptions(argc, argv,
                              "tsfilter - prune a type schema to a query\n");

  std::string FileName = InputFile == "-" ? "<stdin>" : InputFile.getValue();
  tsfilter::DiagnosticEngine Diags(errs(), FileName);

  auto Buffer = MemoryBuffer::getFileOrSTDIN(InputFile);
  if (!Buffer) {
    errs() << FileName << ": error: could not open file: "
           << Buffer.getError().message() << "\n";
    return 1;
  }

  Expected<tsfilter::TypeGraph> Graph =
      tsfilter::loadSchema((*Buffer)->getBuffer().str());
  if (!Graph) {
    Diags.report(Graph.takeError());
    return 1;
  }
  if (Verbose)
    errs() << "Loaded " << Graph->size() << " declarations\n";

  tsfilter::LiteralIndex Index = tsfilter::LiteralIndex::build(*Graph);
  if (Verbose)
    errs() << "Indexed " << Index.getNumOccurrences() << " literals under "
           << Index.getNumTerms() << " terms\n";
  if (DumpIndex) {
    Index.dump(outs());
    return 0;
  }

  std::vector<std::string> CartLiterals;
  if (!loadCart(CartLiterals))
    return 1;

  tsfilter::MatchOptions MatchOpts;
  MatchOpts.StopWords = !NoStopWords;
  tsfilter::QueryMatcher Matcher(Index, MatchOpts);
  tsfilter::LiveSet Live = Matcher.match(Query, CartLiterals);
  if (Verbose) {
    errs() << "Matched " << Live.count() << " live literals\n";
    for (unsigned Id : Live.ids())
      errs() << "  " << Index.getOccurrence(Id).DeclName << ": "
             << Matcher.highlight(Query, Id) << "\n";
  }

  tsfilter::FilterOptions FilterOpts;
  FilterOpts.CompressPaths = Compress;
  tsfilter::PrintOptions PrintOpts;
  PrintOpts.KeepTemplates = KeepTemplates;

  tsfilter::TypeFilter Filter(*Graph, Index, FilterOpts);
  Expected<tsfilter::PrunedSchema> Pruned = Filter.prune(RootName, Live);
  if (!Pruned) {
    bool RootEliminated = false;
    Error Rest = handleErrors(
        Pruned.takeError(), [&](std::unique_ptr<tsfilter::SchemaError> E) {
          RootEliminated = E->kind() == tsfilter::ErrorKind::RootEliminated;
          return Error(std::move(E));
        });
    Diags.report(std::move(Rest));
    if (!RootEliminated)
      return 1;
    if (OnRootEliminated != Fallback::Full)
      return 2;
    Diags.report(0, 0, tsfilter::DiagID::WarnFallbackSchema);
    tsfilter::SchemaPrinter(outs(), PrintOpts).printFrom(*Graph, RootName);
    return 0;
  }

  if (Verbose)
    errs() << "Emitted " << Pruned->Stats.DeclsEmitted << " declarations ("
           << Pruned->Stats.LiteralsKept << " literals kept, "
           << Pruned->Stats.LiteralsRemoved << " removed, "
           << Pruned->Stats.DeclsInlined << " inlined)\n";

  outs() << tsfilter::formatSchema(*Pruned, PrintOpts);
  return 0;
}
