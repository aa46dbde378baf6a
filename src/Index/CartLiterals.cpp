#include "tsfilter/CartLiterals.h"
#include "llvm/ADT/SmallVector.h"
#include <algorithm>

namespace tsfilter {

static void collect(const llvm::json::Value &V,
                    std::vector<std::string> &Out) {
  if (llvm::Optional<llvm::StringRef> S = V.getAsString()) {
    Out.push_back(S->str());
    return;
  }

  if (const llvm::json::Array *A = V.getAsArray()) {
    for (const llvm::json::Value &Elt : *A)
      collect(Elt, Out);
    return;
  }

  if (const llvm::json::Object *O = V.getAsObject()) {
    // json::Object is a hash map; sort for a stable walk.
    llvm::SmallVector<const llvm::json::Object::value_type *, 8> Entries;
    for (const auto &Entry : *O)
      Entries.push_back(&Entry);
    std::sort(Entries.begin(), Entries.end(),
              [](const llvm::json::Object::value_type *L,
                 const llvm::json::Object::value_type *R) {
                return L->first < R->first;
              });
    for (const auto *Entry : Entries)
      collect(Entry->second, Out);
  }
}

std::vector<std::string> collectStringLiterals(const llvm::json::Value &Cart) {
  std::vector<std::string> Out;
  collect(Cart, Out);
  return Out;
}

} // namespace tsfilter
