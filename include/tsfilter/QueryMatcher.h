#pragma once

#include "tsfilter/LiteralIndex.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/StringSet.h"
#include <string>
#include <vector>

namespace tsfilter {

struct MatchOptions {
  /// Drop English function words from the free-text phrase. Cart literals
  /// are always used whole.
  bool StopWords = true;
};

/// QueryMatcher - turns one conversational turn (a phrase plus the string
/// values already in the cart) into the set of live occurrences.
///
/// An occurrence is live when any of its indexed terms (label words and, for
/// a template, alias words) equals any query term. Matching is exact on
/// normalized stems.
class QueryMatcher {
public:
  explicit QueryMatcher(const LiteralIndex &Index,
                        MatchOptions Opts = MatchOptions())
      : Index(Index), Opts(Opts) {}

  LiveSet match(llvm::StringRef Phrase,
                llvm::ArrayRef<std::string> CartLiterals = {}) const;

  /// Normalized, deduplicated query terms in first-seen order.
  std::vector<std::string>
  queryTerms(llvm::StringRef Phrase,
             llvm::ArrayRef<std::string> CartLiterals = {}) const;

  /// The occurrence's value with each word matching \p Phrase in brackets,
  /// e.g. "[iced] coffee" for the phrase "ice".
  std::string highlight(llvm::StringRef Phrase, unsigned Id) const;

private:
  const LiteralIndex &Index;
  MatchOptions Opts;
};

} // namespace tsfilter
