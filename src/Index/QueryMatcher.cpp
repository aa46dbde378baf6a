#include "tsfilter/QueryMatcher.h"
#include "tsfilter/Normalize.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "tsfilter-match"

namespace tsfilter {

std::vector<std::string>
QueryMatcher::queryTerms(llvm::StringRef Phrase,
                         llvm::ArrayRef<std::string> CartLiterals) const {
  std::vector<std::string> Terms;
  llvm::StringSet<> Seen;
  auto Add = [&](std::vector<std::string> Words) {
    for (std::string &W : Words)
      if (Seen.insert(W).second)
        Terms.push_back(std::move(W));
  };

  llvm::SmallVector<llvm::StringRef, 8> Words;
  splitWords(Phrase, Words);
  std::vector<std::string> PhraseTerms;
  for (llvm::StringRef W : Words) {
    std::string Term = normalizeWord(W);
    if (Term.empty())
      continue;
    if (Opts.StopWords && isStopWordToken(W) && !Index.isStopWordTerm(Term))
      continue;
    PhraseTerms.push_back(std::move(Term));
  }
  Add(std::move(PhraseTerms));
  for (const std::string &Lit : CartLiterals)
    Add(normalizeText(Lit));
  return Terms;
}

LiveSet QueryMatcher::match(llvm::StringRef Phrase,
                            llvm::ArrayRef<std::string> CartLiterals) const {
  LiveSet Live(Index.getNumOccurrences());
  for (const std::string &Term : queryTerms(Phrase, CartLiterals)) {
    llvm::ArrayRef<unsigned> Hits = Index.getPostings(Term);
    LLVM_DEBUG(llvm::dbgs() << "term '" << Term << "' hits " << Hits.size()
                            << " occurrence(s)\n");
    for (unsigned Id : Hits)
      Live.insert(Id);
  }

  LLVM_DEBUG(llvm::dbgs() << Live.count() << " of "
                          << Index.getNumOccurrences()
                          << " occurrences live\n");
  return Live;
}

std::string QueryMatcher::highlight(llvm::StringRef Phrase,
                                    unsigned Id) const {
  llvm::StringSet<> Terms;
  for (const std::string &T : queryTerms(Phrase))
    Terms.insert(T);

  llvm::StringRef Rest = Index.getOccurrence(Id).Value;
  std::string Out;
  while (!Rest.empty()) {
    llvm::StringRef Trimmed = Rest.ltrim();
    Out += Rest.take_front(Rest.size() - Trimmed.size()).str();
    if (Trimmed.empty())
      break;

    llvm::StringRef Word = Trimmed.take_until(llvm::isSpace);
    Rest = Trimmed.drop_front(Word.size());

    std::string Stem = normalizeWord(Word);
    if (!Stem.empty() && Terms.count(Stem))
      Out += "[" + Word.str() + "]";
    else
      Out += Word.str();
  }
  return Out;
}

} // namespace tsfilter
