#pragma once

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace tsfilter {

/// Unicode simple case folding of UTF-8 text. Invalid sequences are copied
/// through byte for byte.
std::string foldCase(llvm::StringRef Text);

/// Porter stemmer (M.F. Porter, 1980) over a case-folded word. Bytes outside
/// ASCII are treated as consonants and never rewritten.
std::string stemWord(llvm::StringRef Word);

/// Split \p Text on ASCII whitespace.
void splitWords(llvm::StringRef Text,
                llvm::SmallVectorImpl<llvm::StringRef> &Words);

/// Fold, strip surrounding ASCII punctuation and stem one word. Returns an
/// empty string when nothing but punctuation remains.
std::string normalizeWord(llvm::StringRef Word);

/// normalizeWord() applied to every word of \p Text, in order. When
/// \p DropStopWords is set, common English function words are skipped.
std::vector<std::string> normalizeText(llvm::StringRef Text,
                                       bool DropStopWords = false);

/// True for a case-folded English function word ("a", "the", "with", ...).
bool isStopWord(llvm::StringRef FoldedWord);

/// isStopWord() on a raw word, after folding and stripping punctuation.
bool isStopWordToken(llvm::StringRef Word);

} // namespace tsfilter
