#include "tsfilter/Normalize.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/ConvertUTF.h"
#include "llvm/Support/Unicode.h"

namespace tsfilter {

std::string foldCase(llvm::StringRef Text) {
  std::string Out;
  Out.reserve(Text.size());

  const llvm::UTF8 *Cur = Text.bytes_begin();
  const llvm::UTF8 *End = Text.bytes_end();
  while (Cur < End) {
    if (*Cur < 0x80) {
      Out += llvm::toLower(static_cast<char>(*Cur));
      ++Cur;
      continue;
    }

    const llvm::UTF8 *Start = Cur;
    llvm::UTF32 CodePoint;
    if (llvm::convertUTF8Sequence(&Cur, End, &CodePoint,
                                  llvm::strictConversion) !=
        llvm::conversionOK) {
      Out += static_cast<char>(*Start);
      Cur = Start + 1;
      continue;
    }

    int Folded = llvm::sys::unicode::foldCharSimple(CodePoint);
    char Buf[UNI_MAX_UTF8_BYTES_PER_CODE_POINT];
    char *Ptr = Buf;
    if (llvm::ConvertCodePointToUTF8(Folded, Ptr))
      Out.append(Buf, Ptr);
    else
      Out.append(reinterpret_cast<const char *>(Start), Cur - Start);
  }
  return Out;
}

void splitWords(llvm::StringRef Text,
                llvm::SmallVectorImpl<llvm::StringRef> &Words) {
  size_t Start = 0;
  for (size_t I = 0; I <= Text.size(); ++I) {
    if (I < Text.size() && !llvm::isSpace(Text[I]))
      continue;
    if (I > Start)
      Words.push_back(Text.slice(Start, I));
    Start = I + 1;
  }
}

static bool isAsciiPunct(char C) {
  return llvm::isPrint(C) && !llvm::isAlnum(C) && C != ' ';
}

std::string normalizeWord(llvm::StringRef Word) {
  while (!Word.empty() && isAsciiPunct(Word.front()))
    Word = Word.drop_front();
  while (!Word.empty() && isAsciiPunct(Word.back()))
    Word = Word.drop_back();
  if (Word.empty())
    return std::string();
  return stemWord(foldCase(Word));
}

std::vector<std::string> normalizeText(llvm::StringRef Text,
                                       bool DropStopWords) {
  llvm::SmallVector<llvm::StringRef, 8> Words;
  splitWords(Text, Words);

  std::vector<std::string> Terms;
  for (llvm::StringRef W : Words) {
    if (DropStopWords && isStopWordToken(W))
      continue;
    std::string Term = normalizeWord(W);
    if (!Term.empty())
      Terms.push_back(std::move(Term));
  }
  return Terms;
}

bool isStopWord(llvm::StringRef FoldedWord) {
  static const llvm::StringSet<> StopWords = {
      "a",     "an",    "and",   "are",  "as",    "at",   "be",   "but",
      "by",    "can",   "could", "do",   "for",   "from", "get",  "give",
      "have",  "he",    "her",   "i",    "i'd",   "i'll", "i'm",  "in",
      "is",    "it",    "just",  "like", "me",    "my",   "need", "of",
      "on",    "or",    "our",   "please", "she", "so",   "some", "that",
      "the",   "their", "them",  "then", "there", "they", "this", "to",
      "us",    "want",  "we",    "what", "will",  "with", "would", "you",
      "your"};
  return StopWords.count(FoldedWord);
}

bool isStopWordToken(llvm::StringRef Word) {
  std::string Folded = foldCase(Word);
  return isStopWord(llvm::StringRef(Folded).trim(" .,;:!?\"'()"));
}

} // namespace tsfilter
