#include "tsfilter/Normalize.h"
#include <cstring>

namespace tsfilter {

namespace {

// Porter's algorithm over the byte buffer B[0..K]. J marks the end of the
// stem while a suffix is being tested.
class PorterStemmer {
public:
  explicit PorterStemmer(llvm::StringRef Word)
      : B(Word.str()), K(static_cast<int>(Word.size()) - 1) {}

  std::string run() {
    if (K <= 1)
      return B; // words of one or two letters are left alone
    step1ab();
    if (K > 0) {
      step1c();
      step2();
      step3();
      step4();
      step5();
    }
    return B.substr(0, K + 1);
  }

private:
  std::string B;
  int K;
  int J = 0;

  bool cons(int I) const {
    switch (B[I]) {
    case 'a':
    case 'e':
    case 'i':
    case 'o':
    case 'u':
      return false;
    case 'y':
      return I == 0 ? true : !cons(I - 1);
    default:
      return true;
    }
  }

  // Number of VC sequences in B[0..J]: [C](VC){m}[V].
  int m() const {
    int N = 0;
    int I = 0;
    while (true) {
      if (I > J)
        return N;
      if (!cons(I))
        break;
      I++;
    }
    I++;
    while (true) {
      while (true) {
        if (I > J)
          return N;
        if (cons(I))
          break;
        I++;
      }
      I++;
      N++;
      while (true) {
        if (I > J)
          return N;
        if (!cons(I))
          break;
        I++;
      }
      I++;
    }
  }

  bool vowelInStem() const {
    for (int I = 0; I <= J; I++)
      if (!cons(I))
        return true;
    return false;
  }

  bool doubleC(int I) const {
    if (I < 1)
      return false;
    if (B[I] != B[I - 1])
      return false;
    return cons(I);
  }

  // consonant-vowel-consonant ending at I, where the last C is not w, x or y
  bool cvc(int I) const {
    if (I < 2 || !cons(I) || cons(I - 1) || !cons(I - 2))
      return false;
    char Ch = B[I];
    return Ch != 'w' && Ch != 'x' && Ch != 'y';
  }

  bool ends(const char *S) {
    int Len = static_cast<int>(std::strlen(S));
    if (Len > K + 1)
      return false;
    if (B.compare(K - Len + 1, Len, S) != 0)
      return false;
    J = K - Len;
    return true;
  }

  void setTo(const char *S) {
    int Len = static_cast<int>(std::strlen(S));
    B.replace(J + 1, K - J, S);
    K = J + Len;
  }

  void r(const char *S) {
    if (m() > 0)
      setTo(S);
  }

  // Plurals and -ed / -ing.
  void step1ab() {
    if (B[K] == 's') {
      if (ends("sses"))
        K -= 2;
      else if (ends("ies"))
        setTo("i");
      else if (B[K - 1] != 's')
        K--;
    }
    if (ends("eed")) {
      if (m() > 0)
        K--;
    } else if ((ends("ed") || ends("ing")) && vowelInStem()) {
      K = J;
      if (ends("at"))
        setTo("ate");
      else if (ends("bl"))
        setTo("ble");
      else if (ends("iz"))
        setTo("ize");
      else if (doubleC(K)) {
        K--;
        char Ch = B[K];
        if (Ch == 'l' || Ch == 's' || Ch == 'z')
          K++;
      } else {
        J = K;
        if (m() == 1 && cvc(K))
          setTo("e");
      }
    }
  }

  // Terminal y to i when there is another vowel in the stem.
  void step1c() {
    if (ends("y") && vowelInStem())
      B[K] = 'i';
  }

  // Double suffixes to single ones.
  void step2() {
    if (K < 1)
      return;
    switch (B[K - 1]) {
    case 'a':
      if (ends("ational")) {
        r("ate");
        break;
      }
      if (ends("tional")) {
        r("tion");
        break;
      }
      break;
    case 'c':
      if (ends("enci")) {
        r("ence");
        break;
      }
      if (ends("anci")) {
        r("ance");
        break;
      }
      break;
    case 'e':
      if (ends("izer")) {
        r("ize");
        break;
      }
      break;
    case 'l':
      if (ends("bli")) {
        r("ble");
        break;
      }
      if (ends("alli")) {
        r("al");
        break;
      }
      if (ends("entli")) {
        r("ent");
        break;
      }
      if (ends("eli")) {
        r("e");
        break;
      }
      if (ends("ousli")) {
        r("ous");
        break;
      }
      break;
    case 'o':
      if (ends("ization")) {
        r("ize");
        break;
      }
      if (ends("ation")) {
        r("ate");
        break;
      }
      if (ends("ator")) {
        r("ate");
        break;
      }
      break;
    case 's':
      if (ends("alism")) {
        r("al");
        break;
      }
      if (ends("iveness")) {
        r("ive");
        break;
      }
      if (ends("fulness")) {
        r("ful");
        break;
      }
      if (ends("ousness")) {
        r("ous");
        break;
      }
      break;
    case 't':
      if (ends("aliti")) {
        r("al");
        break;
      }
      if (ends("iviti")) {
        r("ive");
        break;
      }
      if (ends("biliti")) {
        r("ble");
        break;
      }
      break;
    case 'g':
      if (ends("logi")) {
        r("log");
        break;
      }
      break;
    default:
      break;
    }
  }

  // -ic-, -full, -ness etc.
  void step3() {
    switch (B[K]) {
    case 'e':
      if (ends("icate")) {
        r("ic");
        break;
      }
      if (ends("ative")) {
        r("");
        break;
      }
      if (ends("alize")) {
        r("al");
        break;
      }
      break;
    case 'i':
      if (ends("iciti")) {
        r("ic");
        break;
      }
      break;
    case 'l':
      if (ends("ical")) {
        r("ic");
        break;
      }
      if (ends("ful")) {
        r("");
        break;
      }
      break;
    case 's':
      if (ends("ness")) {
        r("");
        break;
      }
      break;
    default:
      break;
    }
  }

  // -ant, -ence etc. in context <c>vcvc<v>.
  void step4() {
    if (K < 1)
      return;
    switch (B[K - 1]) {
    case 'a':
      if (ends("al"))
        break;
      return;
    case 'c':
      if (ends("ance") || ends("ence"))
        break;
      return;
    case 'e':
      if (ends("er"))
        break;
      return;
    case 'i':
      if (ends("ic"))
        break;
      return;
    case 'l':
      if (ends("able") || ends("ible"))
        break;
      return;
    case 'n':
      if (ends("ant") || ends("ement") || ends("ment") || ends("ent"))
        break;
      return;
    case 'o':
      if (ends("ion") && J >= 0 && (B[J] == 's' || B[J] == 't'))
        break;
      if (ends("ou"))
        break;
      return;
    case 's':
      if (ends("ism"))
        break;
      return;
    case 't':
      if (ends("ate") || ends("iti"))
        break;
      return;
    case 'u':
      if (ends("ous"))
        break;
      return;
    case 'v':
      if (ends("ive"))
        break;
      return;
    case 'z':
      if (ends("ize"))
        break;
      return;
    default:
      return;
    }
    if (m() > 1)
      K = J;
  }

  // Final -e and -ll.
  void step5() {
    J = K;
    if (B[K] == 'e') {
      int A = m();
      if (A > 1 || (A == 1 && !cvc(K - 1)))
        K--;
    }
    if (B[K] == 'l' && doubleC(K) && m() > 1)
      K--;
  }
};

} // namespace

std::string stemWord(llvm::StringRef Word) {
  return PorterStemmer(Word).run();
}

} // namespace tsfilter
