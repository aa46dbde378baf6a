#include "SchemaTestUtil.h"
#include "tsfilter/QueryMatcher.h"
#include "gtest/gtest.h"

using namespace tsfilter;
using namespace tsfilter::testutil;

namespace {

class QueryMatcherTest : public ::testing::Test {
protected:
  QueryMatcherTest()
      : G(load("type Drink = LITERAL<\"Iced Latte\", [\"cold coffee\"], false>"
               "  | \"Mocha\" | \"Hot Chocolate\";\n"
               "type Size = \"Small\" | \"Large\";\n"
               "type Special = \"The Works\";\n")),
        Index(LiteralIndex::build(G)) {}

  std::vector<unsigned> live(llvm::StringRef Phrase,
                             std::vector<std::string> Cart = {},
                             MatchOptions Opts = MatchOptions()) {
    return QueryMatcher(Index, Opts).match(Phrase, Cart).ids();
  }

  TypeGraph G;
  LiteralIndex Index;
};

TEST_F(QueryMatcherTest, PhraseWords) {
  EXPECT_EQ(live("one iced latte please"), std::vector<unsigned>{0});
  EXPECT_EQ(live("HOT chocolates"), std::vector<unsigned>{2});
  EXPECT_EQ(live("mocha, large"), (std::vector<unsigned>{1, 4}));
  EXPECT_TRUE(live("").empty());
}

TEST_F(QueryMatcherTest, TemplateAliases) {
  EXPECT_EQ(live("something cold"), std::vector<unsigned>{0});
}

TEST_F(QueryMatcherTest, ExactStemsOnly) {
  EXPECT_TRUE(live("lat moch").empty());
}

TEST_F(QueryMatcherTest, StopWords) {
  EXPECT_EQ(live("the works"), std::vector<unsigned>{5});
  EXPECT_TRUE(live("the").empty());

  MatchOptions Keep;
  Keep.StopWords = false;
  EXPECT_EQ(live("the", {}, Keep), std::vector<unsigned>{5});
}

TEST_F(QueryMatcherTest, CartLiterals) {
  EXPECT_EQ(live("", {"Small"}), std::vector<unsigned>{3});
  // Cart values are used whole, stop words included.
  EXPECT_EQ(live("", {"The"}), std::vector<unsigned>{5});
  EXPECT_EQ(live("latte", {"Large"}), (std::vector<unsigned>{0, 4}));
}

TEST_F(QueryMatcherTest, QueryTermsAreDeduplicated) {
  QueryMatcher M(Index);
  EXPECT_EQ(M.queryTerms("Latte lattes, the", {"latte"}),
            std::vector<std::string>{"latt"});
}

TEST_F(QueryMatcherTest, Highlight) {
  QueryMatcher M(Index);
  EXPECT_EQ(M.highlight("ice", 0), "[Iced] Latte");
  EXPECT_EQ(M.highlight("hot chocolates", 2), "[Hot] [Chocolate]");
  EXPECT_EQ(M.highlight("nothing", 1), "Mocha");
}

TEST(QueryMatcherStopWordTest, StopWordValuesStayReachable) {
  TypeGraph G = load("type Size = \"A\" | \"B\";\n"
                     "type Style = LITERAL<\"Unchanged\", [\"as is\"], false>"
                     " | \"The Works\";\n");
  LiteralIndex Index = LiteralIndex::build(G);
  EXPECT_TRUE(Index.isStopWordTerm("a"));
  EXPECT_TRUE(Index.isStopWordTerm("is"));
  EXPECT_FALSE(Index.isStopWordTerm("the"));

  QueryMatcher M(Index);
  EXPECT_EQ(M.match("a").ids(), std::vector<unsigned>{0});
  EXPECT_EQ(M.match("keep it as is").ids(), std::vector<unsigned>{2});
  EXPECT_EQ(M.queryTerms("keep it as is"),
            (std::vector<std::string>{"keep", "as", "is"}));
  // "The Works" has a content word, so "the" is still dropped.
  EXPECT_TRUE(M.match("the").empty());
  EXPECT_TRUE(M.match("an apple").empty());
}

} // namespace
