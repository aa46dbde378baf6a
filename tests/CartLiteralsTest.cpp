#include "tsfilter/CartLiterals.h"
#include "gtest/gtest.h"

using namespace tsfilter;

namespace {

llvm::json::Value parse(llvm::StringRef Text) {
  auto V = llvm::json::parse(Text);
  if (!V) {
    ADD_FAILURE() << llvm::toString(V.takeError());
    return nullptr;
  }
  return std::move(*V);
}

TEST(CartLiteralsTest, DepthFirstSortedKeys) {
  llvm::json::Value Cart = parse(R"({
    "items": [
      {"size": "Large", "name": "Latte", "qty": 2,
       "extras": ["Oat Milk", null, true]}
    ],
    "customer": "Ann"
  })");
  EXPECT_EQ(collectStringLiterals(Cart),
            (std::vector<std::string>{"Ann", "Oat Milk", "Latte", "Large"}));
}

TEST(CartLiteralsTest, ArraysKeepIndexOrder) {
  EXPECT_EQ(collectStringLiterals(parse(R"(["b", ["a", "c"], "a"])")),
            (std::vector<std::string>{"b", "a", "c", "a"}));
}

TEST(CartLiteralsTest, KeysAndScalarsIgnored) {
  EXPECT_TRUE(collectStringLiterals(parse(R"({"name": 1, "flag": false})"))
                  .empty());
  EXPECT_TRUE(collectStringLiterals(parse("42")).empty());
  EXPECT_EQ(collectStringLiterals(parse(R"("solo")")),
            std::vector<std::string>{"solo"});
}

} // namespace
