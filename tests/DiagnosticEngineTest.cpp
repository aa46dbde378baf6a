#include "tsfilter/DiagnosticEngine.h"
#include "gtest/gtest.h"

using namespace tsfilter;

namespace {

TEST(DiagnosticEngineTest, FormatsPlaceholders) {
  std::string Out;
  llvm::raw_string_ostream OS(Out);
  DiagnosticEngine Diags(OS, "menu.ts");
  Diags.report(3, 7, DiagID::ErrArityMismatch, "Foo", 2, 1);
  EXPECT_EQ(OS.str(), "menu.ts:3:7: error: type 'Foo' expects 2 type "
                      "argument(s), got 1\n");
  EXPECT_EQ(Diags.getErrorCount(), 1u);
  EXPECT_TRUE(Diags.hasErrors());
}

TEST(DiagnosticEngineTest, WarningsWithoutLocation) {
  std::string Out;
  llvm::raw_string_ostream OS(Out);
  DiagnosticEngine Diags(OS);
  Diags.report(0, 0, DiagID::WarnFallbackSchema);
  EXPECT_EQ(OS.str(), "<input>: warning: printing the unpruned schema instead\n");
  EXPECT_EQ(Diags.getWarningCount(), 1u);
  EXPECT_FALSE(Diags.hasErrors());
}

TEST(DiagnosticEngineTest, ReportConsumesSchemaErrors) {
  std::string Out;
  llvm::raw_string_ostream OS(Out);
  DiagnosticEngine Diags(OS, "a.ts");
  Diags.report(
      DiagnosticEngine::makeError(DiagID::ErrUnknownType, 2, 4, "Size"));
  Diags.report(llvm::make_error<llvm::StringError>(
      "disk on fire", llvm::inconvertibleErrorCode()));
  EXPECT_EQ(OS.str(), "a.ts:2:4: error: reference to undeclared type 'Size'\n"
                      "a.ts: error: disk on fire\n");
  EXPECT_EQ(Diags.getErrorCount(), 2u);
}

TEST(DiagnosticEngineTest, SchemaErrorCarriesKindAndLocation) {
  llvm::Error E =
      DiagnosticEngine::makeError(DiagID::ErrRootEliminated, 5, 1, "Cart");
  bool Seen = false;
  llvm::handleAllErrors(std::move(E), [&](const SchemaError &SE) {
    Seen = true;
    EXPECT_EQ(SE.kind(), ErrorKind::RootEliminated);
    EXPECT_EQ(SE.getDiagID(), DiagID::ErrRootEliminated);
    EXPECT_EQ(SE.getLine(), 5);
    EXPECT_EQ(SE.getColumn(), 1);
    EXPECT_EQ(SE.getMessage(),
              "query eliminated every alternative of root type 'Cart'");
  });
  EXPECT_TRUE(Seen);
}

TEST(DiagnosticEngineTest, LogText) {
  EXPECT_EQ(llvm::toString(DiagnosticEngine::makeError(
                DiagID::ErrRedefinition, 1, 6, "A")),
            "1:6: DuplicateDeclarationError: redefinition of type 'A'");
  EXPECT_EQ(llvm::toString(
                DiagnosticEngine::makeError(DiagID::ErrUnknownRoot, 0, 0, "X")),
            "DanglingReferenceError: root type 'X' is not declared in the "
            "schema");
}

TEST(DiagnosticEngineTest, Classification) {
  EXPECT_EQ(DiagnosticEngine::getKind(DiagID::ErrExpected), ErrorKind::Syntax);
  EXPECT_EQ(DiagnosticEngine::getKind(DiagID::ErrArityMismatch),
            ErrorKind::ArityMismatch);
  EXPECT_EQ(DiagnosticEngine::getLevel(DiagID::WarnFallbackSchema),
            DiagLevel::Warning);
  EXPECT_STREQ(getKindName(ErrorKind::DanglingReference),
               "DanglingReferenceError");
}

} // namespace
