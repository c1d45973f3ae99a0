#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <variant>

#include "tests/common/scoreboard_fixture.hpp"
#include "vscore/hir/refs.hpp"
#include "vscore/score/scoreboard.hpp"

namespace vscore::test {
namespace {

class DefinitionsTest : public ScoreboardFixture {
 protected:
  auto FirstPackage(hir::LibraryId lib) -> hir::PackageId {
    auto node = scoreboard_->Hir(lib);
    EXPECT_TRUE(node.has_value());
    return (*node)->packages.front();
  }
};

// ============================================================================
// Libraries
// ============================================================================

TEST_F(DefinitionsTest, LibraryListsPrimaryUnits) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(
                 Unit(b_.Entity("Top")), Unit(b_.Package("Defs")),
                 Unit(b_.Architecture("rtl", "top")),
                 Unit(b_.PackageBody("defs"))));

  auto defs = sb.Definitions(lib);
  ASSERT_TRUE(defs.has_value());
  EXPECT_NE((*defs)->Lookup("top"), nullptr);
  EXPECT_NE((*defs)->Lookup("defs"), nullptr);
  // Secondary units declare nothing.
  EXPECT_EQ((*defs)->Lookup("rtl"), nullptr);
  EXPECT_EQ((*defs)->Size(), 2U);
  EXPECT_TRUE(Diagnostics().empty());
}

TEST_F(DefinitionsTest, DuplicateUnitsAreOneDiagnostic) {
  auto& sb = Session();
  auto first = b_.Package("p");
  SourceSpan first_span = first.name.span;
  auto second = b_.Entity("P");
  SourceSpan second_span = second.name.span;
  auto lib = AddLibrary(
      "lib", Units(Unit(std::move(second)), Unit(std::move(first))));

  EXPECT_FALSE(sb.Definitions(lib).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  const Diagnostic& diag = Diagnostics().front();
  EXPECT_EQ(diag.primary.message, "`p` declared multiple times");
  // Reported at the declaration that comes first in the source.
  EXPECT_EQ(std::get<SourceSpan>(diag.primary.span), first_span);
  ASSERT_EQ(diag.notes.size(), 1U);
  EXPECT_EQ(diag.notes[0].message, "also declared here");
  EXPECT_EQ(std::get<SourceSpan>(diag.notes[0].span), second_span);

  // The failure is cached, not reported again.
  EXPECT_FALSE(sb.Definitions(lib).has_value());
  EXPECT_EQ(Diagnostics().size(), 1U);
}

TEST_F(DefinitionsTest, TwoEntitiesWithOneName) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(b_.Entity("x")), Unit(b_.Entity("X")), Unit(b_.Entity("y"))));

  EXPECT_FALSE(sb.Definitions(lib).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].notes.size(), 1U);
}

TEST_F(DefinitionsTest, IgnoreDuplicateDefsKeepsFirst) {
  auto& sb = Session({.ignore_duplicate_defs = true});
  auto first = b_.Package("p");
  auto second = b_.Package("p");
  auto lib = AddLibrary(
      "lib", Units(Unit(std::move(first)), Unit(std::move(second))));

  auto defs = sb.Definitions(lib);
  ASSERT_TRUE(defs.has_value());
  const auto* entries = (*defs)->Lookup("p");
  ASSERT_NE(entries, nullptr);
  ASSERT_EQ(entries->size(), 1U);
  EXPECT_EQ(entries->front().value, hir::Def{FirstPackage(lib)});
  EXPECT_TRUE(Diagnostics().empty());
}

// ============================================================================
// Context clauses
// ============================================================================

TEST_F(DefinitionsTest, UnknownLibrary) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(
                 b_.Package("p"),
                 {b_.Library({"nolib"}), b_.Use({"nolib.pkg.all"})})));

  EXPECT_FALSE(sb.ScopeOf(FirstPackage(lib)).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  const Diagnostic& diag = Diagnostics().front();
  EXPECT_EQ(diag.primary.message, "no library named `nolib` found");
  ASSERT_EQ(diag.notes.size(), 1U);
  EXPECT_EQ(diag.notes[0].message, "known libraries: std, lib");
}

TEST_F(DefinitionsTest, ImplicitLibrariesMayBeRepeated) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib",
      Units(Unit(b_.Package("p"), {b_.Library({"std", "work"})})));

  EXPECT_TRUE(sb.ScopeOf(FirstPackage(lib)).has_value());
  EXPECT_TRUE(Diagnostics().empty());
}

TEST_F(DefinitionsTest, LibraryClauseTwiceIsAnError) {
  auto& sb = Session();
  AddLibrary("other", Units());
  auto lib = AddLibrary(
      "lib", Units(Unit(
                 b_.Package("p"),
                 {b_.Library({"other"}), b_.Library({"Other"})})));

  EXPECT_FALSE(sb.ScopeOf(FirstPackage(lib)).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(
      Diagnostics()[0].primary.message, "`other` has already been declared");
  ASSERT_EQ(Diagnostics()[0].notes.size(), 1U);
  EXPECT_EQ(Diagnostics()[0].notes[0].message, "previous declaration was here:");
}

TEST_F(DefinitionsTest, WorkDenotesTheOwningLibrary) {
  auto& sb = Session();
  auto lib = AddLibrary("lib", Units(Unit(b_.Package("p"))));

  auto work = sb.ResolveName(
      FirstPackage(lib), {.value = "work", .span = b_.Span()});
  ASSERT_TRUE(work.has_value());
  ASSERT_EQ(work->size(), 1U);
  EXPECT_EQ(work->front().value, hir::Def{lib});
}

// ============================================================================
// Packages
// ============================================================================

TEST_F(DefinitionsTest, EnumerationLiteralsOverload) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(b_.Package(
                 "p", b_.EnumType("color", {"red", "green"}),
                 b_.EnumType("light", {"RED", "off"})))));

  auto defs = sb.Definitions(FirstPackage(lib));
  ASSERT_TRUE(defs.has_value());
  const auto* red = (*defs)->Lookup("red");
  ASSERT_NE(red, nullptr);
  ASSERT_EQ(red->size(), 2U);
  EXPECT_TRUE(std::holds_alternative<hir::EnumLitRef>((*red)[0].value));
  EXPECT_TRUE(std::holds_alternative<hir::EnumLitRef>((*red)[1].value));
  EXPECT_EQ(std::get<hir::EnumLitRef>((*red)[1].value).index, 0U);
  EXPECT_NE((*defs)->Lookup("color"), nullptr);
  EXPECT_TRUE(Diagnostics().empty());
}

TEST_F(DefinitionsTest, CharacterLiteralsAreCaseSensitive) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(b_.Package("p", b_.EnumType("c", {"'A'", "'a'"})))));

  auto defs = sb.Definitions(FirstPackage(lib));
  ASSERT_TRUE(defs.has_value());
  EXPECT_EQ((*defs)->Lookup("'A'")->size(), 1U);
  EXPECT_EQ((*defs)->Lookup("'a'")->size(), 1U);
}

TEST_F(DefinitionsTest, LiteralAfterObjectClashes) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(b_.Package(
                 "p", b_.Constant("red", b_.Subtype("integer")),
                 b_.EnumType("color", {"red"})))));

  EXPECT_FALSE(sb.Definitions(FirstPackage(lib)).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].primary.message, "`red` has already been declared");
}

TEST_F(DefinitionsTest, ObjectAfterLiteralClashes) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(b_.Package(
                 "p", b_.EnumType("color", {"red"}),
                 b_.Signal("Red", b_.Subtype("integer"))))));

  EXPECT_FALSE(sb.Definitions(FirstPackage(lib)).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].primary.message, "`red` has already been declared");
  ASSERT_EQ(Diagnostics()[0].notes.size(), 1U);
}

TEST_F(DefinitionsTest, ObjectsWithSeveralNames) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(b_.Package(
                 "p", b_.Object(
                          ast::ObjectKind::kVariable, {"a", "b"},
                          b_.Subtype("integer"))))));

  auto defs = sb.Definitions(FirstPackage(lib));
  ASSERT_TRUE(defs.has_value());
  EXPECT_TRUE(std::holds_alternative<hir::VariableDeclId>(
      (*defs)->Lookup("a")->front().value));
  EXPECT_TRUE(std::holds_alternative<hir::VariableDeclId>(
      (*defs)->Lookup("b")->front().value));
}

TEST_F(DefinitionsTest, EntityDefinitionsUnsupported) {
  auto& sb = Session();
  auto lib = AddLibrary("lib", Units(Unit(b_.Entity("e"))));
  hir::EntityId entity = (*sb.Hir(lib))->entities.front();

  EXPECT_FALSE(sb.Definitions(entity).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].primary.kind, DiagKind::kUnsupported);
}

}  // namespace
}  // namespace vscore::test
