#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <variant>

#include "tests/common/scoreboard_fixture.hpp"
#include "vscore/hir/refs.hpp"
#include "vscore/score/query.hpp"
#include "vscore/score/scoreboard.hpp"

namespace vscore::test {
namespace {

class ScopeTest : public ScoreboardFixture {
 protected:
  // Package `defs` with `type color is (red, green)` and `constant c`.
  auto DefsPackage() -> ast::DesignUnit {
    return Unit(b_.Package(
        "defs", b_.EnumType("color", {"red", "green"}),
        b_.Constant("c", b_.Subtype("integer"), b_.Int("1"))));
  }

  auto Package(hir::LibraryId lib, std::string_view name) -> hir::PackageId {
    auto node = scoreboard_->Hir(lib);
    EXPECT_TRUE(node.has_value());
    for (hir::PackageId pkg : (*node)->packages) {
      if (scoreboard_->NameOf(pkg) == name) {
        return pkg;
      }
    }
    ADD_FAILURE() << "no package " << name;
    return {};
  }

  auto Resolve(const hir::ScopeRef& scope, std::string_view name)
      -> score::Outcome<std::vector<Spanned<hir::Def>>> {
    return scoreboard_->ResolveName(
        scope, {.value = std::string(name), .span = b_.Span()});
  }
};

// ============================================================================
// Use clauses
// ============================================================================

TEST_F(ScopeTest, WildcardImport) {
  Session();
  auto lib = AddLibrary(
      "lib", Units(
                 DefsPackage(),
                 Unit(b_.Package("user"), {b_.Use({"work.defs.all"})})));

  auto red = Resolve(Package(lib, "user"), "RED");
  ASSERT_TRUE(red.has_value());
  ASSERT_EQ(red->size(), 1U);
  EXPECT_TRUE(std::holds_alternative<hir::EnumLitRef>(red->front().value));

  auto c = Resolve(Package(lib, "user"), "c");
  ASSERT_TRUE(c.has_value());
  EXPECT_TRUE(std::holds_alternative<hir::ConstDeclId>(c->front().value));
  EXPECT_TRUE(Diagnostics().empty());
}

TEST_F(ScopeTest, SelectiveImport) {
  Session();
  auto lib = AddLibrary(
      "lib", Units(
                 DefsPackage(),
                 Unit(b_.Package("user"), {b_.Use({"work.defs.color"})})));

  auto color = Resolve(Package(lib, "user"), "color");
  ASSERT_TRUE(color.has_value());
  EXPECT_TRUE(std::holds_alternative<hir::TypeDeclId>(color->front().value));

  EXPECT_FALSE(Resolve(Package(lib, "user"), "red").has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].primary.message, "`red` is not declared");
}

TEST_F(ScopeTest, UseClauseSeesEarlierClauses) {
  Session();
  AddLibrary("shared", Units(DefsPackage()));
  auto lib = AddLibrary(
      "lib", Units(Unit(
                 b_.Package("user"),
                 {b_.Library({"shared"}), b_.Use({"shared.defs"}),
                  b_.Use({"defs.all"})})));

  EXPECT_TRUE(Resolve(Package(lib, "user"), "green").has_value());
  EXPECT_TRUE(Diagnostics().empty());
}

TEST_F(ScopeTest, AllOnLibraryIsAnError) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(DefsPackage(), Unit(b_.Package("user"), {b_.Use({"work.all"})})));

  EXPECT_FALSE(sb.ScopeOf(Package(lib, "user")).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].primary.message, "`all` not possible on `work`");
}

TEST_F(ScopeTest, SuffixAfterAllIsAnError) {
  auto& sb = Session();
  ast::ContextItem use = b_.Use({"work.defs.all.more"});
  const ast::CompoundName& name = std::get<ast::UseClause>(use).names[0];
  SourceSpan expected{
      .file_id = name.span.file_id,
      .begin = name.parts[1].span.end,
      .end = name.span.end};
  auto lib = AddLibrary(
      "lib", Units(DefsPackage(), Unit(b_.Package("user"), {use})));

  EXPECT_FALSE(sb.ScopeOf(Package(lib, "user")).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].primary.message, "invalid name suffix");
  EXPECT_EQ(std::get<SourceSpan>(Diagnostics()[0].primary.span), expected);
}

TEST_F(ScopeTest, MissingMember) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(b_.Package("user"), {b_.Use({"work.nothing.all"})})));

  EXPECT_FALSE(sb.ScopeOf(Package(lib, "user")).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(
      Diagnostics()[0].primary.message, "no `nothing` in library `work`");
}

TEST_F(ScopeTest, EveryFailingClauseIsReported) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(
                 b_.Package("user"),
                 {b_.Use({"work.all", "nowhere.p"}), b_.Use({"work.x.y"})})));

  EXPECT_FALSE(sb.ScopeOf(Package(lib, "user")).has_value());
  EXPECT_EQ(Diagnostics().size(), 3U);
}

// ============================================================================
// Implicit context
// ============================================================================

TEST_F(ScopeTest, StandardIsVisible) {
  Session();
  auto lib = AddLibrary("lib", Units(Unit(b_.Package("p"))));

  auto integer = Resolve(Package(lib, "p"), "Integer");
  ASSERT_TRUE(integer.has_value());
  EXPECT_TRUE(std::holds_alternative<hir::TypeDeclId>(integer->front().value));

  auto natural = Resolve(Package(lib, "p"), "natural");
  ASSERT_TRUE(natural.has_value());
  EXPECT_TRUE(
      std::holds_alternative<hir::SubtypeDeclId>(natural->front().value));

  // `'0'` is both a bit and a character.
  auto zero = Resolve(Package(lib, "p"), "'0'");
  ASSERT_TRUE(zero.has_value());
  EXPECT_EQ(zero->size(), 2U);
}

TEST_F(ScopeTest, StandardLibraryCanBeDisabled) {
  auto& sb = Session({.standard_library = false});
  auto lib = AddLibrary("lib", Units(Unit(b_.Package("p"))));

  EXPECT_FALSE(sb.LookupLibrary("std").has_value());
  EXPECT_FALSE(Resolve(Package(lib, "p"), "integer").has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].primary.message, "`integer` is not declared");
}

TEST_F(ScopeTest, InnerDeclarationsHideOuterOnes) {
  Session();
  auto lib = AddLibrary(
      "lib", Units(Unit(b_.Package(
                 "p", b_.RangeType("integer", b_.Int("0"), b_.Int("9"))))));
  hir::PackageId pkg = Package(lib, "p");

  auto integer = Resolve(pkg, "integer");
  ASSERT_TRUE(integer.has_value());
  ASSERT_EQ(integer->size(), 1U);
  auto decl = std::get<hir::TypeDeclId>(integer->front().value);
  EXPECT_EQ(hir::ScopeRef{pkg}, scoreboard_->Ast(decl).parent);
}

// ============================================================================
// Context references
// ============================================================================

TEST_F(ScopeTest, ContextReferenceImports) {
  Session();
  AddLibrary("shared", Units(DefsPackage()));
  auto lib = AddLibrary(
      "lib", Units(
                 Unit(b_.Context(
                     "ctx", {b_.Library({"shared"}), b_.Use({"shared.defs.all"})})),
                 Unit(b_.Package("user"), {b_.ContextRef({"work.ctx"})})));

  auto green = Resolve(Package(lib, "user"), "green");
  ASSERT_TRUE(green.has_value());
  EXPECT_TRUE(std::holds_alternative<hir::EnumLitRef>(green->front().value));
  EXPECT_TRUE(Diagnostics().empty());
}

TEST_F(ScopeTest, ContextDeclarationHasNoImplicitWork) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(
                 DefsPackage(),
                 Unit(b_.Context("ctx", {b_.Use({"work.defs.all"})})),
                 Unit(b_.Package("user"), {b_.ContextRef({"work.ctx"})})));

  EXPECT_FALSE(sb.ScopeOf(Package(lib, "user")).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].primary.message, "`work` is not declared");
}

TEST_F(ScopeTest, ContextReferenceToPackage) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(
                 DefsPackage(),
                 Unit(b_.Package("user"), {b_.ContextRef({"work.defs"})})));

  EXPECT_FALSE(sb.ScopeOf(Package(lib, "user")).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(Diagnostics()[0].primary.message, "`work.defs` is not a context");
}

TEST_F(ScopeTest, CircularContextsReportOnce) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(
                 Unit(b_.Context(
                     "a", {b_.Library({"lib"}), b_.ContextRef({"lib.b"})})),
                 Unit(b_.Context(
                     "b", {b_.Library({"lib"}), b_.ContextRef({"lib.a"})})),
                 Unit(b_.Package("p"), {b_.ContextRef({"work.a"})})));

  EXPECT_FALSE(sb.ScopeOf(Package(lib, "p")).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_NE(
      Diagnostics()[0].primary.message.find("circular dependency"),
      std::string::npos);

  EXPECT_FALSE(sb.ScopeOf(Package(lib, "p")).has_value());
  EXPECT_EQ(Diagnostics().size(), 1U);
}

// ============================================================================
// Architectures
// ============================================================================

TEST_F(ScopeTest, ArchitectureSeesEntityContext) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib", Units(
                 DefsPackage(),
                 Unit(b_.Entity("top"), {b_.Use({"work.defs.all"})}),
                 Unit(b_.Architecture("rtl", "top"))));
  hir::ArchitectureId arch = (*sb.Hir(lib))->architectures.front();

  auto scope = sb.ScopeOf(arch);
  ASSERT_TRUE(scope.has_value());
  ASSERT_TRUE((*scope)->parent.has_value());
  auto clauses = std::get<hir::ContextItemsId>(*(*scope)->parent);
  auto clause_scope = sb.ScopeOf(clauses);
  ASSERT_TRUE(clause_scope.has_value());
  EXPECT_TRUE(std::holds_alternative<hir::EntityId>(*(*clause_scope)->parent));
}

TEST_F(ScopeTest, ArchitectureOfMissingEntity) {
  auto& sb = Session();
  auto lib = AddLibrary("lib", Units(Unit(b_.Architecture("rtl", "nope"))));
  hir::ArchitectureId arch = (*sb.Hir(lib))->architectures.front();

  EXPECT_FALSE(sb.Hir(arch).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(
      Diagnostics()[0].primary.message,
      "no entity named `nope` in library `lib`");
}

TEST_F(ScopeTest, MissingEntityReportedOnceAcrossQueries) {
  auto& sb = Session();
  auto lib = AddLibrary("lib", Units(Unit(b_.Architecture("rtl", "nope"))));
  hir::ArchitectureId arch = (*sb.Hir(lib))->architectures.front();

  EXPECT_FALSE(sb.Hir(arch).has_value());
  EXPECT_FALSE(sb.ScopeOf(sb.Ast(arch).context).has_value());
  EXPECT_FALSE(sb.ScopeOf(arch).has_value());
  ASSERT_EQ(Diagnostics().size(), 1U);
  EXPECT_EQ(
      Diagnostics()[0].primary.message,
      "no entity named `nope` in library `lib`");
}

TEST_F(ScopeTest, ArchitectureClausesScopeChainsToEntity) {
  auto& sb = Session();
  auto lib = AddLibrary(
      "lib",
      Units(Unit(b_.Entity("top")), Unit(b_.Architecture("rtl", "top"))));
  hir::ArchitectureId arch = (*sb.Hir(lib))->architectures.front();

  auto scope = sb.ScopeOf(sb.Ast(arch).context);
  ASSERT_TRUE(scope.has_value());
  ASSERT_TRUE((*scope)->parent.has_value());
  EXPECT_EQ(
      *(*scope)->parent, hir::ScopeRef{(*sb.Hir(lib))->entities.front()});
  EXPECT_TRUE(Diagnostics().empty());
}

// ============================================================================
// Compound names
// ============================================================================

TEST_F(ScopeTest, CompoundNameStopsAtNonContainer) {
  auto& sb = Session();
  auto lib = AddLibrary("lib", Units(DefsPackage(), Unit(b_.Package("p"))));
  ast::CompoundName name = b_.Name("work.defs.c'high");

  auto resolved = sb.ResolveCompoundName(Package(lib, "p"), name);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(resolved->name, "c");
  EXPECT_EQ(resolved->tail.size(), 1U);
  EXPECT_EQ(resolved->valid_span.end, name.parts[1].span.end);
}

}  // namespace
}  // namespace vscore::test
