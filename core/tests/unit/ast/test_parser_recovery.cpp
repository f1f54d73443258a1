#include <gtest/gtest.h>

#include <string>

#include "swlint/ast/ast.hpp"
#include "swlint/test_support/parse_helpers.hpp"

using namespace swlint;

namespace
{

bool has_message_containing(const DiagnosticBag & diags, const std::string & needle)
{
  for (const auto & d : diags) {
    if (d.message.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

TEST(ParserRecovery, GarbageInClassBodyKeepsLaterMembers)
{
  const std::string src =
    "final class C {\n"
    "    + garbage here\n"
    "    class func f() {}\n"
    "}\n";

  auto unit = test_support::parse(src);
  EXPECT_TRUE(unit.diags.has_errors());
  EXPECT_TRUE(has_message_containing(unit.diags, "expected declaration in class body"));

  const auto * cls = dyn_cast<ClassDecl>(unit.unit->items[0]);
  ASSERT_NE(cls, nullptr);
  ASSERT_EQ(cls->members.size(), 1u);
  EXPECT_EQ(cast<FunctionDecl>(cls->members[0])->name, "f");
}

TEST(ParserRecovery, MissingClosingBraceReachesEndOfFile)
{
  auto unit = test_support::parse(
    "class C {\n"
    "    class func f() {}\n");

  EXPECT_TRUE(has_message_containing(unit.diags, "'}' at end of class body"));
  ASSERT_EQ(unit.unit->items.size(), 1u);
  EXPECT_EQ(cast<ClassDecl>(unit.unit->items[0])->members.size(), 1u);
}

TEST(ParserRecovery, ExtraneousClosingBraceAtTopLevel)
{
  auto unit = test_support::parse("}\nclass C {}\n");

  EXPECT_TRUE(has_message_containing(unit.diags, "extraneous '}' at top level"));
  ASSERT_EQ(unit.unit->items.size(), 1u);
  EXPECT_TRUE(isa<ClassDecl>(unit.unit->items[0]));
}

TEST(ParserRecovery, UnterminatedStringIsReported)
{
  auto unit = test_support::parse(
    "class C {\n"
    "    var s = \"open\n"
    "    class func f() {}\n"
    "}\n");

  EXPECT_TRUE(has_message_containing(unit.diags, "unterminated string literal"));
  const auto * cls = cast<ClassDecl>(unit.unit->items[0]);
  ASSERT_EQ(cls->members.size(), 2u);
  EXPECT_TRUE(isa<FunctionDecl>(cls->members[1]));
}

TEST(ParserRecovery, MissingTypeName)
{
  auto unit = test_support::parse("struct {}\nstruct S {}\n");

  EXPECT_TRUE(has_message_containing(unit.diags, "expected identifier in struct declaration"));
  ASSERT_EQ(unit.unit->items.size(), 2u);
  const auto * s = dyn_cast<StructDecl>(unit.unit->items[1]);
  ASSERT_NE(s, nullptr);
  EXPECT_EQ(s->name, "S");
}

TEST(ParserRecovery, DiagnosticsCarrySyntaxCodeAndRange)
{
  auto unit = test_support::parse("class C { ) }\n");

  ASSERT_FALSE(unit.diags.empty());
  for (const auto & d : unit.diags) {
    EXPECT_EQ(d.code, "syntax");
    EXPECT_EQ(d.severity, Severity::Error);
    EXPECT_TRUE(d.primary_range().is_valid());
  }
}

TEST(ParserRecovery, EmptyInputYieldsEmptyUnit)
{
  auto unit = test_support::parse("");
  EXPECT_TRUE(unit.diags.empty());
  ASSERT_NE(unit.unit, nullptr);
  EXPECT_TRUE(unit.unit->items.empty());
}
