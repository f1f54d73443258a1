#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "swlint/lint/scope_tracking_visitor.hpp"
#include "swlint/test_support/parse_helpers.hpp"

using namespace swlint;
using namespace swlint::lint;

namespace
{

struct Flagged
{
  test_support::TestParseUnit unit;
  std::vector<FlaggedDeclaration> flagged;
};

Flagged run(const std::string & src)
{
  Flagged out{test_support::parse(src), {}};
  ScopeTrackingVisitor visitor;
  out.flagged = visitor.traverse(out.unit.unit);
  EXPECT_EQ(visitor.scope_depth(), 0u);
  return out;
}

}  // namespace

TEST(ScopeTrackingVisitor, FlagsClassMembersOfFinalClass)
{
  auto r = run(
    "final class C {\n"
    "    class func f() {}\n"
    "    class var b: Bool { true }\n"
    "}\n");

  ASSERT_EQ(r.flagged.size(), 2u);
  EXPECT_EQ(r.flagged[0].member, MemberKind::Method);
  EXPECT_EQ(r.flagged[0].reason, FlagReason::InFinalClass);
  EXPECT_EQ(r.unit.slice(r.flagged[0].modifier_range), "class");
  EXPECT_EQ(r.unit.full_range(r.flagged[0].modifier_range).start_line, 2u);
  EXPECT_EQ(r.flagged[1].member, MemberKind::Property);
  EXPECT_EQ(r.unit.full_range(r.flagged[1].modifier_range).start_line, 3u);
}

TEST(ScopeTrackingVisitor, IgnoresExplicitlyFinalAndStaticMembers)
{
  auto r = run(
    "final class C {\n"
    "    final class func f() {}\n"
    "    class final var b: Bool { true }\n"
    "    static func g() {}\n"
    "    func h() {}\n"
    "}\n");

  EXPECT_TRUE(r.flagged.empty());
}

TEST(ScopeTrackingVisitor, NonFinalClassFlagsOnlyPrivateMembers)
{
  auto r = run(
    "class C {\n"
    "    class func overridable() {}\n"
    "    private class func hidden() {}\n"
    "    fileprivate class var shared: Int { 0 }\n"
    "    private(set) class var settable: Int { 0 }\n"
    "}\n");

  ASSERT_EQ(r.flagged.size(), 2u);
  EXPECT_EQ(r.flagged[0].reason, FlagReason::Private);
  EXPECT_EQ(r.flagged[0].member, MemberKind::Method);
  EXPECT_EQ(r.flagged[1].reason, FlagReason::Private);
  EXPECT_EQ(r.flagged[1].member, MemberKind::Property);
}

TEST(ScopeTrackingVisitor, PrivateMemberOfFinalClassReportsFinalClassReason)
{
  auto r = run(
    "final class C {\n"
    "    private class func f() {}\n"
    "}\n");

  ASSERT_EQ(r.flagged.size(), 1u);
  EXPECT_EQ(r.flagged[0].reason, FlagReason::InFinalClass);
}

TEST(ScopeTrackingVisitor, InnermostClassDecides)
{
  auto r = run(
    "final class Outer {\n"
    "    class Inner {\n"
    "        class func notFlagged() {}\n"
    "    }\n"
    "    class func flagged() {}\n"
    "}\n"
    "class Open {\n"
    "    final class Sealed {\n"
    "        class var flaggedToo: Int { 0 }\n"
    "    }\n"
    "}\n");

  ASSERT_EQ(r.flagged.size(), 2u);
  EXPECT_EQ(cast<FunctionDecl>(r.flagged[0].decl)->name, "flagged");
  EXPECT_EQ(r.flagged[1].member, MemberKind::Property);
  EXPECT_EQ(r.unit.full_range(r.flagged[1].modifier_range).start_line, 9u);
}

TEST(ScopeTrackingVisitor, OnlyClassesPushScopes)
{
  // Structs, enums and extensions are transparent; the enclosing class still decides.
  auto r = run(
    "final class C {\n"
    "    struct S {\n"
    "        class func f() {}\n"
    "    }\n"
    "}\n"
    "extension C {\n"
    "    class func g() {}\n"
    "}\n");

  ASSERT_EQ(r.flagged.size(), 1u);
  EXPECT_EQ(cast<FunctionDecl>(r.flagged[0].decl)->name, "f");
}

TEST(ScopeTrackingVisitor, ProtocolsAreNotVisited)
{
  auto r = run(
    "final class C {\n"
    "    func make() {\n"
    "        protocol P { class func f() }\n"
    "    }\n"
    "}\n"
    "protocol Q {\n"
    "    class func g()\n"
    "}\n");

  EXPECT_TRUE(r.flagged.empty());
}

TEST(ScopeTrackingVisitor, NestedFunctionsAreCheckedAgainstEnclosingClass)
{
  auto r = run(
    "final class C {\n"
    "    func f() {\n"
    "        final class D {\n"
    "            class func g() {}\n"
    "        }\n"
    "    }\n"
    "    var handler = {\n"
    "        class E { private class func h() {} }\n"
    "    }\n"
    "}\n");

  ASSERT_EQ(r.flagged.size(), 2u);
  EXPECT_EQ(cast<FunctionDecl>(r.flagged[0].decl)->name, "g");
  EXPECT_EQ(cast<FunctionDecl>(r.flagged[1].decl)->name, "h");
  EXPECT_EQ(r.flagged[1].reason, FlagReason::Private);
}

TEST(ScopeTrackingVisitor, ResultsAreInSourceOrder)
{
  // Members are checked after their subtree, so nested declarations are
  // found before their enclosing member; the result is sorted.
  auto r = run(
    "final class C {\n"
    "    class var a: Int {\n"
    "        final class D { class func b() {} }\n"
    "        return 0\n"
    "    }\n"
    "}\n");

  ASSERT_EQ(r.flagged.size(), 2u);
  EXPECT_LT(
    r.flagged[0].modifier_range.get_begin().offset(),
    r.flagged[1].modifier_range.get_begin().offset());
  EXPECT_EQ(r.flagged[0].member, MemberKind::Property);
  EXPECT_EQ(r.flagged[1].member, MemberKind::Method);
}

TEST(ScopeTrackingVisitor, TopLevelDeclarationsAreSkipped)
{
  auto r = run("class func f() {}\n");
  EXPECT_TRUE(r.flagged.empty());
}

TEST(ScopeTrackingVisitor, VisitorIsReusable)
{
  auto first = test_support::parse("final class C { class func f() {} }\n");
  auto second = test_support::parse("class C { class func f() {} }\n");

  ScopeTrackingVisitor visitor;
  EXPECT_EQ(visitor.traverse(first.unit).size(), 1u);
  EXPECT_TRUE(visitor.traverse(second.unit).empty());
  EXPECT_EQ(visitor.traverse(first.unit).size(), 1u);
}

TEST(ScopeTrackingVisitor, ViolationsAndEdits)
{
  auto r = run(
    "final class C {\n"
    "    class func f() {}\n"
    "}\n"
    "class D {\n"
    "    private class var b: Int { 0 }\n"
    "}\n");
  ASSERT_EQ(r.flagged.size(), 2u);

  const auto violations =
    make_violations(r.flagged, "non_overridable_class_declaration", Severity::Error);
  ASSERT_EQ(violations.size(), 2u);
  EXPECT_EQ(violations[0].rule_id, "non_overridable_class_declaration");
  EXPECT_EQ(violations[0].severity, Severity::Error);
  EXPECT_EQ(violations[0].reason, "Class methods in final classes should themselves be final");
  EXPECT_EQ(violations[0].position, r.flagged[0].modifier_range.get_begin());
  EXPECT_EQ(violations[1].reason, "Private class properties should be declared final");

  const auto edits = make_correction_edits(r.flagged);
  ASSERT_EQ(edits.size(), 2u);
  EXPECT_EQ(edits[1].range, r.flagged[1].modifier_range);
  EXPECT_EQ(r.unit.slice(edits[1].range), "class");
}

TEST(ScopeTrackingVisitor, RecordsWhatMakesTheModifierRedundant)
{
  auto r = run(
    "public final class C {\n"
    "    class func f() {}\n"
    "}\n"
    "class D {\n"
    "    fileprivate class var b: Int { 0 }\n"
    "}\n");
  ASSERT_EQ(r.flagged.size(), 2u);

  EXPECT_EQ(r.unit.slice(r.flagged[0].cause_range), "final");
  EXPECT_EQ(r.unit.full_range(r.flagged[0].cause_range).start_line, 1u);
  EXPECT_EQ(r.unit.slice(r.flagged[1].cause_range), "fileprivate");

  const auto violations = make_violations(r.flagged, "rule", Severity::Warning);
  EXPECT_EQ(violations[0].cause, r.flagged[0].cause_range);
  EXPECT_EQ(violations[0].cause_note, "class is final here");
  EXPECT_EQ(violations[1].cause_note, "declared private here");
}

TEST(ScopeTrackingVisitor, ReasonMessages)
{
  EXPECT_EQ(
    reason_message(MemberKind::Property, FlagReason::InFinalClass),
    "Class properties in final classes should themselves be final");
  EXPECT_EQ(
    reason_message(MemberKind::Method, FlagReason::Private),
    "Private class methods should be declared final");
}
