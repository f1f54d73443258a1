#include <gtest/gtest.h>

#include <iostream>
#include <string>

#include "swlint/ast/ast.hpp"
#include "swlint/test_support/parse_helpers.hpp"

using namespace swlint;

namespace
{

void expect_no_diagnostics(const test_support::TestParseUnit & unit)
{
  for (const auto & d : unit.diags.all()) {
    std::cerr << "diag: " << d.message << "\n";
  }
  EXPECT_TRUE(unit.diags.empty());
}

}  // namespace

TEST(ParserDecls, ClassWithModifiedMembers)
{
  const std::string src =
    "import Foundation\n"
    "\n"
    "@objc public final class C: NSObject, P {\n"
    "    final class func f() {}\n"
    "    private class var b: Bool { true }\n"
    "    init() {}\n"
    "    deinit {}\n"
    "}\n";

  auto unit = test_support::parse(src);
  expect_no_diagnostics(unit);
  ASSERT_NE(unit.unit, nullptr);
  ASSERT_EQ(unit.unit->items.size(), 2u);

  const auto * imp = dyn_cast<ImportDecl>(unit.unit->items[0]);
  ASSERT_NE(imp, nullptr);
  EXPECT_EQ(imp->path, "Foundation");

  const auto * cls = dyn_cast<ClassDecl>(unit.unit->items[1]);
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cls->name, "C");
  EXPECT_EQ(unit.slice(cls->nameRange), "C");
  ASSERT_EQ(cls->attributes.size(), 1u);
  EXPECT_EQ(cls->attributes[0]->name, "objc");
  EXPECT_TRUE(has_modifier(cls->modifiers, "public"));
  EXPECT_TRUE(is_final(cls->modifiers));
  ASSERT_EQ(cls->members.size(), 4u);

  const auto * fn = dyn_cast<FunctionDecl>(cls->members[0]);
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->name, "f");
  ASSERT_EQ(fn->modifiers.size(), 2u);
  EXPECT_EQ(fn->modifiers[0]->name, "final");
  EXPECT_EQ(fn->modifiers[1]->name, "class");
  EXPECT_EQ(unit.slice(fn->modifiers[1]->get_range()), "class");
  ASSERT_NE(fn->body, nullptr);

  const auto * var = dyn_cast<VariableDecl>(cls->members[1]);
  ASSERT_NE(var, nullptr);
  EXPECT_FALSE(var->isLet);
  ASSERT_EQ(var->names.size(), 1u);
  EXPECT_EQ(var->names[0], "b");
  EXPECT_TRUE(is_private_or_fileprivate(var->modifiers));
  EXPECT_TRUE(has_modifier(var->modifiers, "class"));
  ASSERT_EQ(var->accessors.size(), 1u);
  EXPECT_TRUE(var->accessors[0]->isImplicit);
  EXPECT_EQ(var->accessors[0]->accessorKind, AccessorKind::Get);

  EXPECT_TRUE(isa<InitializerDecl>(cls->members[2]));
  EXPECT_TRUE(isa<DeinitializerDecl>(cls->members[3]));
}

TEST(ParserDecls, ClassKeywordAsModifierVersusTypeDecl)
{
  const std::string src =
    "class Outer {\n"
    "    class Inner {}\n"
    "    class func f() {}\n"
    "    class override var x: Int { 1 }\n"
    "}\n";

  auto unit = test_support::parse(src);
  expect_no_diagnostics(unit);

  const auto * outer = dyn_cast<ClassDecl>(unit.unit->items[0]);
  ASSERT_NE(outer, nullptr);
  ASSERT_EQ(outer->members.size(), 3u);

  const auto * inner = dyn_cast<ClassDecl>(outer->members[0]);
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->name, "Inner");
  EXPECT_TRUE(inner->modifiers.empty());

  const auto * fn = dyn_cast<FunctionDecl>(outer->members[1]);
  ASSERT_NE(fn, nullptr);
  EXPECT_TRUE(has_modifier(fn->modifiers, "class"));

  const auto * var = dyn_cast<VariableDecl>(outer->members[2]);
  ASSERT_NE(var, nullptr);
  EXPECT_TRUE(has_modifier(var->modifiers, "class"));
  EXPECT_TRUE(has_modifier(var->modifiers, "override"));
}

TEST(ParserDecls, ModifierDetailIsKeptApartFromAccessLevel)
{
  auto unit = test_support::parse(
    "class C {\n"
    "    private(set) class var b = 1\n"
    "    fileprivate class func f() {}\n"
    "}\n");
  expect_no_diagnostics(unit);

  const auto * cls = cast<ClassDecl>(unit.unit->items[0]);
  ASSERT_EQ(cls->members.size(), 2u);

  const auto * var = cast<VariableDecl>(cls->members[0]);
  const DeclModifier * priv = find_modifier(var->modifiers, "private");
  ASSERT_NE(priv, nullptr);
  EXPECT_EQ(priv->detail, "set");
  EXPECT_EQ(unit.slice(priv->get_range()), "private");
  EXPECT_EQ(unit.slice(priv->fullRange), "private(set)");
  EXPECT_FALSE(is_private_or_fileprivate(var->modifiers));

  const auto * fn = cast<FunctionDecl>(cls->members[1]);
  EXPECT_TRUE(is_private_or_fileprivate(fn->modifiers));
}

TEST(ParserDecls, OtherTypeDeclarations)
{
  const std::string src =
    "struct S { static func f() {} }\n"
    "enum E { case a, b(Int), c = 3\n"
    "    static var v: Int { 0 } }\n"
    "protocol P { static func f() }\n"
    "extension S: P { func g() {} }\n"
    "actor A { func h() async {} }\n"
    "typealias T = [String: Int]\n";

  auto unit = test_support::parse(src);
  expect_no_diagnostics(unit);
  ASSERT_EQ(unit.unit->items.size(), 6u);

  EXPECT_TRUE(isa<StructDecl>(unit.unit->items[0]));

  const auto * en = dyn_cast<EnumDecl>(unit.unit->items[1]);
  ASSERT_NE(en, nullptr);
  ASSERT_EQ(en->members.size(), 2u);
  const auto * cases = dyn_cast<EnumCaseDecl>(en->members[0]);
  ASSERT_NE(cases, nullptr);
  ASSERT_EQ(cases->names.size(), 3u);
  EXPECT_EQ(cases->names[1], "b");

  const auto * proto = dyn_cast<ProtocolDecl>(unit.unit->items[2]);
  ASSERT_NE(proto, nullptr);
  ASSERT_EQ(proto->members.size(), 1u);
  EXPECT_EQ(cast<FunctionDecl>(proto->members[0])->body, nullptr);

  const auto * ext = dyn_cast<ExtensionDecl>(unit.unit->items[3]);
  ASSERT_NE(ext, nullptr);
  EXPECT_EQ(ext->name, "S");

  EXPECT_TRUE(isa<ActorDecl>(unit.unit->items[4]));

  const auto * alias = dyn_cast<TypeAliasDecl>(unit.unit->items[5]);
  ASSERT_NE(alias, nullptr);
  EXPECT_EQ(alias->name, "T");
}

TEST(ParserDecls, ExplicitAccessorsAndObservers)
{
  const std::string src =
    "class C {\n"
    "    var a: Int {\n"
    "        get { 1 }\n"
    "        set(newValue) {}\n"
    "    }\n"
    "    var b = 0 {\n"
    "        didSet {}\n"
    "    }\n"
    "    subscript(i: Int) -> Int { get { i } }\n"
    "}\n";

  auto unit = test_support::parse(src);
  expect_no_diagnostics(unit);

  const auto * cls = cast<ClassDecl>(unit.unit->items[0]);
  ASSERT_EQ(cls->members.size(), 3u);

  const auto * a = cast<VariableDecl>(cls->members[0]);
  ASSERT_EQ(a->accessors.size(), 2u);
  EXPECT_EQ(a->accessors[0]->accessorKind, AccessorKind::Get);
  EXPECT_EQ(a->accessors[1]->accessorKind, AccessorKind::Set);
  EXPECT_FALSE(a->accessors[0]->isImplicit);

  const auto * b = cast<VariableDecl>(cls->members[1]);
  ASSERT_EQ(b->accessors.size(), 1u);
  EXPECT_EQ(b->accessors[0]->accessorKind, AccessorKind::DidSet);

  const auto * sub = dyn_cast<SubscriptDecl>(cls->members[2]);
  ASSERT_NE(sub, nullptr);
  ASSERT_EQ(sub->accessors.size(), 1u);
}

TEST(ParserDecls, DeclarationsInsideFunctionBodiesAndClosures)
{
  const std::string src =
    "func outer() {\n"
    "    let x = 1\n"
    "    final class Local {\n"
    "        class func f() {}\n"
    "    }\n"
    "}\n"
    "let handler = {\n"
    "    class Boxed {}\n"
    "}\n";

  auto unit = test_support::parse(src);
  expect_no_diagnostics(unit);
  ASSERT_EQ(unit.unit->items.size(), 2u);

  const auto * fn = cast<FunctionDecl>(unit.unit->items[0]);
  ASSERT_NE(fn->body, nullptr);
  ASSERT_EQ(fn->body->items.size(), 2u);
  EXPECT_TRUE(isa<VariableDecl>(fn->body->items[0]));
  const auto * local = dyn_cast<ClassDecl>(fn->body->items[1]);
  ASSERT_NE(local, nullptr);
  EXPECT_TRUE(is_final(local->modifiers));
  ASSERT_EQ(local->members.size(), 1u);

  const auto * handler = cast<VariableDecl>(unit.unit->items[1]);
  ASSERT_EQ(handler->closures.size(), 1u);
  ASSERT_EQ(handler->closures[0]->items.size(), 1u);
  EXPECT_TRUE(isa<ClassDecl>(handler->closures[0]->items[0]));
}

TEST(ParserDecls, CompilerDirectivesAreTransparent)
{
  const std::string src =
    "final class C {\n"
    "#if DEBUG\n"
    "    class func debug() {}\n"
    "#else\n"
    "    class func release() {}\n"
    "#endif\n"
    "}\n";

  auto unit = test_support::parse(src);
  expect_no_diagnostics(unit);

  const auto * cls = cast<ClassDecl>(unit.unit->items[0]);
  ASSERT_EQ(cls->members.size(), 2u);
  EXPECT_EQ(cast<FunctionDecl>(cls->members[0])->name, "debug");
  EXPECT_EQ(cast<FunctionDecl>(cls->members[1])->name, "release");
}
