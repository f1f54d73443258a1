// swlint/ast/ast.hpp - AST node class definitions
//
// Declaration-level syntax tree of a Swift source file, following the
// LLVM/Clang style with classof() for RTTI support. Statements and
// expressions are not modeled; only the code blocks inside them are kept so
// that nested declarations remain reachable.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "swlint/ast/ast_enums.hpp"
#include "swlint/basic/casting.hpp"
#include "swlint/basic/source_manager.hpp"

namespace swlint
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node has a NodeKind for RTTI and a byte range in its source file.
 * Nodes are non-copyable and owned by an AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// One declaration modifier, e.g. `class`, `final`, `private(set)`.
class DeclModifier : public NodeBase<DeclModifier, AstNode, NodeKind::DeclModifier>
{
public:
  std::string_view name;
  std::string_view detail;  ///< `set` in `private(set)`, empty otherwise

  /// Keyword plus detail parentheses. range_ covers the keyword token only.
  SourceRange fullRange;

  DeclModifier(std::string_view n, SourceRange keyword_range)
  : NodeBase(keyword_range), name(n), fullRange(keyword_range)
  {
  }

  [[nodiscard]] bool has_detail() const noexcept { return !detail.empty(); }
};

/// Attribute such as `@objc` or `@available(iOS 13, *)`.
class Attribute : public NodeBase<Attribute, AstNode, NodeKind::Attribute>
{
public:
  std::string_view name;

  explicit Attribute(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Body of a function, accessor or closure.
///
/// `items` holds the declarations and nested blocks found inside, in source
/// order; ordinary statements are not represented.
class CodeBlock : public NodeBase<CodeBlock, AstNode, NodeKind::CodeBlock>
{
public:
  gsl::span<AstNode *> items;

  explicit CodeBlock(SourceRange r = {}) : NodeBase(r) {}
};

/// get/set/willSet/didSet accessor of a property or subscript.
class AccessorDecl : public NodeBase<AccessorDecl, AstNode, NodeKind::AccessorDecl>
{
public:
  AccessorKind accessorKind;
  gsl::span<DeclModifier *> modifiers;
  CodeBlock * body = nullptr;
  bool isImplicit = false;  ///< `var x: T { expr }` getter shorthand

  explicit AccessorDecl(AccessorKind k, SourceRange r = {}) : NodeBase(r), accessorKind(k) {}
};

// ============================================================================
// Declarations
// ============================================================================

/**
 * Base class for declarations. Every declaration carries its attributes and
 * modifiers in source order.
 */
class Decl : public AstNode
{
public:
  gsl::span<Attribute *> attributes;
  gsl::span<DeclModifier *> modifiers;

  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for class, struct, enum, actor, extension and protocol
 * declarations. For extensions `name` is the extended type.
 */
class TypeDecl : public Decl
{
public:
  std::string_view name;
  SourceRange nameRange;
  gsl::span<Decl *> members;

  static bool classof(const AstNode * node) { return is_type_decl_kind(node->kind); }

protected:
  explicit TypeDecl(NodeKind k, SourceRange r = {}) : Decl(k, r) {}
};

class ClassDecl : public NodeBase<ClassDecl, TypeDecl, NodeKind::ClassDecl>
{
public:
  explicit ClassDecl(SourceRange r = {}) : NodeBase(r) {}
};

class StructDecl : public NodeBase<StructDecl, TypeDecl, NodeKind::StructDecl>
{
public:
  explicit StructDecl(SourceRange r = {}) : NodeBase(r) {}
};

class EnumDecl : public NodeBase<EnumDecl, TypeDecl, NodeKind::EnumDecl>
{
public:
  explicit EnumDecl(SourceRange r = {}) : NodeBase(r) {}
};

class ActorDecl : public NodeBase<ActorDecl, TypeDecl, NodeKind::ActorDecl>
{
public:
  explicit ActorDecl(SourceRange r = {}) : NodeBase(r) {}
};

class ExtensionDecl : public NodeBase<ExtensionDecl, TypeDecl, NodeKind::ExtensionDecl>
{
public:
  explicit ExtensionDecl(SourceRange r = {}) : NodeBase(r) {}
};

class ProtocolDecl : public NodeBase<ProtocolDecl, TypeDecl, NodeKind::ProtocolDecl>
{
public:
  explicit ProtocolDecl(SourceRange r = {}) : NodeBase(r) {}
};

/// `func` declaration. `body` is null for protocol requirements.
class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;
  CodeBlock * body = nullptr;

  explicit FunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class InitializerDecl : public NodeBase<InitializerDecl, Decl, NodeKind::InitializerDecl>
{
public:
  CodeBlock * body = nullptr;

  explicit InitializerDecl(SourceRange r = {}) : NodeBase(r) {}
};

class DeinitializerDecl : public NodeBase<DeinitializerDecl, Decl, NodeKind::DeinitializerDecl>
{
public:
  CodeBlock * body = nullptr;

  explicit DeinitializerDecl(SourceRange r = {}) : NodeBase(r) {}
};

class SubscriptDecl : public NodeBase<SubscriptDecl, Decl, NodeKind::SubscriptDecl>
{
public:
  gsl::span<AccessorDecl *> accessors;

  explicit SubscriptDecl(SourceRange r = {}) : NodeBase(r) {}
};

/// `var`/`let` declaration with one or more bindings.
class VariableDecl : public NodeBase<VariableDecl, Decl, NodeKind::VariableDecl>
{
public:
  bool isLet = false;
  gsl::span<std::string_view> names;      ///< Bound identifiers (tuple patterns flattened)
  gsl::span<AccessorDecl *> accessors;    ///< Accessors of the last binding
  gsl::span<CodeBlock *> closures;        ///< Closures inside initializer expressions

  explicit VariableDecl(bool let, SourceRange r = {}) : NodeBase(r), isLet(let) {}
};

class TypeAliasDecl : public NodeBase<TypeAliasDecl, Decl, NodeKind::TypeAliasDecl>
{
public:
  std::string_view name;

  explicit TypeAliasDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class EnumCaseDecl : public NodeBase<EnumCaseDecl, Decl, NodeKind::EnumCaseDecl>
{
public:
  gsl::span<std::string_view> names;

  explicit EnumCaseDecl(SourceRange r = {}) : NodeBase(r) {}
};

class ImportDecl : public NodeBase<ImportDecl, Decl, NodeKind::ImportDecl>
{
public:
  std::string_view path;  ///< Dotted module path, e.g. `Foundation` or `Foo.Bar`

  explicit ImportDecl(std::string_view p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

// ============================================================================
// SourceUnit (Root Node)
// ============================================================================

/// Root of one parsed file: top-level declarations and top-level code blocks.
class SourceUnit : public NodeBase<SourceUnit, AstNode, NodeKind::SourceUnit>
{
public:
  gsl::span<AstNode *> items;

  explicit SourceUnit(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Modifier Queries
// ============================================================================

/// First modifier named `name`, or nullptr. Null entries are ignored.
[[nodiscard]] inline const DeclModifier * find_modifier(
  gsl::span<DeclModifier * const> modifiers, std::string_view name) noexcept
{
  for (const auto * m : modifiers) {
    if (m != nullptr && m->name == name) {
      return m;
    }
  }
  return nullptr;
}

[[nodiscard]] inline bool has_modifier(
  gsl::span<DeclModifier * const> modifiers, std::string_view name) noexcept
{
  return find_modifier(modifiers, name) != nullptr;
}

[[nodiscard]] inline bool is_final(gsl::span<DeclModifier * const> modifiers) noexcept
{
  return has_modifier(modifiers, "final");
}

/// `private` or `fileprivate` without a detail; `private(set)` only narrows the setter.
[[nodiscard]] inline const DeclModifier * find_private_modifier(
  gsl::span<DeclModifier * const> modifiers) noexcept
{
  for (const auto * m : modifiers) {
    if (m != nullptr && !m->has_detail() && (m->name == "private" || m->name == "fileprivate")) {
      return m;
    }
  }
  return nullptr;
}

[[nodiscard]] inline bool is_private_or_fileprivate(
  gsl::span<DeclModifier * const> modifiers) noexcept
{
  return find_private_modifier(modifiers) != nullptr;
}

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace swlint
