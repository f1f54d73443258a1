// swlint/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// AstVisitor dispatches on NodeKind without virtual calls. RecursiveAstVisitor
// additionally walks every child in source order.
//
#pragma once

#include <type_traits>

#include "swlint/ast/ast.hpp"
#include "swlint/ast/ast_enums.hpp"
#include "swlint/basic/casting.hpp"

namespace swlint
{

namespace detail
{

/// Propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements `visit_<snake_kind>` for the node types it
 * cares about; everything else falls through to visit_decl / visit_node.
 *
 * @code
 *   class NameCollector : public ConstAstVisitor<NameCollector> {
 *   public:
 *     void visit_function_decl(const FunctionDecl * fn) { names.push_back(fn->name); }
 *     std::vector<std::string_view> names;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT AstNode* or const AstNode*
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }

  /// Visit a node, dispatching to the matching visit method. Null is a no-op.
  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "swlint/ast/ast_nodes.def"
    }

    return ReturnType();
  }

  // Declarations default to visit_decl
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#include "swlint/ast/ast_nodes.def"

  // Supporting and top-level nodes default to visit_node
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "swlint/ast/ast_nodes.def"

  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that traverses child nodes in source order.
 *
 * Override a visit method and call the base implementation to continue into
 * the children, or return without calling it to prune the subtree. Returning
 * false aborts the whole traversal.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  // ===========================================================================
  // Nominal types
  // ===========================================================================

  bool visit_class_decl(NodePtr<ClassDecl> node) { return traverse_type_decl(node); }
  bool visit_struct_decl(NodePtr<StructDecl> node) { return traverse_type_decl(node); }
  bool visit_enum_decl(NodePtr<EnumDecl> node) { return traverse_type_decl(node); }
  bool visit_actor_decl(NodePtr<ActorDecl> node) { return traverse_type_decl(node); }
  bool visit_extension_decl(NodePtr<ExtensionDecl> node) { return traverse_type_decl(node); }
  bool visit_protocol_decl(NodePtr<ProtocolDecl> node) { return traverse_type_decl(node); }

  // ===========================================================================
  // Members
  // ===========================================================================

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    if (!traverse_decl_header(node)) return false;
    return !node->body || get_derived().visit(node->body);
  }

  bool visit_initializer_decl(NodePtr<InitializerDecl> node)
  {
    if (!traverse_decl_header(node)) return false;
    return !node->body || get_derived().visit(node->body);
  }

  bool visit_deinitializer_decl(NodePtr<DeinitializerDecl> node)
  {
    if (!traverse_decl_header(node)) return false;
    return !node->body || get_derived().visit(node->body);
  }

  bool visit_subscript_decl(NodePtr<SubscriptDecl> node)
  {
    if (!traverse_decl_header(node)) return false;
    for (auto * accessor : node->accessors) {
      if (!get_derived().visit(accessor)) return false;
    }
    return true;
  }

  bool visit_variable_decl(NodePtr<VariableDecl> node)
  {
    if (!traverse_decl_header(node)) return false;
    for (auto * closure : node->closures) {
      if (!get_derived().visit(closure)) return false;
    }
    for (auto * accessor : node->accessors) {
      if (!get_derived().visit(accessor)) return false;
    }
    return true;
  }

  bool visit_type_alias_decl(NodePtr<TypeAliasDecl> node) { return traverse_decl_header(node); }
  bool visit_enum_case_decl(NodePtr<EnumCaseDecl> node) { return traverse_decl_header(node); }
  bool visit_import_decl(NodePtr<ImportDecl> node) { return traverse_decl_header(node); }

  // ===========================================================================
  // Supporting nodes
  // ===========================================================================

  bool visit_accessor_decl(NodePtr<AccessorDecl> node)
  {
    for (auto * m : node->modifiers) {
      if (!get_derived().visit(m)) return false;
    }
    return !node->body || get_derived().visit(node->body);
  }

  bool visit_code_block(NodePtr<CodeBlock> node)
  {
    for (auto * item : node->items) {
      if (!get_derived().visit(item)) return false;
    }
    return true;
  }

  bool visit_source_unit(NodePtr<SourceUnit> node)
  {
    for (auto * item : node->items) {
      if (!get_derived().visit(item)) return false;
    }
    return true;
  }

  bool visit_decl_modifier(NodePtr<DeclModifier> /*node*/) { return true; }
  bool visit_attribute(NodePtr<Attribute> /*node*/) { return true; }

protected:
  /// Attributes and modifiers, then members.
  bool traverse_type_decl(NodePtr<TypeDecl> node)
  {
    if (!traverse_decl_header(node)) return false;
    for (auto * member : node->members) {
      if (!get_derived().visit(member)) return false;
    }
    return true;
  }

  bool traverse_decl_header(NodePtr<Decl> node)
  {
    for (auto * a : node->attributes) {
      if (!get_derived().visit(a)) return false;
    }
    for (auto * m : node->modifiers) {
      if (!get_derived().visit(m)) return false;
    }
    return true;
  }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace swlint
