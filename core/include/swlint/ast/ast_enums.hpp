// swlint/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds and small semantic enums shared by the parser, the visitors
// and the JSON dump.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace swlint
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Generated from ast_nodes.def; categories occupy contiguous ranges.
 */
enum class NodeKind : uint8_t {
// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "swlint/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "swlint/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "swlint/ast/ast_nodes.def"
};

[[nodiscard]] constexpr bool is_decl_kind(NodeKind k) noexcept
{
  return k >= NodeKind::ClassDecl && k <= NodeKind::ImportDecl;
}

/// class, struct, enum, actor, extension and protocol declarations.
[[nodiscard]] constexpr bool is_type_decl_kind(NodeKind k) noexcept
{
  return k >= NodeKind::ClassDecl && k <= NodeKind::ProtocolDecl;
}

/// Declarations whose whole subtree is excluded from class-modifier checks.
[[nodiscard]] constexpr bool is_skippable_decl_kind(NodeKind k) noexcept
{
  return k == NodeKind::ProtocolDecl;
}

[[nodiscard]] constexpr std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "swlint/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// AccessorKind
// ============================================================================

enum class AccessorKind : uint8_t {
  Get,
  Set,
  WillSet,
  DidSet,
  Read,    ///< _read
  Modify,  ///< _modify
  Init,    ///< init accessor
  Other,   ///< unsafeAddress and friends
};

[[nodiscard]] constexpr std::string_view to_string(AccessorKind k) noexcept
{
  switch (k) {
    case AccessorKind::Get:
      return "get";
    case AccessorKind::Set:
      return "set";
    case AccessorKind::WillSet:
      return "willSet";
    case AccessorKind::DidSet:
      return "didSet";
    case AccessorKind::Read:
      return "_read";
    case AccessorKind::Modify:
      return "_modify";
    case AccessorKind::Init:
      return "init";
    case AccessorKind::Other:
      return "other";
  }
  return "";
}

}  // namespace swlint
