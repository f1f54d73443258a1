// swlint/lint/scope_tracking_visitor.hpp - Finality scope stack and class-member check
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string>
#include <vector>

#include "swlint/ast/ast.hpp"
#include "swlint/ast/visitor.hpp"
#include "swlint/basic/diagnostic.hpp"
#include "swlint/lint/violation.hpp"

namespace swlint::lint
{

enum class MemberKind : uint8_t {
  Method,
  Property,
};

enum class FlagReason : uint8_t {
  InFinalClass,  ///< innermost enclosing class is final
  Private,       ///< declaration is private or fileprivate
};

/// A `class` member whose modifier can never be overridden.
struct FlaggedDeclaration
{
  const Decl * decl = nullptr;
  MemberKind member = MemberKind::Method;
  FlagReason reason = FlagReason::InFinalClass;
  SourceRange modifier_range;  ///< the `class` keyword, trivia excluded
  SourceRange cause_range;     ///< the enclosing class's `final`, or the member's `private`
};

[[nodiscard]] std::string reason_message(MemberKind member, FlagReason reason);

/**
 * Walks a SourceUnit once, tracking the finality of the innermost enclosing
 * class, and flags `class` methods and properties that are implicitly final.
 *
 * Only class declarations push a scope. Protocol bodies are not visited.
 * Members are checked after their own subtree has been walked. A visitor
 * instance serves one traversal at a time.
 */
class ScopeTrackingVisitor : public ConstRecursiveAstVisitor<ScopeTrackingVisitor>
{
  using Base = ConstRecursiveAstVisitor<ScopeTrackingVisitor>;

public:
  /// Flagged declarations sorted by source position.
  [[nodiscard]] std::vector<FlaggedDeclaration> traverse(const SourceUnit * unit);

  bool visit_class_decl(const ClassDecl * node);
  bool visit_protocol_decl(const ProtocolDecl * /*node*/) { return true; }
  bool visit_function_decl(const FunctionDecl * node);
  bool visit_variable_decl(const VariableDecl * node);

  [[nodiscard]] size_t scope_depth() const noexcept { return final_class_scope_.size(); }

private:
  void check(const Decl * decl, MemberKind member);

  struct ClassScope
  {
    bool is_final = false;
    SourceRange final_modifier;  ///< invalid unless `is_final`
  };

  std::vector<ClassScope> final_class_scope_;
  std::vector<FlaggedDeclaration> flagged_;
};

/// One violation per flagged declaration, positioned at the `class` keyword.
[[nodiscard]] std::vector<StyleViolation> make_violations(
  gsl::span<const FlaggedDeclaration> flagged, std::string_view rule_id, Severity severity);

/// One edit per flagged declaration, covering exactly the `class` keyword.
[[nodiscard]] std::vector<CorrectionEdit> make_correction_edits(
  gsl::span<const FlaggedDeclaration> flagged);

}  // namespace swlint::lint
