// swlint/lint/scope_tracking_visitor.cpp
#include "swlint/lint/scope_tracking_visitor.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace swlint::lint
{

std::string reason_message(MemberKind member, FlagReason reason)
{
  const std::string_view what = member == MemberKind::Method ? "methods" : "properties";
  if (reason == FlagReason::InFinalClass) {
    return fmt::format("Class {} in final classes should themselves be final", what);
  }
  return fmt::format("Private class {} should be declared final", what);
}

std::vector<FlaggedDeclaration> ScopeTrackingVisitor::traverse(const SourceUnit * unit)
{
  final_class_scope_.clear();
  flagged_.clear();

  visit(unit);

  std::stable_sort(
    flagged_.begin(), flagged_.end(), [](const FlaggedDeclaration & a, const FlaggedDeclaration & b) {
      return a.modifier_range.get_begin() < b.modifier_range.get_begin();
    });
  return std::move(flagged_);
}

bool ScopeTrackingVisitor::visit_class_decl(const ClassDecl * node)
{
  const DeclModifier * final_keyword = find_modifier(node->modifiers, "final");
  final_class_scope_.push_back(
    ClassScope{final_keyword != nullptr, final_keyword ? final_keyword->get_range() : SourceRange{}});
  const bool keep_going = Base::visit_class_decl(node);
  final_class_scope_.pop_back();
  return keep_going;
}

bool ScopeTrackingVisitor::visit_function_decl(const FunctionDecl * node)
{
  const bool keep_going = Base::visit_function_decl(node);
  check(node, MemberKind::Method);
  return keep_going;
}

bool ScopeTrackingVisitor::visit_variable_decl(const VariableDecl * node)
{
  const bool keep_going = Base::visit_variable_decl(node);
  check(node, MemberKind::Property);
  return keep_going;
}

void ScopeTrackingVisitor::check(const Decl * decl, MemberKind member)
{
  if (is_final(decl->modifiers)) {
    return;
  }
  const DeclModifier * class_keyword = find_modifier(decl->modifiers, "class");
  if (class_keyword == nullptr) {
    return;
  }
  // No enclosing class: nothing to compare against.
  if (final_class_scope_.empty()) {
    return;
  }

  const ClassScope & scope = final_class_scope_.back();
  const DeclModifier * private_keyword = find_private_modifier(decl->modifiers);
  if (!scope.is_final && private_keyword == nullptr) {
    return;
  }

  FlaggedDeclaration flagged;
  flagged.decl = decl;
  flagged.member = member;
  flagged.reason = scope.is_final ? FlagReason::InFinalClass : FlagReason::Private;
  flagged.modifier_range = class_keyword->get_range();
  flagged.cause_range = scope.is_final ? scope.final_modifier : private_keyword->get_range();
  flagged_.push_back(flagged);
}

std::vector<StyleViolation> make_violations(
  gsl::span<const FlaggedDeclaration> flagged, std::string_view rule_id, Severity severity)
{
  std::vector<StyleViolation> out;
  out.reserve(flagged.size());
  for (const auto & f : flagged) {
    StyleViolation v;
    v.rule_id = std::string(rule_id);
    v.severity = severity;
    v.position = f.modifier_range.get_begin();
    v.reason = reason_message(f.member, f.reason);
    v.cause = f.cause_range;
    v.cause_note =
      f.reason == FlagReason::InFinalClass ? "class is final here" : "declared private here";
    out.push_back(std::move(v));
  }
  return out;
}

std::vector<CorrectionEdit> make_correction_edits(gsl::span<const FlaggedDeclaration> flagged)
{
  std::vector<CorrectionEdit> out;
  out.reserve(flagged.size());
  for (const auto & f : flagged) {
    out.push_back(CorrectionEdit{f.modifier_range});
  }
  return out;
}

}  // namespace swlint::lint
