// swlint/lint/non_overridable_class_declaration_rule.cpp
#include "swlint/lint/non_overridable_class_declaration_rule.hpp"

#include "swlint/lint/scope_tracking_visitor.hpp"

namespace swlint::lint
{
namespace
{

RuleDescription make_description()
{
  RuleDescription d;
  d.identifier = NonOverridableClassDeclarationRule::k_identifier;
  d.name = "Class Declaration in Final Class";
  d.description =
    "Class methods and properties in final classes should themselves be final, just as if the "
    "declarations are private. In both cases, they cannot be overridden. Using `final class` or "
    "`static` makes this explicit.";
  d.kind = RuleKind::Style;
  d.opt_in = true;

  d.non_triggering_examples = {
    {R"(final class C {
    final class var b: Bool { true }
    final class func f() {}
})",
     ""},
    {R"(class C {
    final class var b: Bool { true }
    final class func f() {}
})",
     ""},
    {R"(class C {
    class var b: Bool { true }
    class func f() {}
})",
     ""},
    {R"(class C {
    static var b: Bool { true }
    static func f() {}
})",
     ""},
    {R"(final class C {
    static var b: Bool { true }
    static func f() {}
})",
     ""},
    {R"(final class C {
    class D {
        class var b: Bool { true }
        class func f() {}
    }
})",
     ""},
    {R"(class C {
    private(set) class var b: Bool = true
})",
     ""},
    {R"(final class C {
    class func f() {} // swlint:disable:this non_overridable_class_declaration
})",
     ""},
  };

  d.triggering_examples = {
    {R"(final class C {
    ↓class var b: Bool { true }
    ↓class func f() {}
})",
     ""},
    {R"(class C {
    final class D {
        ↓class var b: Bool { true }
        ↓class func f() {}
    }
})",
     ""},
    {R"(class C {
    private ↓class var b: Bool { true }
    private ↓class func f() {}
})",
     ""},
    {R"(class C {
    fileprivate ↓class func f() {}
})",
     ""},
  };

  d.corrections = {
    {{R"(final class C {
    class func f() {}
})",
      ""},
     R"(final class C {
    final class func f() {}
})"},
    {{R"(final class C {
    class var b: Bool { true }
})",
      "final_class_modifier: static"},
     R"(final class C {
    static var b: Bool { true }
})"},
  };

  return d;
}

}  // namespace

const RuleDescription & NonOverridableClassDeclarationRule::description()
{
  static const RuleDescription k_description = make_description();
  return k_description;
}

std::vector<StyleViolation> NonOverridableClassDeclarationRule::validate(
  const SourceUnit * unit) const
{
  ScopeTrackingVisitor visitor;
  const auto flagged = visitor.traverse(unit);
  return make_violations(flagged, k_identifier, config_.severity);
}

CorrectionOutcome NonOverridableClassDeclarationRule::correct(
  const SourceUnit * unit, FileId file_id, const SourceFile & file,
  const SuppressionFilter & filter) const
{
  ScopeTrackingVisitor visitor;
  const auto edits = make_correction_edits(visitor.traverse(unit));

  const CorrectionApplier applier(file_id, file, filter);
  return applier.apply(edits, description(), replacement_text(config_.final_class_modifier));
}

}  // namespace swlint::lint
