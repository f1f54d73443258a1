// swlint/lint/correction_applier.cpp
#include "swlint/lint/correction_applier.hpp"

#include <algorithm>
#include <cstdint>

namespace swlint::lint
{

CorrectionOutcome CorrectionApplier::apply(
  gsl::span<const CorrectionEdit> edits, const RuleDescription & rule,
  std::string_view replacement) const
{
  // Map and filter before touching the contents.
  std::vector<TextRange> ranges;
  ranges.reserve(edits.size());
  for (const auto & edit : edits) {
    if (edit.range.file_id() != file_id_) {
      continue;
    }
    const auto range = file_.resolve_text_range(edit.range);
    if (!range) {
      continue;
    }
    if (filter_.rule_state(*range, rule.identifier) != RuleState::Enabled) {
      continue;
    }
    ranges.push_back(*range);
  }

  std::sort(ranges.begin(), ranges.end(), [](const TextRange & a, const TextRange & b) {
    return a.location > b.location;
  });

  CorrectionOutcome out;
  out.contents = std::string(file_.content());

  uint32_t applied_floor = UINT32_MAX;  // lowest offset already rewritten
  for (const auto & range : ranges) {
    if (range.end() > applied_floor) {
      continue;  // overlaps an applied edit
    }

    out.contents.replace(range.location, range.length, replacement);
    applied_floor = range.location;

    Correction c;
    c.rule_id = std::string(rule.identifier);
    c.rule_name = std::string(rule.name);
    c.location = make_location(file_, range.location);
    c.offset = range.location;
    out.corrections.push_back(std::move(c));
  }

  return out;
}

}  // namespace swlint::lint
