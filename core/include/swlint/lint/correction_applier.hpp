// swlint/lint/correction_applier.hpp - Apply correction edits to file contents
#pragma once

#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "swlint/basic/source_manager.hpp"
#include "swlint/lint/rule_description.hpp"
#include "swlint/lint/suppression.hpp"
#include "swlint/lint/violation.hpp"

namespace swlint::lint
{

struct CorrectionOutcome
{
  std::string contents;                 ///< contents after every applied edit
  std::vector<Correction> corrections;  ///< in application order (end of file first)

  [[nodiscard]] bool changed() const noexcept { return !corrections.empty(); }
};

/**
 * Replaces edit ranges of one file with a fixed keyword.
 *
 * Edits are mapped onto the contents, filtered through the suppression
 * filter, then applied from the highest offset down so that pending ranges
 * stay valid. Edits that cannot be mapped, are not enabled, or overlap an
 * edit already applied are dropped individually.
 */
class CorrectionApplier
{
public:
  CorrectionApplier(FileId file_id, const SourceFile & file, const SuppressionFilter & filter)
  : file_id_(file_id), file_(file), filter_(filter)
  {
  }

  [[nodiscard]] CorrectionOutcome apply(
    gsl::span<const CorrectionEdit> edits, const RuleDescription & rule,
    std::string_view replacement) const;

private:
  FileId file_id_;
  const SourceFile & file_;
  const SuppressionFilter & filter_;
};

}  // namespace swlint::lint
