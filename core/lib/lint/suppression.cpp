// swlint/lint/suppression.cpp - Directive comment scanning
#include "swlint/lint/suppression.hpp"

#include <algorithm>

#include "swlint/syntax/lexer.hpp"

namespace swlint::lint
{
namespace
{

constexpr std::string_view k_prefix = "swlint:";
constexpr std::string_view k_legacy_prefix = "swiftlint:";

std::vector<std::string_view> split_words(std::string_view s)
{
  std::vector<std::string_view> words;
  size_t pos = 0;
  while (pos < s.size()) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\r')) ++pos;
    const size_t start = pos;
    while (pos < s.size() && s[pos] != ' ' && s[pos] != '\t' && s[pos] != '\r') ++pos;
    if (pos > start) {
      words.push_back(s.substr(start, pos - start));
    }
  }
  return words;
}

}  // namespace

// ============================================================================
// Directive
// ============================================================================

bool Directive::applies_to(std::string_view rule_id) const
{
  return std::any_of(rules.begin(), rules.end(), [&](const std::string & r) {
    return r == "all" || r == rule_id;
  });
}

std::optional<Directive> parse_directive(std::string_view comment, std::string & error)
{
  error.clear();

  size_t pos = comment.find(k_prefix);
  size_t prefix_len = k_prefix.size();
  const size_t legacy = comment.find(k_legacy_prefix);
  if (legacy != std::string_view::npos && (pos == std::string_view::npos || legacy < pos)) {
    pos = legacy;
    prefix_len = k_legacy_prefix.size();
  }
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }

  std::string_view body = comment.substr(pos + prefix_len);
  if (body.size() >= 2 && body.substr(body.size() - 2) == "*/") {
    body.remove_suffix(2);
  }

  const auto words = split_words(body);
  if (words.empty()) {
    error = "missing command";
    return std::nullopt;
  }

  Directive d;

  const std::string_view command = words.front();
  const size_t colon = command.find(':');
  const std::string_view action = command.substr(0, colon);
  if (action == "disable") {
    d.action = DirectiveAction::Disable;
  } else if (action == "enable") {
    d.action = DirectiveAction::Enable;
  } else {
    error = "unknown command '" + std::string(action) + "'";
    return std::nullopt;
  }

  if (colon != std::string_view::npos) {
    const std::string_view scope = command.substr(colon + 1);
    if (scope == "this") {
      d.scope = DirectiveScope::ThisLine;
    } else if (scope == "next") {
      d.scope = DirectiveScope::NextLine;
    } else if (scope == "previous") {
      d.scope = DirectiveScope::PreviousLine;
    } else {
      error = "unknown modifier '" + std::string(scope) + "'";
      return std::nullopt;
    }
  }

  for (size_t i = 1; i < words.size(); ++i) {
    if (words[i] == "-") break;  // trailing explanation
    d.rules.emplace_back(words[i]);
  }
  if (d.rules.empty()) {
    error = "no rules specified";
    return std::nullopt;
  }

  return d;
}

// ============================================================================
// Filters
// ============================================================================

RuleState NullSuppressionFilter::rule_state(TextRange range, std::string_view /*rule_id*/) const
{
  return range.end() <= file_.size() ? RuleState::Enabled : RuleState::Unresolvable;
}

DirectiveSuppressionFilter::DirectiveSuppressionFilter(
  FileId file_id, const SourceFile & file, DiagnosticBag * diags)
: file_(file)
{
  syntax::Lexer lexer(file_id, file.content());
  for (const auto & tok : lexer.lex_all()) {
    if (!tok.is_comment()) continue;

    std::string error;
    auto directive = parse_directive(tok.text, error);
    if (!directive) {
      if (!error.empty() && diags != nullptr) {
        diags->report_warning(tok.range, "invalid swlint directive: " + error)
          .with_code("directive")
          .with_help("expected `swlint:disable` or `swlint:enable`, optionally with "
                     "`:next`, `:this` or `:previous`, followed by rule identifiers or `all`");
      }
      continue;
    }

    directive->offset = tok.begin();
    directive->line = file.get_line_column(tok.begin()).line;
    directives_.push_back(std::move(*directive));
  }
}

RuleState DirectiveSuppressionFilter::rule_state(TextRange range, std::string_view rule_id) const
{
  if (range.end() > file_.size()) {
    return RuleState::Unresolvable;
  }

  const uint32_t line = file_.get_line_column(range.location).line;

  bool enabled = true;
  for (const auto & d : directives_) {
    if (d.scope == DirectiveScope::Region && d.offset <= range.location && d.applies_to(rule_id)) {
      enabled = d.action == DirectiveAction::Enable;
    }
  }

  // Line-scoped directives win on their line.
  for (const auto & d : directives_) {
    if (d.scope == DirectiveScope::Region || !d.applies_to(rule_id)) continue;

    uint32_t target = d.line;
    if (d.scope == DirectiveScope::NextLine) {
      target = d.line + 1;
    } else if (d.scope == DirectiveScope::PreviousLine) {
      target = d.line - 1;
    }
    if (target == line) {
      enabled = d.action == DirectiveAction::Enable;
    }
  }

  return enabled ? RuleState::Enabled : RuleState::Disabled;
}

}  // namespace swlint::lint
