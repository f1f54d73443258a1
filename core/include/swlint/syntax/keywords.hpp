#pragma once

#include <algorithm>
#include <array>
#include <string_view>

namespace swlint::syntax
{

// Declaration modifiers. `class` is listed here and is disambiguated from a
// class declaration by what follows it.
inline constexpr std::array<std::string_view, 29> k_decl_modifiers = {
  "class",       "static",     "final",     "override",   "required",  "convenience",
  "dynamic",     "lazy",       "weak",      "unowned",    "mutating",  "nonmutating",
  "optional",    "indirect",   "prefix",    "postfix",    "infix",     "open",
  "public",      "package",    "internal",  "fileprivate", "private",  "nonisolated",
  "distributed", "consuming",  "borrowing", "__consuming", "async",
};

// Keywords that introduce a declaration.
// `actor` is contextual and handled by the parser.
inline constexpr std::array<std::string_view, 17> k_decl_keywords = {
  "class",     "struct", "enum",   "extension",      "protocol",        "func",
  "init",      "deinit", "subscript", "var",          "let",             "typealias",
  "case",      "import", "associatedtype", "precedencegroup", "operator",
};

// Member declaration keywords that may follow a `class` modifier.
inline constexpr std::array<std::string_view, 5> k_class_member_keywords = {
  "func", "var", "let", "subscript", "typealias",
};

inline constexpr std::array<std::string_view, 10> k_accessor_keywords = {
  "get",   "set",    "willSet", "didSet",        "_read",
  "_modify", "init", "unsafeAddress", "unsafeMutableAddress", "modify",
};

// Effects that may appear between an accessor keyword and its body.
inline constexpr std::array<std::string_view, 3> k_accessor_effects = {"async", "throws", "rethrows"};

template <size_t N>
[[nodiscard]] inline bool contains(
  const std::array<std::string_view, N> & words, std::string_view w) noexcept
{
  return std::find(words.begin(), words.end(), w) != words.end();
}

}  // namespace swlint::syntax
