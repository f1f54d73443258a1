// swlint/lint/rule_description.cpp
#include "swlint/lint/rule_description.hpp"

namespace swlint::lint
{

std::string strip_violation_markers(std::string_view code, std::vector<uint32_t> * offsets)
{
  std::string out;
  out.reserve(code.size());

  size_t pos = 0;
  while (pos < code.size()) {
    const size_t marker = code.find(k_violation_marker, pos);
    if (marker == std::string_view::npos) {
      out.append(code.substr(pos));
      break;
    }
    out.append(code.substr(pos, marker - pos));
    if (offsets != nullptr) {
      offsets->push_back(static_cast<uint32_t>(out.size()));
    }
    pos = marker + k_violation_marker.size();
  }
  return out;
}

}  // namespace swlint::lint
