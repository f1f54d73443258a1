// swlint/lint/violation.cpp
#include "swlint/lint/violation.hpp"

namespace swlint::lint
{

Location make_location(const SourceFile & file, uint32_t offset)
{
  const LineColumn lc = file.get_line_column(offset);
  Location loc;
  loc.file = file.path();
  loc.line = lc.line;
  loc.character = file.get_character_column(offset);
  return loc;
}

}  // namespace swlint::lint
