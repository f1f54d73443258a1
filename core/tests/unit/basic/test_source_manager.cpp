#include <gtest/gtest.h>

#include <string>

#include "swlint/basic/source_manager.hpp"

using namespace swlint;

TEST(SourceManager, LineColumnLookup)
{
  const SourceFile file("a.swift", "ab\ncd\n\nef");

  EXPECT_EQ(file.line_count(), 4u);

  const LineColumn first = file.get_line_column(0);
  EXPECT_EQ(first.line, 1u);
  EXPECT_EQ(first.column, 1u);

  const LineColumn d = file.get_line_column(4);
  EXPECT_EQ(d.line, 2u);
  EXPECT_EQ(d.column, 2u);

  const LineColumn e = file.get_line_column(7);
  EXPECT_EQ(e.line, 4u);
  EXPECT_EQ(e.column, 1u);

  EXPECT_EQ(file.get_line(1), "cd");
  EXPECT_EQ(file.get_line(2), "");
  EXPECT_EQ(file.get_line_offset(3), 7u);
}

TEST(SourceManager, CharacterColumnCountsCodePoints)
{
  // "é" is two bytes, "↓" three.
  const SourceFile file("u.swift", "\xC3\xA9\xE2\x86\x93x");

  EXPECT_EQ(file.get_character_column(0), 1u);
  EXPECT_EQ(file.get_character_column(2), 2u);
  EXPECT_EQ(file.get_character_column(5), 3u);
  EXPECT_EQ(file.get_line_column(5).column, 6u);
}

TEST(SourceManager, ResolveTextRange)
{
  const FileId id{0};
  const SourceFile file("r.swift", "class \xC3\xA9");

  const auto ok = file.resolve_text_range(SourceRange(id, 0, 5));
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->location, 0u);
  EXPECT_EQ(ok->length, 5u);

  // Past the end of the contents
  EXPECT_FALSE(file.resolve_text_range(SourceRange(id, 6, 20)).has_value());
  // Inside a multi-byte sequence
  EXPECT_FALSE(file.resolve_text_range(SourceRange(id, 7, 8)).has_value());
  // Invalid range
  EXPECT_FALSE(file.resolve_text_range(SourceRange{}).has_value());
}

TEST(SourceManager, RegistryKeepsIdsPerPath)
{
  SourceRegistry reg;
  const FileId a = reg.register_file("dir/a.swift", "let a = 1");
  const FileId b = reg.register_file("dir/b.swift", "let b = 2");

  EXPECT_TRUE(a.is_valid());
  EXPECT_NE(a, b);
  EXPECT_EQ(reg.size(), 2u);

  // Re-registering returns the existing id without replacing contents.
  EXPECT_EQ(reg.register_file("dir/a.swift", "changed"), a);
  EXPECT_EQ(reg.get_file(a)->content(), "let a = 1");

  reg.update_content(a, "let a = 42");
  EXPECT_EQ(reg.get_file(a)->content(), "let a = 42");

  const auto found = reg.find_by_path("dir/b.swift");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(*found, b);
  EXPECT_FALSE(reg.find_by_path("dir/c.swift").has_value());

  EXPECT_EQ(reg.get_slice(SourceRange(b, 4, 5)), "b");
  EXPECT_EQ(reg.get_file(FileId::invalid()), nullptr);
  EXPECT_TRUE(reg.get_path(FileId::invalid()).empty());
}

TEST(SourceManager, FullRangeSpansLines)
{
  SourceRegistry reg;
  const FileId id = reg.register_file("f.swift", "class C {\n  func f() {}\n}\n");

  const FullSourceRange fr = reg.get_full_range(SourceRange(id, 12, 16));
  ASSERT_TRUE(fr.is_valid());
  EXPECT_EQ(fr.start_line, 2u);
  EXPECT_EQ(fr.start_column, 3u);
  EXPECT_EQ(fr.end_line, 2u);
  EXPECT_EQ(fr.end_column, 7u);
}
