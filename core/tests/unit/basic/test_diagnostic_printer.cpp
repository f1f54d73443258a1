#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "swlint/basic/diagnostic.hpp"
#include "swlint/basic/diagnostic_printer.hpp"
#include "swlint/basic/source_manager.hpp"

using namespace swlint;

TEST(DiagnosticPrinter, PrintsHeaderLocationAndMarker)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("/tmp/swlint-printer/C.swift", "final class C {\n    class func f() {}\n}\n");

  DiagnosticBag diags;
  diags
    .report_warning(
      SourceRange(id, 20, 25), "Class methods in final classes should themselves be final")
    .with_code("non_overridable_class_declaration")
    .with_fixit(SourceRange(id, 20, 25), "final class");

  std::ostringstream out;
  DiagnosticPrinter printer(out, /*use_color=*/false);
  printer.print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_NE(
    text.find("warning[non_overridable_class_declaration]: Class methods in final classes"),
    std::string::npos)
    << text;
  EXPECT_NE(text.find("C.swift:2:5"), std::string::npos) << text;
  EXPECT_NE(text.find("    2 |     class func f() {}"), std::string::npos) << text;
  EXPECT_NE(text.find("|     ^^^^^"), std::string::npos) << text;
  EXPECT_NE(text.find("= help: replace with 'final class'"), std::string::npos) << text;
  EXPECT_NE(text.find("    2 |     final class func f() {}"), std::string::npos) << text;
}

TEST(DiagnosticPrinter, DiagnosticWithoutLocation)
{
  SourceRegistry sources;
  DiagnosticBag diags;
  diags.report_error(SourceRange{}, "path not found: missing.swift").with_code("io");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("error[io]: path not found: missing.swift"), std::string::npos) << text;
  EXPECT_NE(text.find("--> <unknown>"), std::string::npos) << text;
}

TEST(DiagnosticPrinter, PrintAllOrdersByPosition)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("/tmp/swlint-printer/D.swift", "let a = 1\nlet b = 2\n");

  DiagnosticBag diags;
  diags.report_error(SourceRange(id, 14, 15), "second");
  diags.report_error(SourceRange(id, 4, 5), "first");

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(diags, sources);

  const std::string text = out.str();
  const auto first = text.find("error: first");
  const auto second = text.find("error: second");
  ASSERT_NE(first, std::string::npos);
  ASSERT_NE(second, std::string::npos);
  EXPECT_LT(first, second);
}

TEST(DiagnosticPrinter, SecondaryLabelAndHelp)
{
  SourceRegistry sources;
  const FileId id = sources.register_file("/tmp/swlint-printer/E.swift", "final class C {\n    class func f() {}\n}\n");

  DiagnosticBag diags;
  diags.report_warning(SourceRange(id, 20, 25), "redundant")
    .with_secondary_label(SourceRange(id, 0, 5), "class is final here")
    .with_secondary_label(SourceRange{}, "dropped")
    .with_help("write `final class` instead");

  ASSERT_EQ(diags.size(), 1u);
  ASSERT_EQ(diags.all()[0].labels.size(), 2u);
  EXPECT_EQ(diags.all()[0].labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(diags.all()[0].primary_range(), SourceRange(id, 20, 25));

  std::ostringstream out;
  DiagnosticPrinter(out, false).print_all(diags, sources);

  const std::string text = out.str();
  EXPECT_NE(text.find("E.swift:2:5"), std::string::npos) << text;
  EXPECT_NE(text.find("    1 | final class C {"), std::string::npos) << text;
  EXPECT_NE(text.find("| ----- class is final here"), std::string::npos) << text;
  EXPECT_EQ(text.find("dropped"), std::string::npos) << text;
  EXPECT_NE(text.find("= help: write `final class` instead"), std::string::npos) << text;
}

TEST(DiagnosticBag, MergeMovesDiagnostics)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_warning(SourceRange{}, "first");
  b.report_error(SourceRange{}, "second").with_code("io");

  EXPECT_FALSE(a.has_errors());
  a.merge(std::move(b));

  ASSERT_EQ(a.size(), 2u);
  EXPECT_EQ(a.all()[0].message, "first");
  EXPECT_EQ(a.all()[1].message, "second");
  EXPECT_TRUE(a.has_errors());
}
