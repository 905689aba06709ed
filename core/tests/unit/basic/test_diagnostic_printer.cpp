#include <gtest/gtest.h>

#include <sstream>

#include "reactc/basic/diagnostic_printer.hpp"

using namespace reactc;

namespace
{

const char * k_source =
  "function List() {\n"
  "  const items = [];\n"
  "  items.push(x);\n"
  "}\n";

}  // namespace

TEST(BasicDiagnosticPrinter, RendersSourceLineAndFix)
{
  const SourceFile source("List.tsx", k_source);
  DiagnosticBag diags(&source);
  diags.report_warning(SourceRange{40, 53}, "items is static", "mutated here")
    .with_code("non-reactive-mutation")
    .with_fix("use let");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(diags, source);

  EXPECT_EQ(
    os.str(),
    "warning[non-reactive-mutation]: items is static\n"
    "    --> List.tsx:3:3\n"
    "      |\n"
    "    3 |   items.push(x);\n"
    "      |   ^^^^^^^^^^^^^ mutated here\n"
    "      |\n"
    "      = fix: use let\n"
    "\n");
}

TEST(BasicDiagnosticPrinter, PrintAllSortsByPosition)
{
  const SourceFile source("List.tsx", k_source);
  DiagnosticBag diags(&source);
  diags.report_error(SourceRange{40, 45}, "second");
  diags.report_error(SourceRange{26, 31}, "first");

  std::ostringstream os;
  DiagnosticPrinter(os, false).print_all(diags, source);

  const std::string out = os.str();
  ASSERT_NE(out.find("first"), std::string::npos);
  ASSERT_NE(out.find("second"), std::string::npos);
  EXPECT_LT(out.find("first"), out.find("second"));
  EXPECT_NE(out.find("List.tsx:2:9"), std::string::npos);
}

TEST(BasicDiagnosticPrinter, CompactLine)
{
  const SourceFile source("List.tsx", k_source);
  DiagnosticBag diags(&source);
  diags.report_warning(SourceRange{40, 53}, "items is static").with_code("non-reactive-mutation");
  diags.report_error(SourceRange{}, "cannot read file");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  for (const auto & d : diags) {
    printer.print_compact(d, "List.tsx");
  }
  EXPECT_EQ(
    os.str(),
    "List.tsx:3:3: warning[non-reactive-mutation]: items is static\n"
    "List.tsx: error: cannot read file\n");
}
