// test_diagnostic.cpp - Unit tests for DiagnosticBag and DiagnosticPrinter
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <utility>

#include "apigen/basic/diagnostic.hpp"
#include "apigen/basic/diagnostic_printer.hpp"

namespace apigen
{

TEST(DiagnosticBag, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error("apigen.yaml: generator.decorators[0]", "unknown decorator");
    EXPECT_TRUE(bag.empty());
    builder.with_code("E0101").with_help("try object_to_json");
  }

  ASSERT_EQ(bag.size(), 1u);
  const auto & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E0101");
  EXPECT_EQ(d.message, "unknown decorator");
  EXPECT_EQ(d.primary_location(), "apigen.yaml: generator.decorators[0]");
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "try object_to_json");
}

TEST(DiagnosticBag, MovedBuilderAddsOnce)
{
  DiagnosticBag bag;
  {
    auto first = bag.report_warning("x", "careful");
    auto second = std::move(first);
    second.with_code("W0101");
  }
  ASSERT_EQ(bag.size(), 1u);
  EXPECT_EQ(bag.all()[0].code, "W0101");
}

TEST(DiagnosticBag, SeverityQueries)
{
  DiagnosticBag bag;
  bag.report_warning("", "w1");
  bag.report_info("", "i1");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());

  bag.report_error("", "e1");
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.errors().size(), 1u);
  EXPECT_EQ(bag.warnings().size(), 1u);
  EXPECT_EQ(bag.size(), 3u);
}

TEST(DiagnosticBag, NoLocationMeansNoLabel)
{
  DiagnosticBag bag;
  bag.report_error("", "plain");
  EXPECT_TRUE(bag.all()[0].labels.empty());
  EXPECT_EQ(bag.all()[0].primary_label(), nullptr);
  EXPECT_TRUE(bag.all()[0].primary_location().empty());
}

TEST(DiagnosticBag, Merge)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_error("", "a");
  b.report_error("", "b");
  b.report_error("", "c");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 3u);
  EXPECT_EQ(a.all()[2].message, "c");
}

TEST(DiagnosticPrinter, RustStyleWithoutColor)
{
  DiagnosticBag bag;
  bag
    .report_error(
      "apigen.yaml: generator.decorators[1]", "unknown decorator 'to_xml'",
      "not a registered decorator")
    .with_code("E0101")
    .with_help("available decorators: object_to_json");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(bag);

  const std::string expected =
    "error[E0101]: unknown decorator 'to_xml'\n"
    "  --> apigen.yaml: generator.decorators[1]\n"
    "      |\n"
    "      = note: not a registered decorator\n"
    "      |\n"
    "      = help: available decorators: object_to_json\n"
    "\n";
  EXPECT_EQ(os.str(), expected);
}

TEST(DiagnosticPrinter, ErrorsPrintedFirst)
{
  DiagnosticBag bag;
  bag.report_warning("", "listed twice");
  bag.report_error("", "no name");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print_all(bag);

  const std::string out = os.str();
  EXPECT_EQ(out.rfind("error: no name\n", 0), 0u) << out;
  EXPECT_NE(out.find("warning: listed twice\n"), std::string::npos);
}

TEST(DiagnosticPrinter, SecondaryLabelShowsItsLocation)
{
  DiagnosticBag bag;
  bag.report_error("a.yaml: x", "bad")
    .with_secondary_label("b.json: name", "declared here");

  std::ostringstream os;
  DiagnosticPrinter printer(os, false);
  printer.print(bag.all()[0]);

  const std::string expected =
    "error: bad\n"
    "  --> a.yaml: x\n"
    "      |\n"
    "      = note: b.json: name: declared here\n"
    "\n";
  EXPECT_EQ(os.str(), expected);
}

}  // namespace apigen
