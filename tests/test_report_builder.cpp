#include <catch2/catch_test_macros.hpp>
#include "report/ReportBuilder.hpp"

using report::ReportBuilder;
using scanning::Finding;

namespace
{

Finding scenarioFinding()
{
    Finding f;
    f.sheet_name = "Sheet1";
    f.row = 4;
    f.col = 3;
    f.column_letter = "C";
    f.column_header = "Customer Name";
    f.character = 0x81;
    f.is_printable = false;
    f.category = "Non-printable - Unicode category: Cc (Cc)";
    f.positions = { 15 };
    f.cell_value = "John Doe's Caf\xC3\xA9\xC2\x81";
    return f;
}

bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("ReportBuilder - No findings", "[report]")
{
    ReportBuilder builder;
    const auto report = builder.build({});
    REQUIRE(report.rows.empty());
    REQUIRE(contains(report.console_text, ReportBuilder::kNoFindings));
}

TEST_CASE("ReportBuilder - Console rendering", "[report]")
{
    ReportBuilder builder;
    const auto report = builder.build({ scenarioFinding() });
    const auto& text = report.console_text;

    REQUIRE(contains(text, "Found 1 instances of problematic characters:"));
    REQUIRE(contains(text, "Sheet: Sheet1\n"));
    REQUIRE(contains(text, "Location: Cell C4 (Column Header: Customer Name)\n"));
    REQUIRE(contains(text, "Problematic Character: 0x81\n"));
    REQUIRE(contains(text, "Character: Non-printable - Unicode category: Cc (Cc)\n"));
    REQUIRE(contains(text, "Character Position(s) in Cell: 15\n"));

    SECTION("Non-printable characters are masked on the console")
    {
        REQUIRE(contains(text, "Cell Value: John Doe's Caf\xC3\xA9?\n"));
        REQUIRE_FALSE(contains(text, "\xC2\x81"));
    }

    SECTION("Context window with aligned caret")
    {
        REQUIRE(contains(text, "Context: ...Doe's Caf\xC3\xA9?...\n"));
        REQUIRE(contains(text, "\n         " + std::string(13, ' ') + "^\n"));
    }

    SECTION("Printable characters are quoted")
    {
        Finding f = scenarioFinding();
        f.character = 0xE9;
        f.is_printable = true;
        f.category = "Printable";
        f.positions = { 14 };
        REQUIRE(contains(builder.renderFinding(f), "Character: '\xC3\xA9' - Printable\n"));
    }

    SECTION("Missing header is left out")
    {
        Finding f = scenarioFinding();
        f.column_header.reset();
        REQUIRE(contains(builder.renderFinding(f), "Location: Cell C4\n"));
    }
}

TEST_CASE("ReportBuilder - Context radius is configurable", "[report]")
{
    ReportBuilder narrow({ .context_radius = 2 });
    const auto ctx = scenarioFinding().context(2);
    REQUIRE(ctx.line == "...f\xC3\xA9?...");
    REQUIRE(ctx.caret == "     ^");
    REQUIRE(contains(narrow.renderFinding(scenarioFinding()), "Context: ...f\xC3\xA9?...\n"));
}

TEST_CASE("ReportBuilder - Tabular rows keep raw values", "[report]")
{
    const auto row = ReportBuilder::toRow(scenarioFinding());
    REQUIRE(row.cell_value == "John Doe's Caf\xC3\xA9\xC2\x81");
    REQUIRE(row.problematic_char == "\xC2\x81");
    REQUIRE(row.column == "C");
    REQUIRE(row.row == 4);

    const auto fields = ReportBuilder::toFields(row);
    REQUIRE(fields.size() == ReportBuilder::columnNames().size());
    REQUIRE(fields[6] == "0x81");
    REQUIRE(fields[7] == "15");
    REQUIRE(fields[8] == "False");
}
