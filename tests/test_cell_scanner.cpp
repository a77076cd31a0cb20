#include <catch2/catch_test_macros.hpp>
#include "scanning/CellScanner.hpp"
#include "utils/ErrorReporter.hpp"

using charclass::CharacterClassifier;
using charclass::TargetSet;
using scanning::CellScanner;
using workbook::Cell;
using workbook::CellKind;
using workbook::Workbook;

namespace
{

Workbook customerWorkbook()
{
    Workbook wb("customers.xlsx");
    auto& sheet = wb.addSheet("Sheet1");
    sheet.setCell({ 1, 1 }, Cell::Text("Id"));
    sheet.setCell({ 1, 3 }, Cell::Text("Customer Name"));
    sheet.setCell({ 2, 1 }, Cell::Number(1, "1"));
    sheet.setCell({ 2, 3 }, Cell::Text("Plain ASCII"));
    sheet.setCell({ 4, 3 }, Cell::Text("John Doe's Caf\xC3\xA9\xC2\x81"));
    return wb;
}

} // namespace

TEST_CASE("CellScanner - Scenario cell", "[scanning]")
{
    CharacterClassifier classifier;
    CellScanner scanner(classifier);
    const auto wb = customerWorkbook();

    SECTION("Default range finds U+00E9 and U+0081 in C4")
    {
        const auto result = scanner.scan(wb, std::nullopt);
        REQUIRE(result.findings.size() == 2);
        REQUIRE(result.sheets_scanned == 1);
        REQUIRE(result.cells_scanned == 4);

        // First-occurrence order within the cell
        REQUIRE(result.findings[0].character == 0xE9);
        REQUIRE(result.findings[0].positions == std::vector<std::size_t>{ 14 });

        const auto& f = result.findings[1];
        REQUIRE(f.sheet_name == "Sheet1");
        REQUIRE(f.row == 4);
        REQUIRE(f.col == 3);
        REQUIRE(f.column_letter == "C");
        REQUIRE(f.column_header == std::optional<std::string>("Customer Name"));
        REQUIRE(f.character == 0x81);
        REQUIRE(f.hexValue() == "0x81");
        REQUIRE(f.positions == std::vector<std::size_t>{ 15 });
        REQUIRE_FALSE(f.is_printable);
        REQUIRE(f.category.rfind("Non-printable", 0) == 0);
    }

    SECTION("Target set selects only the requested character")
    {
        const auto result = scanner.scan(wb, TargetSet{ 0x81 });
        REQUIRE(result.findings.size() == 1);
        REQUIRE(result.findings[0].positions == std::vector<std::size_t>{ 15 });
    }

    SECTION("Target not present gives no findings")
    {
        const auto result = scanner.scan(wb, TargetSet{ 0x82 });
        REQUIRE(result.findings.empty());
    }

    SECTION("Scanning is idempotent and read-only")
    {
        const auto first = scanner.scan(wb, std::nullopt);
        const auto second = scanner.scan(wb, std::nullopt);
        REQUIRE(first.findings.size() == second.findings.size());
        for (std::size_t i = 0; i < first.findings.size(); ++i)
        {
            REQUIRE(first.findings[i].positions == second.findings[i].positions);
            REQUIRE(first.findings[i].cell_value == second.findings[i].cell_value);
        }
        REQUIRE(wb.modifiedCellCount() == 0);
    }
}

TEST_CASE("CellScanner - Aggregation and ordering", "[scanning]")
{
    CharacterClassifier classifier;
    CellScanner scanner(classifier);

    Workbook wb("order.xlsx");
    {
        auto& first = wb.addSheet("First");
        first.setCell({ 2, 2 }, Cell::Text("\xC2\x82x\xC2\x81y\xC2\x82"));
        first.setCell({ 1, 5 }, Cell::Text("\xC2\xA0"));
    }
    wb.addSheet("Second").setCell({ 1, 1 }, Cell::Text("\xC3\xBF"));

    const auto result = scanner.scan(wb, std::nullopt);
    REQUIRE(result.findings.size() == 4);

    // Row-major within a sheet: E1 before B2
    REQUIRE(result.findings[0].cellReference() == "E1");
    REQUIRE(result.findings[0].character == 0xA0);
    REQUIRE(result.findings[0].is_printable);

    // One finding per distinct character, all positions collected
    REQUIRE(result.findings[1].character == 0x82);
    REQUIRE(result.findings[1].positions == std::vector<std::size_t>{ 0, 4 });
    REQUIRE(result.findings[1].positionList() == "0, 4");
    REQUIRE(result.findings[2].character == 0x81);
    REQUIRE(result.findings[2].positions == std::vector<std::size_t>{ 2 });

    REQUIRE(result.findings[3].sheet_name == "Second");
    REQUIRE(result.findings[3].column_header == std::nullopt);

    // Positions index the character in the value
    for (const auto& f : result.findings)
    {
        REQUIRE_FALSE(f.positions.empty());
        REQUIRE(CellScanner::positionsOf(f.cell_value, f.character) == f.positions);
    }
}

TEST_CASE("CellScanner - Non-text cells are ignored", "[scanning]")
{
    CharacterClassifier classifier;
    CellScanner scanner(classifier);

    Workbook wb("kinds.xlsx");
    auto& sheet = wb.addSheet("Sheet1");
    sheet.setCell({ 1, 1 }, Cell::Number(3.5, "3.5"));

    Cell formula;
    formula.kind = CellKind::Formula;
    formula.text = "caf\xC3\xA9";
    sheet.setCell({ 1, 2 }, formula);

    Cell error;
    error.kind = CellKind::ErrorValue;
    error.text = "#N/A";
    sheet.setCell({ 1, 3 }, error);

    const auto result = scanner.scan(wb, std::nullopt);
    REQUIRE(result.findings.empty());
    REQUIRE(result.cells_scanned == 0);
    REQUIRE(result.cells_skipped == 0);
}

TEST_CASE("CellScanner - Unreadable units are skipped and counted", "[scanning]")
{
    utils::ErrorReporter::Reset();
    CharacterClassifier classifier;
    CellScanner scanner(classifier);

    Workbook wb("broken.xlsx");
    wb.addSheet("Broken").markUnreadable("worksheet XML unreadable");
    {
        auto& good = wb.addSheet("Good");
        good.setCell({ 1, 1 }, Cell::Text("bad \xFF bytes \xC2\x81"));

        Cell unreadable;
        unreadable.kind = CellKind::Unreadable;
        unreadable.read_error = "shared string index out of range: 99";
        good.setCell({ 2, 1 }, unreadable);

        good.setCell({ 3, 1 }, Cell::Text("ok \xC2\x81"));
    }

    const auto result = scanner.scan(wb, std::nullopt);
    REQUIRE(result.sheets_skipped == 1);
    REQUIRE(result.sheets_scanned == 1);
    REQUIRE(result.cells_skipped == 2);
    // Only A3 was actually scanned; the invalid UTF-8 cell counts as skipped alone
    REQUIRE(result.cells_scanned == 1);
    REQUIRE(result.findings.size() == 1);
    REQUIRE(result.findings[0].cellReference() == "A3");
    REQUIRE(utils::ErrorReporter::CountFor(utils::ErrorCategory::WorkbookRead) == 3);

    utils::ErrorReporter::Reset();
}
