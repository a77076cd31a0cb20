#include <catch2/catch_test_macros.hpp>
#include "cleaning/BulkDecisionSource.hpp"
#include "cleaning/CleaningEngine.hpp"
#include "scanning/CellScanner.hpp"
#include "utils/ErrorReporter.hpp"

#include <deque>

using namespace cleaning;
using charclass::CharacterClassifier;
using charclass::TargetSet;
using scanning::CellScanner;
using workbook::Cell;
using workbook::Workbook;

namespace
{

// Replays a fixed list of decisions; records what it was shown
class ScriptedSource : public IDecisionSource
{
public:
    explicit ScriptedSource(std::deque<std::optional<CleaningDecision>> script, bool retry = true)
        : script_(std::move(script))
        , retry_(retry)
    {
    }

    std::optional<CleaningDecision> getDecision(const scanning::Finding& finding) override
    {
        shown.push_back(finding);
        if (script_.empty())
            return std::nullopt;
        auto next = script_.front();
        script_.pop_front();
        return next;
    }

    bool canRetry() const override { return retry_; }
    void onRejected(const CleaningDecision&, const std::string&) override { ++rejected; }

    std::vector<scanning::Finding> shown;
    int rejected = 0;

private:
    std::deque<std::optional<CleaningDecision>> script_;
    bool retry_;
};

const std::string kCafe = "John Doe's Caf\xC3\xA9\xC2\x81";

Workbook makeWorkbook()
{
    Workbook wb("book.xlsx");
    auto& sheet = wb.addSheet("Sheet1");
    sheet.setCell({ 1, 3 }, Cell::Text("Customer Name"));
    sheet.setCell({ 2, 1 }, Cell::Text("a\xC2\x81" "b\xC2\x81"));
    sheet.setCell({ 2, 2 }, Cell::Text("x\xC2\x82y"));
    sheet.setCell({ 3, 1 }, Cell::Number(5, "5"));
    sheet.setCell({ 4, 3 }, Cell::Text(kCafe));
    return wb;
}

const std::string& textAt(const Workbook& wb, int row, int col)
{
    return wb.findSheet("Sheet1")->find({ row, col })->text;
}

} // namespace

TEST_CASE("CleaningEngine - Scenario delete in one cell", "[cleaning]")
{
    CharacterClassifier classifier;
    CellScanner scanner(classifier);

    Workbook wb("book.xlsx");
    auto& sheet = wb.addSheet("Sheet1");
    sheet.setCell({ 1, 3 }, Cell::Text("Customer Name"));
    sheet.setCell({ 4, 3 }, Cell::Text(kCafe));

    const TargetSet targets{ 0x81 };
    auto findings = scanner.scan(wb, targets).findings;
    REQUIRE(findings.size() == 1);

    CleaningEngine engine(wb, classifier, targets);
    ScriptedSource source({ CleaningDecision::Delete(Scope::ThisCellThisCharacter) });
    const auto result = engine.run(findings, source);

    REQUIRE(result.status == EngineStatus::Completed);
    REQUIRE(result.final_state == EngineState::Done);
    REQUIRE(engine.state() == EngineState::Done);
    REQUIRE(result.log.size() == 1);
    REQUIRE(textAt(wb, 4, 3) == "John Doe's Caf\xC3\xA9");

    const auto& entry = result.log.front();
    REQUIRE(entry.sheet == "Sheet1");
    REQUIRE(entry.cellReference() == "C4");
    REQUIRE(entry.character == 0x81);
    REQUIRE(entry.operation == Operation::Delete);
    REQUIRE_FALSE(entry.replacement_text);
    REQUIRE(entry.original_value == kCafe);
    REQUIRE(entry.resulting_value == "John Doe's Caf\xC3\xA9");

    REQUIRE(scanner.scan(wb, targets).findings.empty());
    REQUIRE(wb.modifiedCellCount() == 1);
}

TEST_CASE("CleaningEngine - Scopes", "[cleaning]")
{
    CharacterClassifier classifier;
    CellScanner scanner(classifier);
    auto wb = makeWorkbook();
    auto findings = scanner.scan(wb, std::nullopt).findings;
    // A2:0x81, B2:0x82, C4:0xE9, C4:0x81
    REQUIRE(findings.size() == 4);

    CleaningEngine engine(wb, classifier, std::nullopt);

    SECTION("This cell only")
    {
        ScriptedSource source({ CleaningDecision::Replace(Scope::ThisCellThisCharacter, "_"),
                                CleaningDecision::Skip(), CleaningDecision::Skip(), CleaningDecision::Skip() });
        const auto result = engine.run(findings, source);
        REQUIRE(textAt(wb, 2, 1) == "a_b_");
        REQUIRE(textAt(wb, 4, 3) == kCafe);
        REQUIRE(result.log.size() == 1);
        REQUIRE(result.decisions_applied == 1);
        REQUIRE(result.findings_skipped == 3);
    }

    SECTION("This character everywhere, including cells not yet visited")
    {
        ScriptedSource source({ CleaningDecision::Delete(Scope::AllCellsThisCharacter), CleaningDecision::Skip(),
                                CleaningDecision::Skip() });
        const auto result = engine.run(findings, source);
        REQUIRE(textAt(wb, 2, 1) == "ab");
        REQUIRE(textAt(wb, 4, 3) == "John Doe's Caf\xC3\xA9");
        REQUIRE(textAt(wb, 2, 2) == "x\xC2\x82y");
        REQUIRE(result.log.size() == 2);

        // C4:0x81 is covered by the workbook-wide delete and never shown
        REQUIRE(result.findings_resolved == 1);
        REQUIRE(result.status == EngineStatus::Completed);
        REQUIRE(source.shown.size() == 3);
        REQUIRE(source.shown[1].character == 0x82);
        REQUIRE(source.shown[2].character == 0xE9);

        for (const auto& f : scanner.scan(wb, std::nullopt).findings)
            REQUIRE(f.character != 0x81);
    }

    SECTION("All problematic characters everywhere")
    {
        ScriptedSource source({ CleaningDecision::Replace(Scope::AllCellsAllProblematic, "?") });
        const auto result = engine.run(findings, source);
        REQUIRE(textAt(wb, 2, 1) == "a?b?");
        REQUIRE(textAt(wb, 2, 2) == "x?y");
        REQUIRE(textAt(wb, 4, 3) == "John Doe's Caf??");
        REQUIRE(textAt(wb, 1, 3) == "Customer Name");
        // One entry per (cell, character): A2 0x81, B2 0x82, C4 0xE9, C4 0x81
        REQUIRE(result.log.size() == 4);
        REQUIRE(result.findings_resolved == 3);
        REQUIRE(source.shown.size() == 1);
        REQUIRE(scanner.scan(wb, std::nullopt).findings.empty());
    }

    SECTION("Replacement text is not re-scanned")
    {
        // Replacing with a problematic character must not loop or double-apply
        ScriptedSource source(
            { CleaningDecision::Replace(Scope::AllCellsAllProblematic, "\xC2\x81\xC2\x81") });
        const auto result = engine.run(findings, source);
        REQUIRE(textAt(wb, 2, 2) == "x\xC2\x81\xC2\x81y");
        REQUIRE(result.status == EngineStatus::Completed);
        REQUIRE(source.shown.size() == 1);
    }

    SECTION("Empty replacement equals delete")
    {
        ScriptedSource source({ CleaningDecision::Replace(Scope::AllCellsThisCharacter, "") });
        const auto result = engine.run(findings, source);
        REQUIRE(textAt(wb, 2, 1) == "ab");
        REQUIRE(result.log.front().replacement_text == std::optional<std::string>(""));
    }
}

TEST_CASE("CleaningEngine - Skip all remaining", "[cleaning]")
{
    CharacterClassifier classifier;
    CellScanner scanner(classifier);
    auto wb = makeWorkbook();
    auto findings = scanner.scan(wb, std::nullopt).findings;

    CleaningEngine engine(wb, classifier, std::nullopt);
    ScriptedSource source({ CleaningDecision::Delete(Scope::ThisCellThisCharacter),
                            CleaningDecision::SkipAllRemaining() });
    const auto result = engine.run(findings, source);

    REQUIRE(result.status == EngineStatus::SkippedRemaining);
    REQUIRE(result.log.size() == 1);
    REQUIRE(result.findings_unprocessed == 3);
    REQUIRE(source.shown.size() == 2);
    REQUIRE(textAt(wb, 2, 1) == "ab");
    REQUIRE(textAt(wb, 2, 2) == "x\xC2\x82y");
    REQUIRE(textAt(wb, 4, 3) == kCafe);
}

TEST_CASE("CleaningEngine - Cancellation behaves like skip all", "[cleaning]")
{
    CharacterClassifier classifier;
    CellScanner scanner(classifier);
    auto wb = makeWorkbook();
    auto findings = scanner.scan(wb, std::nullopt).findings;

    CleaningEngine engine(wb, classifier, std::nullopt);
    ScriptedSource source({ std::nullopt });
    const auto result = engine.run(findings, source);

    REQUIRE(result.status == EngineStatus::Cancelled);
    REQUIRE(result.log.empty());
    REQUIRE(result.findings_unprocessed == findings.size());
    REQUIRE(wb.modifiedCellCount() == 0);
}

TEST_CASE("CleaningEngine - Stale findings are refreshed", "[cleaning]")
{
    CharacterClassifier classifier;
    CellScanner scanner(classifier);

    Workbook wb("book.xlsx");
    wb.addSheet("Sheet1").setCell({ 1, 1 }, Cell::Text("\xC2\x82" "a\xC2\x81" "b\xC2\x81"));
    auto findings = scanner.scan(wb, std::nullopt).findings;
    REQUIRE(findings.size() == 2);
    REQUIRE(findings[1].positions == std::vector<std::size_t>{ 2, 4 });

    CleaningEngine engine(wb, classifier, std::nullopt);
    ScriptedSource source({ CleaningDecision::Delete(Scope::ThisCellThisCharacter),
                            CleaningDecision::Skip() });
    const auto result = engine.run(findings, source);

    REQUIRE(result.log.size() == 1);
    REQUIRE(source.shown.size() == 2);
    // The 0x81 finding was shown with the value after the 0x82 delete
    REQUIRE(source.shown[1].cell_value == "a\xC2\x81" "b\xC2\x81");
    REQUIRE(source.shown[1].positions == std::vector<std::size_t>{ 1, 3 });

    SECTION("refresh drops findings whose character is gone")
    {
        REQUIRE_FALSE(engine.refresh(findings[0]));
        REQUIRE(engine.refresh(findings[1]));
    }
}

TEST_CASE("CleaningEngine - Invalid decisions", "[cleaning]")
{
    utils::ErrorReporter::Reset();
    CharacterClassifier classifier;
    CellScanner scanner(classifier);
    auto wb = makeWorkbook();
    auto findings = scanner.scan(wb, std::nullopt).findings;
    CleaningEngine engine(wb, classifier, std::nullopt);

    CleaningDecision missing_text;
    missing_text.scope = Scope::ThisCellThisCharacter;
    missing_text.operation = Operation::Replace;

    SECTION("Interactive sources are asked again")
    {
        ScriptedSource source({ missing_text, CleaningDecision::Delete(Scope::ThisCellThisCharacter) });
        const auto result = engine.run(findings, source);
        REQUIRE(source.rejected == 1);
        REQUIRE(textAt(wb, 2, 1) == "ab");
        REQUIRE(result.log.size() == 1);
    }

    SECTION("Bulk sources abort before any edit")
    {
        BulkDecisionSource source(missing_text);
        const auto result = engine.run(findings, source);
        REQUIRE(result.status == EngineStatus::InvalidDecision);
        REQUIRE(result.log.empty());
        REQUIRE(result.findings_unprocessed == findings.size());
        REQUIRE(wb.modifiedCellCount() == 0);
    }

    SECTION("An abort keeps the edits already applied")
    {
        ScriptedSource source({ CleaningDecision::Delete(Scope::ThisCellThisCharacter), missing_text },
                              /*retry=*/false);
        const auto result = engine.run(findings, source);
        REQUIRE(result.status == EngineStatus::InvalidDecision);
        REQUIRE(result.final_state == EngineState::Done);
        REQUIRE(source.rejected == 1);

        REQUIRE(result.log.size() == 1);
        REQUIRE(result.log[0].cellReference() == "A2");
        REQUIRE(result.log[0].character == 0x81);
        REQUIRE(result.log[0].resulting_value == "ab");
        REQUIRE(textAt(wb, 2, 1) == "ab");

        // B2 and both C4 findings were never applied
        REQUIRE(result.findings_unprocessed == 3);
        REQUIRE(textAt(wb, 2, 2) == "x\xC2\x82y");
        REQUIRE(textAt(wb, 4, 3) == kCafe);
        REQUIRE(wb.modifiedCellCount() == 1);
    }

    REQUIRE(utils::ErrorReporter::CountFor(utils::ErrorCategory::InvalidDecision) >= 1);
    utils::ErrorReporter::Reset();
}

TEST_CASE("CleaningEngine - Bulk delete is complete", "[cleaning]")
{
    CharacterClassifier classifier;
    CellScanner scanner(classifier);
    auto wb = makeWorkbook();
    auto findings = scanner.scan(wb, std::nullopt).findings;

    CleaningEngine engine(wb, classifier, std::nullopt);
    BulkDecisionSource source(CleaningDecision::Delete(Scope::ThisCellThisCharacter));
    const auto result = engine.run(findings, source);

    REQUIRE(result.status == EngineStatus::Completed);
    REQUIRE(result.log.size() == 4);
    REQUIRE(result.decisions_applied == 4);
    REQUIRE(scanner.scan(wb, std::nullopt).findings.empty());
}

TEST_CASE("CleaningTypes - Decision validation", "[cleaning]")
{
    std::string error;
    REQUIRE(validateDecision(CleaningDecision::Delete(Scope::AllCellsThisCharacter), error));
    REQUIRE(validateDecision(CleaningDecision::Replace(Scope::ThisCellThisCharacter, ""), error));
    REQUIRE(validateDecision(CleaningDecision::SkipAllRemaining(), error));

    CleaningDecision d = CleaningDecision::Delete(Scope::ThisCellThisCharacter);
    d.replacement_text = "x";
    REQUIRE_FALSE(validateDecision(d, error));

    d = CleaningDecision::Delete(Scope::ThisCellThisCharacter);
    d.scope = static_cast<Scope>(42);
    REQUIRE_FALSE(validateDecision(d, error));
    REQUIRE(error == "unknown scope");

    d = CleaningDecision::Skip();
    d.operation = static_cast<Operation>(42);
    REQUIRE_FALSE(validateDecision(d, error));

    Scope scope;
    Operation op;
    REQUIRE(parseScope("char", scope));
    REQUIRE(scope == Scope::AllCellsThisCharacter);
    REQUIRE_FALSE(parseScope("row", scope));
    REQUIRE(parseOperation("replace", op));
    REQUIRE(op == Operation::Replace);
    REQUIRE_FALSE(parseOperation("erase", op));
}
