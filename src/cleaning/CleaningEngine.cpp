#include "CleaningEngine.hpp"

#include "../processing/TextUtils.hpp"
#include "../scanning/CellScanner.hpp"
#include "../utils/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>

#include <plog/Log.h>

using utils::ErrorCategory;
using utils::ErrorReporter;

namespace cleaning
{

CleaningEngine::CleaningEngine(workbook::Workbook& workbook, const charclass::CharacterClassifier& classifier,
                               std::optional<charclass::TargetSet> targets)
    : workbook_(workbook)
    , classifier_(classifier)
    , targets_(std::move(targets))
{
}

CleaningResult CleaningEngine::run(const std::vector<scanning::Finding>& findings, IDecisionSource& source)
{
    CleaningResult result;
    state_ = EngineState::Iterating;

    std::size_t index = 0;
    for (; index < findings.size() && state_ == EngineState::Iterating; ++index)
    {
        const auto& queued = findings[index];
        if (isResolved(queued))
        {
            ++result.findings_resolved;
            continue;
        }

        auto current = refresh(queued);
        if (!current)
        {
            PLOG_DEBUG << "Finding " << queued.sheet_name << "!" << queued.cellReference() << " "
                       << queued.hexValue() << " already resolved by an earlier edit";
            ++result.findings_resolved;
            continue;
        }

        while (true)
        {
            auto decision = source.getDecision(*current);
            if (!decision)
            {
                PLOG_INFO << "Decision input ended; remaining findings left untouched";
                state_ = EngineState::SkipAllRemaining;
                result.status = EngineStatus::Cancelled;
                ++result.findings_unprocessed;
                break;
            }

            std::string error;
            if (!validateDecision(*decision, error))
            {
                ErrorReporter::ReportWarning(ErrorCategory::InvalidDecision,
                                             "Rejected decision for " + current->sheet_name + "!" +
                                                 current->cellReference(),
                                             error);
                source.onRejected(*decision, error);
                if (source.canRetry())
                    continue;

                ErrorReporter::ReportError(ErrorCategory::InvalidDecision, "Cleaning aborted", error);
                result.status = EngineStatus::InvalidDecision;
                result.error = error;
                state_ = EngineState::Done;
                result.findings_unprocessed += findings.size() - index;
                result.final_state = state_;
                return result;
            }

            std::vector<CleaningLogEntry> entries;
            switch (decision->operation)
            {
            case Operation::Skip:
                ++result.findings_skipped;
                break;
            case Operation::SkipAllRemaining:
                state_ = EngineState::SkipAllRemaining;
                result.status = EngineStatus::SkippedRemaining;
                ++result.findings_unprocessed;
                break;
            case Operation::Delete:
            case Operation::Replace:
                switch (decision->scope)
                {
                case Scope::ThisCellThisCharacter:
                    entries = applyToCell(*current, *decision);
                    break;
                case Scope::AllCellsThisCharacter:
                    entries = applyToCharacter(current->character, *decision);
                    break;
                case Scope::AllCellsAllProblematic:
                    entries = applyToAllProblematic(*decision);
                    break;
                }
                ++result.decisions_applied;
                break;
            }

            source.onApplied(*decision, entries);
            result.log.insert(result.log.end(), entries.begin(), entries.end());
            break;
        }
    }

    if (index < findings.size())
        result.findings_unprocessed += findings.size() - index;

    state_ = EngineState::Done;
    result.final_state = state_;

    PLOG_INFO << "Cleaning " << toString(result.status) << ": " << result.log.size() << " change(s), "
              << result.findings_skipped << " skipped, " << result.findings_resolved << " already resolved, "
              << result.findings_unprocessed << " unprocessed";
    return result;
}

bool CleaningEngine::isResolved(const scanning::Finding& finding) const
{
    if (all_resolved_)
        return true;
    if (resolved_characters_.count(finding.character))
        return true;
    return resolved_cells_.count({ finding.sheet_name, finding.row, finding.col, finding.character }) > 0;
}

std::optional<scanning::Finding> CleaningEngine::refresh(const scanning::Finding& finding) const
{
    const auto* sheet = workbook_.findSheet(finding.sheet_name);
    if (!sheet)
        return std::nullopt;

    const auto* cell = sheet->find(finding.address());
    if (!cell || cell->kind != workbook::CellKind::Text)
        return std::nullopt;

    if (cell->text == finding.cell_value)
        return finding;

    auto positions = scanning::CellScanner::positionsOf(cell->text, finding.character);
    if (positions.empty())
        return std::nullopt;

    scanning::Finding refreshed = finding;
    refreshed.cell_value = cell->text;
    refreshed.positions = std::move(positions);
    PLOG_DEBUG << "Refreshed stale finding " << finding.sheet_name << "!" << finding.cellReference() << " "
               << finding.hexValue();
    return refreshed;
}

std::vector<CleaningLogEntry> CleaningEngine::applyToCell(const scanning::Finding& finding,
                                                          const CleaningDecision& decision)
{
    std::vector<CleaningLogEntry> log;
    resolved_cells_.insert({ finding.sheet_name, finding.row, finding.col, finding.character });

    auto* sheet = workbook_.findSheet(finding.sheet_name);
    if (!sheet)
        return log;

    const auto* cell = sheet->find(finding.address());
    if (!cell || cell->kind != workbook::CellKind::Text)
        return log;

    // Copy: rewriteCell replaces the cell the reference points at
    const std::string value = cell->text;
    const char32_t target = finding.character;
    rewriteCell(*sheet, finding.address(), value, [target](char32_t cp) { return cp == target; }, decision, log);
    return log;
}

std::vector<CleaningLogEntry> CleaningEngine::applyToCharacter(char32_t character, const CleaningDecision& decision)
{
    resolved_characters_.insert(character);
    return applyEverywhere([character](char32_t cp) { return cp == character; }, decision);
}

std::vector<CleaningLogEntry> CleaningEngine::applyToAllProblematic(const CleaningDecision& decision)
{
    all_resolved_ = true;
    return applyEverywhere([this](char32_t cp) { return classifier_.isProblematic(cp, targets_); }, decision);
}

std::vector<CleaningLogEntry> CleaningEngine::applyEverywhere(const Matcher& matches,
                                                              const CleaningDecision& decision)
{
    std::vector<CleaningLogEntry> log;
    for (auto& sheet : workbook_.sheets())
    {
        if (!sheet.isReadable())
            continue;

        // Collect first: rewriting mutates the cell map being walked
        std::vector<std::pair<workbook::CellAddress, std::string>> targets;
        for (const auto& [address, cell] : sheet.cells())
        {
            if (cell.kind == workbook::CellKind::Text)
                targets.emplace_back(address, cell.text);
        }

        for (const auto& [address, value] : targets)
            rewriteCell(sheet, address, value, matches, decision, log);
    }
    PLOG_INFO << "Workbook-wide " << toString(decision.operation) << " changed " << log.size() << " cell/character pair(s)";
    return log;
}

void CleaningEngine::rewriteCell(workbook::Sheet& sheet, const workbook::CellAddress& address,
                                 const std::string& value, const Matcher& matches,
                                 const CleaningDecision& decision, std::vector<CleaningLogEntry>& log)
{
    std::u32string text;
    std::size_t bad_offset = 0;
    if (!processing::tryUtf8ToUtf32(value, text, &bad_offset))
    {
        PLOG_DEBUG << "Not cleaning " << sheet.name() << "!" << workbook::toA1(address)
                   << ": invalid UTF-8 at byte " << bad_offset;
        return;
    }

    const std::u32string replacement =
        decision.operation == Operation::Replace && decision.replacement_text
            ? processing::utf8ToUtf32(*decision.replacement_text)
            : std::u32string();

    std::u32string cleaned;
    cleaned.reserve(text.size());
    std::vector<char32_t> changed; // distinct, first-occurrence order
    for (char32_t cp : text)
    {
        if (!matches(cp))
        {
            cleaned.push_back(cp);
            continue;
        }
        if (std::find(changed.begin(), changed.end(), cp) == changed.end())
            changed.push_back(cp);
        cleaned += replacement;
    }

    if (changed.empty())
        return;

    const std::string result = processing::utf32ToUtf8(cleaned);
    if (!sheet.setText(address, result))
        return;

    if (utils::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(utils::Diagnostics::kLogInstance)
            << sheet.name() << "!" << workbook::toA1(address) << " '" << utils::Diagnostics::Preview(value)
            << "' -> '" << utils::Diagnostics::Preview(result) << "'";
    }

    const std::string timestamp = ErrorReporter::GetTimestamp();
    for (char32_t cp : changed)
    {
        CleaningLogEntry entry;
        entry.timestamp = timestamp;
        entry.sheet = sheet.name();
        entry.row = address.row;
        entry.col = address.col;
        entry.character = cp;
        entry.operation = decision.operation;
        entry.replacement_text = decision.operation == Operation::Replace ? decision.replacement_text : std::nullopt;
        entry.original_value = value;
        entry.resulting_value = result;
        log.push_back(std::move(entry));
    }
}

} // namespace cleaning
