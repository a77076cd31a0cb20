#pragma once

#include "CleaningTypes.hpp"
#include "IDecisionSource.hpp"
#include "../charclass/CharacterClassifier.hpp"
#include "../scanning/Finding.hpp"
#include "../workbook/Workbook.hpp"

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace cleaning
{

/**
 * @brief Applies cleaning decisions to a live workbook
 *
 * Findings are consumed in scan order. Each one is checked against what
 * has already been cleaned and against the current cell value before the
 * decision source is asked, so an earlier edit never leaves a stale
 * Finding in front of the user.
 *
 * The workbook is borrowed for the lifetime of the engine.
 */
class CleaningEngine
{
public:
    CleaningEngine(workbook::Workbook& workbook, const charclass::CharacterClassifier& classifier,
                   std::optional<charclass::TargetSet> targets);

    CleaningResult run(const std::vector<scanning::Finding>& findings, IDecisionSource& source);

    EngineState state() const { return state_; }

    /// Current view of a queued Finding: std::nullopt if its cell no longer
    /// contains the character, otherwise a copy with live value and positions.
    std::optional<scanning::Finding> refresh(const scanning::Finding& finding) const;

    // The three scopes. Each returns the log entries it produced.
    std::vector<CleaningLogEntry> applyToCell(const scanning::Finding& finding, const CleaningDecision& decision);
    std::vector<CleaningLogEntry> applyToCharacter(char32_t character, const CleaningDecision& decision);
    std::vector<CleaningLogEntry> applyToAllProblematic(const CleaningDecision& decision);

private:
    using CellKey = std::tuple<std::string, int, int, char32_t>;
    using Matcher = std::function<bool(char32_t)>;

    bool isResolved(const scanning::Finding& finding) const;

    // Rewrites one text cell, replacing every matched codepoint in a single
    // pass. Appends one entry per distinct matched character.
    void rewriteCell(workbook::Sheet& sheet, const workbook::CellAddress& address, const std::string& value,
                     const Matcher& matches, const CleaningDecision& decision,
                     std::vector<CleaningLogEntry>& log);

    std::vector<CleaningLogEntry> applyEverywhere(const Matcher& matches, const CleaningDecision& decision);

    workbook::Workbook& workbook_;
    const charclass::CharacterClassifier& classifier_;
    std::optional<charclass::TargetSet> targets_;

    EngineState state_ = EngineState::Iterating;
    std::set<CellKey> resolved_cells_;
    std::set<char32_t> resolved_characters_;
    bool all_resolved_ = false;
};

} // namespace cleaning
