#pragma once

#include "../workbook/CellReference.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cleaning
{

enum class Scope
{
    ThisCellThisCharacter,
    AllCellsThisCharacter,
    AllCellsAllProblematic
};

enum class Operation
{
    Delete,
    Replace,
    Skip,
    SkipAllRemaining
};

struct CleaningDecision
{
    Scope scope = Scope::ThisCellThisCharacter;
    Operation operation = Operation::Skip;
    std::optional<std::string> replacement_text; // present iff operation == Replace

    static CleaningDecision Delete(Scope scope);
    static CleaningDecision Replace(Scope scope, std::string text);
    static CleaningDecision Skip();
    static CleaningDecision SkipAllRemaining();
};

// Rejects Replace without text, text on anything but Replace, and
// out-of-range enum values.
bool validateDecision(const CleaningDecision& decision, std::string& outError);

std::string toString(Scope scope);
std::string toString(Operation operation);

// CLI spellings: "cell" | "char" | "all"; "delete" | "replace" | "skip" | "skip-all"
bool parseScope(const std::string& text, Scope& out);
bool parseOperation(const std::string& text, Operation& out);

/// Append-only audit record, one per (cell, character) actually changed
struct CleaningLogEntry
{
    std::string timestamp;
    std::string sheet;
    int row = 0;
    int col = 0;
    char32_t character = 0;
    Operation operation = Operation::Delete;
    std::optional<std::string> replacement_text;
    std::string original_value;
    std::string resulting_value;

    std::string cellReference() const { return workbook::toA1({ row, col }); }
};

enum class EngineState
{
    Iterating,
    SkipAllRemaining,
    Done
};

enum class EngineStatus
{
    Completed,         // queue exhausted
    SkippedRemaining,  // user chose skip-all-remaining
    Cancelled,         // decision source ran out of input
    InvalidDecision    // non-retryable source produced a rejected decision
};

std::string toString(EngineStatus status);

struct CleaningResult
{
    std::vector<CleaningLogEntry> log;
    EngineState final_state = EngineState::Done;
    EngineStatus status = EngineStatus::Completed;
    std::string error;

    std::size_t decisions_applied = 0;  // delete/replace decisions that changed something
    std::size_t findings_skipped = 0;   // explicit skip
    std::size_t findings_resolved = 0;  // already handled by an earlier edit
    std::size_t findings_unprocessed = 0;
};

} // namespace cleaning
