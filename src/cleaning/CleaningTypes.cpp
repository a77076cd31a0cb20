#include "CleaningTypes.hpp"

namespace cleaning
{

CleaningDecision CleaningDecision::Delete(Scope scope)
{
    return { scope, Operation::Delete, std::nullopt };
}

CleaningDecision CleaningDecision::Replace(Scope scope, std::string text)
{
    return { scope, Operation::Replace, std::move(text) };
}

CleaningDecision CleaningDecision::Skip()
{
    return { Scope::ThisCellThisCharacter, Operation::Skip, std::nullopt };
}

CleaningDecision CleaningDecision::SkipAllRemaining()
{
    return { Scope::ThisCellThisCharacter, Operation::SkipAllRemaining, std::nullopt };
}

bool validateDecision(const CleaningDecision& decision, std::string& outError)
{
    switch (decision.scope)
    {
    case Scope::ThisCellThisCharacter:
    case Scope::AllCellsThisCharacter:
    case Scope::AllCellsAllProblematic:
        break;
    default:
        outError = "unknown scope";
        return false;
    }

    switch (decision.operation)
    {
    case Operation::Replace:
        if (!decision.replacement_text)
        {
            outError = "replace requires replacement text";
            return false;
        }
        return true;
    case Operation::Delete:
    case Operation::Skip:
    case Operation::SkipAllRemaining:
        if (decision.replacement_text)
        {
            outError = "replacement text is only valid with replace";
            return false;
        }
        return true;
    default:
        outError = "unknown operation";
        return false;
    }
}

std::string toString(Scope scope)
{
    switch (scope)
    {
    case Scope::ThisCellThisCharacter:
        return "this cell, this character";
    case Scope::AllCellsThisCharacter:
        return "all cells, this character";
    case Scope::AllCellsAllProblematic:
        return "all cells, all problematic characters";
    default:
        return "unknown";
    }
}

std::string toString(Operation operation)
{
    switch (operation)
    {
    case Operation::Delete:
        return "delete";
    case Operation::Replace:
        return "replace";
    case Operation::Skip:
        return "skip";
    case Operation::SkipAllRemaining:
        return "skip-all-remaining";
    default:
        return "unknown";
    }
}

std::string toString(EngineStatus status)
{
    switch (status)
    {
    case EngineStatus::Completed:
        return "completed";
    case EngineStatus::SkippedRemaining:
        return "remaining findings skipped";
    case EngineStatus::Cancelled:
        return "cancelled";
    case EngineStatus::InvalidDecision:
        return "aborted: invalid decision";
    default:
        return "unknown";
    }
}

bool parseScope(const std::string& text, Scope& out)
{
    if (text == "cell")
        out = Scope::ThisCellThisCharacter;
    else if (text == "char")
        out = Scope::AllCellsThisCharacter;
    else if (text == "all")
        out = Scope::AllCellsAllProblematic;
    else
        return false;
    return true;
}

bool parseOperation(const std::string& text, Operation& out)
{
    if (text == "delete")
        out = Operation::Delete;
    else if (text == "replace")
        out = Operation::Replace;
    else if (text == "skip")
        out = Operation::Skip;
    else if (text == "skip-all")
        out = Operation::SkipAllRemaining;
    else
        return false;
    return true;
}

} // namespace cleaning
