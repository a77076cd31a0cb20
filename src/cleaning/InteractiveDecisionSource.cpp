#include "InteractiveDecisionSource.hpp"

#include <istream>
#include <ostream>

#include <plog/Log.h>

namespace cleaning
{

namespace
{

std::string trim(const std::string& s)
{
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

InteractiveDecisionSource::InteractiveDecisionSource(std::istream& in, std::ostream& out,
                                                     const report::ReportBuilder& renderer)
    : in_(in)
    , out_(out)
    , renderer_(renderer)
{
}

std::optional<CleaningDecision> InteractiveDecisionSource::getDecision(const scanning::Finding& finding)
{
    out_ << "\nCleaning cell " << finding.sheet_name << "!" << finding.cellReference() << "\n";
    out_ << renderer_.renderFinding(finding);
    printMenu();

    while (true)
    {
        std::string line;
        if (!readLine("Choose an option (1-8): ", line))
            return std::nullopt;

        line = trim(line);
        int choice = 0;
        if (line.size() == 1 && line[0] >= '1' && line[0] <= '8')
            choice = line[0] - '0';

        if (choice == 0)
        {
            out_ << "Invalid choice. Please enter a number from 1 to 8.\n";
            continue;
        }

        std::optional<std::string> replacement;
        if (choiceNeedsReplacement(choice))
        {
            std::string text;
            // Taken verbatim: an empty line means replace with nothing
            if (!readLine("Enter replacement text: ", text))
                return std::nullopt;
            if (!text.empty() && text.back() == '\r')
                text.pop_back();
            replacement = std::move(text);
        }

        PLOG_DEBUG << "Menu choice " << choice << " for " << finding.sheet_name << "!" << finding.cellReference();
        return decisionForChoice(choice, replacement);
    }
}

void InteractiveDecisionSource::onRejected(const CleaningDecision&, const std::string& reason)
{
    out_ << "That choice cannot be applied: " << reason << "\n";
}

void InteractiveDecisionSource::onApplied(const CleaningDecision& decision,
                                          const std::vector<CleaningLogEntry>& entries)
{
    switch (decision.operation)
    {
    case Operation::Skip:
        out_ << "Skipped.\n";
        return;
    case Operation::SkipAllRemaining:
        out_ << "Skipping all remaining cells.\n";
        return;
    default:
        break;
    }

    if (entries.empty())
    {
        out_ << "No changes were made.\n";
        return;
    }

    if (decision.scope == Scope::ThisCellThisCharacter)
    {
        out_ << "Updated cell value: " << report::ReportBuilder::displayText(entries.back().resulting_value) << "\n";
        return;
    }

    out_ << "Applied " << toString(decision.operation) << " to " << entries.size()
         << " cell/character pair(s) across the workbook.\n";
}

std::optional<CleaningDecision> InteractiveDecisionSource::decisionForChoice(
    int choice, const std::optional<std::string>& replacement)
{
    CleaningDecision decision;
    switch (choice)
    {
    case 1:
        return CleaningDecision::Delete(Scope::ThisCellThisCharacter);
    case 2:
        decision = { Scope::ThisCellThisCharacter, Operation::Replace, replacement };
        return decision;
    case 3:
        return CleaningDecision::Skip();
    case 4:
        return CleaningDecision::SkipAllRemaining();
    case 5:
        return CleaningDecision::Delete(Scope::AllCellsThisCharacter);
    case 6:
        decision = { Scope::AllCellsThisCharacter, Operation::Replace, replacement };
        return decision;
    case 7:
        return CleaningDecision::Delete(Scope::AllCellsAllProblematic);
    case 8:
        decision = { Scope::AllCellsAllProblematic, Operation::Replace, replacement };
        return decision;
    default:
        return std::nullopt;
    }
}

bool InteractiveDecisionSource::readLine(const char* prompt, std::string& line)
{
    out_ << prompt << std::flush;
    if (!std::getline(in_, line))
    {
        out_ << "\n";
        return false;
    }
    return true;
}

void InteractiveDecisionSource::printMenu()
{
    out_ << "\nOptions:\n"
         << "1. Delete the character\n"
         << "2. Replace with custom text\n"
         << "3. Skip this cell\n"
         << "4. Skip all remaining cells\n"
         << "5. Delete ALL instances of this character in ALL cells\n"
         << "6. Replace ALL instances of this character in ALL cells\n"
         << "7. Delete ALL problematic characters (all types) in ALL cells\n"
         << "8. Replace ALL problematic characters (all types) in ALL cells\n";
}

} // namespace cleaning
