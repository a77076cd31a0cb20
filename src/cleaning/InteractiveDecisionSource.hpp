#pragma once

#include "IDecisionSource.hpp"
#include "../report/ReportBuilder.hpp"

#include <iosfwd>
#include <optional>
#include <string>

namespace cleaning
{

/// Console prompt with the eight-option menu. Rejected decisions are
/// prompted again; end of input cancels.
class InteractiveDecisionSource : public IDecisionSource
{
public:
    InteractiveDecisionSource(std::istream& in, std::ostream& out, const report::ReportBuilder& renderer);

    std::optional<CleaningDecision> getDecision(const scanning::Finding& finding) override;
    bool canRetry() const override { return true; }
    void onRejected(const CleaningDecision& decision, const std::string& reason) override;
    void onApplied(const CleaningDecision& decision, const std::vector<CleaningLogEntry>& entries) override;

    /// Menu option (1-8) to decision. Replacing options take the text as given.
    static std::optional<CleaningDecision> decisionForChoice(int choice,
                                                             const std::optional<std::string>& replacement);

    static bool choiceNeedsReplacement(int choice) { return choice == 2 || choice == 6 || choice == 8; }

private:
    bool readLine(const char* prompt, std::string& line);
    void printMenu();

    std::istream& in_;
    std::ostream& out_;
    const report::ReportBuilder& renderer_;
};

} // namespace cleaning
