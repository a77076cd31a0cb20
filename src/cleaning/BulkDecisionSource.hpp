#pragma once

#include "IDecisionSource.hpp"

namespace cleaning
{

/// Answers every Finding with the same decision. Never retried.
class BulkDecisionSource : public IDecisionSource
{
public:
    explicit BulkDecisionSource(CleaningDecision decision);

    std::optional<CleaningDecision> getDecision(const scanning::Finding& finding) override;
    bool canRetry() const override { return false; }
    void onRejected(const CleaningDecision& decision, const std::string& reason) override;

    const CleaningDecision& decision() const { return decision_; }

private:
    CleaningDecision decision_;
};

} // namespace cleaning
