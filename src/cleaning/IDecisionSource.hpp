#pragma once

#include "CleaningTypes.hpp"
#include "../scanning/Finding.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cleaning
{

/// Supplies a CleaningDecision for each Finding the engine presents.
/// getDecision is the engine's only suspension point.
class IDecisionSource
{
public:
    virtual ~IDecisionSource() = default;

    // std::nullopt means the source has no more input (treated as cancel)
    [[nodiscard]] virtual std::optional<CleaningDecision> getDecision(const scanning::Finding& finding) = 0;

    // Whether the engine may ask again after rejecting a decision
    [[nodiscard]] virtual bool canRetry() const = 0;

    virtual void onRejected(const CleaningDecision& decision, const std::string& reason) = 0;

    virtual void onApplied(const CleaningDecision&, const std::vector<CleaningLogEntry>&) {}
};

} // namespace cleaning
