#include "BulkDecisionSource.hpp"

#include <plog/Log.h>

namespace cleaning
{

BulkDecisionSource::BulkDecisionSource(CleaningDecision decision)
    : decision_(std::move(decision))
{
}

std::optional<CleaningDecision> BulkDecisionSource::getDecision(const scanning::Finding& finding)
{
    PLOG_DEBUG << "Bulk " << toString(decision_.operation) << " (" << toString(decision_.scope) << ") for "
               << finding.sheet_name << "!" << finding.cellReference();
    return decision_;
}

void BulkDecisionSource::onRejected(const CleaningDecision& decision, const std::string& reason)
{
    PLOG_WARNING << "Bulk decision " << toString(decision.operation) << " rejected: " << reason;
}

} // namespace cleaning
