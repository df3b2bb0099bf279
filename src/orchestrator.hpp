#pragma once

#include "api_client.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "models.hpp"
#include "pagination.hpp"

#include <vector>

namespace bili_trends {

struct CollectionResult {
    std::vector<MergedRecord>  merged;
    std::vector<UnitResult>    unitResults;
    PaginationCollector::Stats stats;
    int                        plannedUnits = 0;
    int64_t                    rawRecords   = 0;
    int                        droppedWithoutIdentity = 0;
    bool                       cancelled = false;
};

/// Plans every (keyword, window) unit and drives them one after another
/// through a single collector and rate limiter.
class CollectionOrchestrator {
public:
    CollectionOrchestrator(ApiClient& client, Clock& clock, const AppConfig& cfg);

    /// Never throws for unit failures; they are recorded per unit.
    /// Records from partial, failed and cancelled units are still merged.
    /// @throws std::invalid_argument if the configured date range is inverted.
    CollectionResult run(const CancellationToken& cancel);

private:
    ApiClient& mClient;
    Clock&     mClock;
    AppConfig  mCfg;
};

/// Run-level scalars (unit outcomes, request counts, requested range).
RunSummary summarize(const CollectionResult& result, const AppConfig& cfg);

} // namespace bili_trends
