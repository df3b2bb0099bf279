#include "orchestrator.hpp"
#include "merger.hpp"
#include "query_planner.hpp"
#include "rate_limiter.hpp"
#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

namespace bili_trends {

CollectionOrchestrator::CollectionOrchestrator(ApiClient& client, Clock& clock, const AppConfig& cfg)
    : mClient(client)
    , mClock(clock)
    , mCfg(cfg) {}

CollectionResult CollectionOrchestrator::run(const CancellationToken& cancel) {
    const auto& c = mCfg.collection;
    const bool verbose = mCfg.verbose;

    CollectionResult out;

    const auto units = planUnits(c.keywords, c.dateRange, c.maxResultsPerKeyword,
                                 c.pageSize, c.maxPagesPerQuery);
    out.plannedUnits = static_cast<int>(units.size());

    std::cerr << "[Orchestrator] " << units.size() << " unit(s) planned for "
              << c.keywords.size() << " keyword(s)\n";

    RateLimiter limiter(mClock, std::chrono::milliseconds(c.requestIntervalMs), verbose);
    PaginationCollector collector(mClient, limiter, mClock, mCfg.retry,
                                  c.maxPagesPerQuery, c.assumeReverseChronological, verbose);
    Deduplicator dedup;

    for (std::size_t i = 0; i < units.size(); ++i) {
        if (cancel.isCancelled()) {
            std::cerr << "[Orchestrator] Cancelled; " << (units.size() - i)
                      << " unit(s) not started\n";
            out.cancelled = true;
            break;
        }

        auto result = collector.collect(units[i], cancel);
        out.rawRecords += static_cast<int64_t>(result.records.size());
        dedup.addAll(result.records);

        std::cerr << "[Orchestrator] Unit " << (i + 1) << "/" << units.size()
                  << " '" << units[i].keyword << "': " << toString(result.status)
                  << ", " << result.records.size() << " record(s), "
                  << dedup.size() << " unique so far\n";

        if (result.status == UnitStatus::Cancelled) out.cancelled = true;
        out.unitResults.push_back(std::move(result));
    }

    out.stats = collector.getStats();
    out.droppedWithoutIdentity = dedup.droppedWithoutIdentity();
    out.merged = dedup.release();

    if (verbose) {
        std::cerr << "[Orchestrator] Requests " << out.stats.totalRequests
                  << ", retries " << out.stats.totalRetries
                  << ", rate-limit wait " << limiter.totalWait().count() << " ms"
                  << ", out-of-window " << out.stats.outOfWindow
                  << ", without identity " << out.droppedWithoutIdentity << "\n";
    }
    return out;
}

RunSummary summarize(const CollectionResult& result, const AppConfig& cfg) {
    RunSummary s;
    s.rawRecords     = result.rawRecords;
    s.totalRecords   = static_cast<int64_t>(result.merged.size());
    s.totalUnits     = result.plannedUnits;
    s.requestedRange = cfg.collection.dateRange;
    s.totalRequests  = result.stats.totalRequests;
    s.totalRetries   = result.stats.totalRetries;
    s.cancelled      = result.cancelled;

    for (const auto& u : result.unitResults) {
        switch (u.status) {
            case UnitStatus::Completed: break;
            case UnitStatus::Partial:   ++s.partialUnits;   break;
            case UnitStatus::Cancelled: ++s.cancelledUnits; break;
            case UnitStatus::Failed:
                ++s.failedUnits;
                if (std::find(s.failedKeywords.begin(), s.failedKeywords.end(),
                              u.unit.keyword) == s.failedKeywords.end()) {
                    s.failedKeywords.push_back(u.unit.keyword);
                }
                break;
        }
    }
    // Units never started because of cancellation.
    s.cancelledUnits += result.plannedUnits - static_cast<int>(result.unitResults.size());
    return s;
}

} // namespace bili_trends
