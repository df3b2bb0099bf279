#pragma once

#include "api_client.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "models.hpp"
#include "rate_limiter.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace bili_trends {

enum class UnitStatus {
    Completed,   // exhausted, capped or left the window
    Partial,     // retries exhausted; records so far are kept
    Failed,      // auth / fatal error
    Cancelled,   // cancellation requested mid-unit
};

const char* toString(UnitStatus status);

struct UnitResult {
    CollectionUnit         unit;
    std::vector<RawRecord> records;
    UnitStatus             status = UnitStatus::Completed;
    std::string            error;
    int                    pagesFetched = 0;
    int                    retries      = 0;
};

/// Orchestrates cursor-based pagination, retry logic, and rate limiting for
/// one CollectionUnit at a time.
class PaginationCollector {
public:
    struct Stats {
        int                       totalFetched  = 0;
        int                       totalRequests = 0;
        int                       totalRetries  = 0;
        int                       outOfWindow   = 0;
        std::chrono::milliseconds totalBackoff{0};
    };

    PaginationCollector(ApiClient& client,
                        RateLimiter& limiter,
                        Clock& clock,
                        const RetryConfig& retry,
                        int maxPagesPerQuery,
                        bool assumeReverseChronological,
                        bool verbose = false);

    /// Drive @p unit until exhaustion, its cap, an error, or cancellation.
    /// Never throws for API failures; they are reported in the result.
    UnitResult collect(const CollectionUnit& unit, const CancellationToken& cancel);

    Stats getStats() const { return mStats; }

    /// Ceiling for a single backoff sleep.
    static constexpr std::chrono::milliseconds kMaxBackoff{24 * 3600 * 1000};

private:
    /// Outcome of fetching one page with retries.
    struct PageAttempt {
        bool        ok = false;
        UnitStatus  failure = UnitStatus::Failed;
        std::string error;
        PageResult  page;
    };

    ApiClient&   mClient;
    RateLimiter& mLimiter;
    Clock&       mClock;
    RetryConfig  mRetry;
    int          mMaxPages;
    bool         mStopOnOlder;
    bool         mVerbose;
    Stats        mStats{};
    int64_t      mSequence = 0;

    /// Fetch one page, retrying transient / rate-limited failures with
    /// exponential backoff.  At most mRetry.maxAttempts attempts.
    PageAttempt fetchWithRetry(const CollectionUnit& unit,
                               const std::string& cursor,
                               const CancellationToken& cancel,
                               UnitResult& result);

    /// Saturates at kMaxBackoff.
    std::chrono::milliseconds backoffFor(int attempt, bool rateLimited) const;
};

} // namespace bili_trends
