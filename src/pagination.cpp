#include "pagination.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

namespace bili_trends {

const char* toString(UnitStatus status) {
    switch (status) {
        case UnitStatus::Completed: return "completed";
        case UnitStatus::Partial:   return "partial";
        case UnitStatus::Failed:    return "failed";
        case UnitStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

PaginationCollector::PaginationCollector(ApiClient& client,
                                         RateLimiter& limiter,
                                         Clock& clock,
                                         const RetryConfig& retry,
                                         int maxPagesPerQuery,
                                         bool assumeReverseChronological,
                                         bool verbose)
    : mClient(client)
    , mLimiter(limiter)
    , mClock(clock)
    , mRetry(retry)
    , mMaxPages(maxPagesPerQuery)
    , mStopOnOlder(assumeReverseChronological)
    , mVerbose(verbose)
{
    mRetry.maxAttempts = std::max(1, mRetry.maxAttempts);
}

// ---------------------------------------------------------------------------
// Public: one unit
// ---------------------------------------------------------------------------

UnitResult PaginationCollector::collect(const CollectionUnit& unit,
                                        const CancellationToken& cancel)
{
    UnitResult result;
    result.unit = unit;

    const std::size_t cap = unit.resultCap > 0
        ? static_cast<std::size_t>(unit.resultCap)
        : std::numeric_limits<std::size_t>::max();

    if (mVerbose) {
        std::cerr << "[Collector] Unit '" << unit.keyword << "' "
                  << formatIsoUtc(unit.window.start) << " .. "
                  << formatIsoUtc(unit.window.end) << ", cap " << unit.resultCap << "\n";
    }

    std::string cursor = kStartCursor;

    while (true) {
        if (cancel.isCancelled()) {
            result.status = UnitStatus::Cancelled;
            break;
        }
        if (result.records.size() >= cap) {
            if (mVerbose) {
                std::cerr << "[Collector] Result cap reached.\n";
            }
            break;
        }
        if (mMaxPages > 0 && result.pagesFetched >= mMaxPages) {
            if (mVerbose) {
                std::cerr << "[Collector] Page limit (" << mMaxPages << ") reached.\n";
            }
            break;
        }

        auto attempt = fetchWithRetry(unit, cursor, cancel, result);
        if (!attempt.ok) {
            result.status = attempt.failure;
            result.error  = attempt.error;
            if (attempt.failure != UnitStatus::Cancelled) {
                std::cerr << "[Collector] Unit '" << unit.keyword << "' "
                          << toString(attempt.failure) << " after "
                          << result.pagesFetched << " page(s): "
                          << attempt.error << "\n";
            }
            break;
        }

        ++result.pagesFetched;
        auto& page = attempt.page;

        if (page.records.empty()) {
            if (mVerbose) {
                std::cerr << "[Collector] Empty page received; stopping.\n";
            }
            break;
        }

        bool reachedOlder = false;
        for (auto& record : page.records) {
            if (record.pubdate && !unit.window.contains(*record.pubdate)) {
                ++mStats.outOfWindow;
                if (*record.pubdate < unit.window.start) reachedOlder = true;
                continue;
            }
            if (result.records.size() >= cap) break;

            record.sourceKeyword = unit.keyword;
            record.fetchSequence = ++mSequence;
            result.records.push_back(std::move(record));
        }

        if (mVerbose) {
            std::cerr << "[Collector] Page " << result.pagesFetched << ": total so far "
                      << result.records.size() << "\n";
        }

        // Relies on pubdate-descending pages; see assumeReverseChronological.
        if (mStopOnOlder && reachedOlder) {
            if (mVerbose) {
                std::cerr << "[Collector] Results left the window; stopping.\n";
            }
            break;
        }

        if (!page.hasMore) {
            if (mVerbose) {
                std::cerr << "[Collector] No more pages.\n";
            }
            break;
        }

        if (page.nextCursor.empty() || page.nextCursor == cursor) {
            std::cerr << "[Collector] Unit '" << unit.keyword
                      << "': more pages announced without a new cursor; stopping.\n";
            break;
        }

        cursor = page.nextCursor;
    }

    mStats.totalFetched += static_cast<int>(result.records.size());
    return result;
}

// ---------------------------------------------------------------------------
// Private: retry wrapper
// ---------------------------------------------------------------------------

PaginationCollector::PageAttempt
PaginationCollector::fetchWithRetry(const CollectionUnit& unit,
                                    const std::string& cursor,
                                    const CancellationToken& cancel,
                                    UnitResult& result)
{
    PageAttempt out;
    std::string lastError;

    for (int attempt = 0; attempt < mRetry.maxAttempts; ++attempt) {
        mLimiter.acquire();
        ++mStats.totalRequests;

        bool rateLimited = false;
        try {
            out.page = mClient.fetchPage(unit.keyword, unit.window, cursor);
            out.ok = true;
            return out;
        } catch (const RateLimitedError& e) {
            rateLimited = true;
            lastError   = e.what();
        } catch (const TransientError& e) {
            lastError = e.what();
        } catch (const AuthError& e) {
            out.failure = UnitStatus::Failed;
            out.error   = std::string("Authentication rejected: ") + e.what();
            return out;
        } catch (const std::exception& e) {
            // FatalError and anything unexpected from the client.
            out.failure = UnitStatus::Failed;
            out.error   = e.what();
            return out;
        }

        if (attempt == mRetry.maxAttempts - 1) break;

        ++result.retries;
        ++mStats.totalRetries;
        const auto backoff = backoffFor(attempt, rateLimited);

        if (mVerbose) {
            std::cerr << "[Retry] " << (rateLimited ? "Rate limited" : "Transient error")
                      << ": " << lastError << " - attempt " << (attempt + 1) << "/"
                      << mRetry.maxAttempts << ", backoff " << backoff.count() << " ms\n";
        }

        if (cancel.isCancelled()) {
            out.failure = UnitStatus::Cancelled;
            out.error   = "Cancelled during backoff";
            return out;
        }

        mClock.sleepFor(backoff);
        mStats.totalBackoff += backoff;
    }

    out.failure = UnitStatus::Partial;
    out.error   = "Max retries exceeded.  Last error: " + lastError;
    return out;
}

std::chrono::milliseconds PaginationCollector::backoffFor(int attempt, bool rateLimited) const
{
    auto delay = computeBackoffMs(attempt, mRetry.baseDelayMs, mRetry.maxDelayMs,
                                  mRetry.jitterMs);
    if (rateLimited) {
        const double scaled = static_cast<double>(delay.count()) * mRetry.rateLimitMultiplier;
        delay = scaled >= static_cast<double>(kMaxBackoff.count())
            ? kMaxBackoff
            : std::chrono::milliseconds(static_cast<int64_t>(scaled));
    }
    return std::min(delay, kMaxBackoff);
}

} // namespace bili_trends
