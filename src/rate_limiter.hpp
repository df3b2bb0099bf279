#pragma once

#include "clock.hpp"

#include <chrono>
#include <optional>

namespace bili_trends {

/// Enforces a minimum interval between outbound requests.
/// State is the next time a request may be issued; acquire() waits for it
/// on the injected clock and then pushes it forward by one interval.
class RateLimiter {
public:
    RateLimiter(Clock& clock, std::chrono::milliseconds minInterval, bool verbose = false);

    /// Block until the next request is permitted.  Never fails; the first
    /// call returns immediately.
    void acquire();

    // ---- accessors for summary report ----
    std::chrono::milliseconds minInterval()     const { return mMinInterval; }
    std::chrono::milliseconds totalWait()       const { return mTotalWait; }
    int                       totalAcquisitions() const { return mAcquisitions; }

private:
    Clock&                    mClock;
    std::chrono::milliseconds mMinInterval;
    bool                      mVerbose;

    std::optional<Clock::time_point> mNextAllowed;

    std::chrono::milliseconds mTotalWait{0};
    int                       mAcquisitions = 0;
};

} // namespace bili_trends
