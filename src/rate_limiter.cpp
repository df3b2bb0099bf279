#include "rate_limiter.hpp"

#include <iostream>

namespace bili_trends {

RateLimiter::RateLimiter(Clock& clock, std::chrono::milliseconds minInterval, bool verbose)
    : mClock(clock)
    , mMinInterval(minInterval.count() > 0 ? minInterval : std::chrono::milliseconds(0))
    , mVerbose(verbose) {}

void RateLimiter::acquire() {
    auto now = mClock.now();

    if (mNextAllowed && now < *mNextAllowed) {
        // Round up so a sub-millisecond remainder still waits.
        auto wait = std::chrono::ceil<std::chrono::milliseconds>(*mNextAllowed - now);

        if (mVerbose) {
            std::cerr << "[RateLimiter] Waiting " << wait.count() << " ms\n";
        }

        mClock.sleepFor(wait);
        mTotalWait += wait;
        now = mClock.now();
    }

    mNextAllowed = now + mMinInterval;
    ++mAcquisitions;
}

} // namespace bili_trends
