#pragma once

#include <atomic>
#include <chrono>

namespace bili_trends {

/// Time source used by everything that waits.  Tests substitute a clock
/// whose sleeps only advance a counter.
class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

/// std::chrono::steady_clock + std::this_thread::sleep_for.
class SteadyClock : public Clock {
public:
    time_point now() const override;
    void sleepFor(std::chrono::milliseconds duration) override;
};

/// Cooperative cancellation flag, checked between pages and between units.
class CancellationToken {
public:
    void requestCancel() { mCancelled.store(true); }
    bool isCancelled() const { return mCancelled.load(); }

private:
    std::atomic<bool> mCancelled{false};
};

} // namespace bili_trends
