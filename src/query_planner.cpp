#include "query_planner.hpp"
#include "util.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace bili_trends {

std::vector<CollectionUnit> planUnits(const std::vector<std::string>& keywords,
                                      const TimeWindow& range,
                                      int maxResultsPerKeyword,
                                      int pageSize,
                                      int maxPagesPerQuery)
{
    if (!range.valid()) {
        throw std::invalid_argument("Date range start is after its end");
    }

    const int64_t cap       = std::max(0, maxResultsPerKeyword);
    const int64_t reachable = int64_t{std::max(0, pageSize)} * std::max(0, maxPagesPerQuery);

    int64_t windows = 1;
    if (cap > 0 && reachable > 0 && cap > reachable) {
        windows = (cap + reachable - 1) / reachable;
    }
    // Never more windows than seconds in the range.
    const int64_t span = range.end - range.start + 1;
    windows = std::min(windows, span);

    std::vector<CollectionUnit> units;
    std::unordered_set<std::string> seen;

    for (const auto& raw : keywords) {
        auto keyword = trim(raw);
        if (keyword.empty() || !seen.insert(keyword).second) continue;

        const int64_t baseLen = span / windows;
        const int64_t extra   = span % windows;
        int64_t start = range.start;

        for (int64_t i = 0; i < windows; ++i) {
            // Earlier windows absorb the remainder of both length and cap.
            const int64_t len = baseLen + (i < extra ? 1 : 0);

            CollectionUnit unit;
            unit.keyword      = keyword;
            unit.window.start = start;
            unit.window.end   = start + len - 1;
            if (cap > 0) {
                unit.resultCap = static_cast<int>(cap / windows + (i < cap % windows ? 1 : 0));
            }
            units.push_back(std::move(unit));

            start += len;
        }
    }

    return units;
}

} // namespace bili_trends
