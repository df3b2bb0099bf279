#pragma once

#include "models.hpp"

#include <string>
#include <vector>

namespace bili_trends {

/// Expand keywords x date range into the ordered units to collect.
///
/// A keyword whose cap exceeds what one query can reach
/// (pageSize * maxPagesPerQuery) gets its range split into
/// ceil(cap / reachable) contiguous sub-windows, ascending, with the cap
/// spread over them.  The split is a volume heuristic: the API may still
/// cap a query below that.  A zero cap or page limit means unlimited and
/// never splits.
///
/// Blank keywords are dropped and duplicates collapse onto the first
/// occurrence.  Throws std::invalid_argument if range.start > range.end.
std::vector<CollectionUnit> planUnits(const std::vector<std::string>& keywords,
                                      const TimeWindow& range,
                                      int maxResultsPerKeyword,
                                      int pageSize,
                                      int maxPagesPerQuery);

} // namespace bili_trends
