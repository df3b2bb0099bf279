#pragma once

#include "config.hpp"
#include "models.hpp"

#include <string>
#include <vector>

namespace bili_trends {

/// A pure reduction of the scored dataset into one table.
/// Implementations may throw; the pipeline isolates the failure.
class Aggregator {
public:
    virtual ~Aggregator() = default;

    virtual std::string    name() const = 0;
    virtual AggregateTable compute(const std::vector<ScoredRecord>& records) const = 0;
};

/// Per-record interaction ratios.  Zero views give all-zero ratios and
/// lowSignal = true; every ratio is clamped to [0, 1].
struct EngagementRatios {
    double like      = 0.0;
    double coin      = 0.0;
    double favorite  = 0.0;
    bool   lowSignal = false;

    double mean() const { return (like + coin + favorite) / 3.0; }
};

EngagementRatios engagementRatios(const RawRecord& r);

/// Weighted interaction count (likes*3 + coins*5 + ... by default).
double engagementScore(const RawRecord& r, const EngagementWeights& w);

/// Weighted interactions per 100 views; 0 for zero-view records.
double engagementRate(const RawRecord& r, const EngagementWeights& w);

enum class Granularity { Year, Quarter, Month };

/// "2021", "2021-Q3" or "2021-07"; keys sort chronologically as strings.
std::string bucketKey(int64_t unixSeconds, Granularity g, int64_t utcOffsetSeconds);

double mean(const std::vector<double>& values);

/// Sample standard deviation (n - 1); 0 for fewer than two values.
double stddev(const std::vector<double>& values);

/// Linear-interpolated percentile, q in [0, 1].  Sorts @p values.
double percentile(std::vector<double>& values, double q);

} // namespace bili_trends
