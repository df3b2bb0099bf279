#pragma once

#include "aggregator.hpp"

namespace bili_trends {

/// Publish counts and views per calendar bucket, with the relative change
/// against the previous non-empty bucket of the same granularity.
/// Records without a publish timestamp are excluded.
class TimeBucketAggregator : public Aggregator {
public:
    TimeBucketAggregator(Granularity granularity, int64_t utcOffsetSeconds);

    std::string    name() const override;
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

private:
    Granularity mGranularity;
    int64_t     mUtcOffset;
};

/// Percentage of each sentiment label per calendar year, with the year's
/// mean score.  Records without a publish timestamp are excluded.
class YearlySentimentAggregator : public Aggregator {
public:
    explicit YearlySentimentAggregator(int64_t utcOffsetSeconds);

    std::string    name() const override { return "yearly_sentiment"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

private:
    int64_t mUtcOffset;
};

} // namespace bili_trends
