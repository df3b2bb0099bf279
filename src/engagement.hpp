#pragma once

#include "aggregator.hpp"

namespace bili_trends {

/// Interaction ratios overall (mean / p50 / p90) and per year-quarter.
/// Zero-view records count as low-signal with ratios of 0; they are never
/// excluded.  Records without a publish timestamp only miss the quarter rows.
class EngagementAggregator : public Aggregator {
public:
    EngagementAggregator(const EngagementWeights& weights, int64_t utcOffsetSeconds);

    std::string    name() const override { return "engagement"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

private:
    EngagementWeights mWeights;
    int64_t           mUtcOffset;
};

/// Mean, median and sample standard deviation of each raw counter
/// (view, like, coin, favorite, share, reply) and of the engagement rate.
class EngagementStatsAggregator : public Aggregator {
public:
    explicit EngagementStatsAggregator(const EngagementWeights& weights);

    std::string    name() const override { return "engagement_stats"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

private:
    EngagementWeights mWeights;
};

/// Views and engagement by video length: (0,5], (5,15], (15,30], (30,60]
/// and over 60 minutes.  Missing or zero durations are excluded.
class DurationEngagementAggregator : public Aggregator {
public:
    std::string    name() const override { return "duration_engagement"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

    /// Row key for a length, or "" when it falls in no bin.
    static std::string bucketFor(int64_t durationSeconds);
};

/// Count, share, mean score and mean engagement per sentiment label.
class SentimentDistributionAggregator : public Aggregator {
public:
    std::string    name() const override { return "sentiment_distribution"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;
};

} // namespace bili_trends
