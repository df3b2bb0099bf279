#include "time_bucket.hpp"

#include <map>

namespace bili_trends {

namespace {

double growth(double current, double previous) {
    if (previous <= 0.0) return 0.0;
    return (current - previous) / previous;
}

} // namespace

TimeBucketAggregator::TimeBucketAggregator(Granularity granularity, int64_t utcOffsetSeconds)
    : mGranularity(granularity)
    , mUtcOffset(utcOffsetSeconds) {}

std::string TimeBucketAggregator::name() const {
    switch (mGranularity) {
        case Granularity::Year:    return "yearly_trend";
        case Granularity::Quarter: return "quarterly_trend";
        case Granularity::Month:   return "monthly_trend";
    }
    return "trend";
}

AggregateTable TimeBucketAggregator::compute(const std::vector<ScoredRecord>& records) const {
    struct Bucket {
        int64_t count = 0;
        int64_t views = 0;
    };

    AggregateTable table;
    table.name = name();

    // Keys are zero-padded, so map order is chronological.
    std::map<std::string, Bucket> buckets;
    for (const auto& rec : records) {
        const auto& raw = rec.raw();
        if (!raw.pubdate) {
            ++table.excluded;
            continue;
        }
        auto& b = buckets[bucketKey(*raw.pubdate, mGranularity, mUtcOffset)];
        ++b.count;
        b.views += raw.views;
    }

    const Bucket* previous = nullptr;
    for (const auto& [key, b] : buckets) {
        AggregateRow row;
        row.key = key;
        row.metrics["video_count"] = static_cast<double>(b.count);
        row.metrics["total_views"] = static_cast<double>(b.views);
        row.metrics["avg_views"]   = static_cast<double>(b.views) / static_cast<double>(b.count);
        row.metrics["growth_rate"] = previous
            ? growth(static_cast<double>(b.count), static_cast<double>(previous->count)) : 0.0;
        row.metrics["view_growth_rate"] = previous
            ? growth(static_cast<double>(b.views), static_cast<double>(previous->views)) : 0.0;
        table.rows.push_back(std::move(row));
        previous = &b;
    }

    return table;
}

// ---------------------------------------------------------------------------
// YearlySentimentAggregator
// ---------------------------------------------------------------------------

YearlySentimentAggregator::YearlySentimentAggregator(int64_t utcOffsetSeconds)
    : mUtcOffset(utcOffsetSeconds) {}

AggregateTable YearlySentimentAggregator::compute(const std::vector<ScoredRecord>& records) const {
    struct Bucket {
        int64_t positive = 0;
        int64_t neutral  = 0;
        int64_t negative = 0;
        double  scoreSum = 0.0;

        int64_t total() const { return positive + neutral + negative; }
    };

    AggregateTable table;
    table.name = name();

    std::map<std::string, Bucket> buckets;
    for (const auto& rec : records) {
        const auto& raw = rec.raw();
        if (!raw.pubdate) {
            ++table.excluded;
            continue;
        }
        auto& b = buckets[bucketKey(*raw.pubdate, Granularity::Year, mUtcOffset)];
        switch (rec.label) {
            case SentimentLabel::Positive: ++b.positive; break;
            case SentimentLabel::Neutral:  ++b.neutral;  break;
            case SentimentLabel::Negative: ++b.negative; break;
        }
        b.scoreSum += rec.score;
    }

    for (const auto& [key, b] : buckets) {
        const double n = static_cast<double>(b.total());
        AggregateRow row;
        row.key = key;
        row.metrics["video_count"]  = n;
        row.metrics["positive_pct"] = b.positive * 100.0 / n;
        row.metrics["neutral_pct"]  = b.neutral * 100.0 / n;
        row.metrics["negative_pct"] = b.negative * 100.0 / n;
        row.metrics["avg_score"]    = b.scoreSum / n;
        table.rows.push_back(std::move(row));
    }

    return table;
}

} // namespace bili_trends
