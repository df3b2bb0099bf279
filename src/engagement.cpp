#include "engagement.hpp"

#include <array>
#include <map>
#include <utility>

namespace bili_trends {

namespace {

struct RatioSeries {
    std::vector<double> like;
    std::vector<double> coin;
    std::vector<double> favorite;
    std::vector<double> combined;
    int64_t             lowSignal = 0;

    void add(const EngagementRatios& r) {
        like.push_back(r.like);
        coin.push_back(r.coin);
        favorite.push_back(r.favorite);
        combined.push_back(r.mean());
        if (r.lowSignal) ++lowSignal;
    }
};

void addDistribution(AggregateRow& row, const std::string& prefix, std::vector<double> values) {
    row.metrics[prefix + "_mean"] = mean(values);
    row.metrics[prefix + "_p50"]  = percentile(values, 0.5);
    row.metrics[prefix + "_p90"]  = percentile(values, 0.9);
}

} // namespace

// ---------------------------------------------------------------------------
// EngagementAggregator
// ---------------------------------------------------------------------------

EngagementAggregator::EngagementAggregator(const EngagementWeights& weights,
                                           int64_t utcOffsetSeconds)
    : mWeights(weights)
    , mUtcOffset(utcOffsetSeconds) {}

AggregateTable EngagementAggregator::compute(const std::vector<ScoredRecord>& records) const {
    AggregateTable table;
    table.name = name();

    RatioSeries                        overall;
    std::vector<double>                scores;
    std::vector<double>                rates;
    std::map<std::string, RatioSeries> byQuarter;

    for (const auto& rec : records) {
        const auto& raw    = rec.raw();
        const auto  ratios = engagementRatios(raw);
        const auto  score  = engagementScore(raw, mWeights);

        overall.add(ratios);
        scores.push_back(score);
        rates.push_back(engagementRate(raw, mWeights));

        if (!raw.pubdate) {
            ++table.excluded;
            continue;
        }
        byQuarter[bucketKey(*raw.pubdate, Granularity::Quarter, mUtcOffset)].add(ratios);
    }

    AggregateRow row;
    row.key = "overall";
    row.metrics["video_count"]      = static_cast<double>(records.size());
    row.metrics["low_signal_count"] = static_cast<double>(overall.lowSignal);
    addDistribution(row, "like_ratio",       overall.like);
    addDistribution(row, "coin_ratio",       overall.coin);
    addDistribution(row, "favorite_ratio",   overall.favorite);
    addDistribution(row, "engagement_ratio", overall.combined);
    row.metrics["engagement_score_mean"] = mean(scores);
    row.metrics["engagement_rate_mean"]  = mean(rates);
    table.rows.push_back(std::move(row));

    for (const auto& [key, series] : byQuarter) {
        AggregateRow q;
        q.key = key;
        q.metrics["video_count"]           = static_cast<double>(series.like.size());
        q.metrics["low_signal_count"]      = static_cast<double>(series.lowSignal);
        q.metrics["like_ratio_mean"]       = mean(series.like);
        q.metrics["coin_ratio_mean"]       = mean(series.coin);
        q.metrics["favorite_ratio_mean"]   = mean(series.favorite);
        q.metrics["engagement_ratio_mean"] = mean(series.combined);
        table.rows.push_back(std::move(q));
    }

    return table;
}

// ---------------------------------------------------------------------------
// EngagementStatsAggregator
// ---------------------------------------------------------------------------

EngagementStatsAggregator::EngagementStatsAggregator(const EngagementWeights& weights)
    : mWeights(weights) {}

AggregateTable EngagementStatsAggregator::compute(const std::vector<ScoredRecord>& records) const {
    AggregateTable table;
    table.name = name();

    std::vector<double> views, likes, coins, favorites, shares, replies, rates;
    for (const auto& rec : records) {
        const auto& raw = rec.raw();
        views.push_back(static_cast<double>(raw.views));
        likes.push_back(static_cast<double>(raw.likes));
        coins.push_back(static_cast<double>(raw.coins));
        favorites.push_back(static_cast<double>(raw.favorites));
        shares.push_back(static_cast<double>(raw.shares));
        replies.push_back(static_cast<double>(raw.replies));
        rates.push_back(engagementRate(raw, mWeights));
    }

    const std::pair<const char*, std::vector<double>*> series[] = {
        {"view", &views},   {"like", &likes},     {"coin", &coins},
        {"favorite", &favorites}, {"share", &shares}, {"reply", &replies},
        {"engagement_rate", &rates},
    };
    for (const auto& [key, values] : series) {
        AggregateRow row;
        row.key = key;
        row.metrics["mean"]   = mean(*values);
        row.metrics["std"]    = stddev(*values);
        row.metrics["median"] = percentile(*values, 0.5);
        table.rows.push_back(std::move(row));
    }

    return table;
}

// ---------------------------------------------------------------------------
// DurationEngagementAggregator
// ---------------------------------------------------------------------------

std::string DurationEngagementAggregator::bucketFor(int64_t durationSeconds) {
    // Bins are (lower, upper]; a zero length belongs to none.
    if (durationSeconds <= 0)    return {};
    if (durationSeconds <= 300)  return "0-5min";
    if (durationSeconds <= 900)  return "5-15min";
    if (durationSeconds <= 1800) return "15-30min";
    if (durationSeconds <= 3600) return "30-60min";
    return "60min+";
}

AggregateTable DurationEngagementAggregator::compute(const std::vector<ScoredRecord>& records) const {
    static const std::array<const char*, 5> kOrder = {
        "0-5min", "5-15min", "15-30min", "30-60min", "60min+"};

    struct Bucket {
        std::vector<double> views;
        std::vector<double> ratios;
    };

    AggregateTable table;
    table.name = name();

    std::map<std::string, Bucket> buckets;
    for (const auto& rec : records) {
        const auto& raw = rec.raw();
        const auto key = raw.durationSeconds ? bucketFor(*raw.durationSeconds) : std::string();
        if (key.empty()) {
            ++table.excluded;
            continue;
        }
        auto& b = buckets[key];
        b.views.push_back(static_cast<double>(raw.views));
        b.ratios.push_back(engagementRatios(raw).mean());
    }

    for (const char* key : kOrder) {
        const auto& b = buckets[key];
        AggregateRow row;
        row.key = key;
        row.metrics["video_count"]          = static_cast<double>(b.views.size());
        row.metrics["avg_views"]            = mean(b.views);
        row.metrics["avg_engagement_ratio"] = mean(b.ratios);
        table.rows.push_back(std::move(row));
    }

    return table;
}

// ---------------------------------------------------------------------------
// SentimentDistributionAggregator
// ---------------------------------------------------------------------------

AggregateTable SentimentDistributionAggregator::compute(const std::vector<ScoredRecord>& records) const {
    struct Bucket {
        std::vector<double> scores;
        std::vector<double> views;
        std::vector<double> ratios;
    };

    AggregateTable table;
    table.name = name();

    std::map<SentimentLabel, Bucket> buckets;
    for (const auto& rec : records) {
        auto& b = buckets[rec.label];
        b.scores.push_back(rec.score);
        b.views.push_back(static_cast<double>(rec.raw().views));
        b.ratios.push_back(engagementRatios(rec.raw()).mean());
    }

    const double total = static_cast<double>(records.size());
    for (auto label : {SentimentLabel::Positive, SentimentLabel::Neutral, SentimentLabel::Negative}) {
        const auto& b = buckets[label];
        AggregateRow row;
        row.key = toString(label);
        row.metrics["video_count"]          = static_cast<double>(b.scores.size());
        row.metrics["share"]                = total > 0 ? b.scores.size() / total : 0.0;
        row.metrics["avg_score"]            = mean(b.scores);
        row.metrics["avg_views"]            = mean(b.views);
        row.metrics["avg_engagement_ratio"] = mean(b.ratios);
        table.rows.push_back(std::move(row));
    }

    return table;
}

} // namespace bili_trends
