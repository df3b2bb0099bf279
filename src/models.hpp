#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bili_trends {

/// Inclusive [start, end] range of Unix seconds.
struct TimeWindow {
    int64_t start = 0;
    int64_t end   = 0;

    bool contains(int64_t ts) const { return ts >= start && ts <= end; }
    bool valid() const { return start <= end; }
};

/// One (keyword, window) query the collector drives to completion.
struct CollectionUnit {
    std::string keyword;
    TimeWindow  window;
    int         resultCap = 0;   // 0 = unlimited
};

/// Mirrors one video item of the search API (subset of fields used in analysis).
struct RawRecord {
    std::string bvid;            // e.g. "BV1xx411c7mD"
    int64_t     aid = 0;
    std::string title;           // highlight markup stripped
    std::string description;
    std::string tags;            // comma-separated
    std::string typeName;

    std::optional<int64_t> pubdate;          // Unix seconds
    std::optional<int64_t> durationSeconds;

    int64_t     authorId = 0;    // "mid"
    std::string authorName;

    int64_t views     = 0;
    int64_t likes     = 0;
    int64_t coins     = 0;
    int64_t favorites = 0;
    int64_t shares    = 0;
    int64_t replies   = 0;
    int64_t danmaku   = 0;

    std::string sourceKeyword;
    int64_t     fetchSequence = 0;   // global fetch order, assigned by the collector

    /// Video identity used for deduplication ("" when the item carries none).
    std::string identity() const {
        if (!bvid.empty()) return bvid;
        if (aid > 0) return "av" + std::to_string(aid);
        return {};
    }
};

/// A RawRecord after deduplication across keywords.
struct MergedRecord {
    RawRecord                record;
    std::vector<std::string> keywords;   // union, first-seen order
    int                      sightings = 1;
};

enum class SentimentLabel { Positive, Neutral, Negative };

inline const char* toString(SentimentLabel label) {
    switch (label) {
        case SentimentLabel::Positive: return "positive";
        case SentimentLabel::Negative: return "negative";
        case SentimentLabel::Neutral:  break;
    }
    return "neutral";
}

struct ScoredRecord {
    MergedRecord   merged;
    SentimentLabel label = SentimentLabel::Neutral;
    double         score = 0.0;

    const RawRecord& raw() const { return merged.record; }
};

/// One bucket of an aggregate table.
struct AggregateRow {
    std::string                   key;
    std::string                   label;     // optional display name (e.g. author name)
    std::map<std::string, double> metrics;

    bool operator==(const AggregateRow& o) const {
        return key == o.key && label == o.label && metrics == o.metrics;
    }
};

struct AggregateTable {
    std::string               name;
    std::vector<AggregateRow> rows;
    int64_t                   excluded = 0;   // records lacking the required field
    bool                      degraded = false;
    std::string               error;

    const AggregateRow* find(const std::string& key) const {
        for (const auto& row : rows) {
            if (row.key == key) return &row;
        }
        return nullptr;
    }

    bool operator==(const AggregateTable& o) const {
        return name == o.name && rows == o.rows && excluded == o.excluded
            && degraded == o.degraded && error == o.error;
    }
};

/// Run-level scalars handed to writers together with the tables.
struct RunSummary {
    int64_t totalRecords     = 0;
    int64_t rawRecords       = 0;
    int     totalUnits       = 0;
    int     failedUnits      = 0;
    int     partialUnits     = 0;
    int     cancelledUnits   = 0;
    std::vector<std::string> failedKeywords;

    TimeWindow requestedRange;
    std::optional<TimeWindow> coveredRange;

    // Dataset totals, filled by the analysis pipeline.
    int64_t totalViews        = 0;
    double  totalEngagement   = 0.0;   // sum of weighted engagement scores
    double  avgViews          = 0.0;
    double  avgEngagementRate = 0.0;

    int     totalRequests = 0;
    int     totalRetries  = 0;
    int64_t generatedAt   = 0;
    bool    cancelled     = false;
};

struct Report {
    RunSummary                            summary;
    std::map<std::string, AggregateTable> tables;
    std::vector<ScoredRecord>             records;
};

} // namespace bili_trends
