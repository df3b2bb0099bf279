#include "creator.hpp"

#include <algorithm>
#include <map>

namespace bili_trends {

CreatorAggregator::CreatorAggregator(const InfluenceWeights& weights, int topN)
    : mWeights(weights)
    , mTopN(topN) {}

AggregateTable CreatorAggregator::compute(const std::vector<ScoredRecord>& records) const {
    struct Author {
        int64_t     id = 0;
        std::string name;
        int64_t     count = 0;
        int64_t     views = 0;
        double      ratioSum = 0.0;
        double      influence = 0.0;

        double avgRatio() const { return count > 0 ? ratioSum / static_cast<double>(count) : 0.0; }
    };

    AggregateTable table;
    table.name = name();

    std::map<int64_t, Author> authors;
    for (const auto& rec : records) {
        const auto& raw = rec.raw();
        if (raw.authorId <= 0) {
            ++table.excluded;
            continue;
        }
        auto& a = authors[raw.authorId];
        if (a.count == 0) {
            a.id   = raw.authorId;
            a.name = raw.authorName;
        }
        ++a.count;
        a.views    += raw.views;
        a.ratioSum += engagementRatios(raw).mean();
    }

    int64_t maxCount = 0;
    double  maxRatio = 0.0;
    for (const auto& [id, a] : authors) {
        maxCount = std::max(maxCount, a.count);
        maxRatio = std::max(maxRatio, a.avgRatio());
    }

    std::vector<Author> ranked;
    ranked.reserve(authors.size());
    for (auto& [id, a] : authors) {
        const double countPart = maxCount > 0
            ? static_cast<double>(a.count) / static_cast<double>(maxCount) : 0.0;
        const double ratioPart = maxRatio > 0.0 ? a.avgRatio() / maxRatio : 0.0;
        a.influence = mWeights.count * countPart + mWeights.engagement * ratioPart;
        ranked.push_back(a);
    }

    std::sort(ranked.begin(), ranked.end(), [](const Author& l, const Author& r) {
        if (l.influence != r.influence) return l.influence > r.influence;
        if (l.views != r.views) return l.views > r.views;
        return l.id < r.id;
    });

    if (mTopN > 0 && ranked.size() > static_cast<std::size_t>(mTopN)) {
        ranked.resize(static_cast<std::size_t>(mTopN));
    }

    int rank = 0;
    for (const auto& a : ranked) {
        AggregateRow row;
        row.key   = std::to_string(a.id);
        row.label = a.name;
        row.metrics["rank"]                 = ++rank;
        row.metrics["video_count"]          = static_cast<double>(a.count);
        row.metrics["total_views"]          = static_cast<double>(a.views);
        row.metrics["avg_engagement_ratio"] = a.avgRatio();
        row.metrics["influence_score"]      = a.influence;
        table.rows.push_back(std::move(row));
    }

    return table;
}

} // namespace bili_trends
