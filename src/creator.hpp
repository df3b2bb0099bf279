#pragma once

#include "aggregator.hpp"

namespace bili_trends {

/// Ranks authors by an influence score:
///   w_count * count / max_count + w_engagement * avg_ratio / max_avg_ratio
/// Ties break on total views (desc) then author id (asc).  Records without
/// an author id are excluded.
class CreatorAggregator : public Aggregator {
public:
    CreatorAggregator(const InfluenceWeights& weights, int topN);

    std::string    name() const override { return "creator_influence"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

private:
    InfluenceWeights mWeights;
    int              mTopN;   // 0 = all
};

} // namespace bili_trends
