#pragma once

#include "aggregator.hpp"
#include "config.hpp"
#include "models.hpp"
#include "sentiment.hpp"

#include <memory>
#include <vector>

namespace bili_trends {

/// Scores the merged dataset, runs every aggregator and assembles the Report.
class AnalysisPipeline {
public:
    /// Registers the built-in aggregators for @p cfg.
    /// Throws ConfigError on bad sentiment settings or an unreadable lexicon.
    AnalysisPipeline(const AppConfig& cfg, bool verbose = false);

    /// Pipeline with a caller-chosen scorer, default engagement weights and
    /// no aggregators.
    AnalysisPipeline(SentimentScorer scorer, bool verbose = false);

    void addAggregator(std::unique_ptr<Aggregator> aggregator);
    std::size_t aggregatorCount() const { return mAggregators.size(); }

    /// @throws EmptyDatasetError if @p merged is empty (before any aggregator runs).
    /// A throwing aggregator yields a degraded table; the others still run.
    Report run(const std::vector<MergedRecord>& merged, RunSummary summary) const;

    /// Run every aggregator over an already-scored dataset.
    std::vector<AggregateTable> aggregate(const std::vector<ScoredRecord>& scored) const;

private:
    SentimentScorer                          mScorer;
    EngagementWeights                        mWeights;
    std::vector<std::unique_ptr<Aggregator>> mAggregators;
    bool                                     mVerbose;
};

} // namespace bili_trends
