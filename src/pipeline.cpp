#include "pipeline.hpp"
#include "creator.hpp"
#include "engagement.hpp"
#include "errors.hpp"
#include "keyword_frequency.hpp"
#include "time_bucket.hpp"

#include <algorithm>
#include <iostream>

namespace bili_trends {

namespace {

SentimentScorer makeScorer(const SentimentConfig& cfg) {
    SentimentScorer scorer(cfg);
    if (!cfg.lexiconPath.empty()) {
        scorer.loadLexicon(cfg.lexiconPath);
    }
    return scorer;
}

} // namespace

AnalysisPipeline::AnalysisPipeline(const AppConfig& cfg, bool verbose)
    : mScorer(makeScorer(cfg.sentiment))
    , mWeights(cfg.analysis.engagement)
    , mVerbose(verbose)
{
    const auto& a = cfg.analysis;

    std::vector<std::string> dictionary = cfg.collection.keywords;
    dictionary.insert(dictionary.end(), a.userDictionary.begin(), a.userDictionary.end());

    addAggregator(std::make_unique<TimeBucketAggregator>(Granularity::Year, a.utcOffsetSeconds));
    addAggregator(std::make_unique<TimeBucketAggregator>(Granularity::Quarter, a.utcOffsetSeconds));
    addAggregator(std::make_unique<TimeBucketAggregator>(Granularity::Month, a.utcOffsetSeconds));
    addAggregator(std::make_unique<SentimentDistributionAggregator>());
    addAggregator(std::make_unique<YearlySentimentAggregator>(a.utcOffsetSeconds));
    addAggregator(std::make_unique<EngagementAggregator>(a.engagement, a.utcOffsetSeconds));
    addAggregator(std::make_unique<EngagementStatsAggregator>(a.engagement));
    addAggregator(std::make_unique<DurationEngagementAggregator>());
    addAggregator(std::make_unique<CreatorAggregator>(a.influence, a.creatorTopN));
    addAggregator(std::make_unique<KeywordFrequencyAggregator>(dictionary, a.stopWords, a.topN));
    addAggregator(std::make_unique<YearlyKeywordAggregator>(dictionary, a.stopWords,
                                                            a.yearlyTopN, a.utcOffsetSeconds));
    addAggregator(std::make_unique<HighEngagementKeywordAggregator>(dictionary, a.stopWords,
                                                                    a.engagement,
                                                                    a.highEngagementTopN));
    addAggregator(std::make_unique<TagFrequencyAggregator>(a.stopWords, a.topN));
}

AnalysisPipeline::AnalysisPipeline(SentimentScorer scorer, bool verbose)
    : mScorer(std::move(scorer))
    , mVerbose(verbose) {}

void AnalysisPipeline::addAggregator(std::unique_ptr<Aggregator> aggregator) {
    mAggregators.push_back(std::move(aggregator));
}

// ---------------------------------------------------------------------------
// Run
// ---------------------------------------------------------------------------

Report AnalysisPipeline::run(const std::vector<MergedRecord>& merged, RunSummary summary) const {
    if (merged.empty()) {
        throw EmptyDatasetError("Merged dataset is empty; collection produced no records");
    }

    Report report;
    report.records = mScorer.scoreAll(merged);

    if (mVerbose) {
        std::cerr << "[Pipeline] Scored " << report.records.size() << " records\n";
    }

    for (auto& table : aggregate(report.records)) {
        auto name = table.name;
        report.tables.emplace(std::move(name), std::move(table));
    }

    summary.totalRecords    = static_cast<int64_t>(report.records.size());
    summary.totalViews      = 0;
    summary.totalEngagement = 0.0;
    double rateSum = 0.0;
    for (const auto& rec : report.records) {
        summary.totalViews      += rec.raw().views;
        summary.totalEngagement += engagementScore(rec.raw(), mWeights);
        rateSum                 += engagementRate(rec.raw(), mWeights);

        const auto& pub = rec.raw().pubdate;
        if (!pub) continue;
        if (!summary.coveredRange) {
            summary.coveredRange = TimeWindow{*pub, *pub};
        } else {
            summary.coveredRange->start = std::min(summary.coveredRange->start, *pub);
            summary.coveredRange->end   = std::max(summary.coveredRange->end, *pub);
        }
    }
    const double n = static_cast<double>(report.records.size());
    summary.avgViews          = static_cast<double>(summary.totalViews) / n;
    summary.avgEngagementRate = rateSum / n;
    report.summary = std::move(summary);

    return report;
}

std::vector<AggregateTable> AnalysisPipeline::aggregate(const std::vector<ScoredRecord>& scored) const {
    std::vector<AggregateTable> tables;
    tables.reserve(mAggregators.size());

    for (const auto& aggregator : mAggregators) {
        try {
            tables.push_back(aggregator->compute(scored));
            if (mVerbose) {
                std::cerr << "[Pipeline] " << aggregator->name() << ": "
                          << tables.back().rows.size() << " rows, "
                          << tables.back().excluded << " excluded\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] Aggregate '" << aggregator->name()
                      << "' degraded: " << e.what() << "\n";
            AggregateTable degraded;
            degraded.name     = aggregator->name();
            degraded.degraded = true;
            degraded.error    = e.what();
            tables.push_back(std::move(degraded));
        }
    }
    return tables;
}

} // namespace bili_trends
