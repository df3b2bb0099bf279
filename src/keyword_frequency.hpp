#pragma once

#include "aggregator.hpp"
#include "segmenter.hpp"

#include <set>
#include <string>
#include <vector>

namespace bili_trends {

/// Splits free text into countable terms.
/// Stop words, single-character tokens and pure numbers are dropped.
class TermExtractor {
public:
    /// @param dictionary  Words the segmenter should keep whole
    ///                    (search keywords, user dictionary).
    TermExtractor(const std::vector<std::string>& dictionary,
                  const std::set<std::string>& stopWords);

    std::vector<std::string> tokens(const std::string& text) const;

private:
    Segmenter             mSegmenter;
    std::set<std::string> mStopWords;
};

/// Top-N tokens of title + description, with per-sentiment-label counts.
class KeywordFrequencyAggregator : public Aggregator {
public:
    KeywordFrequencyAggregator(const std::vector<std::string>& dictionary,
                               const std::set<std::string>& stopWords,
                               int topN);

    std::string    name() const override { return "keyword_frequency"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

    std::vector<std::string> tokens(const std::string& text) const { return mTerms.tokens(text); }

private:
    TermExtractor mTerms;
    int           mTopN;   // 0 = all
};

/// Top-N tokens of title + description for each publish year.
/// One row per (year, token): key is the year, label the token.
/// Records without a publish timestamp are excluded.
class YearlyKeywordAggregator : public Aggregator {
public:
    YearlyKeywordAggregator(const std::vector<std::string>& dictionary,
                            const std::set<std::string>& stopWords,
                            int topNPerYear, int64_t utcOffsetSeconds);

    std::string    name() const override { return "yearly_keywords"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

private:
    TermExtractor mTerms;
    int           mTopN;
    int64_t       mUtcOffset;
};

/// Title terms of the videos whose engagement rate is strictly above the
/// 80th percentile.  A term counts once per title.
class HighEngagementKeywordAggregator : public Aggregator {
public:
    HighEngagementKeywordAggregator(const std::vector<std::string>& dictionary,
                                    const std::set<std::string>& stopWords,
                                    const EngagementWeights& weights, int topN);

    std::string    name() const override { return "high_engagement_keywords"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

private:
    TermExtractor     mTerms;
    EngagementWeights mWeights;
    int               mTopN;
};

/// Top-N comma-separated tags.
class TagFrequencyAggregator : public Aggregator {
public:
    TagFrequencyAggregator(const std::set<std::string>& stopWords, int topN);

    std::string    name() const override { return "tag_frequency"; }
    AggregateTable compute(const std::vector<ScoredRecord>& records) const override;

private:
    std::set<std::string> mStopWords;
    int                   mTopN;
};

} // namespace bili_trends
