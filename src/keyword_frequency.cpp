#include "keyword_frequency.hpp"
#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace bili_trends {

namespace {

struct Counts {
    int64_t total    = 0;
    int64_t positive = 0;
    int64_t neutral  = 0;
    int64_t negative = 0;

    void add(SentimentLabel label) {
        ++total;
        switch (label) {
            case SentimentLabel::Positive: ++positive; break;
            case SentimentLabel::Neutral:  ++neutral;  break;
            case SentimentLabel::Negative: ++negative; break;
        }
    }
};

bool allDigits(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) || c == '.'; });
}

std::set<std::string> lowered(const std::set<std::string>& words) {
    std::set<std::string> out;
    for (const auto& w : words) out.insert(toLowerAscii(trim(w)));
    return out;
}

/// Count desc, token asc, truncated to topN (0 = all).
std::vector<std::pair<std::string, Counts>>
rankCounts(const std::map<std::string, Counts>& counts, int topN) {
    std::vector<std::pair<std::string, Counts>> ranked(counts.begin(), counts.end());
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& l, const auto& r) {
        return l.second.total > r.second.total;
    });
    if (topN > 0 && ranked.size() > static_cast<std::size_t>(topN)) {
        ranked.resize(static_cast<std::size_t>(topN));
    }
    return ranked;
}

AggregateRow toRow(const std::string& key, const Counts& c) {
    AggregateRow row;
    row.key = key;
    row.metrics["count"]    = static_cast<double>(c.total);
    row.metrics["positive"] = static_cast<double>(c.positive);
    row.metrics["neutral"]  = static_cast<double>(c.neutral);
    row.metrics["negative"] = static_cast<double>(c.negative);
    return row;
}

} // namespace

// ---------------------------------------------------------------------------
// TermExtractor
// ---------------------------------------------------------------------------

TermExtractor::TermExtractor(const std::vector<std::string>& dictionary,
                             const std::set<std::string>& stopWords)
    : mSegmenter(Segmenter::Fallback::Bigrams)
    , mStopWords(lowered(stopWords))
{
    mSegmenter.addWords(dictionary);
    // Multi-character stop words must segment whole to be removed.
    mSegmenter.addWords(mStopWords);
}

std::vector<std::string> TermExtractor::tokens(const std::string& text) const {
    std::vector<std::string> out;
    for (auto& token : mSegmenter.segment(text)) {
        if (utf8Length(token) < 2) continue;
        if (allDigits(token)) continue;
        if (mStopWords.count(token)) continue;
        out.push_back(std::move(token));
    }
    return out;
}

// ---------------------------------------------------------------------------
// KeywordFrequencyAggregator
// ---------------------------------------------------------------------------

KeywordFrequencyAggregator::KeywordFrequencyAggregator(const std::vector<std::string>& dictionary,
                                                       const std::set<std::string>& stopWords,
                                                       int topN)
    : mTerms(dictionary, stopWords)
    , mTopN(topN) {}

AggregateTable KeywordFrequencyAggregator::compute(const std::vector<ScoredRecord>& records) const {
    AggregateTable table;
    table.name = name();

    // std::map keeps tokens ascending, which the stable sort preserves on ties.
    std::map<std::string, Counts> counts;
    for (const auto& rec : records) {
        const auto& raw = rec.raw();
        for (const auto& token : mTerms.tokens(raw.title + " " + raw.description)) {
            counts[token].add(rec.label);
        }
    }

    for (const auto& [token, c] : rankCounts(counts, mTopN)) {
        table.rows.push_back(toRow(token, c));
    }
    return table;
}

// ---------------------------------------------------------------------------
// YearlyKeywordAggregator
// ---------------------------------------------------------------------------

YearlyKeywordAggregator::YearlyKeywordAggregator(const std::vector<std::string>& dictionary,
                                                 const std::set<std::string>& stopWords,
                                                 int topNPerYear, int64_t utcOffsetSeconds)
    : mTerms(dictionary, stopWords)
    , mTopN(topNPerYear)
    , mUtcOffset(utcOffsetSeconds) {}

AggregateTable YearlyKeywordAggregator::compute(const std::vector<ScoredRecord>& records) const {
    AggregateTable table;
    table.name = name();

    std::map<std::string, std::map<std::string, Counts>> byYear;
    for (const auto& rec : records) {
        const auto& raw = rec.raw();
        if (!raw.pubdate) {
            ++table.excluded;
            continue;
        }
        auto& counts = byYear[bucketKey(*raw.pubdate, Granularity::Year, mUtcOffset)];
        for (const auto& token : mTerms.tokens(raw.title + " " + raw.description)) {
            counts[token].add(rec.label);
        }
    }

    for (const auto& [year, counts] : byYear) {
        int rank = 0;
        for (const auto& [token, c] : rankCounts(counts, mTopN)) {
            auto row  = toRow(year, c);
            row.label = token;
            row.metrics["rank"] = ++rank;
            table.rows.push_back(std::move(row));
        }
    }
    return table;
}

// ---------------------------------------------------------------------------
// HighEngagementKeywordAggregator
// ---------------------------------------------------------------------------

HighEngagementKeywordAggregator::HighEngagementKeywordAggregator(
        const std::vector<std::string>& dictionary,
        const std::set<std::string>& stopWords,
        const EngagementWeights& weights, int topN)
    : mTerms(dictionary, stopWords)
    , mWeights(weights)
    , mTopN(topN) {}

AggregateTable HighEngagementKeywordAggregator::compute(const std::vector<ScoredRecord>& records) const {
    AggregateTable table;
    table.name = name();

    std::vector<double> rates;
    rates.reserve(records.size());
    for (const auto& rec : records) rates.push_back(engagementRate(rec.raw(), mWeights));

    auto sorted = rates;
    const double threshold = percentile(sorted, 0.8);

    std::map<std::string, Counts> counts;
    int64_t selected = 0;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (rates[i] <= threshold) continue;
        ++selected;
        const auto terms = mTerms.tokens(records[i].raw().title);
        const std::set<std::string> unique(terms.begin(), terms.end());
        for (const auto& token : unique) {
            counts[token].add(records[i].label);
        }
    }

    for (const auto& [token, c] : rankCounts(counts, mTopN)) {
        auto row = toRow(token, c);
        row.metrics["engagement_rate_threshold"] = threshold;
        row.metrics["selected_videos"]           = static_cast<double>(selected);
        table.rows.push_back(std::move(row));
    }
    return table;
}

// ---------------------------------------------------------------------------
// TagFrequencyAggregator
// ---------------------------------------------------------------------------

TagFrequencyAggregator::TagFrequencyAggregator(const std::set<std::string>& stopWords, int topN)
    : mStopWords(lowered(stopWords))
    , mTopN(topN) {}

AggregateTable TagFrequencyAggregator::compute(const std::vector<ScoredRecord>& records) const {
    AggregateTable table;
    table.name = name();

    std::map<std::string, Counts> counts;
    for (const auto& rec : records) {
        if (trim(rec.raw().tags).empty()) {
            ++table.excluded;
            continue;
        }
        for (const auto& part : split(rec.raw().tags, ',')) {
            const auto tag = trim(part);
            if (tag.empty() || mStopWords.count(toLowerAscii(tag))) continue;
            counts[tag].add(rec.label);
        }
    }

    for (const auto& [tag, c] : rankCounts(counts, mTopN)) {
        table.rows.push_back(toRow(tag, c));
    }
    return table;
}

} // namespace bili_trends
