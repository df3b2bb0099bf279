#pragma once

#include "config.hpp"
#include "models.hpp"
#include "segmenter.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bili_trends {

struct SentimentResult {
    SentimentLabel label = SentimentLabel::Neutral;
    double         score = 0.0;   // [-1, 1]
};

/// Lexicon-based scorer for mixed Chinese / English titles.
///
/// Valences of lexicon hits are summed, with negators and intensifiers in
/// the two preceding tokens adjusting each hit, then normalised into
/// [-1, 1] as x / sqrt(x^2 + 15).
class SentimentScorer {
public:
    /// Uses the built-in lexicon.  Throws ConfigError if the thresholds are
    /// out of order.
    explicit SentimentScorer(const SentimentConfig& cfg);

    /// Lines of `word <whitespace> valence`; `#` starts a comment.  Entries
    /// override built-in ones.  Throws ConfigError if the file is unreadable.
    void loadLexicon(const std::string& path);
    void addLexiconEntry(const std::string& word, double valence);

    /// Empty or whitespace-only text is neutral with score 0.
    SentimentResult score(const std::string& text) const;

    /// score() over title + " " + description.
    ScoredRecord scoreRecord(const MergedRecord& record) const;
    std::vector<ScoredRecord> scoreAll(const std::vector<MergedRecord>& records) const;

    SentimentLabel labelFor(double score) const;

    std::size_t lexiconSize() const { return mLexicon.size(); }

private:
    SentimentConfig                         mCfg;
    std::unordered_map<std::string, double> mLexicon;
    std::unordered_map<std::string, double> mBoosters;
    std::unordered_set<std::string>         mNegators;
    Segmenter                               mSegmenter{Segmenter::Fallback::Characters};

    static double normalize(double sum, double alpha = 15.0);
};

} // namespace bili_trends
