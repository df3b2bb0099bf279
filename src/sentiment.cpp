#include "sentiment.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace bili_trends {

namespace {

// Valences on the usual -4 .. +4 scale.
const std::vector<std::pair<const char*, double>> kBuiltinLexicon = {
    // Chinese, positive
    {"好", 1.9}, {"优秀", 2.9}, {"高效", 2.4}, {"提升", 1.9}, {"提高", 1.8},
    {"成功", 2.8}, {"进步", 2.1}, {"强", 1.6}, {"成长", 2.0}, {"积极", 2.3},
    {"有效", 2.0}, {"干货", 1.6}, {"喜欢", 2.2}, {"厉害", 2.5}, {"推荐", 1.5},
    {"坚持", 1.4}, {"自律", 1.5}, {"快乐", 2.6}, {"开心", 2.6}, {"突破", 2.0},
    {"实用", 1.8}, {"精彩", 2.7}, {"感谢", 2.0}, {"收获", 2.0}, {"轻松", 1.7},
    {"专注", 1.5}, {"优化", 1.4}, {"赞", 2.2}, {"棒", 2.4}, {"受益", 2.2},
    {"牛", 2.0}, {"清晰", 1.5}, {"靠谱", 2.0}, {"改善", 1.6}, {"自信", 2.0},
    // Chinese, negative
    {"差", -2.0}, {"失败", -2.5}, {"拖延", -2.0}, {"焦虑", -2.2}, {"痛苦", -2.8},
    {"困难", -1.5}, {"问题", -0.9}, {"懒", -1.9}, {"低效", -2.1}, {"不足", -1.5},
    {"崩溃", -3.0}, {"无能", -2.8}, {"糟糕", -2.5}, {"废", -2.0}, {"累", -1.5},
    {"压力", -1.5}, {"迷茫", -1.8}, {"后悔", -2.0}, {"坑", -1.6}, {"垃圾", -3.0},
    {"难", -1.0}, {"烂", -2.6}, {"混乱", -2.0}, {"抱怨", -1.9}, {"摆烂", -2.2},
    {"内耗", -2.0}, {"浪费", -2.0}, {"糊弄", -1.8}, {"敷衍", -1.9}, {"痛", -1.8},
    // English
    {"good", 1.9}, {"great", 3.1}, {"excellent", 3.2}, {"effective", 2.0},
    {"success", 2.7}, {"improve", 1.8}, {"love", 3.2}, {"best", 3.2},
    {"happy", 2.7}, {"useful", 1.9}, {"productive", 2.0},
    {"bad", -2.5}, {"fail", -2.3}, {"failure", -2.5}, {"poor", -2.1},
    {"lazy", -1.7}, {"stress", -1.8}, {"anxiety", -2.0}, {"worst", -3.1},
    {"hate", -2.7}, {"problem", -1.7}, {"procrastination", -1.8},
};

const std::vector<std::pair<const char*, double>> kBuiltinBoosters = {
    {"很", 0.293}, {"非常", 0.293}, {"太", 0.293}, {"特别", 0.293}, {"十分", 0.293},
    {"极其", 0.293}, {"超", 0.293}, {"最", 0.293}, {"真", 0.293}, {"超级", 0.293},
    {"有点", -0.293}, {"稍微", -0.293}, {"略", -0.293}, {"一点", -0.293},
    {"very", 0.293}, {"really", 0.293}, {"extremely", 0.293}, {"so", 0.293},
    {"slightly", -0.293}, {"somewhat", -0.293}, {"barely", -0.293},
};

const std::vector<const char*> kBuiltinNegators = {
    "不", "没", "没有", "别", "无", "非", "未", "不是", "不会", "不要", "毫无",
    "not", "no", "never", "without", "dont", "isnt", "cant",
};

constexpr double kNegationScalar = -0.74;
constexpr double kExclamationBoost = 0.292;

} // namespace

SentimentScorer::SentimentScorer(const SentimentConfig& cfg)
    : mCfg(cfg)
{
    // Thresholds straddle zero so the score-0 fallback is always neutral.
    if (!(mCfg.negativeThreshold < 0.0 && 0.0 < mCfg.positiveThreshold)) {
        throw ConfigError("Sentiment thresholds must satisfy negative < 0 < positive");
    }

    for (const auto& [word, valence] : kBuiltinLexicon) addLexiconEntry(word, valence);
    for (const auto& [word, scalar] : kBuiltinBoosters) {
        mBoosters.emplace(word, scalar);
        mSegmenter.addWord(word);
    }
    for (const auto* word : kBuiltinNegators) {
        mNegators.insert(word);
        mSegmenter.addWord(word);
    }
}

void SentimentScorer::addLexiconEntry(const std::string& word, double valence) {
    const auto key = toLowerAscii(trim(word));
    if (key.empty()) return;
    mLexicon[key] = valence;
    mSegmenter.addWord(key);
}

void SentimentScorer::loadLexicon(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open sentiment lexicon: " + path);
    }

    std::string line;
    while (std::getline(in, line)) {
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        if (trim(line).empty()) continue;

        std::istringstream fields(line);
        std::string word;
        double valence = 0.0;
        if (fields >> word >> valence) {
            addLexiconEntry(word, valence);
        }
    }
}

// ---------------------------------------------------------------------------
// Scoring
// ---------------------------------------------------------------------------

SentimentResult SentimentScorer::score(const std::string& text) const {
    SentimentResult result;
    if (trim(text).empty()) return result;

    const auto tokens = mSegmenter.segment(text);

    double sum = 0.0;
    bool   hit = false;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        auto it = mLexicon.find(tokens[i]);
        if (it == mLexicon.end()) continue;

        double valence = it->second;
        hit = true;

        for (std::size_t back = 1; back <= 2 && back <= i; ++back) {
            auto boost = mBoosters.find(tokens[i - back]);
            if (boost == mBoosters.end()) continue;
            double scalar = (valence < 0) ? -boost->second : boost->second;
            if (back == 2) scalar *= 0.95;
            valence += scalar;
        }

        for (std::size_t back = 1; back <= 2 && back <= i; ++back) {
            if (mNegators.count(tokens[i - back])) {
                valence *= kNegationScalar;
                break;
            }
        }

        sum += valence;
    }

    if (!hit) return result;

    // Exclamation marks (ASCII and full-width) amplify, up to four.
    int bangs = 0;
    for (std::size_t pos = 0; pos < text.size() && bangs < 4;) {
        const char32_t cp = decodeUtf8(text, pos);
        if (cp == U'!' || cp == 0xFF01) ++bangs;
    }
    if (sum > 0) sum += bangs * kExclamationBoost;
    else if (sum < 0) sum -= bangs * kExclamationBoost;

    result.score = normalize(sum);
    result.label = labelFor(result.score);
    return result;
}

SentimentLabel SentimentScorer::labelFor(double score) const {
    if (score >= mCfg.positiveThreshold) return SentimentLabel::Positive;
    if (score <= mCfg.negativeThreshold) return SentimentLabel::Negative;
    return SentimentLabel::Neutral;
}

ScoredRecord SentimentScorer::scoreRecord(const MergedRecord& record) const {
    ScoredRecord scored;
    scored.merged = record;

    const auto& raw = record.record;
    const auto s = score(raw.title + " " + raw.description);
    scored.label = s.label;
    scored.score = s.score;
    return scored;
}

std::vector<ScoredRecord> SentimentScorer::scoreAll(const std::vector<MergedRecord>& records) const {
    std::vector<ScoredRecord> out;
    out.reserve(records.size());
    for (const auto& r : records) out.push_back(scoreRecord(r));
    return out;
}

double SentimentScorer::normalize(double sum, double alpha) {
    const double score = sum / std::sqrt(sum * sum + alpha);
    if (score < -1.0) return -1.0;
    if (score > 1.0)  return 1.0;
    return score;
}

} // namespace bili_trends
