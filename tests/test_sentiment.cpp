/// @file test_sentiment.cpp
/// Unit tests for sentiment.hpp — lexicon scoring and labelling.

#include "errors.hpp"
#include "sentiment.hpp"

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>

using namespace bili_trends;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static SentimentScorer defaultScorer() {
    return SentimentScorer(SentimentConfig{});
}

static MergedRecord recordWith(const std::string& title, const std::string& description = "") {
    MergedRecord m;
    m.record.bvid        = "BV1";
    m.record.title       = title;
    m.record.description = description;
    m.keywords           = {"k"};
    return m;
}

// ============================================================================
// Construction
// ============================================================================

TEST(SentimentScorer, RejectsThresholdsNotStraddlingZero) {
    SentimentConfig cfg;
    cfg.positiveThreshold = -0.1;
    EXPECT_THROW(SentimentScorer{cfg}, ConfigError);

    cfg = SentimentConfig{};
    cfg.negativeThreshold = 0.2;
    EXPECT_THROW(SentimentScorer{cfg}, ConfigError);
}

TEST(SentimentScorer, HasBuiltinLexicon) {
    EXPECT_GT(defaultScorer().lexiconSize(), 50u);
}

// ============================================================================
// score
// ============================================================================

TEST(SentimentScorer, EmptyTextIsNeutralZero) {
    auto s = defaultScorer();
    auto r = s.score("   ");
    EXPECT_EQ(r.label, SentimentLabel::Neutral);
    EXPECT_DOUBLE_EQ(r.score, 0.0);
}

TEST(SentimentScorer, NoLexiconHitIsNeutralZero) {
    auto s = defaultScorer();
    auto r = s.score("第三期 2021");
    EXPECT_EQ(r.label, SentimentLabel::Neutral);
    EXPECT_DOUBLE_EQ(r.score, 0.0);
}

TEST(SentimentScorer, PositiveAndNegativeWords) {
    auto s = defaultScorer();
    EXPECT_EQ(s.score("高效学习").label, SentimentLabel::Positive);
    EXPECT_EQ(s.score("拖延症怎么办").label, SentimentLabel::Negative);
    EXPECT_EQ(s.score("A great talk").label, SentimentLabel::Positive);
}

TEST(SentimentScorer, NegatorFlipsPolarity) {
    auto s = defaultScorer();
    EXPECT_GT(s.score("好").score, 0.0);
    EXPECT_LT(s.score("不好").score, 0.0);
    EXPECT_LT(s.score("not good").score, 0.0);
}

TEST(SentimentScorer, BoosterIncreasesMagnitude) {
    auto s = defaultScorer();
    EXPECT_GT(s.score("很好").score, s.score("好").score);
    EXPECT_LT(s.score("非常糟糕").score, s.score("糟糕").score);
}

TEST(SentimentScorer, ExclamationAmplifies) {
    auto s = defaultScorer();
    EXPECT_GT(s.score("好！！").score, s.score("好").score);
    // Capped at four marks.
    EXPECT_DOUBLE_EQ(s.score("好!!!!").score, s.score("好!!!!!!!").score);
}

TEST(SentimentScorer, ScoreStaysWithinUnitRange) {
    auto s = defaultScorer();
    auto r = s.score("优秀优秀优秀优秀优秀优秀优秀优秀优秀优秀!!!!");
    EXPECT_LE(r.score, 1.0);
    EXPECT_GT(r.score, 0.9);
}

TEST(SentimentScorer, LabelsAgreeWithThresholds) {
    SentimentConfig cfg;
    cfg.positiveThreshold = 0.5;
    cfg.negativeThreshold = -0.5;
    SentimentScorer s(cfg);

    for (const char* text : {"好", "不好", "很好", "崩溃", "问题", "优秀!!", "abc"}) {
        const auto r = s.score(text);
        if (r.score >= 0.5)       EXPECT_EQ(r.label, SentimentLabel::Positive) << text;
        else if (r.score <= -0.5) EXPECT_EQ(r.label, SentimentLabel::Negative) << text;
        else                      EXPECT_EQ(r.label, SentimentLabel::Neutral) << text;
    }
}

// ============================================================================
// Records and lexicon files
// ============================================================================

TEST(SentimentScorer, ScoreRecordUsesTitleAndDescription) {
    auto s = defaultScorer();
    auto scored = s.scoreRecord(recordWith("第一期", "非常实用"));
    EXPECT_EQ(scored.label, SentimentLabel::Positive);
    EXPECT_EQ(scored.merged.record.bvid, "BV1");
}

TEST(SentimentScorer, ScoreAllPreservesOrder) {
    auto s = defaultScorer();
    auto out = s.scoreAll({recordWith("好"), recordWith("差"), recordWith("abc")});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].label, SentimentLabel::Positive);
    EXPECT_EQ(out[1].label, SentimentLabel::Negative);
    EXPECT_EQ(out[2].label, SentimentLabel::Neutral);
}

TEST(SentimentScorer, LoadLexiconOverridesAndExtends) {
    const std::string path = ::testing::TempDir() + "bili_trends_lexicon.txt";
    {
        std::ofstream out(path);
        out << "# custom entries\n"
            << "卷王 -2.0\n"
            << "好 -1.0   # override\n"
            << "\n";
    }

    auto s = defaultScorer();
    s.loadLexicon(path);
    EXPECT_EQ(s.score("卷王").label, SentimentLabel::Negative);
    EXPECT_EQ(s.score("好").label, SentimentLabel::Negative);
    std::remove(path.c_str());
}

TEST(SentimentScorer, MissingLexiconFileThrows) {
    auto s = defaultScorer();
    EXPECT_THROW(s.loadLexicon("/nonexistent/lexicon.txt"), ConfigError);
}
