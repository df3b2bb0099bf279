/// @file test_segmenter.cpp
/// Unit tests for segmenter.hpp — UTF-8 decoding and mixed-script tokenizing.

#include "segmenter.hpp"

#include <gtest/gtest.h>

using namespace bili_trends;
using Tokens = std::vector<std::string>;

// ============================================================================
// UTF-8
// ============================================================================

TEST(DecodeUtf8, DecodesMultiByteSequences) {
    std::string s = "a\xE6\x89\xA7";   // a执
    std::size_t pos = 0;
    EXPECT_EQ(decodeUtf8(s, pos), U'a');
    EXPECT_EQ(pos, 1u);
    EXPECT_EQ(decodeUtf8(s, pos), U'执');
    EXPECT_EQ(pos, 4u);
}

TEST(DecodeUtf8, MalformedBytesBecomeReplacement) {
    std::string truncated = "\xE6\x89";
    std::size_t pos = 0;
    EXPECT_EQ(decodeUtf8(truncated, pos), char32_t{0xFFFD});
    EXPECT_EQ(pos, 1u);

    std::string stray = "\x80";
    pos = 0;
    EXPECT_EQ(decodeUtf8(stray, pos), char32_t{0xFFFD});
}

TEST(Utf8Length, CountsCodePoints) {
    EXPECT_EQ(utf8Length(""), 0u);
    EXPECT_EQ(utf8Length("abc"), 3u);
    EXPECT_EQ(utf8Length("执行力"), 3u);
}

TEST(IsCjk, Ranges) {
    EXPECT_TRUE(isCjk(U'执'));
    EXPECT_FALSE(isCjk(U'a'));
    EXPECT_FALSE(isCjk(U'！'));   // full-width !
}

// ============================================================================
// Segmenter
// ============================================================================

TEST(Segmenter, LatinWordsAreLowercased) {
    Segmenter seg;
    EXPECT_EQ(seg.segment("Time Management 101!"), (Tokens{"time", "management", "101"}));
}

TEST(Segmenter, DictionaryWordsStayWhole) {
    Segmenter seg;
    seg.addWords(Tokens{"执行力", "提升"});
    EXPECT_EQ(seg.segment("提升执行力"), (Tokens{"提升", "执行力"}));
}

TEST(Segmenter, LongestMatchWins) {
    Segmenter seg;
    seg.addWords(Tokens{"执行", "执行力"});
    EXPECT_EQ(seg.segment("执行力"), (Tokens{"执行力"}));
}

TEST(Segmenter, UnmatchedRunFallsBackToBigrams) {
    Segmenter seg(Segmenter::Fallback::Bigrams);
    seg.addWord("执行力");
    EXPECT_EQ(seg.segment("执行力方法论"), (Tokens{"执行力", "方法", "法论"}));
}

TEST(Segmenter, CharacterFallback) {
    Segmenter seg(Segmenter::Fallback::Characters);
    EXPECT_EQ(seg.segment("方法论"), (Tokens{"方", "法", "论"}));
}

TEST(Segmenter, SingleUnmatchedCharacterIsKept) {
    Segmenter seg;
    seg.addWord("执行力");
    EXPECT_EQ(seg.segment("好执行力"), (Tokens{"好", "执行力"}));
}

TEST(Segmenter, MixedScriptsSplitAtBoundaries) {
    Segmenter seg;
    seg.addWord("执行力");
    EXPECT_EQ(seg.segment("GTD执行力, OKR"), (Tokens{"gtd", "执行力", "okr"}));
}

TEST(Segmenter, NonCjkDictionaryWordsAreIgnored) {
    Segmenter seg;
    seg.addWord("okr");
    seg.addWord("执行力x");
    EXPECT_EQ(seg.dictionarySize(), 0u);
}

TEST(Segmenter, EmptyAndPunctuationOnly) {
    Segmenter seg;
    EXPECT_TRUE(seg.segment("").empty());
    EXPECT_TRUE(seg.segment("!!, 。").empty());
}
