/// @file test_merger.cpp
/// Unit tests for merger.hpp — deduplication across keywords.

#include "merger.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace bili_trends;
using bili_trends::fakes::makeRecord;

// ---------------------------------------------------------------------------
// Helper: record seen under a keyword
// ---------------------------------------------------------------------------

static RawRecord seen(const std::string& bvid, const std::string& keyword, int64_t views = 100) {
    auto r = makeRecord(bvid, 1600000000, views);
    r.sourceKeyword = keyword;
    return r;
}

// ============================================================================
// Deduplicator
// ============================================================================

TEST(Deduplicator, OverlappingKeywordsCollapseToUnion) {
    std::vector<RawRecord> all = {
        seen("1", "A"), seen("2", "A"), seen("3", "A"),
        seen("2", "B"), seen("4", "B"),
    };
    auto merged = mergeRecords(all);

    ASSERT_EQ(merged.size(), 4u);
    EXPECT_EQ(merged[0].record.bvid, "1");
    EXPECT_EQ(merged[1].record.bvid, "2");
    EXPECT_EQ(merged[2].record.bvid, "3");
    EXPECT_EQ(merged[3].record.bvid, "4");

    EXPECT_EQ(merged[1].keywords, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(merged[1].sightings, 2);
    EXPECT_EQ(merged[0].keywords, (std::vector<std::string>{"A"}));
    EXPECT_EQ(merged[3].keywords, (std::vector<std::string>{"B"}));
}

TEST(Deduplicator, LatestSightingWinsButFirstKeywordKept) {
    Deduplicator d;
    d.add(seen("x", "A", 100));
    d.add(seen("x", "B", 250));

    ASSERT_EQ(d.size(), 1u);
    const auto& m = d.records()[0];
    EXPECT_EQ(m.record.views, 250);
    EXPECT_EQ(m.record.sourceKeyword, "A");
}

TEST(Deduplicator, LaterSightingWithoutFieldsKeepsKnownValues) {
    auto first = seen("x", "A", 100);
    first.description     = "desc";
    first.tags            = "效率,自律";
    first.durationSeconds = 600;

    auto later = seen("x", "B", 300);
    later.pubdate.reset();
    later.authorName.clear();
    later.title.clear();

    auto merged = mergeRecords({first, later});
    ASSERT_EQ(merged.size(), 1u);
    const auto& r = merged[0].record;
    ASSERT_TRUE(r.pubdate.has_value());
    EXPECT_EQ(*r.pubdate, 1600000000);
    EXPECT_EQ(r.description, "desc");
    EXPECT_EQ(r.tags, "效率,自律");
    ASSERT_TRUE(r.durationSeconds.has_value());
    EXPECT_EQ(*r.durationSeconds, 600);
    EXPECT_EQ(r.authorName, "author");
    EXPECT_EQ(r.title, "video x");
    EXPECT_EQ(r.views, 300);
}

TEST(Deduplicator, PresentLaterValuesReplaceEarlierOnes) {
    auto first = seen("x", "A");
    first.description = "old";
    auto later = seen("x", "B");
    later.description = "new";
    later.pubdate     = 1700000000;
    later.likes       = 0;

    auto merged = mergeRecords({first, later});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].record.description, "new");
    EXPECT_EQ(*merged[0].record.pubdate, 1700000000);
    EXPECT_EQ(merged[0].record.likes, 0);
}

TEST(Deduplicator, SameKeywordTwiceIsNotDuplicatedInUnion) {
    Deduplicator d;
    d.add(seen("x", "A"));
    d.add(seen("x", "A"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d.records()[0].keywords.size(), 1u);
    EXPECT_EQ(d.records()[0].sightings, 2);
}

TEST(Deduplicator, AidFallbackIdentity) {
    RawRecord a;
    a.aid = 7;
    a.sourceKeyword = "A";
    RawRecord b = a;
    b.sourceKeyword = "B";

    auto merged = mergeRecords({a, b});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].record.identity(), "av7");
}

TEST(Deduplicator, RecordsWithoutIdentityAreDropped) {
    Deduplicator d;
    d.add(RawRecord{});
    d.add(seen("x", "A"));
    EXPECT_EQ(d.size(), 1u);
    EXPECT_EQ(d.droppedWithoutIdentity(), 1);
}

TEST(Deduplicator, ReleaseEmptiesTheCollection) {
    Deduplicator d;
    d.addAll({seen("x", "A"), seen("y", "A")});
    auto out = d.release();
    EXPECT_EQ(out.size(), 2u);
    EXPECT_EQ(d.size(), 0u);

    d.add(seen("x", "B"));
    ASSERT_EQ(d.size(), 1u);
    EXPECT_EQ(d.records()[0].sightings, 1);
}

TEST(Deduplicator, EmptyInputGivesEmptyOutput) {
    EXPECT_TRUE(mergeRecords({}).empty());
}
