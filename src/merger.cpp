#include "merger.hpp"

#include <algorithm>

namespace bili_trends {

namespace {

void takeIfSet(std::string& into, const std::string& from) {
    if (!from.empty()) into = from;
}

template <typename T>
void takeIfSet(std::optional<T>& into, const std::optional<T>& from) {
    if (from) into = from;
}

void takeIfSet(int64_t& into, int64_t from) {
    if (from > 0) into = from;
}

} // namespace

void mergeInto(RawRecord& into, const RawRecord& later) {
    // Counters always follow the latest fetch.
    into.views     = later.views;
    into.likes     = later.likes;
    into.coins     = later.coins;
    into.favorites = later.favorites;
    into.shares    = later.shares;
    into.replies   = later.replies;
    into.danmaku   = later.danmaku;

    // Descriptive fields: a missing value never erases a known one.
    takeIfSet(into.bvid,            later.bvid);
    takeIfSet(into.aid,             later.aid);
    takeIfSet(into.title,           later.title);
    takeIfSet(into.description,     later.description);
    takeIfSet(into.tags,            later.tags);
    takeIfSet(into.typeName,        later.typeName);
    takeIfSet(into.pubdate,         later.pubdate);
    takeIfSet(into.durationSeconds, later.durationSeconds);
    takeIfSet(into.authorId,        later.authorId);
    takeIfSet(into.authorName,      later.authorName);

    into.fetchSequence = later.fetchSequence;
}

void Deduplicator::add(const RawRecord& record) {
    const auto id = record.identity();
    if (id.empty()) {
        ++mDropped;
        return;
    }

    auto it = mIndex.find(id);
    if (it == mIndex.end()) {
        MergedRecord merged;
        merged.record = record;
        if (!record.sourceKeyword.empty()) {
            merged.keywords.push_back(record.sourceKeyword);
        }
        mIndex.emplace(id, mRecords.size());
        mRecords.push_back(std::move(merged));
        return;
    }

    auto& merged = mRecords[it->second];
    mergeInto(merged.record, record);
    ++merged.sightings;

    const auto& kw = record.sourceKeyword;
    if (!kw.empty() &&
        std::find(merged.keywords.begin(), merged.keywords.end(), kw) == merged.keywords.end()) {
        merged.keywords.push_back(kw);
    }
}

void Deduplicator::addAll(const std::vector<RawRecord>& records) {
    for (const auto& r : records) add(r);
}

std::vector<MergedRecord> Deduplicator::release() {
    auto out = std::move(mRecords);
    mRecords.clear();
    mIndex.clear();
    return out;
}

std::vector<MergedRecord> mergeRecords(const std::vector<RawRecord>& records) {
    Deduplicator dedup;
    dedup.addAll(records);
    return dedup.release();
}

} // namespace bili_trends
