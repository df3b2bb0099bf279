#pragma once

#include "models.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace bili_trends {

/// Folds records from every unit into one collection keyed by video identity.
///
/// Fold a later sighting of the same video into @p into.
/// Engagement counters take the later values.  Other fields take the later
/// value only when it is present; sourceKeyword is never touched.
void mergeInto(RawRecord& into, const RawRecord& later);

/// Records must be added in unit-processing order.  Output keeps first-seen
/// order; fields merge as in mergeInto(), the keyword set is the union of
/// every sighting and sourceKeyword stays the first keyword.
class Deduplicator {
public:
    void add(const RawRecord& record);
    void addAll(const std::vector<RawRecord>& records);

    std::size_t size() const { return mRecords.size(); }
    int droppedWithoutIdentity() const { return mDropped; }

    const std::vector<MergedRecord>& records() const { return mRecords; }
    std::vector<MergedRecord> release();

private:
    std::vector<MergedRecord>                    mRecords;
    std::unordered_map<std::string, std::size_t> mIndex;
    int                                          mDropped = 0;
};

/// Convenience wrapper: merge a flat, ordered list in one call.
std::vector<MergedRecord> mergeRecords(const std::vector<RawRecord>& records);

} // namespace bili_trends
