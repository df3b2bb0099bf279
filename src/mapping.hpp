#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bili_trends {

/// Result of parsing one page of the video search response.
struct SearchPage {
    std::vector<RawRecord> records;
    int                    page       = 1;
    int                    numPages   = 0;
    int64_t                numResults = 0;
    int                    skipped    = 0;   // items without an identity
};

/// Parse a full search response body (`{"code":0,"data":{...}}`) into a SearchPage.
/// Throws std::runtime_error if the expected shape is missing.
SearchPage parseSearchPage(const nlohmann::json& responseBody);

/// Map a single video item JSON node into a RawRecord.
RawRecord parseVideoItem(const nlohmann::json& node);

/// Remove `<em class="keyword">` highlight markup and decode the few HTML
/// entities the search API emits.
std::string stripHighlight(const std::string& title);

/// Parse "ss", "mm:ss" or "hh:mm:ss".  Returns nullopt for anything else.
std::optional<int64_t> parseDuration(const std::string& text);

/// Read an integer that the API may send as a number or a numeric string.
/// Anything else yields @p fallback.
int64_t readInt(const nlohmann::json& node, const char* key, int64_t fallback = 0);

} // namespace bili_trends
