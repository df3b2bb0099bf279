#pragma once

#include "models.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace bili_trends {

struct ApiConfig {
    std::string endpoint  = "https://api.bilibili.com/x/web-interface/search/type";
    std::string cookie;
    std::string userAgent = "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) "
                            "AppleWebKit/537.36 (KHTML, like Gecko) "
                            "Chrome/120.0.0.0 Safari/537.36";
    std::string referer   = "https://www.bilibili.com/";
    int         timeoutMs = 10000;
};

struct CollectionConfig {
    std::vector<std::string> keywords;
    TimeWindow               dateRange;
    int                      maxResultsPerKeyword = 1000;   // 0 = unlimited
    int                      pageSize             = 20;
    int                      maxPagesPerQuery     = 50;     // 0 = unlimited
    int                      requestIntervalMs    = 1000;
    // Stop paginating once a page reaches items older than the window start.
    // Only sound if the API really returns pubdate-descending pages.
    bool                     assumeReverseChronological = true;
};

struct RetryConfig {
    int     maxAttempts         = 5;     // attempts per page, first one included
    int64_t baseDelayMs         = 500;
    int64_t maxDelayMs          = 8000;
    double  rateLimitMultiplier = 4.0;
    int64_t jitterMs            = 100;
};

struct SentimentConfig {
    double      positiveThreshold = 0.05;
    double      negativeThreshold = -0.05;
    std::string lexiconPath;             // optional extra lexicon
};

struct InfluenceWeights {
    double count      = 0.5;
    double engagement = 0.5;
};

/// Weights of the composite engagement score.
struct EngagementWeights {
    double like     = 3.0;
    double coin     = 5.0;
    double favorite = 4.0;
    double share    = 6.0;
    double reply    = 2.0;
};

struct AnalysisConfig {
    int                      topN             = 50;
    int                      creatorTopN      = 20;      // 0 = all authors
    int                      yearlyTopN       = 10;      // terms per year
    int                      highEngagementTopN = 20;
    int64_t                  utcOffsetSeconds = 8 * 3600;
    InfluenceWeights         influence;
    EngagementWeights        engagement;
    std::set<std::string>    stopWords;
    std::vector<std::string> userDictionary;
};

struct AppConfig {
    ApiConfig        api;
    CollectionConfig collection;
    RetryConfig      retry;
    SentimentConfig  sentiment;
    AnalysisConfig   analysis;
    std::string      outputDir = "output";
    bool             verbose   = false;
};

/// Built-in defaults: execution-related keywords, 2019-01-01 .. 2025-12-31 (UTC+8).
AppConfig defaultConfig();

/// Overlay the keys present in @p j onto @p base.
/// Throws ConfigError on type errors or malformed dates.
AppConfig configFromJson(const nlohmann::json& j, AppConfig base = defaultConfig());

/// Read and parse a JSON config file.  Throws ConfigError.
AppConfig loadConfigFile(const std::string& path);

/// Throws ConfigError naming the first invalid setting.
void validateConfig(const AppConfig& cfg);

/// Inclusive window covering whole days [start 00:00:00, end 23:59:59] local time.
TimeWindow dateRangeFromStrings(const std::string& start, const std::string& end,
                                int64_t utcOffsetSeconds);

} // namespace bili_trends
