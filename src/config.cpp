#include "config.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <fstream>
#include <stdexcept>

namespace bili_trends {

namespace {

constexpr int64_t kMaxRetryDelayMs        = 3600 * 1000;
constexpr double  kMaxRateLimitMultiplier = 100.0;

const std::vector<std::string> kDefaultKeywords = {
    "执行力", "执行力培训", "执行力管理", "团队执行力", "提高执行力",
    "执行力差", "执行力强", "执行力不足", "执行能力", "执行方法",
    "高效执行", "落地执行", "执行思维", "执行技巧", "执行文化",
};

const std::set<std::string> kDefaultStopWords = {
    "的", "了", "是", "在", "我", "有", "和", "就", "不", "人", "都", "一", "个",
    "上", "也", "很", "到", "说", "要", "去", "你", "会", "着", "没有", "看",
    "好", "自己", "这", "哔哩", "bilibili", "b站", "视频", "观看", "点赞",
    "投币", "收藏", "分享", "弹幕", "评论", "关注", "up主", "播放",
    "更新", "发布", "上传", "链接", "地址", "网站", "平台", "用户", "内容",
    "the", "and", "of", "to", "a", "in", "is", "for", "on", "with",
};

template <typename T>
void assign(const nlohmann::json& obj, const char* key, T& target, const std::string& path) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return;
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid value for '" + path + key + "': " + e.what());
    }
}

const nlohmann::json& section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return kEmpty;
    if (!it->is_object()) {
        throw ConfigError(std::string("Config section '") + key + "' must be an object");
    }
    return *it;
}

} // namespace

TimeWindow dateRangeFromStrings(const std::string& start, const std::string& end,
                                int64_t utcOffsetSeconds) {
    TimeWindow window;
    try {
        window.start = unixFromCivil(parseDate(start), utcOffsetSeconds);
        window.end   = unixFromCivil(parseDate(end), utcOffsetSeconds) + 86400 - 1;
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    return window;
}

AppConfig defaultConfig() {
    AppConfig cfg;
    cfg.collection.keywords  = kDefaultKeywords;
    cfg.collection.dateRange = dateRangeFromStrings("2019-01-01", "2025-12-31",
                                                    cfg.analysis.utcOffsetSeconds);
    cfg.analysis.stopWords   = kDefaultStopWords;
    return cfg;
}

AppConfig configFromJson(const nlohmann::json& j, AppConfig cfg) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }

    const auto& api = section(j, "api");
    assign(api, "endpoint",   cfg.api.endpoint,  "api.");
    assign(api, "cookie",     cfg.api.cookie,    "api.");
    assign(api, "user_agent", cfg.api.userAgent, "api.");
    assign(api, "referer",    cfg.api.referer,   "api.");
    assign(api, "timeout_ms", cfg.api.timeoutMs, "api.");

    assign(j, "keywords", cfg.collection.keywords, "");

    const auto& col = section(j, "collection");
    assign(col, "max_results_per_keyword",      cfg.collection.maxResultsPerKeyword, "collection.");
    assign(col, "page_size",                    cfg.collection.pageSize,             "collection.");
    assign(col, "max_pages_per_query",          cfg.collection.maxPagesPerQuery,     "collection.");
    assign(col, "request_interval_ms",          cfg.collection.requestIntervalMs,    "collection.");
    assign(col, "assume_reverse_chronological", cfg.collection.assumeReverseChronological,
           "collection.");

    const auto& retry = section(j, "retry");
    assign(retry, "max_attempts",          cfg.retry.maxAttempts,         "retry.");
    assign(retry, "base_delay_ms",         cfg.retry.baseDelayMs,         "retry.");
    assign(retry, "max_delay_ms",          cfg.retry.maxDelayMs,          "retry.");
    assign(retry, "rate_limit_multiplier", cfg.retry.rateLimitMultiplier, "retry.");
    assign(retry, "jitter_ms",             cfg.retry.jitterMs,            "retry.");

    const auto& sent = section(j, "sentiment");
    assign(sent, "positive_threshold", cfg.sentiment.positiveThreshold, "sentiment.");
    assign(sent, "negative_threshold", cfg.sentiment.negativeThreshold, "sentiment.");
    assign(sent, "lexicon_path",       cfg.sentiment.lexiconPath,       "sentiment.");

    const int64_t previousOffset = cfg.analysis.utcOffsetSeconds;

    const auto& an = section(j, "analysis");
    assign(an, "top_n",              cfg.analysis.topN,             "analysis.");
    assign(an, "creator_top_n",      cfg.analysis.creatorTopN,      "analysis.");
    assign(an, "yearly_top_n",       cfg.analysis.yearlyTopN,       "analysis.");
    assign(an, "high_engagement_top_n", cfg.analysis.highEngagementTopN, "analysis.");
    assign(an, "utc_offset_seconds", cfg.analysis.utcOffsetSeconds, "analysis.");
    assign(an, "stop_words",         cfg.analysis.stopWords,        "analysis.");
    assign(an, "user_dictionary",    cfg.analysis.userDictionary,   "analysis.");

    const auto& iw = section(an, "influence_weights");
    assign(iw, "count",      cfg.analysis.influence.count,      "analysis.influence_weights.");
    assign(iw, "engagement", cfg.analysis.influence.engagement, "analysis.influence_weights.");

    const auto& ew = section(an, "engagement_weights");
    assign(ew, "like",     cfg.analysis.engagement.like,     "analysis.engagement_weights.");
    assign(ew, "coin",     cfg.analysis.engagement.coin,     "analysis.engagement_weights.");
    assign(ew, "favorite", cfg.analysis.engagement.favorite, "analysis.engagement_weights.");
    assign(ew, "share",    cfg.analysis.engagement.share,    "analysis.engagement_weights.");
    assign(ew, "reply",    cfg.analysis.engagement.reply,    "analysis.engagement_weights.");

    // Dates are resolved last so they pick up an overridden UTC offset.
    const auto& dr = section(j, "date_range");
    if (dr.contains("start") || dr.contains("end")) {
        std::string start, end;
        assign(dr, "start", start, "date_range.");
        assign(dr, "end",   end,   "date_range.");
        if (start.empty() || end.empty()) {
            throw ConfigError("date_range needs both 'start' and 'end'");
        }
        cfg.collection.dateRange =
            dateRangeFromStrings(start, end, cfg.analysis.utcOffsetSeconds);
    } else if (cfg.analysis.utcOffsetSeconds != previousOffset) {
        // Keep the inherited range on the same local calendar days.
        const int64_t shift = previousOffset - cfg.analysis.utcOffsetSeconds;
        cfg.collection.dateRange.start += shift;
        cfg.collection.dateRange.end   += shift;
    }

    assign(j, "output_dir", cfg.outputDir, "");
    assign(j, "verbose",    cfg.verbose,   "");

    return cfg;
}

AppConfig loadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse config file " + path + ": " + e.what());
    }

    return configFromJson(j);
}

void validateConfig(const AppConfig& cfg) {
    if (cfg.api.endpoint.empty()) {
        throw ConfigError("api.endpoint must not be empty");
    }
    try {
        (void)parseUrl(cfg.api.endpoint);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("api.endpoint: ") + e.what());
    }
    if (cfg.api.timeoutMs <= 0) {
        throw ConfigError("api.timeout_ms must be positive");
    }

    const auto& c = cfg.collection;
    if (!c.dateRange.valid()) {
        throw ConfigError("date_range.start must not be after date_range.end");
    }
    if (c.pageSize <= 0) {
        throw ConfigError("collection.page_size must be positive");
    }
    if (c.maxResultsPerKeyword < 0 || c.maxPagesPerQuery < 0) {
        throw ConfigError("collection limits must not be negative");
    }
    if (c.requestIntervalMs < 0) {
        throw ConfigError("collection.request_interval_ms must not be negative");
    }

    const auto& r = cfg.retry;
    if (r.maxAttempts < 1) {
        throw ConfigError("retry.max_attempts must be at least 1");
    }
    if (r.baseDelayMs < 0 || r.maxDelayMs < r.baseDelayMs || r.jitterMs < 0) {
        throw ConfigError("retry delays must satisfy 0 <= base_delay_ms <= max_delay_ms");
    }
    if (r.maxDelayMs > kMaxRetryDelayMs || r.jitterMs > kMaxRetryDelayMs) {
        throw ConfigError("retry.max_delay_ms and retry.jitter_ms must not exceed one hour");
    }
    if (!(r.rateLimitMultiplier >= 1.0 && r.rateLimitMultiplier <= kMaxRateLimitMultiplier)) {
        throw ConfigError("retry.rate_limit_multiplier must be within [1, 100]");
    }

    if (!(cfg.sentiment.negativeThreshold < 0.0 && 0.0 < cfg.sentiment.positiveThreshold)) {
        throw ConfigError("sentiment thresholds must satisfy negative_threshold < 0 < positive_threshold");
    }

    const auto& a = cfg.analysis;
    if (a.topN < 0 || a.creatorTopN < 0 || a.yearlyTopN < 0 || a.highEngagementTopN < 0) {
        throw ConfigError("analysis top_n limits must not be negative");
    }
    if (a.influence.count < 0 || a.influence.engagement < 0) {
        throw ConfigError("analysis.influence_weights must not be negative");
    }
}

} // namespace bili_trends
