#include "report_writer.hpp"
#include "aggregator.hpp"
#include "util.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace bili_trends {

namespace {

nlohmann::json windowToJson(const TimeWindow& w) {
    return {
        {"start", formatIsoUtc(w.start)},
        {"end",   formatIsoUtc(w.end)},
    };
}

std::string joined(const std::vector<std::string>& parts, char sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string fixed(double v, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << v;
    return os.str();
}

std::ofstream openForWrite(const std::string& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot open " + path + " for writing");
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

nlohmann::json summaryToJson(const RunSummary& s) {
    nlohmann::json j = {
        {"total_records",   s.totalRecords},
        {"raw_records",     s.rawRecords},
        {"total_units",     s.totalUnits},
        {"failed_units",    s.failedUnits},
        {"partial_units",   s.partialUnits},
        {"cancelled_units", s.cancelledUnits},
        {"failed_keywords", s.failedKeywords},
        {"requested_range", windowToJson(s.requestedRange)},
        {"total_views",         s.totalViews},
        {"total_engagement",    s.totalEngagement},
        {"avg_views",           s.avgViews},
        {"avg_engagement_rate", s.avgEngagementRate},
        {"total_requests",  s.totalRequests},
        {"total_retries",   s.totalRetries},
        {"generated_at",    formatIsoUtc(s.generatedAt)},
        {"cancelled",       s.cancelled},
    };
    j["covered_range"] = s.coveredRange ? windowToJson(*s.coveredRange) : nlohmann::json();
    return j;
}

nlohmann::json tableToJson(const AggregateTable& table) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : table.rows) {
        nlohmann::json r = {{"key", row.key}, {"metrics", row.metrics}};
        if (!row.label.empty()) r["label"] = row.label;
        rows.push_back(std::move(r));
    }
    return {
        {"excluded", table.excluded},
        {"degraded", table.degraded},
        {"error",    table.error},
        {"rows",     std::move(rows)},
    };
}

nlohmann::json reportToJson(const Report& report) {
    nlohmann::json tables = nlohmann::json::object();
    for (const auto& [name, table] : report.tables) {
        tables[name] = tableToJson(table);
    }
    return {
        {"summary", summaryToJson(report.summary)},
        {"tables",  std::move(tables)},
    };
}

void writeReportJson(const Report& report, const std::string& path) {
    auto out = openForWrite(path);
    out << reportToJson(report).dump(2) << "\n";
    if (!out) {
        throw std::runtime_error("Write failed: " + path);
    }
}

// ---------------------------------------------------------------------------
// CSV
// ---------------------------------------------------------------------------

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void writeDatasetCsv(const std::vector<ScoredRecord>& records, std::ostream& out) {
    out << "bvid,aid,title,author,mid,pubdate,duration_seconds,views,likes,coins,"
           "favorites,shares,replies,danmaku,keywords,sentiment,sentiment_score,"
           "like_ratio,coin_ratio,favorite_ratio,low_signal\r\n";

    for (const auto& rec : records) {
        const auto& r = rec.raw();
        const auto ratios = engagementRatios(r);

        out << csvField(r.bvid) << ','
            << r.aid << ','
            << csvField(r.title) << ','
            << csvField(r.authorName) << ','
            << r.authorId << ','
            << (r.pubdate ? formatIsoUtc(*r.pubdate) : std::string()) << ','
            << (r.durationSeconds ? std::to_string(*r.durationSeconds) : std::string()) << ','
            << r.views << ','
            << r.likes << ','
            << r.coins << ','
            << r.favorites << ','
            << r.shares << ','
            << r.replies << ','
            << r.danmaku << ','
            << csvField(joined(rec.merged.keywords, '|')) << ','
            << toString(rec.label) << ','
            << fixed(rec.score, 4) << ','
            << fixed(ratios.like, 6) << ','
            << fixed(ratios.coin, 6) << ','
            << fixed(ratios.favorite, 6) << ','
            << (ratios.lowSignal ? "true" : "false") << "\r\n";
    }
}

void writeDatasetCsv(const std::vector<ScoredRecord>& records, const std::string& path) {
    auto out = openForWrite(path);
    writeDatasetCsv(records, static_cast<std::ostream&>(out));
    if (!out) {
        throw std::runtime_error("Write failed: " + path);
    }
}

} // namespace bili_trends
