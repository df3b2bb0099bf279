#include "aggregator.hpp"
#include "util.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace bili_trends {

namespace {

double ratio(int64_t part, int64_t views) {
    if (views <= 0 || part <= 0) return 0.0;
    return std::min(1.0, static_cast<double>(part) / static_cast<double>(views));
}

} // namespace

EngagementRatios engagementRatios(const RawRecord& r) {
    EngagementRatios out;
    if (r.views <= 0) {
        out.lowSignal = true;
        return out;
    }
    out.like     = ratio(r.likes, r.views);
    out.coin     = ratio(r.coins, r.views);
    out.favorite = ratio(r.favorites, r.views);
    return out;
}

double engagementScore(const RawRecord& r, const EngagementWeights& w) {
    return r.likes * w.like
         + r.coins * w.coin
         + r.favorites * w.favorite
         + r.shares * w.share
         + r.replies * w.reply;
}

double engagementRate(const RawRecord& r, const EngagementWeights& w) {
    if (r.views <= 0) return 0.0;
    return engagementScore(r, w) / static_cast<double>(r.views) * 100.0;
}

std::string bucketKey(int64_t unixSeconds, Granularity g, int64_t utcOffsetSeconds) {
    const auto date = civilFromUnix(unixSeconds, utcOffsetSeconds);

    char buf[16];
    switch (g) {
        case Granularity::Year:
            std::snprintf(buf, sizeof(buf), "%04d", date.year);
            break;
        case Granularity::Quarter:
            std::snprintf(buf, sizeof(buf), "%04d-Q%d", date.year, date.quarter());
            break;
        case Granularity::Month:
            std::snprintf(buf, sizeof(buf), "%04d-%02d", date.year, date.month);
            break;
    }
    return buf;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

double stddev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    const double m = mean(values);
    double sq = 0.0;
    for (double v : values) sq += (v - m) * (v - m);
    return std::sqrt(sq / static_cast<double>(values.size() - 1));
}

double percentile(std::vector<double>& values, double q) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());

    q = std::clamp(q, 0.0, 1.0);
    const double pos   = q * static_cast<double>(values.size() - 1);
    const auto   lower = static_cast<std::size_t>(std::floor(pos));
    const auto   upper = std::min(lower + 1, values.size() - 1);
    const double frac  = pos - static_cast<double>(lower);
    return values[lower] + (values[upper] - values[lower]) * frac;
}

} // namespace bili_trends
