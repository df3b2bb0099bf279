#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <limits>
#include <random>
#include <stdexcept>

namespace bili_trends {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string urlEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::chrono::milliseconds computeBackoffMs(int attempt, int64_t baseMs,
                                           int64_t maxMs, int64_t jitterMs) {
    // Exponential: base * 2^attempt, clamped to maxMs.
    // Saturates at maxMs instead of overflowing.
    attempt = std::clamp(attempt, 0, 30);
    baseMs  = std::max<int64_t>(baseMs, 0);
    maxMs   = std::max<int64_t>(maxMs, 0);
    const int64_t limit = std::numeric_limits<int64_t>::max() >> attempt;
    int64_t backoff = baseMs > limit ? maxMs : std::min(baseMs << attempt, maxMs);

    if (jitterMs > 0) {
        static thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int64_t> jitter(0, jitterMs);
        const int64_t extra = jitter(rng);
        backoff = backoff > std::numeric_limits<int64_t>::max() - extra
            ? std::numeric_limits<int64_t>::max() : backoff + extra;
    }

    return std::chrono::milliseconds(backoff);
}

// ---------------------------------------------------------------------------
// Calendar arithmetic (proleptic Gregorian, days since 1970-01-01)
// ---------------------------------------------------------------------------

namespace {

constexpr int64_t kSecondsPerDay = 86400;

int64_t daysFromCivil(int64_t y, int m, int d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp  = (5 * doy + 2) / 153;

    CivilDate date;
    date.day   = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year  = static_cast<int>(yoe + era * 400 + (date.month <= 2));
    return date;
}

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

int daysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : kDays[month - 1];
}

} // namespace

CivilDate civilFromUnix(int64_t unixSeconds, int64_t utcOffsetSeconds) {
    return civilFromDays(floorDiv(unixSeconds + utcOffsetSeconds, kSecondsPerDay));
}

int64_t unixFromCivil(const CivilDate& date, int64_t utcOffsetSeconds) {
    return daysFromCivil(date.year, date.month, date.day) * kSecondsPerDay
         - utcOffsetSeconds;
}

CivilDate parseDate(const std::string& text) {
    CivilDate date;
    const auto t = trim(text);
    if (t.size() != 10 || t[4] != '-' || t[7] != '-') {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + text);
    }
    for (std::size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(t[i]))) {
            throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): " + text);
        }
    }

    date.year  = std::stoi(t.substr(0, 4));
    date.month = std::stoi(t.substr(5, 2));
    date.day   = std::stoi(t.substr(8, 2));

    if (date.month < 1 || date.month > 12 ||
        date.day < 1 || date.day > daysInMonth(date.year, date.month)) {
        throw std::invalid_argument("Invalid date (out of range): " + text);
    }
    return date;
}

std::string formatIsoUtc(int64_t unixSeconds) {
    const auto date = civilFromUnix(unixSeconds);
    const int64_t secs = unixSeconds - floorDiv(unixSeconds, kSecondsPerDay) * kSecondsPerDay;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  date.year, date.month, date.day,
                  static_cast<int>(secs / 3600),
                  static_cast<int>((secs % 3600) / 60),
                  static_cast<int>(secs % 60));
    return buf;
}

// ---------------------------------------------------------------------------
// Strings
// ---------------------------------------------------------------------------

std::string trim(const std::string& s) {
    const auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(s.begin(), s.end(), notSpace);
    auto end   = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    while (true) {
        auto pos = s.find(delimiter, start);
        parts.push_back(s.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

} // namespace bili_trends
