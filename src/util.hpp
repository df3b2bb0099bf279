#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace bili_trends {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path component (e.g. "/x/web-interface/search/type")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Percent-encode a query-string component (RFC 3986 unreserved set kept).
std::string urlEncode(const std::string& value);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter,
/// jitter is uniform in [0, jitterMs].
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs   = 200,
                                           int64_t maxMs    = 5000,
                                           int64_t jitterMs = 100);

/// Broken-down calendar date.
struct CivilDate {
    int year  = 1970;
    int month = 1;    // 1..12
    int day   = 1;    // 1..31

    int quarter() const { return (month - 1) / 3 + 1; }
};

/// Calendar date of a Unix timestamp shifted by @p utcOffsetSeconds.
CivilDate civilFromUnix(int64_t unixSeconds, int64_t utcOffsetSeconds = 0);

/// Unix timestamp of 00:00:00 local time on the given date.
int64_t unixFromCivil(const CivilDate& date, int64_t utcOffsetSeconds = 0);

/// Parse "YYYY-MM-DD".  Throws std::invalid_argument on malformed input.
CivilDate parseDate(const std::string& text);

/// "YYYY-MM-DDTHH:MM:SSZ"
std::string formatIsoUtc(int64_t unixSeconds);

std::string trim(const std::string& s);
std::string toLowerAscii(std::string s);
std::vector<std::string> split(const std::string& s, char delimiter);

} // namespace bili_trends
