/// @file test_util.cpp
/// Unit tests for util.hpp — URL handling, backoff, calendar and string helpers.

#include "util.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>

using namespace bili_trends;

// ============================================================================
// parseUrl
// ============================================================================

TEST(ParseUrl, HttpsWithoutPortDefaultsTo443) {
    auto parts = parseUrl("https://api.bilibili.com/x/web-interface/search/type");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "api.bilibili.com");
    EXPECT_EQ(parts.port, "443");
    EXPECT_EQ(parts.target, "/x/web-interface/search/type");
}

TEST(ParseUrl, HttpWithPort) {
    auto parts = parseUrl("http://localhost:8080/search");
    EXPECT_EQ(parts.scheme, "http");
    EXPECT_EQ(parts.host, "localhost");
    EXPECT_EQ(parts.port, "8080");
    EXPECT_EQ(parts.target, "/search");
}

TEST(ParseUrl, HttpWithoutPortDefaultsTo80) {
    auto parts = parseUrl("http://example.com/api");
    EXPECT_EQ(parts.port, "80");
}

TEST(ParseUrl, UrlWithoutPathDefaultsToSlash) {
    auto parts = parseUrl("http://example.com");
    EXPECT_EQ(parts.host, "example.com");
    EXPECT_EQ(parts.target, "/");
}

TEST(ParseUrl, MissingSchemeThrows) {
    EXPECT_THROW(parseUrl("api.bilibili.com/x"), std::invalid_argument);
}

TEST(ParseUrl, EmptyHostThrows) {
    EXPECT_THROW(parseUrl("http:///search"), std::invalid_argument);
}

TEST(ParseUrl, UnsupportedSchemeThrows) {
    EXPECT_THROW(parseUrl("ftp://example.com/file"), std::invalid_argument);
}

// ============================================================================
// urlEncode
// ============================================================================

TEST(UrlEncode, KeepsUnreservedCharacters) {
    EXPECT_EQ(urlEncode("abc-XYZ_0.9~"), "abc-XYZ_0.9~");
}

TEST(UrlEncode, EncodesSpaceAndReserved) {
    EXPECT_EQ(urlEncode("a b&c=d"), "a%20b%26c%3Dd");
}

TEST(UrlEncode, EncodesUtf8BytesAsUppercaseHex) {
    // 执 = E6 89 A7
    EXPECT_EQ(urlEncode("\xE6\x89\xA7"), "%E6%89%A7");
}

// ============================================================================
// computeBackoffMs
// ============================================================================

TEST(ComputeBackoff, Attempt0InRange200To300) {
    for (int i = 0; i < 50; ++i) {
        auto ms = computeBackoffMs(0).count();
        EXPECT_GE(ms, 200);
        EXPECT_LE(ms, 300);
    }
}

TEST(ComputeBackoff, Attempt2InRange800To900) {
    for (int i = 0; i < 50; ++i) {
        auto ms = computeBackoffMs(2).count();
        EXPECT_GE(ms, 800);
        EXPECT_LE(ms, 900);
    }
}

TEST(ComputeBackoff, ClampsToMaxPlusJitter) {
    for (int i = 0; i < 50; ++i) {
        auto ms = computeBackoffMs(10).count();
        EXPECT_GE(ms, 5000);
        EXPECT_LE(ms, 5100);
    }
}

TEST(ComputeBackoff, ZeroJitterIsDeterministic) {
    EXPECT_EQ(computeBackoffMs(0, 500, 8000, 0).count(), 500);
    EXPECT_EQ(computeBackoffMs(3, 500, 8000, 0).count(), 4000);
    EXPECT_EQ(computeBackoffMs(5, 500, 8000, 0).count(), 8000);
}

TEST(ComputeBackoff, HugeBaseSaturatesAtMax) {
    const int64_t huge = std::numeric_limits<int64_t>::max() / 4;
    EXPECT_EQ(computeBackoffMs(30, huge, 60000, 0).count(), 60000);
    EXPECT_EQ(computeBackoffMs(30, huge, std::numeric_limits<int64_t>::max(), 0).count(),
              std::numeric_limits<int64_t>::max());
    EXPECT_EQ(computeBackoffMs(30, huge, std::numeric_limits<int64_t>::max(), 100).count(),
              std::numeric_limits<int64_t>::max());
}

TEST(ComputeBackoff, HugeAttemptDoesNotOverflow) {
    EXPECT_EQ(computeBackoffMs(std::numeric_limits<int>::max(), 500, 8000, 0).count(), 8000);
    EXPECT_EQ(computeBackoffMs(-3, 500, 8000, 0).count(), 500);
}

// ============================================================================
// Calendar
// ============================================================================

TEST(Calendar, EpochIsJanuaryFirst1970) {
    auto d = civilFromUnix(0);
    EXPECT_EQ(d.year, 1970);
    EXPECT_EQ(d.month, 1);
    EXPECT_EQ(d.day, 1);
}

TEST(Calendar, UtcOffsetShiftsDate) {
    // 2020-12-31T20:00:00Z is already 2021-01-01 at UTC+8.
    const int64_t ts = 1609444800;
    EXPECT_EQ(civilFromUnix(ts).year, 2020);
    auto local = civilFromUnix(ts, 8 * 3600);
    EXPECT_EQ(local.year, 2021);
    EXPECT_EQ(local.month, 1);
    EXPECT_EQ(local.day, 1);
    EXPECT_EQ(local.quarter(), 1);
}

TEST(Calendar, UnixFromCivilInvertsCivilFromUnix) {
    CivilDate d{2019, 1, 1};
    EXPECT_EQ(unixFromCivil(d), 1546300800);
    EXPECT_EQ(unixFromCivil(d, 8 * 3600), 1546300800 - 8 * 3600);
}

TEST(Calendar, QuarterOfMonth) {
    EXPECT_EQ((CivilDate{2021, 3, 31}).quarter(), 1);
    EXPECT_EQ((CivilDate{2021, 4, 1}).quarter(), 2);
    EXPECT_EQ((CivilDate{2021, 12, 1}).quarter(), 4);
}

TEST(ParseDate, ValidDate) {
    auto d = parseDate("2024-02-29");
    EXPECT_EQ(d.year, 2024);
    EXPECT_EQ(d.month, 2);
    EXPECT_EQ(d.day, 29);
}

TEST(ParseDate, RejectsMalformedAndOutOfRange) {
    EXPECT_THROW(parseDate("2024/01/01"), std::invalid_argument);
    EXPECT_THROW(parseDate("2024-1-1"), std::invalid_argument);
    EXPECT_THROW(parseDate("2023-02-29"), std::invalid_argument);
    EXPECT_THROW(parseDate("2023-13-01"), std::invalid_argument);
    EXPECT_THROW(parseDate(""), std::invalid_argument);
}

TEST(FormatIsoUtc, FormatsSeconds) {
    EXPECT_EQ(formatIsoUtc(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(formatIsoUtc(1609444800 + 3661), "2020-12-31T21:01:01Z");
}

// ============================================================================
// Strings
// ============================================================================

TEST(StringHelpers, TrimLowerSplit) {
    EXPECT_EQ(trim("  a b \t\n"), "a b");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(toLowerAscii("Hello ABC"), "hello abc");

    auto parts = split("a,,b", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "b");
}
