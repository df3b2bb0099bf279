/// @file test_api_client.cpp
/// Unit tests for api_client.hpp — request building and error classification.

#include "api_client.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace bili_trends;
using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Fake transport: canned response, records the last request
// ---------------------------------------------------------------------------

class FakeTransport : public HttpTransport {
public:
    Response    next;
    bool        failNetwork = false;
    std::string lastTarget;
    HttpHeaders lastHeaders;

    Response get(const std::string& target, const HttpHeaders& headers) override {
        lastTarget  = target;
        lastHeaders = headers;
        if (failNetwork) throw std::runtime_error("connection reset");
        return next;
    }

    void respond(unsigned int status, const json& body) {
        next.httpStatus = status;
        next.body       = body.dump();
    }
};

static json okBody(int page, int numPages, int items) {
    json result = json::array();
    for (int i = 0; i < items; ++i) {
        result.push_back({{"type", "video"}, {"bvid", "BV" + std::to_string(page * 100 + i)},
                          {"pubdate", 1600000000}});
    }
    return {{"code", 0}, {"data", {{"page", page}, {"numPages", numPages},
                                   {"numResults", numPages * 20}, {"result", result}}}};
}

static ApiConfig testApi() {
    ApiConfig api;
    api.endpoint = "https://api.bilibili.com/x/web-interface/search/type";
    api.cookie   = "SESSDATA=abc";
    return api;
}

static const TimeWindow kWindow{1546272000, 1577807999};

// ============================================================================
// Request building
// ============================================================================

TEST(BilibiliApiClient, BuildTargetCarriesQueryParameters) {
    FakeTransport t;
    BilibiliApiClient client(t, testApi(), 20);
    auto target = client.buildTarget("time management", kWindow, 3);

    EXPECT_EQ(target.rfind("/x/web-interface/search/type?", 0), 0u);
    EXPECT_NE(target.find("search_type=video"), std::string::npos);
    EXPECT_NE(target.find("keyword=time%20management"), std::string::npos);
    EXPECT_NE(target.find("page=3"), std::string::npos);
    EXPECT_NE(target.find("page_size=20"), std::string::npos);
    EXPECT_NE(target.find("order=pubdate"), std::string::npos);
    EXPECT_NE(target.find("pubtime_begin_s=1546272000"), std::string::npos);
    EXPECT_NE(target.find("pubtime_end_s=1577807999"), std::string::npos);
}

TEST(BilibiliApiClient, SendsBrowserHeadersAndCookie) {
    FakeTransport t;
    t.respond(200, okBody(1, 1, 1));
    BilibiliApiClient client(t, testApi(), 20);
    client.fetchPage("执行力", kWindow, kStartCursor);

    bool sawCookie = false, sawAgent = false, sawReferer = false;
    for (const auto& [name, value] : t.lastHeaders) {
        if (name == "Cookie" && value == "SESSDATA=abc") sawCookie = true;
        if (name == "User-Agent" && !value.empty()) sawAgent = true;
        if (name == "Referer") sawReferer = true;
    }
    EXPECT_TRUE(sawCookie);
    EXPECT_TRUE(sawAgent);
    EXPECT_TRUE(sawReferer);
}

// ============================================================================
// Paging
// ============================================================================

TEST(BilibiliApiClient, FirstPageAdvertisesNextCursor) {
    FakeTransport t;
    t.respond(200, okBody(1, 3, 2));
    BilibiliApiClient client(t, testApi(), 20);

    auto page = client.fetchPage("k", kWindow, kStartCursor);
    EXPECT_NE(t.lastTarget.find("page=1"), std::string::npos);
    EXPECT_EQ(page.records.size(), 2u);
    EXPECT_TRUE(page.hasMore);
    EXPECT_EQ(page.nextCursor, "2");
    EXPECT_EQ(page.reportedTotal, 60);
}

TEST(BilibiliApiClient, LastPageHasNoMore) {
    FakeTransport t;
    t.respond(200, okBody(3, 3, 1));
    BilibiliApiClient client(t, testApi(), 20);

    auto page = client.fetchPage("k", kWindow, "3");
    EXPECT_NE(t.lastTarget.find("page=3"), std::string::npos);
    EXPECT_FALSE(page.hasMore);
    EXPECT_EQ(page.nextCursor, "");
}

TEST(BilibiliApiClient, InvalidCursorIsFatal) {
    FakeTransport t;
    BilibiliApiClient client(t, testApi(), 20);
    EXPECT_THROW(client.fetchPage("k", kWindow, "abc"), FatalError);
    EXPECT_THROW(client.fetchPage("k", kWindow, "0"), FatalError);
}

TEST(BilibiliApiClient, InvertedWindowIsFatal) {
    FakeTransport t;
    BilibiliApiClient client(t, testApi(), 20);
    EXPECT_THROW(client.fetchPage("k", TimeWindow{10, 5}, kStartCursor), FatalError);
}

// ============================================================================
// Classification
// ============================================================================

TEST(BilibiliApiClient, NetworkFailureIsTransient) {
    FakeTransport t;
    t.failNetwork = true;
    BilibiliApiClient client(t, testApi(), 20);
    EXPECT_THROW(client.fetchPage("k", kWindow, kStartCursor), TransientError);
}

TEST(BilibiliApiClient, MalformedJsonIsTransient) {
    FakeTransport t;
    t.next.httpStatus = 200;
    t.next.body       = "<html>gateway</html>";
    BilibiliApiClient client(t, testApi(), 20);
    EXPECT_THROW(client.fetchPage("k", kWindow, kStartCursor), TransientError);
}

TEST(BilibiliApiClient, SchemaMismatchIsFatal) {
    FakeTransport t;
    t.respond(200, json{{"code", 0}, {"data", "nope"}});
    BilibiliApiClient client(t, testApi(), 20);
    EXPECT_THROW(client.fetchPage("k", kWindow, kStartCursor), FatalError);
}

TEST(ClassifyHttpStatus, MapsStatusToErrorKind) {
    EXPECT_THROW(BilibiliApiClient::throwForHttpStatus(429, ""), RateLimitedError);
    EXPECT_THROW(BilibiliApiClient::throwForHttpStatus(412, ""), RateLimitedError);
    EXPECT_THROW(BilibiliApiClient::throwForHttpStatus(503, ""), TransientError);
    EXPECT_THROW(BilibiliApiClient::throwForHttpStatus(500, ""), TransientError);
    EXPECT_THROW(BilibiliApiClient::throwForHttpStatus(401, ""), AuthError);
    EXPECT_THROW(BilibiliApiClient::throwForHttpStatus(403, ""), AuthError);
    EXPECT_THROW(BilibiliApiClient::throwForHttpStatus(404, ""), FatalError);
}

TEST(ClassifyHttpStatus, CarriesStatusCode) {
    try {
        BilibiliApiClient::throwForHttpStatus(503, "busy");
        FAIL() << "expected TransientError";
    } catch (const TransientError& e) {
        EXPECT_EQ(e.httpStatus(), 503u);
        EXPECT_NE(std::string(e.what()).find("busy"), std::string::npos);
    }
}

TEST(ClassifyApiCode, MapsCodeToErrorKind) {
    EXPECT_THROW(BilibiliApiClient::throwForApiCode(-412, "m"), RateLimitedError);
    EXPECT_THROW(BilibiliApiClient::throwForApiCode(-352, "m"), RateLimitedError);
    EXPECT_THROW(BilibiliApiClient::throwForApiCode(-503, "m"), TransientError);
    EXPECT_THROW(BilibiliApiClient::throwForApiCode(-101, "m"), AuthError);
    EXPECT_THROW(BilibiliApiClient::throwForApiCode(-400, "m"), FatalError);
}

TEST(BilibiliApiClient, NonZeroCodeInOkResponseIsClassified) {
    FakeTransport t;
    t.respond(200, json{{"code", -412}, {"message", "请求被拦截"}});
    BilibiliApiClient client(t, testApi(), 20);
    EXPECT_THROW(client.fetchPage("k", kWindow, kStartCursor), RateLimitedError);
}

TEST(BilibiliApiClient, HttpErrorStatusIsClassified) {
    FakeTransport t;
    t.next.httpStatus = 403;
    BilibiliApiClient client(t, testApi(), 20);
    EXPECT_THROW(client.fetchPage("k", kWindow, kStartCursor), AuthError);
}
