#include "api_client.hpp"
#include "errors.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <iostream>
#include <stdexcept>

namespace bili_trends {

BilibiliApiClient::BilibiliApiClient(HttpTransport& transport,
                                     const ApiConfig& api,
                                     int pageSize,
                                     bool verbose)
    : mTransport(transport)
    , mPath(parseUrl(api.endpoint).target)
    , mPageSize(pageSize)
    , mVerbose(verbose)
{
    if (!api.userAgent.empty()) mHeaders.emplace_back("User-Agent", api.userAgent);
    if (!api.referer.empty())   mHeaders.emplace_back("Referer", api.referer);
    if (!api.cookie.empty())    mHeaders.emplace_back("Cookie", api.cookie);
    mHeaders.emplace_back("Accept-Language", "zh-CN,zh;q=0.9,en;q=0.8");
}

// ---------------------------------------------------------------------------
// Public: one page
// ---------------------------------------------------------------------------

PageResult BilibiliApiClient::fetchPage(const std::string& keyword,
                                        const TimeWindow&  window,
                                        const std::string& cursor)
{
    if (keyword.empty()) {
        throw FatalError("Empty keyword");
    }
    if (!window.valid()) {
        throw FatalError("Invalid time window: start after end");
    }

    const int page = pageFromCursor(cursor);
    const auto target = buildTarget(keyword, window, page);

    HttpTransport::Response resp;
    try {
        resp = mTransport.get(target, mHeaders);
    } catch (const std::runtime_error& e) {
        // Network / timeout.
        throw TransientError(std::string("Network error: ") + e.what());
    }

    if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
        throwForHttpStatus(resp.httpStatus, resp.body);
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw TransientError(std::string("Failed to parse JSON response: ") + e.what(),
                             resp.httpStatus);
    }

    if (!body.is_object()) {
        throw FatalError("Response body is not a JSON object", resp.httpStatus);
    }

    const int code = static_cast<int>(readInt(body, "code", -1));
    if (code != 0) {
        std::string message = "unknown error";
        auto it = body.find("message");
        if (it != body.end() && it->is_string()) message = it->get<std::string>();
        throwForApiCode(code, message);
    }

    SearchPage parsed;
    try {
        parsed = parseSearchPage(body);
    } catch (const std::runtime_error& e) {
        throw FatalError(std::string("Unexpected response schema: ") + e.what(),
                         resp.httpStatus);
    }

    if (mVerbose) {
        std::cerr << "[ApiClient] '" << keyword << "' page " << page << "/"
                  << parsed.numPages << ": " << parsed.records.size()
                  << " videos";
        if (parsed.skipped > 0) std::cerr << " (" << parsed.skipped << " without id)";
        std::cerr << "\n";
    }

    PageResult result;
    result.records       = std::move(parsed.records);
    result.reportedTotal = parsed.numResults;
    result.hasMore       = page < parsed.numPages;
    if (result.hasMore) {
        result.nextCursor = std::to_string(page + 1);
    }
    return result;
}

std::string BilibiliApiClient::buildTarget(const std::string& keyword,
                                           const TimeWindow&  window,
                                           int page) const
{
    std::string target = mPath;
    target += "?search_type=video";
    target += "&keyword=" + urlEncode(keyword);
    target += "&page=" + std::to_string(page);
    target += "&page_size=" + std::to_string(mPageSize);
    target += "&order=pubdate";
    target += "&pubtime_begin_s=" + std::to_string(window.start);
    target += "&pubtime_end_s=" + std::to_string(window.end);
    return target;
}

// ---------------------------------------------------------------------------
// Classification
// ---------------------------------------------------------------------------

void BilibiliApiClient::throwForHttpStatus(unsigned int status, const std::string& body)
{
    std::string msg = "HTTP " + std::to_string(status);
    if (!body.empty()) {
        msg += ": " + body.substr(0, 200);
    }

    // 412 is Bilibili's risk-control rejection of a too-frequent client.
    if (status == 429 || status == 412) throw RateLimitedError(msg, status);
    if (status >= 500)                  throw TransientError(msg, status);
    if (status == 401 || status == 403) throw AuthError(msg, status);
    throw FatalError(msg, status);
}

void BilibiliApiClient::throwForApiCode(int code, const std::string& message)
{
    const std::string msg = "API code " + std::to_string(code) + ": " + message;

    switch (code) {
        case -412:   // request intercepted
        case -509:   // too frequent
        case -352:   // risk control
        case -799:   // too frequent
            throw RateLimitedError(msg, 200, code);
        case -500:
        case -503:
        case -504:
            throw TransientError(msg, 200, code);
        case -101:   // not logged in
        case -111:   // csrf
        case -403:
            throw AuthError(msg, 200, code);
        default:
            throw FatalError(msg, 200, code);
    }
}

int BilibiliApiClient::pageFromCursor(const std::string& cursor)
{
    if (cursor.empty()) return 1;

    for (char c : cursor) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw FatalError("Invalid page cursor: " + cursor);
        }
    }
    int page = 0;
    try {
        page = std::stoi(cursor);
    } catch (const std::out_of_range&) {
        throw FatalError("Invalid page cursor: " + cursor);
    }
    if (page < 1) {
        throw FatalError("Invalid page cursor: " + cursor);
    }
    return page;
}

} // namespace bili_trends
