#pragma once

#include "config.hpp"
#include "http_client.hpp"
#include "models.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bili_trends {

/// One page of search results for a (keyword, window) query.
struct PageResult {
    std::vector<RawRecord> records;
    bool                   hasMore = false;
    std::string            nextCursor;
    int64_t                reportedTotal = 0;
};

/// Cursor value that addresses the first page of any query.
inline const std::string kStartCursor;

/// Issues a single paginated query.  Implementations never retry; failures
/// are reported as TransientError / RateLimitedError / AuthError / FatalError.
class ApiClient {
public:
    virtual ~ApiClient() = default;

    virtual PageResult fetchPage(const std::string& keyword,
                                 const TimeWindow&  window,
                                 const std::string& cursor) = 0;
};

/// Bilibili `x/web-interface/search/type` video search.
/// The cursor is the 1-based page number rendered as a string.
class BilibiliApiClient : public ApiClient {
public:
    BilibiliApiClient(HttpTransport& transport,
                      const ApiConfig& api,
                      int pageSize,
                      bool verbose = false);

    PageResult fetchPage(const std::string& keyword,
                         const TimeWindow&  window,
                         const std::string& cursor) override;

    /// Request target (path + query) for one page.
    std::string buildTarget(const std::string& keyword,
                            const TimeWindow&  window,
                            int page) const;

    /// Throw the ApiError subclass matching an HTTP status outside 2xx.
    [[noreturn]] static void throwForHttpStatus(unsigned int status, const std::string& body);

    /// Throw the ApiError subclass matching a non-zero API `code`.
    [[noreturn]] static void throwForApiCode(int code, const std::string& message);

private:
    HttpTransport& mTransport;
    std::string    mPath;
    HttpHeaders    mHeaders;
    int            mPageSize;
    bool           mVerbose;

    static int pageFromCursor(const std::string& cursor);
};

} // namespace bili_trends
