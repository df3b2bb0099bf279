#pragma once

#include <string>
#include <utility>
#include <vector>

namespace bili_trends {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/// One HTTP round trip.  Implementations throw std::runtime_error on
/// network / timeout failures and return any status the server sent.
class HttpTransport {
public:
    struct Response {
        unsigned int httpStatus = 0;
        std::string  body;
    };

    virtual ~HttpTransport() = default;

    /// GET @p target (path + query string) on the transport's host.
    virtual Response get(const std::string& target, const HttpHeaders& headers) = 0;
};

/// Low-level HTTP(S) client built on Boost.Beast.
class HttpClient : public HttpTransport {
public:
    /// @param baseUrl    Scheme + authority, e.g. "https://api.bilibili.com"
    ///                   (any path component is ignored)
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit HttpClient(const std::string& baseUrl, int timeoutMs = 10000);

    /// @throws std::runtime_error on network / timeout errors.
    Response get(const std::string& target, const HttpHeaders& headers) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mHost;
    std::string mPort;
    int         mTimeoutMs;
    bool        mVerbose = false;
    bool        mUseSsl  = false;

    Response doHttpRequest(const std::string& target, const HttpHeaders& headers);
    Response doHttpsRequest(const std::string& target, const HttpHeaders& headers);
};

} // namespace bili_trends
