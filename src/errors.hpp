#pragma once

#include <stdexcept>
#include <string>

namespace bili_trends {

/// Base of every failure reported by an ApiClient.
class ApiError : public std::runtime_error {
public:
    ApiError(const std::string& what, unsigned int httpStatus = 0, int apiCode = 0)
        : std::runtime_error(what)
        , mHttpStatus(httpStatus)
        , mApiCode(apiCode) {}

    unsigned int httpStatus() const { return mHttpStatus; }
    int          apiCode()    const { return mApiCode; }

private:
    unsigned int mHttpStatus;
    int          mApiCode;
};

/// Network failure, HTTP 5xx or a malformed body: retry with backoff.
class TransientError : public ApiError {
public:
    using ApiError::ApiError;
};

/// HTTP 429 or an API throttle code: retry with a longer backoff.
class RateLimitedError : public ApiError {
public:
    using ApiError::ApiError;
};

/// Credentials rejected: never retried.
class AuthError : public ApiError {
public:
    using ApiError::ApiError;
};

/// Anything else the client cannot recover from: never retried.
class FatalError : public ApiError {
public:
    using ApiError::ApiError;
};

/// The merged collection is empty; nothing can be analysed.
class EmptyDatasetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid or unreadable configuration.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace bili_trends
