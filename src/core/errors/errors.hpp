#pragma once
#include <stdexcept>
#include <string>

namespace Harvest {
namespace Core {

// Every way a single render attempt, or a whole domain crawl, can end badly.
enum class FailureKind {
    TransientBackend,    // 502/503 or premature end of stream, retried
    BackendUnavailable,  // retry budget exhausted
    Connection,          // socket level failure or missing response body
    ContentRejected,     // document language not accepted
    Timeout,             // backend side render timeout (504)
    Unexpected           // anything else, isolated to the attempt
};

const char* to_string(FailureKind kind);

struct Failure {
    FailureKind kind = FailureKind::Unexpected;
    std::string message;
};

class CrawlError : public std::runtime_error {
public:
    CrawlError(FailureKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {
    }

    FailureKind kind() const noexcept {
        return kind_;
    }

private:
    FailureKind kind_;
};

class BackendUnavailableError : public CrawlError {
public:
    explicit BackendUnavailableError(const std::string& message)
        : CrawlError(FailureKind::BackendUnavailable, message) {
    }
};

class ConnectionError : public CrawlError {
public:
    explicit ConnectionError(const std::string& message)
        : CrawlError(FailureKind::Connection, message) {
    }
};

class ContentRejectedError : public CrawlError {
public:
    explicit ContentRejectedError(const std::string& message)
        : CrawlError(FailureKind::ContentRejected, message) {
    }
};

class TooManyConnectionFailures : public std::runtime_error {
public:
    explicit TooManyConnectionFailures(int count)
        : std::runtime_error("Too many connection failures in a row ("
                             + std::to_string(count) + ")") {
    }
};

// Rebuilds the exception matching a recorded failure.
[[noreturn]] void raise(const Failure& failure);

}  // namespace Core
}  // namespace Harvest
