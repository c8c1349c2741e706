#include "errors.hpp"

namespace Harvest {
namespace Core {

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::TransientBackend:
            return "transient-backend";
        case FailureKind::BackendUnavailable:
            return "backend-unavailable";
        case FailureKind::Connection:
            return "connection";
        case FailureKind::ContentRejected:
            return "content-rejected";
        case FailureKind::Timeout:
            return "timeout";
        case FailureKind::Unexpected:
            return "unexpected";
    }
    return "unknown";
}

void raise(const Failure& failure) {
    switch (failure.kind) {
        case FailureKind::BackendUnavailable:
            throw BackendUnavailableError(failure.message);
        case FailureKind::Connection:
            throw ConnectionError(failure.message);
        case FailureKind::ContentRejected:
            throw ContentRejectedError(failure.message);
        case FailureKind::TransientBackend:
        case FailureKind::Timeout:
        case FailureKind::Unexpected:
            throw CrawlError(failure.kind, failure.message);
    }
    throw CrawlError(failure.kind, failure.message);
}

}  // namespace Core
}  // namespace Harvest
