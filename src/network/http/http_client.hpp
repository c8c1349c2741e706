#pragma once

#include <functional>
#include <stop_token>
#include <string>

namespace Harvest {
namespace Network {
namespace Http {

// Transport level outcome of a call. Anything but None means no HTTP
// response was read.
enum class ErrorType {
    None,
    PrematureEof,  // peer dropped the connection mid exchange
    SocketClosed,  // closed locally, usually a cancellation
    Rejected,      // client no longer accepts work
    Network,
    Timeout
};

enum class HTTPCode {
    Ok                 = 200,
    BadGateway         = 502,
    ServiceUnavailable = 503,
    GatewayTimeout     = 504
};

const char* to_string(ErrorType type);

struct Request {
    std::string method = "POST";
    std::string target;
    std::string content_type = "application/json";
    std::string body;
};

struct Response {
    long        status_code = 0;
    std::string content_type;
    std::string body;
    bool        has_body   = false;
    std::string error;
    ErrorType   error_type = ErrorType::None;

    bool transport_failed() const {
        return error_type != ErrorType::None;
    }
};

class HttpClient {
public:
    using Handler = std::function<void(Response)>;

    virtual ~HttpClient() = default;

    // Starts the call and returns immediately. The handler runs exactly once,
    // on a client thread, or inline when the call is rejected. A stop request
    // on the token aborts the call.
    virtual void send(Request request, std::stop_token stop, Handler handler) = 0;

    virtual int  running_calls_count() const = 0;
    virtual void shutdown()                  = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Harvest
