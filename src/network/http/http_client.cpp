#include "http_client.hpp"

namespace Harvest {
namespace Network {
namespace Http {

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None:
            return "none";
        case ErrorType::PrematureEof:
            return "premature end of stream";
        case ErrorType::SocketClosed:
            return "socket closed";
        case ErrorType::Rejected:
            return "executor rejected";
        case ErrorType::Network:
            return "network";
        case ErrorType::Timeout:
            return "timeout";
    }
    return "unknown";
}

}  // namespace Http
}  // namespace Network
}  // namespace Harvest
