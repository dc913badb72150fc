#include "http_client.hpp"

namespace Burrow {
namespace Network {
namespace Http {

const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None:
            return "none";
        case ErrorType::Network:
            return "network";
        case ErrorType::Timeout:
            return "timeout";
        case ErrorType::Resource:
            return "resource";
        case ErrorType::Proxy:
            return "proxy";
        case ErrorType::Other:
            return "other";
    }
    return "other";
}

}  // namespace Http
}  // namespace Network
}  // namespace Burrow
