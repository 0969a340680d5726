#include "fetcher.hpp"

namespace Trawl {
namespace Network {
namespace Http {

std::string to_string(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::None: return "none";
        case FetchErrorKind::Network: return "network";
        case FetchErrorKind::Proxy: return "proxy";
        case FetchErrorKind::Timeout: return "timeout";
        case FetchErrorKind::HttpStatus: return "http_status";
        case FetchErrorKind::Cancelled: return "cancelled";
        case FetchErrorKind::Other: return "other";
    }
    return "other";
}

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
