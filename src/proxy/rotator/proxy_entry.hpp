#pragma once
#include <cstdint>
#include <string>

namespace Trawl {
namespace Proxy {

struct ProxyEntry {
    std::string   host;
    std::uint16_t port = 0;
    std::string   username;
    std::string   password;

    // "http://host:port"; credentials travel separately.
    std::string url() const {
        return "http://" + host + ":" + std::to_string(port);
    }

    // Log-safe form, password masked.
    std::string display() const {
        std::string out = host + ":" + std::to_string(port);
        if (!username.empty())
            out = username + ":***@" + out;
        return out;
    }

    bool operator==(const ProxyEntry& other) const {
        return host == other.host && port == other.port && username == other.username
               && password == other.password;
    }
    bool operator!=(const ProxyEntry& other) const {
        return !(*this == other);
    }
};

}  // namespace Proxy
}  // namespace Trawl
