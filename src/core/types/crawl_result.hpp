#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../../proxy/rotator/proxy_entry.hpp"

namespace Trawl {
namespace Core {

// One successfully fetched and admitted page.
struct CrawlResult {
    std::string                      url;
    int                              depth = 0;
    std::optional<std::string>       parent_url;
    std::string                      content;
    std::vector<std::string>         links;  // Absolute, fragment-free, page order
    std::string                      content_type;
    std::optional<Proxy::ProxyEntry> fetched_via_proxy;  // Empty for direct fetches
};

}  // namespace Core
}  // namespace Trawl
