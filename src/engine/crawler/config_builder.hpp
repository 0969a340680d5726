#pragma once
#include <vector>
#include "../../core/config/config.hpp"
#include "crawl_engine.hpp"

namespace Trawl {
namespace Engine {

// Maps a validated SiteConfig onto the engine's session configuration.
// Keywords switch scoring on; best-first mode without them is left for
// CrawlEngine::start() to reject.
CrawlerConfig build_crawler_config(const Core::SiteConfig& site, std::vector<Proxy::ProxyEntry> proxies);

}  // namespace Engine
}  // namespace Trawl
