#include "config_builder.hpp"

namespace Trawl {
namespace Engine {

CrawlerConfig build_crawler_config(const Core::SiteConfig& site, std::vector<Proxy::ProxyEntry> proxies) {
    CrawlerConfig config;

    config.filters.allowed_domains = {site.site_domain};
    config.filters.url_patterns    = site.url_patterns;
    config.filters.allowed_content_types =
        std::set<std::string>(site.allowed_content_types.begin(), site.allowed_content_types.end());

    if (!site.keywords.empty()) {
        ScoreSpec spec;
        spec.keywords  = std::set<std::string>(site.keywords.begin(), site.keywords.end());
        spec.weight    = site.keyword_weight;
        config.scoring = spec;
    }

    config.mode            = parse_crawl_mode(site.mode);
    config.max_depth       = site.max_depth;
    config.max_pages       = site.max_pages;
    config.concurrency     = site.concurrency;
    config.max_retries     = site.max_retries;
    config.retry_backoff   = std::chrono::milliseconds(site.retry_backoff_ms);
    config.proxies         = std::move(proxies);
    config.require_proxies = site.require_proxies;
    return config;
}

}  // namespace Engine
}  // namespace Trawl
