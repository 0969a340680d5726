#pragma once
#include <optional>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace YAML {
class Node;
}

namespace Trawl {
namespace Core {

// Everything one crawl run needs, merged from the YAML file and the command
// line (command line wins). The key set is closed: an unknown YAML key is a
// ConfigurationError.
struct SiteConfig {
    std::string              seed_url;
    std::string              site_domain;  // Derived from the seed host when empty
    std::vector<std::string> url_patterns;
    int                      max_pages = 0;
    int                      max_depth = Constants::DEFAULT_DEPTH;
    std::string              mode      = "bfs";

    std::vector<std::string> keywords;
    double                   keyword_weight = Constants::DEFAULT_KEYWORD_WEIGHT;
    std::vector<std::string> allowed_content_types = {Constants::DEFAULT_CONTENT_TYPE};

    int  concurrency       = Constants::DEFAULT_CONCURRENCY;
    int  max_retries       = Constants::DEFAULT_MAX_RETRIES;
    int  retry_backoff_ms  = Constants::DEFAULT_RETRY_BACKOFF_MS;
    long request_timeout_s = Constants::REQUEST_TIMEOUT_SECONDS;

    std::string proxies_file;
    bool        require_proxies = true;

    std::string output_dir = Constants::DEFAULT_OUTPUT_DIR;
    std::string jsonl_output;
    std::string log_level = "info";

    std::string config_path;

    static SiteConfig parse(int argc, char* argv[]);

    static SiteConfig load_file(const std::string& path);
    static void       apply_yaml(SiteConfig& config, const YAML::Node& yaml);

    // Fills derived fields and rejects invalid shapes with ConfigurationError.
    void validate();

    // proxies_file, else $PROXIES_FILE, else empty.
    std::optional<std::string> resolve_proxies_file() const;
};

}  // namespace Core
}  // namespace Trawl
