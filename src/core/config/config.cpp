#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <set>
#include <yaml-cpp/yaml.h>

#include "../../utils/url/url.hpp"
#include "../errors/errors.hpp"

namespace Trawl {
namespace Core {

namespace {

const std::set<std::string> KNOWN_KEYS = {
    "site_domain",      "url_patterns",      "max_pages",    "max_depth",
    "mode",             "keywords",          "keyword_weight", "allowed_content_types",
    "concurrency",      "max_retries",       "retry_backoff_ms", "request_timeout_s",
    "proxies_file",     "require_proxies",   "output_dir",   "jsonl_output",
    "log_level"};

std::vector<std::string> as_string_list(const YAML::Node& node, const std::string& key) {
    std::vector<std::string> out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    if (!node.IsSequence())
        throw ConfigurationError("'" + key + "' must be a string or a list of strings");
    for (const auto& item : node)
        out.push_back(item.as<std::string>());
    return out;
}

}  // namespace

void SiteConfig::apply_yaml(SiteConfig& config, const YAML::Node& yaml) {
    if (!yaml.IsMap())
        throw ConfigurationError("Site configuration must be a mapping");

    for (auto it = yaml.begin(); it != yaml.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (KNOWN_KEYS.find(key) == KNOWN_KEYS.end())
            throw ConfigurationError("Unknown configuration key: '" + key + "'");
    }

    if (!yaml["site_domain"])
        throw ConfigurationError("Missing required key: 'site_domain'");
    if (!yaml["url_patterns"])
        throw ConfigurationError("Missing required key: 'url_patterns'");
    if (!yaml["max_pages"])
        throw ConfigurationError("Missing required key: 'max_pages'");

    try {
        config.site_domain  = yaml["site_domain"].as<std::string>();
        config.url_patterns = as_string_list(yaml["url_patterns"], "url_patterns");
        config.max_pages    = yaml["max_pages"].as<int>();

        if (yaml["max_depth"])
            config.max_depth = yaml["max_depth"].as<int>();
        if (yaml["mode"])
            config.mode = yaml["mode"].as<std::string>();
        if (yaml["keywords"])
            config.keywords = as_string_list(yaml["keywords"], "keywords");
        if (yaml["keyword_weight"])
            config.keyword_weight = yaml["keyword_weight"].as<double>();
        if (yaml["allowed_content_types"])
            config.allowed_content_types =
                as_string_list(yaml["allowed_content_types"], "allowed_content_types");
        if (yaml["concurrency"])
            config.concurrency = yaml["concurrency"].as<int>();
        if (yaml["max_retries"])
            config.max_retries = yaml["max_retries"].as<int>();
        if (yaml["retry_backoff_ms"])
            config.retry_backoff_ms = yaml["retry_backoff_ms"].as<int>();
        if (yaml["request_timeout_s"])
            config.request_timeout_s = yaml["request_timeout_s"].as<long>();
        if (yaml["proxies_file"])
            config.proxies_file = yaml["proxies_file"].as<std::string>();
        if (yaml["require_proxies"])
            config.require_proxies = yaml["require_proxies"].as<bool>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["jsonl_output"])
            config.jsonl_output = yaml["jsonl_output"].as<std::string>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid configuration value: " + std::string(e.what()));
    }
}

SiteConfig SiteConfig::load_file(const std::string& path) {
    SiteConfig config;
    YAML::Node yaml;
    try {
        yaml = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Error parsing config file " + path + ": " + std::string(e.what()));
    }
    apply_yaml(config, yaml);
    config.config_path = path;
    return config;
}

SiteConfig SiteConfig::parse(int argc, char* argv[]) {
    SiteConfig config;
    CLI::App   app{"Trawl - Scoped, polite web crawler"};

    bool no_proxies = false;

    app.add_option("seed", config.seed_url, "Seed URL to crawl")->required();
    app.add_option("-c,--config", config.config_path, "Path to YAML site configuration");
    app.add_option("--domain", config.site_domain, "Allowed site domain (subdomains included)");
    app.add_option("--pattern", config.url_patterns, "URL glob pattern (repeatable)");
    app.add_option("-n,--max-pages", config.max_pages, "Page budget");
    app.add_option("-d,--depth", config.max_depth, "Maximum link depth");
    app.add_option("-m,--mode", config.mode, "Traversal mode: bfs or best_first");
    app.add_option("-k,--keyword", config.keywords, "Relevance keyword (repeatable)");
    app.add_option("--weight", config.keyword_weight, "Keyword weight in [0, 1]");
    app.add_option("--content-type", config.allowed_content_types, "Allowed content type (repeatable)");
    app.add_option("-t,--concurrency", config.concurrency, "Concurrent fetches");
    app.add_option("-r,--retries", config.max_retries, "Retries per URL");
    app.add_option("--backoff", config.retry_backoff_ms, "Retry backoff base in milliseconds");
    app.add_option("--timeout", config.request_timeout_s, "Request timeout in seconds");
    app.add_option("--proxy-list", config.proxies_file, "File of ip:port:username:password records");
    app.add_flag("--no-proxies", no_proxies, "Fetch directly when no proxy list is given");
    app.add_option("-o,--output", config.output_dir, "Markdown output directory");
    app.add_option("--jsonl", config.jsonl_output, "Append results to this JSON Lines file");
    app.add_option("--log-level", config.log_level, "debug, info, warn, error or quiet");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        SiteConfig file_config   = load_file(config.config_path);
        std::string seed         = config.seed_url;
        config                   = file_config;
        config.seed_url          = seed;

        // Second pass: command-line values override the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (no_proxies)
        config.require_proxies = false;

    config.validate();
    return config;
}

void SiteConfig::validate() {
    if (seed_url.empty())
        throw ConfigurationError("A seed URL is required");
    if (!Utils::Url::is_http(seed_url))
        throw ConfigurationError("Seed must be an absolute http(s) URL: '" + seed_url + "'");

    if (site_domain.empty())
        site_domain = Utils::Url::host_of(seed_url);
    if (site_domain.empty())
        throw ConfigurationError("Cannot derive site_domain from seed '" + seed_url + "'");

    if (max_pages <= 0)
        throw ConfigurationError("max_pages must be positive, got " + std::to_string(max_pages));
    if (max_depth < 0)
        throw ConfigurationError("max_depth must not be negative");
    if (concurrency <= 0)
        throw ConfigurationError("concurrency must be positive");
    if (max_retries < 0 || max_retries > Constants::MAX_RETRIES)
        throw ConfigurationError("max_retries must be within [0, " + std::to_string(Constants::MAX_RETRIES)
                                 + "], got " + std::to_string(max_retries));
    if (retry_backoff_ms < 0)
        throw ConfigurationError("retry_backoff_ms must not be negative");
    if (request_timeout_s <= 0)
        throw ConfigurationError("request_timeout_s must be positive");
    if (keyword_weight < 0.0 || keyword_weight > 1.0)
        throw ConfigurationError("keyword_weight must be within [0, 1]");

    if (require_proxies && !resolve_proxies_file())
        throw ConfigurationError("A proxy list is required: set proxies_file, --proxy-list or "
                                 + std::string(Constants::PROXIES_FILE_ENV));
}

std::optional<std::string> SiteConfig::resolve_proxies_file() const {
    if (!proxies_file.empty())
        return proxies_file;
    const char* env = std::getenv(Constants::PROXIES_FILE_ENV);
    if (env && *env)
        return std::string(env);
    return std::nullopt;
}

}  // namespace Core
}  // namespace Trawl
