#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"
#include "../../src/core/errors/errors.hpp"
#include "../../src/engine/crawler/config_builder.hpp"

using namespace Trawl::Core;

namespace {

void write_file(const std::string& path, const std::string& content) {
    std::ofstream ofs(path);
    ofs << content;
}

SiteConfig parse_args(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(arg.data());
    return SiteConfig::parse(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv(Constants::PROXIES_FILE_ENV);
    }

    void TearDown() override {
        unsetenv(Constants::PROXIES_FILE_ENV);
        std::remove("test_site.yaml");
    }
};

TEST_F(ConfigTest, YamlLoading) {
    write_file("test_site.yaml", R"(
        site_domain: example.com
        url_patterns:
          - "*news*"
          - "*blog*"
        max_pages: 40
        max_depth: 4
        mode: best_first
        keywords: [rust, async]
        keyword_weight: 0.5
        allowed_content_types: ["text/html", "application/xhtml+xml"]
        concurrency: 8
        max_retries: 1
        retry_backoff_ms: 250
        request_timeout_s: 20
        proxies_file: proxies.txt
        require_proxies: true
        output_dir: pages
        jsonl_output: pages.jsonl
        log_level: debug
    )");

    SiteConfig config = SiteConfig::load_file("test_site.yaml");
    EXPECT_EQ(config.site_domain, "example.com");
    ASSERT_EQ(config.url_patterns.size(), 2u);
    EXPECT_EQ(config.url_patterns[1], "*blog*");
    EXPECT_EQ(config.max_pages, 40);
    EXPECT_EQ(config.max_depth, 4);
    EXPECT_EQ(config.mode, "best_first");
    EXPECT_EQ(config.keywords.size(), 2u);
    EXPECT_DOUBLE_EQ(config.keyword_weight, 0.5);
    EXPECT_EQ(config.allowed_content_types.size(), 2u);
    EXPECT_EQ(config.concurrency, 8);
    EXPECT_EQ(config.max_retries, 1);
    EXPECT_EQ(config.retry_backoff_ms, 250);
    EXPECT_EQ(config.request_timeout_s, 20);
    EXPECT_EQ(config.proxies_file, "proxies.txt");
    EXPECT_EQ(config.output_dir, "pages");
    EXPECT_EQ(config.jsonl_output, "pages.jsonl");
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(ConfigTest, DefaultsForOptionalKeys) {
    write_file("test_site.yaml", "site_domain: example.com\nurl_patterns: '*'\nmax_pages: 3\n");

    SiteConfig config = SiteConfig::load_file("test_site.yaml");
    ASSERT_EQ(config.url_patterns.size(), 1u);
    EXPECT_EQ(config.max_depth, Constants::DEFAULT_DEPTH);
    EXPECT_EQ(config.mode, "bfs");
    EXPECT_EQ(config.concurrency, Constants::DEFAULT_CONCURRENCY);
    EXPECT_EQ(config.max_retries, Constants::DEFAULT_MAX_RETRIES);
    EXPECT_TRUE(config.require_proxies);
    ASSERT_EQ(config.allowed_content_types.size(), 1u);
    EXPECT_EQ(config.allowed_content_types[0], "text/html");
}

TEST_F(ConfigTest, JsonDocumentAccepted) {
    write_file("test_site.yaml",
               R"({"site_domain": "example.com", "url_patterns": ["*"], "max_pages": 2})");
    EXPECT_EQ(SiteConfig::load_file("test_site.yaml").max_pages, 2);
}

TEST_F(ConfigTest, UnknownKeyRejected) {
    write_file("test_site.yaml",
               "site_domain: example.com\nurl_patterns: ['*']\nmax_pages: 3\nthreads: 9\n");
    try {
        SiteConfig::load_file("test_site.yaml");
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("threads"), std::string::npos);
    }
}

TEST_F(ConfigTest, MissingRequiredKeys) {
    write_file("test_site.yaml", "site_domain: example.com\nmax_pages: 3\n");
    EXPECT_THROW(SiteConfig::load_file("test_site.yaml"), ConfigurationError);

    write_file("test_site.yaml", "url_patterns: ['*']\nmax_pages: 3\n");
    EXPECT_THROW(SiteConfig::load_file("test_site.yaml"), ConfigurationError);

    write_file("test_site.yaml", "site_domain: example.com\nurl_patterns: ['*']\n");
    EXPECT_THROW(SiteConfig::load_file("test_site.yaml"), ConfigurationError);
}

TEST_F(ConfigTest, WrongValueTypesRejected) {
    write_file("test_site.yaml", "site_domain: example.com\nurl_patterns: ['*']\nmax_pages: many\n");
    EXPECT_THROW(SiteConfig::load_file("test_site.yaml"), ConfigurationError);

    write_file("test_site.yaml", "site_domain: example.com\nurl_patterns: {a: b}\nmax_pages: 1\n");
    EXPECT_THROW(SiteConfig::load_file("test_site.yaml"), ConfigurationError);

    write_file("test_site.yaml", "- just\n- a list\n");
    EXPECT_THROW(SiteConfig::load_file("test_site.yaml"), ConfigurationError);
}

TEST_F(ConfigTest, MissingFileRejected) {
    EXPECT_THROW(SiteConfig::load_file("does_not_exist.yaml"), ConfigurationError);
}

TEST_F(ConfigTest, CommandLineOnly) {
    SiteConfig config = parse_args({"trawl", "https://News.Example.com/start", "--max-pages", "5",
                                    "--pattern", "*news*", "--pattern", "*blog*", "-k", "rust",
                                    "--mode", "best_first", "--no-proxies"});
    EXPECT_EQ(config.seed_url, "https://News.Example.com/start");
    EXPECT_EQ(config.site_domain, "news.example.com");
    EXPECT_EQ(config.max_pages, 5);
    EXPECT_EQ(config.url_patterns.size(), 2u);
    EXPECT_EQ(config.keywords.size(), 1u);
    EXPECT_EQ(config.mode, "best_first");
    EXPECT_FALSE(config.require_proxies);
}

TEST_F(ConfigTest, CliOverridesYaml) {
    write_file("test_site.yaml",
               "site_domain: example.com\nurl_patterns: ['*news*']\nmax_pages: 40\n"
               "max_depth: 5\nconcurrency: 3\nrequire_proxies: false\n");

    SiteConfig config = parse_args({"trawl", "https://example.com/", "--config", "test_site.yaml",
                                    "--max-pages", "7", "--depth", "1"});
    EXPECT_EQ(config.max_pages, 7);
    EXPECT_EQ(config.max_depth, 1);
    EXPECT_EQ(config.concurrency, 3);
    ASSERT_EQ(config.url_patterns.size(), 1u);
    EXPECT_EQ(config.url_patterns[0], "*news*");
    EXPECT_EQ(config.site_domain, "example.com");
    EXPECT_EQ(config.config_path, "test_site.yaml");
}

TEST_F(ConfigTest, ValidateRejectsBadShapes) {
    SiteConfig config;
    config.seed_url        = "https://example.com/";
    config.max_pages       = 10;
    config.require_proxies = false;
    EXPECT_NO_THROW(config.validate());

    SiteConfig bad = config;
    bad.max_pages  = 0;
    EXPECT_THROW(bad.validate(), ConfigurationError);

    bad                = config;
    bad.keyword_weight = 1.2;
    EXPECT_THROW(bad.validate(), ConfigurationError);

    bad             = config;
    bad.concurrency = 0;
    EXPECT_THROW(bad.validate(), ConfigurationError);

    bad          = config;
    bad.seed_url = "ftp://example.com/";
    EXPECT_THROW(bad.validate(), ConfigurationError);

    bad                 = config;
    bad.require_proxies = true;
    EXPECT_THROW(bad.validate(), ConfigurationError);

    bad             = config;
    bad.max_retries = Constants::MAX_RETRIES + 1;
    EXPECT_THROW(bad.validate(), ConfigurationError);

    bad             = config;
    bad.max_retries = Constants::MAX_RETRIES;
    EXPECT_NO_THROW(bad.validate());
}

TEST(BackoffTest, DoublesPerAttempt) {
    using std::chrono::milliseconds;
    EXPECT_EQ(get_backoff_time(0, milliseconds(500)), milliseconds(0));
    EXPECT_EQ(get_backoff_time(1, milliseconds(500)), milliseconds(500));
    EXPECT_EQ(get_backoff_time(2, milliseconds(500)), milliseconds(1000));
    EXPECT_EQ(get_backoff_time(4, milliseconds(500)), milliseconds(4000));
    EXPECT_EQ(get_backoff_time(3, milliseconds(0)), milliseconds(0));
}

TEST(BackoffTest, ClampedToCeiling) {
    using std::chrono::milliseconds;
    const milliseconds ceiling(Constants::MAX_RETRY_BACKOFF_MS);
    EXPECT_EQ(get_backoff_time(Constants::MAX_RETRIES, milliseconds(500)), ceiling);
    for (int attempt : {20, 31, 32, 33, 64, 1000}) {
        milliseconds wait = get_backoff_time(attempt, milliseconds(500));
        EXPECT_GT(wait.count(), 0) << "attempt " << attempt;
        EXPECT_LE(wait, ceiling) << "attempt " << attempt;
    }
    EXPECT_EQ(get_backoff_time(1, milliseconds(10 * 60 * 1000)), ceiling);
}

TEST_F(ConfigTest, ProxiesFileFallsBackToEnvironment) {
    SiteConfig config;
    EXPECT_FALSE(config.resolve_proxies_file().has_value());

    setenv(Constants::PROXIES_FILE_ENV, "/etc/trawl/proxies.txt", 1);
    ASSERT_TRUE(config.resolve_proxies_file().has_value());
    EXPECT_EQ(*config.resolve_proxies_file(), "/etc/trawl/proxies.txt");

    config.proxies_file = "local.txt";
    EXPECT_EQ(*config.resolve_proxies_file(), "local.txt");

    SiteConfig required;
    required.seed_url  = "https://example.com/";
    required.max_pages = 1;
    EXPECT_NO_THROW(required.validate());
}

TEST_F(ConfigTest, BuildsCrawlerConfig) {
    SiteConfig site;
    site.seed_url              = "https://example.com/";
    site.site_domain           = "example.com";
    site.url_patterns          = {"*news*"};
    site.max_pages             = 12;
    site.max_depth             = 3;
    site.mode                  = "best_first";
    site.keywords              = {"rust", "async"};
    site.keyword_weight        = 0.4;
    site.allowed_content_types = {"text/html", "text/plain"};
    site.retry_backoff_ms      = 100;
    site.require_proxies       = false;

    auto cfg = Trawl::Engine::build_crawler_config(site, {});
    EXPECT_EQ(cfg.filters.allowed_domains.count("example.com"), 1u);
    EXPECT_EQ(cfg.filters.url_patterns.size(), 1u);
    EXPECT_EQ(cfg.filters.allowed_content_types.size(), 2u);
    ASSERT_TRUE(cfg.scoring.has_value());
    EXPECT_EQ(cfg.scoring->keywords.size(), 2u);
    EXPECT_DOUBLE_EQ(cfg.scoring->weight, 0.4);
    EXPECT_EQ(cfg.mode, Trawl::Engine::CrawlMode::BestFirst);
    EXPECT_EQ(cfg.max_pages, 12);
    EXPECT_EQ(cfg.retry_backoff.count(), 100);
    EXPECT_FALSE(cfg.require_proxies);

    site.keywords.clear();
    site.mode = "bfs";
    EXPECT_FALSE(Trawl::Engine::build_crawler_config(site, {}).scoring.has_value());

    site.mode = "dfs";
    EXPECT_THROW(Trawl::Engine::build_crawler_config(site, {}), ConfigurationError);
}
