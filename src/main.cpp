#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <curl/curl.h>
#include <memory>
#include <thread>

#include "core/config/config.hpp"
#include "core/errors/errors.hpp"
#include "core/logger/logger.hpp"
#include "engine/crawler/config_builder.hpp"
#include "engine/crawler/crawl_engine.hpp"
#include "network/http/curl_fetcher.hpp"
#include "proxy/rotator/proxy_list.hpp"
#include "storage/jsonl_sink.hpp"
#include "storage/markdown_sink.hpp"

using namespace Trawl;
using Trawl::Core::Logger;

namespace {

std::unique_ptr<Storage::FanoutSink> make_sinks(const Core::SiteConfig& config) {
    auto sinks = std::make_unique<Storage::FanoutSink>();
    if (!config.output_dir.empty())
        sinks->add(std::make_unique<Storage::MarkdownSink>(config.output_dir));
    if (!config.jsonl_output.empty())
        sinks->add(std::make_unique<Storage::JsonLinesSink>(config.jsonl_output));
    return sinks;
}

int exit_code(Engine::CrawlState state) {
    switch (state) {
        case Engine::CrawlState::Completed:
        case Engine::CrawlState::BudgetExhausted:
            return 0;
        case Engine::CrawlState::Cancelled:
            return 130;
        default:
            return 1;
    }
}

int run_crawler(const Core::SiteConfig& config) {
    std::vector<Proxy::ProxyEntry> proxies;
    if (auto path = config.resolve_proxies_file())
        proxies = Proxy::ProxyList::load_file(*path);

    Network::Http::CurlFetcher::Options options;
    options.timeout_seconds = config.request_timeout_s;
    auto fetcher            = std::make_shared<Network::Http::CurlFetcher>(options);

    Engine::CrawlEngine engine(Engine::build_crawler_config(config, std::move(proxies)), fetcher);
    auto                sinks = make_sinks(config);

    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&engine](const boost::system::error_code& ec, int) {
        if (ec)
            return;
        Logger::warn("Interrupted, cancelling crawl");
        engine.cancel();
    });
    std::thread signal_thread([&signal_ioc]() { signal_ioc.run(); });

    Engine::CrawlState state = Engine::CrawlState::Failed;
    try {
        state = engine.run(config.seed_url, *sinks);
    } catch (...) {
        signal_ioc.stop();
        signal_thread.join();
        throw;
    }

    signal_ioc.stop();
    signal_thread.join();

    Engine::CrawlStats stats = engine.stats();
    Logger::info("Done: " + Engine::to_string(state) + ", " + std::to_string(stats.pages_fetched)
                 + " pages, " + std::to_string(stats.urls_seen) + " URLs seen");
    return exit_code(state);
}

}  // namespace

int main(int argc, char* argv[]) {
    curl_global_init(CURL_GLOBAL_ALL);

    int code = 1;
    try {
        Core::SiteConfig config = Core::SiteConfig::parse(argc, argv);
        Logger::set_level(Logger::parse_level(config.log_level));
        code = run_crawler(config);
    } catch (const Core::ConfigurationError& e) {
        Logger::error("Configuration error: " + std::string(e.what()));
        code = 2;
    } catch (const std::exception& e) {
        Logger::error("Fatal: " + std::string(e.what()));
        code = 1;
    }

    curl_global_cleanup();
    return code;
}
