#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "../../../core/errors/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../../../utils/url/url.hpp"
#include "../crawl_engine.hpp"

namespace Trawl {
namespace Engine {

using Trawl::Utils::Url;

void CrawlEngine::validate(const std::string& seed_url) const {
    if (config_.max_pages <= 0)
        throw ConfigurationError("max_pages must be positive, got "
                                 + std::to_string(config_.max_pages));
    if (config_.max_depth < 0)
        throw ConfigurationError("max_depth must not be negative");
    if (config_.concurrency <= 0)
        throw ConfigurationError("concurrency must be positive");
    if (config_.max_retries < 0 || config_.max_retries > Constants::MAX_RETRIES)
        throw ConfigurationError("max_retries must be within [0, " + std::to_string(Constants::MAX_RETRIES)
                                 + "]");
    if (config_.retry_backoff.count() < 0)
        throw ConfigurationError("retry_backoff must not be negative");
    if (config_.filters.allowed_domains.empty())
        throw ConfigurationError("At least one allowed domain is required");
    if (!fetcher_)
        throw NotConfiguredError("No fetcher configured");
    if (!Url::is_http(seed_url) || Url::host_of(seed_url).empty())
        throw ConfigurationError("Seed must be an absolute http(s) URL: '" + seed_url + "'");
    if (config_.mode == CrawlMode::BestFirst && !config_.scoring)
        throw NotConfiguredError("Best-first crawling needs a relevance scorer (keywords)");
}

std::unique_ptr<CrawlEngine::Session> CrawlEngine::build_session() const {
    auto session      = std::make_unique<Session>();
    session->filters  = FilterChain(config_.filters);
    session->frontier = make_frontier(config_.mode, config_.max_depth);

    if (config_.scoring)
        session->scorer = std::make_unique<RelevanceScorer>(*config_.scoring);

    if (config_.require_proxies || !config_.proxies.empty())
        session->rotator = std::make_unique<Proxy::ProxyRotator>(config_.proxies);

    return session;
}

void CrawlEngine::start(const std::string& seed_url) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CrawlState::Idle)
        throw EngineStateError("Crawl engine can only start once (state " + to_string(state_) + ")");

    try {
        validate(seed_url);
        session_ = build_session();
    } catch (const ConfigurationError& e) {
        session_.reset();
        finish(CrawlState::Failed);
        Logger::error("Crawl configuration rejected: " + std::string(e.what()));
        throw;
    }

    // Operator-supplied seed: no domain or pattern admission.
    session_->frontier->push(seed_url, 0);
    state_ = CrawlState::Running;

    Logger::info("Crawler: Starting " + to_string(config_.mode) + " crawl of " + seed_url);
    Logger::info("Crawler: max_pages=" + std::to_string(config_.max_pages)
                 + " max_depth=" + std::to_string(config_.max_depth) + " concurrency="
                 + std::to_string(config_.concurrency) + " proxies="
                 + std::to_string(session_->rotator ? session_->rotator->size() : 0));

    spawn_workers();
    init_io_services();
}

void CrawlEngine::spawn_workers() {
    for (int i = 0; i < config_.concurrency; ++i) {
        boost::asio::co_spawn(ioc_, worker_loop(), boost::asio::detached);
    }
}

void CrawlEngine::init_io_services() {
    // Fetchers may block, so every worker gets a thread to block on.
    for (int i = 0; i < config_.concurrency; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
            }
        });
    }
}

void CrawlEngine::finish(CrawlState state) {
    if (is_terminal(state_))
        return;

    state_ = state;
    channel_.close();
    if (session_)
        session_->cancel.cancel();

    if (state == CrawlState::Failed || !session_)
        return;

    CrawlStats s = collect_stats();
    Logger::info("Crawler: " + to_string(state) + " - fetched " + std::to_string(s.pages_fetched)
                 + ", failed " + std::to_string(s.pages_failed) + ", filtered "
                 + std::to_string(s.pages_filtered) + ", retries " + std::to_string(s.retries));
}

void CrawlEngine::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(state_))
        return;
    if (state_ == CrawlState::Running)
        Logger::warn("Crawler: Cancel requested, stopping dispatch");
    finish(CrawlState::Cancelled);
}

void CrawlEngine::wait() {
    std::lock_guard<std::mutex> join_lock(join_mutex_);
    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            return;
    }
    for (auto& t : io_threads_) {
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    if (session_ && is_terminal(state_)) {
        final_stats_ = collect_stats();
        session_.reset();
    }
}

}  // namespace Engine
}  // namespace Trawl
