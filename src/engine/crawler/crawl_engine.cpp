#include "crawl_engine.hpp"
#include "../../core/logger/logger.hpp"

namespace Trawl {
namespace Engine {

std::string to_string(CrawlState state) {
    switch (state) {
        case CrawlState::Idle: return "IDLE";
        case CrawlState::Running: return "RUNNING";
        case CrawlState::Completed: return "COMPLETED";
        case CrawlState::BudgetExhausted: return "BUDGET_EXHAUSTED";
        case CrawlState::Cancelled: return "CANCELLED";
        case CrawlState::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

bool is_terminal(CrawlState state) {
    return state != CrawlState::Idle && state != CrawlState::Running;
}

CrawlEngine::CrawlEngine(CrawlerConfig config, std::shared_ptr<Fetcher> fetcher)
    : config_(std::move(config)), fetcher_(std::move(fetcher)) {
}

CrawlEngine::~CrawlEngine() {
    cancel();
    wait();
}

std::optional<CrawlResult> CrawlEngine::next_result() {
    return channel_.pop();
}

CrawlState CrawlEngine::run(const std::string& seed_url, Storage::ResultSink& sink) {
    start(seed_url);

    try {
        while (auto result = next_result()) {
            sink.consume(*result);
        }
    } catch (const std::exception& e) {
        Logger::error("Result sink failed, cancelling crawl: " + std::string(e.what()));
        cancel();
        wait();
        throw;
    }

    wait();
    return state();
}

CrawlState CrawlEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CrawlStats CrawlEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ ? collect_stats() : final_stats_;
}

CrawlStats CrawlEngine::collect_stats() const {
    CrawlStats stats;
    stats.pages_fetched  = session_->pages_fetched;
    stats.pages_failed   = session_->pages_failed.load();
    stats.pages_filtered = session_->pages_filtered.load();
    stats.retries        = session_->retries.load();
    stats.urls_seen      = session_->frontier->visited().size();
    return stats;
}

bool CrawlEngine::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CrawlState::Running;
}

}  // namespace Engine
}  // namespace Trawl
