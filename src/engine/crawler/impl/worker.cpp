#include <algorithm>
#include <functional>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "../../../core/logger/logger.hpp"
#include "../../../utils/url/url.hpp"
#include "../crawl_engine.hpp"

namespace Trawl {
namespace Engine {

using Trawl::Utils::Url;

namespace {

// Releases the dispatch slot however the task ends.
struct TaskGuard {
    std::function<void()> release;
    explicit TaskGuard(std::function<void()> r) : release(std::move(r)) {
    }
    ~TaskGuard() {
        release();
    }
};

std::string proxy_suffix(const std::optional<Proxy::ProxyEntry>& proxy) {
    return proxy ? " [" + proxy->display() + "]" : "";
}

}  // namespace

CrawlEngine::Task CrawlEngine::next_task() {
    std::lock_guard<std::mutex> lock(mutex_);
    Task                        task;

    if (state_ != CrawlState::Running)
        return task;

    if (session_->frontier->empty()) {
        if (session_->in_flight == 0) {
            finish(CrawlState::Completed);
            return task;
        }
        task.status = TaskStatus::Wait;
        return task;
    }

    // Never dispatch more than the remaining budget could emit.
    if (session_->pages_fetched + session_->in_flight >= config_.max_pages) {
        task.status = TaskStatus::Wait;
        return task;
    }

    task.target = session_->frontier->pop();
    task.status = TaskStatus::Dispatch;
    ++session_->in_flight;
    return task;
}

void CrawlEngine::complete_task() {
    std::lock_guard<std::mutex> lock(mutex_);
    --session_->in_flight;
    if (state_ == CrawlState::Running && session_->in_flight == 0 && session_->frontier->empty()) {
        finish(CrawlState::Completed);
    }
}

boost::asio::awaitable<void> CrawlEngine::worker_loop() {
    try {
        boost::asio::steady_timer timer(ioc_);

        while (true) {
            Task task = next_task();

            if (task.status == TaskStatus::Stop)
                co_return;

            if (task.status == TaskStatus::Wait) {
                timer.expires_after(std::chrono::milliseconds(Constants::WORKER_POLL_INTERVAL_MS));
                boost::system::error_code ec;
                co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                continue;
            }

            TaskGuard guard([this] { complete_task(); });
            co_await  process_target(std::move(*task.target));
        }
    } catch (const std::exception& e) {
        Logger::error("Worker Loop Exception: " + std::string(e.what()));
        cancel();
    }
}

boost::asio::awaitable<bool> CrawlEngine::sleep_while_running(std::chrono::milliseconds duration) {
    boost::asio::steady_timer timer(ioc_);
    auto                      deadline = std::chrono::steady_clock::now() + duration;
    const auto                slice    = std::chrono::milliseconds(Constants::WORKER_POLL_INTERVAL_MS);

    while (running()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            co_return true;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        timer.expires_after(std::min(remaining, slice));
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return false;
}

boost::asio::awaitable<void> CrawlEngine::process_target(CrawlTarget target) {
    const int attempts = 1 + config_.max_retries;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (!running())
            co_return;

        // Every attempt, retries included, takes the next rotation slot.
        std::optional<Proxy::ProxyEntry> proxy;
        if (session_->rotator)
            proxy = session_->rotator->next();

        std::string log_msg = "Fetching: " + target.url + " (Depth " + std::to_string(target.depth) + ")";
        if (attempt > 1)
            log_msg += " [Retry " + std::to_string(attempt - 1) + "]";
        Logger::debug(log_msg + proxy_suffix(proxy));

        FetchResult result;
        try {
            result = co_await fetcher_->fetch(target.url, proxy, session_->cancel);
        } catch (const std::exception& e) {
            result = FetchResult::failure(FetchErrorKind::Other, false, e.what());
        }

        if (session_->rotator && proxy) {
            bool proxy_ok = result.ok() || result.error.kind == FetchErrorKind::HttpStatus
                            || result.error.kind == FetchErrorKind::Cancelled;
            session_->rotator->report(*proxy, proxy_ok);
        }

        if (result.ok()) {
            handle_outcome(target, proxy, std::move(*result.outcome));
            co_return;
        }

        const FetchError& err = result.error;
        if (err.kind == FetchErrorKind::Cancelled)
            co_return;

        if (!err.retriable) {
            ++session_->pages_failed;
            Logger::warn("Dropped: " + target.url + " (" + to_string(err.kind) + ": " + err.message
                         + ")" + proxy_suffix(proxy));
            co_return;
        }

        if (attempt == attempts) {
            ++session_->pages_failed;
            Logger::error("Failed: " + target.url + " - Max retries (" + err.message + ")"
                          + proxy_suffix(proxy));
            co_return;
        }

        ++session_->retries;
        Logger::warn("Retrying: " + target.url + " (" + to_string(err.kind) + ": " + err.message
                     + ")" + proxy_suffix(proxy));
        if (!co_await sleep_while_running(get_backoff_time(attempt, config_.retry_backoff)))
            co_return;
    }
}

std::vector<CrawlEngine::Candidate>
CrawlEngine::collect_candidates(const CrawlTarget&        target,
                                const FetchOutcome&       outcome,
                                std::vector<std::string>& links) const {
    const std::string& base = outcome.effective_url.empty() ? target.url : outcome.effective_url;

    std::vector<Candidate> candidates;
    bool                   expand = target.depth < config_.max_depth;

    for (const auto& raw : outcome.raw_links) {
        std::string absolute = Url::resolve(base, raw);
        if (absolute.empty() || !Url::is_http(absolute))
            continue;
        absolute = Url::strip_fragment(absolute);
        links.push_back(absolute);

        if (!expand || !session_->filters.admit(absolute))
            continue;

        Candidate candidate;
        candidate.url = absolute;
        if (session_->scorer) {
            auto        context = outcome.anchor_contexts.find(raw);
            std::string text =
                (context != outcome.anchor_contexts.end() && !context->second.empty())
                    ? context->second
                    : absolute;
            candidate.priority = session_->scorer->score(text);
        }
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

void CrawlEngine::handle_outcome(const CrawlTarget&                      target,
                                 const std::optional<Proxy::ProxyEntry>& proxy,
                                 FetchOutcome                            outcome) {
    if (!session_->filters.admit_content(target.url, outcome.content_type)) {
        ++session_->pages_filtered;
        Logger::info("Skipped (Content-Type " + outcome.content_type + "): " + target.url);
        return;
    }

    CrawlResult result;
    result.url               = target.url;
    result.depth             = target.depth;
    result.parent_url        = target.parent_url;
    result.content_type      = outcome.content_type;
    result.fetched_via_proxy = proxy;

    // Scoring and filtering are pure; only the frontier needs the lock.
    std::vector<Candidate> candidates = collect_candidates(target, outcome, result.links);
    result.content                    = std::move(outcome.rendered_text);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != CrawlState::Running || session_->pages_fetched >= config_.max_pages) {
        Logger::debug("Discarded after stop: " + target.url);
        return;
    }

    ++session_->pages_fetched;
    Logger::success("Crawled: " + target.url + " (Depth " + std::to_string(target.depth) + ", "
                    + std::to_string(session_->pages_fetched) + "/"
                    + std::to_string(config_.max_pages) + ")");
    channel_.push(std::move(result));

    if (session_->pages_fetched == config_.max_pages) {
        finish(CrawlState::BudgetExhausted);
        return;
    }

    for (const auto& candidate : candidates) {
        session_->frontier->push(candidate.url, target.depth + 1, target.url, candidate.priority);
    }
}

}  // namespace Engine
}  // namespace Trawl
