#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../core/types/crawl_result.hpp"
#include "../../filter/filter_chain.hpp"
#include "../../network/http/fetcher.hpp"
#include "../../proxy/rotator/proxy_rotator.hpp"
#include "../../scoring/relevance_scorer.hpp"
#include "../../storage/result_sink.hpp"
#include "../frontier/frontier.hpp"
#include "result_channel.hpp"

#ifndef CPPCHECK
class CrawlEngineTest_SessionBuildsFromConfig_Test;
#endif

namespace Trawl {
namespace Engine {

using namespace Trawl::Core;
using namespace Trawl::Filter;
using namespace Trawl::Scoring;
using namespace Trawl::Network::Http;

enum class CrawlState { Idle, Running, Completed, BudgetExhausted, Cancelled, Failed };

std::string to_string(CrawlState state);
bool        is_terminal(CrawlState state);

struct CrawlerConfig {
    FilterSpec               filters;
    std::optional<ScoreSpec> scoring;  // Required in best-first mode
    CrawlMode                mode        = CrawlMode::BreadthFirst;
    int                      max_depth   = Constants::DEFAULT_DEPTH;
    int                      max_pages   = 0;
    int                      concurrency = Constants::DEFAULT_CONCURRENCY;
    int                      max_retries = Constants::DEFAULT_MAX_RETRIES;
    std::chrono::milliseconds retry_backoff{Constants::DEFAULT_RETRY_BACKOFF_MS};

    std::vector<Proxy::ProxyEntry> proxies;
    bool                           require_proxies = true;
};

struct CrawlStats {
    int    pages_fetched  = 0;
    int    pages_failed   = 0;  // Dropped after fetch errors
    int    pages_filtered = 0;  // Rejected by the post-fetch content check
    int    retries        = 0;
    size_t urls_seen      = 0;  // Size of the visited set
};

// Scoped crawl over one seed.
//
//   IDLE -> RUNNING -> COMPLETED | BUDGET_EXHAUSTED | CANCELLED
//   IDLE -> FAILED                (configuration rejected in start())
//
// start() returns once the workers are running; results are drained with
// next_result() (or handed to a sink by run()). Frontier, visited set and
// the budget counter share one session lock that is never held across a
// fetch. With concurrency 1 results come out in traversal order.
class CrawlEngine {
#ifndef CPPCHECK
    friend class ::CrawlEngineTest_SessionBuildsFromConfig_Test;
#endif

public:
    CrawlEngine(CrawlerConfig config, std::shared_ptr<Fetcher> fetcher);
    ~CrawlEngine();

    CrawlEngine(const CrawlEngine&)            = delete;
    CrawlEngine& operator=(const CrawlEngine&) = delete;

    // Throws ConfigurationError (state becomes FAILED, stream closed, nothing
    // emitted) or EngineStateError when the engine is not IDLE.
    void start(const std::string& seed_url);

    // Blocks until the next result or the end of the stream.
    std::optional<CrawlResult> next_result();

    // start(), drain every result into sink, wait().
    CrawlState run(const std::string& seed_url, Storage::ResultSink& sink);

    void cancel();
    void wait();

    CrawlState state() const;
    CrawlStats stats() const;

private:
    struct Session {
        std::unique_ptr<Frontier>            frontier;
        std::unique_ptr<Proxy::ProxyRotator> rotator;  // Null for direct fetches
        FilterChain                          filters;
        std::unique_ptr<RelevanceScorer>     scorer;
        CancelToken                          cancel;

        int pages_fetched = 0;
        int in_flight     = 0;

        std::atomic<int> pages_failed{0};
        std::atomic<int> pages_filtered{0};
        std::atomic<int> retries{0};
    };

    struct Candidate {
        std::string url;
        double      priority = 0.0;
    };

    enum class TaskStatus { Dispatch, Wait, Stop };

    struct Task {
        TaskStatus                 status = TaskStatus::Stop;
        std::optional<CrawlTarget> target;
    };

    CrawlerConfig            config_;
    std::shared_ptr<Fetcher> fetcher_;

    std::unique_ptr<Session> session_;
    CrawlState               state_ = CrawlState::Idle;
    CrawlStats               final_stats_;
    mutable std::mutex       mutex_;  // Guards state_, session_ counters and the frontier

    ResultChannel channel_;

    boost::asio::io_context  ioc_;
    std::vector<std::thread> io_threads_;
    std::mutex               join_mutex_;

    void                     validate(const std::string& seed_url) const;
    std::unique_ptr<Session> build_session() const;
    void                     init_io_services();
    void                     spawn_workers();
    void                     finish(CrawlState state);  // mutex_ held
    CrawlStats               collect_stats() const;     // mutex_ held

    Task next_task();
    void complete_task();

    boost::asio::awaitable<void> worker_loop();
    boost::asio::awaitable<void> process_target(CrawlTarget target);
    boost::asio::awaitable<bool> sleep_while_running(std::chrono::milliseconds duration);
    void                         handle_outcome(const CrawlTarget&                      target,
                                                const std::optional<Proxy::ProxyEntry>& proxy,
                                                FetchOutcome                            outcome);
    std::vector<Candidate> collect_candidates(const CrawlTarget&       target,
                                              const FetchOutcome&      outcome,
                                              std::vector<std::string>& links) const;
    bool                   running() const;
};

}  // namespace Engine
}  // namespace Trawl
