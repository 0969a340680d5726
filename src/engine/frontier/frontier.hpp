#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <unordered_set>
#include <vector>

namespace Trawl {
namespace Engine {

enum class CrawlMode { BreadthFirst, BestFirst };

std::string to_string(CrawlMode mode);
CrawlMode   parse_crawl_mode(const std::string& name);  // "bfs" | "best_first"

struct CrawlTarget {
    std::string                url;
    std::string                key;  // Normalized URL, the identity of the target
    int                        depth = 0;
    std::optional<std::string> parent_url;
    std::uint64_t              discovered_at = 0;
};

// Normalized URLs that were ever enqueued. Only grows.
class VisitedSet {
public:
    // False when the key was already present.
    bool insert(const std::string& key) {
        return keys_.insert(key).second;
    }
    bool contains(const std::string& key) const {
        return keys_.count(key) > 0;
    }
    size_t size() const {
        return keys_.size();
    }

private:
    std::unordered_set<std::string> keys_;
};

// Pending targets plus the visited set they were admitted through.
//
// push() is a no-op for targets deeper than max_depth and for URLs that were
// pushed before; the dedup check happens before insertion. Not thread-safe:
// the engine serialises every call under its session lock.
class Frontier {
public:
    explicit Frontier(int max_depth);
    virtual ~Frontier() = default;

    Frontier(const Frontier&)            = delete;
    Frontier& operator=(const Frontier&) = delete;

    bool push(const std::string&         url,
              int                        depth,
              std::optional<std::string> parent_url = std::nullopt,
              double                     priority   = 0.0);

    std::optional<CrawlTarget> pop();

    bool empty() const {
        return pending() == 0;
    }
    size_t size() const {
        return pending();
    }
    int max_depth() const {
        return max_depth_;
    }
    const VisitedSet& visited() const {
        return visited_;
    }

protected:
    virtual void                       enqueue(CrawlTarget target, double priority) = 0;
    virtual std::optional<CrawlTarget> dequeue()                                    = 0;
    virtual size_t                     pending() const                              = 0;

private:
    VisitedSet    visited_;
    int           max_depth_;
    std::uint64_t next_order_ = 0;
};

// FIFO; the priority argument is ignored.
class BreadthFirstFrontier : public Frontier {
public:
    using Frontier::Frontier;

protected:
    void                       enqueue(CrawlTarget target, double priority) override;
    std::optional<CrawlTarget> dequeue() override;
    size_t                     pending() const override {
        return queue_.size();
    }

private:
    std::queue<CrawlTarget> queue_;
};

// Highest priority first; equal priorities leave in discovery order.
class BestFirstFrontier : public Frontier {
public:
    using Frontier::Frontier;

protected:
    void                       enqueue(CrawlTarget target, double priority) override;
    std::optional<CrawlTarget> dequeue() override;
    size_t                     pending() const override {
        return heap_.size();
    }

private:
    struct Entry {
        double      priority = 0.0;
        CrawlTarget target;

        // Max-heap pops the largest. For equal priority the earlier
        // discovery must compare larger.
        bool operator<(const Entry& other) const {
            if (priority != other.priority)
                return priority < other.priority;
            return target.discovered_at > other.target.discovered_at;
        }
    };

    std::priority_queue<Entry> heap_;
};

std::unique_ptr<Frontier> make_frontier(CrawlMode mode, int max_depth);

}  // namespace Engine
}  // namespace Trawl
