#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "../../core/types/crawl_result.hpp"

namespace Trawl {
namespace Engine {

// Closable blocking queue between the engine and whoever drains results.
// Items pushed before close() are still handed out; after that pop()
// returns empty.
class ResultChannel {
public:
    // False once the channel is closed; the item is dropped.
    bool push(Core::CrawlResult result) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return false;
            items_.push_back(std::move(result));
        }
        cv_.notify_one();
        return true;
    }

    std::optional<Core::CrawlResult> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        if (items_.empty())
            return std::nullopt;
        Core::CrawlResult result = std::move(items_.front());
        items_.pop_front();
        return result;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    std::deque<Core::CrawlResult> items_;
    bool                          closed_ = false;
    mutable std::mutex            mutex_;
    std::condition_variable       cv_;
};

}  // namespace Engine
}  // namespace Trawl
