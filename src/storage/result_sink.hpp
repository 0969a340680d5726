#pragma once
#include <memory>
#include <vector>
#include "../core/types/crawl_result.hpp"

namespace Trawl {
namespace Storage {

class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void consume(const Core::CrawlResult& result) = 0;
};

// Forwards every result to each child sink in order.
class FanoutSink : public ResultSink {
public:
    void add(std::unique_ptr<ResultSink> sink) {
        sinks_.push_back(std::move(sink));
    }

    void consume(const Core::CrawlResult& result) override {
        for (auto& sink : sinks_)
            sink->consume(result);
    }

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<ResultSink>> sinks_;
};

}  // namespace Storage
}  // namespace Trawl
