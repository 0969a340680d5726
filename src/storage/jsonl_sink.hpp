#pragma once
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include "result_sink.hpp"

namespace Trawl {
namespace Storage {

// Appends one JSON object per result to a single file.
class JsonLinesSink : public ResultSink {
public:
    explicit JsonLinesSink(const std::string& path);

    void consume(const Core::CrawlResult& result) override;

    static nlohmann::json to_json(const Core::CrawlResult& result);

    size_t written() const {
        return written_;
    }

private:
    std::string   path_;
    std::ofstream out_;
    std::mutex    mutex_;
    size_t        written_ = 0;
};

}  // namespace Storage
}  // namespace Trawl
