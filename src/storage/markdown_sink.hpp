#pragma once
#include <filesystem>
#include <string>
#include "result_sink.hpp"

namespace Trawl {
namespace Storage {

// Writes each page's text to <base_path>/<host>/<path>.md.
class MarkdownSink : public ResultSink {
public:
    explicit MarkdownSink(const std::string& base_path);
    ~MarkdownSink() override = default;

    void consume(const Core::CrawlResult& result) override;

    // Keys resolving outside base_path (absolute, "..", symlinked away) are
    // logged and dropped.
    void save(const std::string& key, const std::string& content);

private:
    std::string base_path_;

    bool contains(const std::filesystem::path& path) const;
};

}  // namespace Storage
}  // namespace Trawl
