#include "jsonl_sink.hpp"
#include <filesystem>
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"

namespace Trawl {
namespace Storage {

using Trawl::Core::Logger;

JsonLinesSink::JsonLinesSink(const std::string& path) : path_(path) {
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_.is_open())
        throw Core::ConfigurationError("Cannot open JSONL output: " + path_);
}

nlohmann::json JsonLinesSink::to_json(const Core::CrawlResult& result) {
    nlohmann::json j;
    j["url"]          = result.url;
    j["depth"]        = result.depth;
    j["parent_url"]   = result.parent_url ? nlohmann::json(*result.parent_url) : nlohmann::json(nullptr);
    j["content_type"] = result.content_type;
    j["links"]        = result.links;

    if (result.fetched_via_proxy) {
        const auto& proxy = *result.fetched_via_proxy;
        j["proxy"]        = {{"host", proxy.host}, {"port", proxy.port}, {"username", proxy.username}};
    }
    else {
        j["proxy"] = nullptr;
    }

    j["content"] = result.content;
    return j;
}

void JsonLinesSink::consume(const Core::CrawlResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << to_json(result).dump() << '\n';
    out_.flush();
    if (!out_)
        Logger::error("Write Error: " + path_);
    else
        ++written_;
}

}  // namespace Storage
}  // namespace Trawl
