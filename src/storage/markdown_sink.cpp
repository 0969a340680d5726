#include "markdown_sink.hpp"
#include <filesystem>
#include <fstream>
#include "../core/logger/logger.hpp"
#include "../utils/url/url.hpp"

namespace Trawl {
namespace Storage {

using Trawl::Core::Logger;

MarkdownSink::MarkdownSink(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(base_path_, ec);
        if (ec)
            Logger::error("Failed to create storage directory: " + base_path_ + " (" + ec.message() + ")");
    }
}

void MarkdownSink::consume(const Core::CrawlResult& result) {
    std::string body = "<!-- " + result.url + " (depth " + std::to_string(result.depth) + ") -->\n\n";
    body += result.content;
    body += "\n";
    save(Utils::Url::to_filename(result.url), body);
}

bool MarkdownSink::contains(const std::filesystem::path& path) const {
    std::filesystem::path root = std::filesystem::weakly_canonical(base_path_.empty() ? "." : base_path_);
    std::filesystem::path rel  = std::filesystem::weakly_canonical(path).lexically_relative(root);
    return !rel.empty() && *rel.begin() != ".." && rel != ".";
}

void MarkdownSink::save(const std::string& key, const std::string& content) {
    try {
        std::filesystem::path path(base_path_);
        path /= key;

        if (!contains(path)) {
            Logger::error("Refusing to write outside " + base_path_ + ": " + key);
            return;
        }

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path, std::ios::binary);
        if (file.is_open()) {
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            Logger::debug("Saved: " + path.string());
        }
        else {
            Logger::error("Write Error: " + path.string());
        }
    } catch (const std::filesystem::filesystem_error& e) {
        Logger::error("FS Error: " + std::string(e.what()));
    }
}

}  // namespace Storage
}  // namespace Trawl
