#include "proxy_rotator.hpp"
#include <algorithm>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"

namespace Trawl {
namespace Proxy {

using namespace Trawl::Core;

namespace {

std::vector<ProxyEntry> require_entries(std::vector<ProxyEntry> entries) {
    if (entries.empty())
        throw ConfigurationError("Proxy rotation requires at least one proxy");
    return entries;
}

}  // namespace

ProxyRotator::ProxyRotator(std::vector<ProxyEntry> entries)
    : entries_(require_entries(std::move(entries))), failure_counts_(entries_.size(), 0) {
}

ProxyEntry ProxyRotator::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    const ProxyEntry&           entry = entries_[cursor_];
    cursor_                           = (cursor_ + 1) % entries_.size();
    return entry;
}

void ProxyRotator::report(const ProxyEntry& entry, bool success) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find(entries_.begin(), entries_.end(), entry);
    if (it == entries_.end())
        return;

    size_t& count = failure_counts_[static_cast<size_t>(it - entries_.begin())];
    if (success) {
        count = 0;
        return;
    }

    ++count;
    Logger::warn("Proxy failed (" + std::to_string(count) + " in a row): " + entry.display());
}

size_t ProxyRotator::failures(const ProxyEntry& entry) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(entries_.begin(), entries_.end(), entry);
    if (it == entries_.end())
        return 0;
    return failure_counts_[static_cast<size_t>(it - entries_.begin())];
}

}  // namespace Proxy
}  // namespace Trawl
