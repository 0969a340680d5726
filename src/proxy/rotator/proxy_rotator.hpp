#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "proxy_entry.hpp"

namespace Trawl {
namespace Proxy {

// Round-robin over an immutable list. Each next() hands out the entry under
// the cursor and advances it modulo the list size under one lock, so
// concurrent callers never see the same slot twice within a cycle. State is
// per instance: a new crawl session builds a new rotator.
//
// Outcome reports only feed per-entry statistics for logging; they never
// change the rotation order.
class ProxyRotator {
public:
    // Throws ConfigurationError on an empty list.
    explicit ProxyRotator(std::vector<ProxyEntry> entries);

    ProxyRotator(const ProxyRotator&)            = delete;
    ProxyRotator& operator=(const ProxyRotator&) = delete;

    ProxyEntry next();
    size_t     size() const {
        return entries_.size();
    }

    void   report(const ProxyEntry& entry, bool success);
    size_t failures(const ProxyEntry& entry) const;

private:
    const std::vector<ProxyEntry> entries_;
    std::vector<size_t>           failure_counts_;
    size_t                        cursor_ = 0;
    mutable std::mutex            mutex_;
};

}  // namespace Proxy
}  // namespace Trawl
