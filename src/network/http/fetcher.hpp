#pragma once

#include <atomic>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../../proxy/rotator/proxy_entry.hpp"

namespace Trawl {
namespace Network {
namespace Http {

enum class FetchErrorKind { None, Network, Proxy, Timeout, HttpStatus, Cancelled, Other };

std::string to_string(FetchErrorKind kind);

struct FetchOutcome {
    long                               status_code = 200;
    std::string                        effective_url;
    std::string                        content_type;
    std::vector<std::string>           raw_links;  // As written in the page, document order
    std::string                        rendered_text;
    std::map<std::string, std::string> anchor_contexts;  // raw link -> anchor text
};

struct FetchError {
    FetchErrorKind kind      = FetchErrorKind::Other;
    bool           retriable = false;
    long           status_code = 0;
    std::string    message;
};

struct FetchResult {
    std::optional<FetchOutcome> outcome;
    FetchError                  error;

    bool ok() const {
        return outcome.has_value();
    }

    static FetchResult success(FetchOutcome outcome) {
        FetchResult r;
        r.outcome = std::move(outcome);
        return r;
    }

    static FetchResult failure(FetchErrorKind kind, bool retriable, std::string message,
                               long status_code = 0) {
        FetchResult r;
        r.error.kind        = kind;
        r.error.retriable   = retriable;
        r.error.message     = std::move(message);
        r.error.status_code = status_code;
        return r;
    }
};

// Cancellation flag shared by one crawl session and its in-flight fetches.
class CancelToken {
public:
    void cancel() {
        cancelled_.store(true);
    }
    bool cancelled() const {
        return cancelled_.load();
    }

private:
    std::atomic<bool> cancelled_{false};
};

// One URL and one egress identity in, one outcome out. Implementations must
// be callable from several workers at once and should give up promptly once
// the token reports cancellation. proxy is empty for direct connections.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual boost::asio::awaitable<FetchResult> fetch(const std::string&                       url,
                                                      const std::optional<Proxy::ProxyEntry>& proxy,
                                                      const CancelToken& cancel) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
