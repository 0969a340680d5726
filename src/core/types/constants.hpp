#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>

namespace Trawl {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_CONCURRENCY      = 5;
    static constexpr int         DEFAULT_DEPTH            = 2;
    static constexpr int         DEFAULT_MAX_RETRIES      = 2;  // Extra attempts after the first
    static constexpr int         DEFAULT_RETRY_BACKOFF_MS = 500;
    static constexpr int         MAX_RETRIES              = 10;
    static constexpr int         MAX_RETRY_BACKOFF_MS     = 30000;  // Ceiling for a single wait
    static constexpr double      DEFAULT_KEYWORD_WEIGHT   = 0.7;
    static constexpr const char* DEFAULT_OUTPUT_DIR       = "output";
    static constexpr const char* DEFAULT_CONTENT_TYPE     = "text/html";
    static constexpr const char* PROXIES_FILE_ENV         = "PROXIES_FILE";
    static constexpr const char* VERSION                  = "0.1.0";

    static constexpr int         REQUEST_TIMEOUT_SECONDS = 10;
    static constexpr int         CONNECT_TIMEOUT_SECONDS = 5;
    static constexpr int         MAX_REDIRECTS           = 5;
    static constexpr const char* USER_AGENT              = "Trawl-Crawler/0.1";

    static constexpr int WORKER_POLL_INTERVAL_MS = 20;
};

// base * 2^(attempt-1), clamped to MAX_RETRY_BACKOFF_MS.
inline std::chrono::milliseconds get_backoff_time(int attempt, std::chrono::milliseconds base) {
    if (attempt <= 0 || base.count() <= 0)
        return std::chrono::milliseconds(0);

    const std::chrono::milliseconds ceiling(Constants::MAX_RETRY_BACKOFF_MS);
    if (base >= ceiling || attempt > 31)
        return ceiling;
    return std::min(base * (std::int64_t{1} << (attempt - 1)), ceiling);
}

}  // namespace Core
}  // namespace Trawl
