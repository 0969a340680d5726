#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include "../../core/types/constants.hpp"
#include "fetcher.hpp"

namespace Trawl {
namespace Network {
namespace Http {

// libcurl-backed Fetcher. Every call runs on its own easy handle, so one
// instance serves all workers. The transfer blocks the calling IO thread;
// the engine runs one IO thread per worker for that reason.
class CurlFetcher : public Fetcher {
public:
    struct Options {
        long        timeout_seconds         = Core::Constants::REQUEST_TIMEOUT_SECONDS;
        long        connect_timeout_seconds = Core::Constants::CONNECT_TIMEOUT_SECONDS;
        long        max_redirects           = Core::Constants::MAX_REDIRECTS;
        std::string user_agent              = Core::Constants::USER_AGENT;
    };

    CurlFetcher();
    explicit CurlFetcher(Options options);

    CurlFetcher(const CurlFetcher&)            = delete;
    CurlFetcher& operator=(const CurlFetcher&) = delete;

    boost::asio::awaitable<FetchResult> fetch(const std::string&                       url,
                                              const std::optional<Proxy::ProxyEntry>& proxy,
                                              const CancelToken& cancel) override;

    // Synchronous body of fetch(); exposed for callers outside a coroutine.
    FetchResult perform(const std::string&                       url,
                        const std::optional<Proxy::ProxyEntry>& proxy,
                        const CancelToken&                       cancel) const;

    static FetchError classify(CURLcode code, long status_code, bool cancelled);

private:
    struct RequestContext {
        std::string*       body         = nullptr;
        std::string*       content_type = nullptr;
        const CancelToken* cancel       = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    Options options_;

    void setup_curl_options(CURL*                                    curl,
                            const std::string&                       url,
                            RequestContext&                          ctx,
                            const std::optional<Proxy::ProxyEntry>& proxy) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
    static int    progress_callback(void*      clientp,
                                    curl_off_t dltotal,
                                    curl_off_t dlnow,
                                    curl_off_t ultotal,
                                    curl_off_t ulnow);
};

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
