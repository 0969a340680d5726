#include "curl_fetcher.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>
#include "../../filter/filter_chain.hpp"
#include "../../utils/text/converter.hpp"

namespace Trawl {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

inline std::string_view trim_view(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool istarts_with(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}

bool is_html(const std::string& content_type) {
    std::string primary = Filter::ContentTypeFilter::primary_type(content_type);
    return primary.empty() || primary == "text/html" || primary == "application/xhtml+xml";
}

}  // namespace

size_t CurlFetcher::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlFetcher::RequestContext*>(userp);
    if (!ctx || !ctx->body)
        return 0;

    size_t total = size * nmemb;
    ctx->body->append(static_cast<const char*>(contents), total);
    return total;
}

size_t CurlFetcher::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto*            ctx = static_cast<CurlFetcher::RequestContext*>(userp);
    size_t           total = size * nitems;
    std::string_view header(buffer, total);

    if (!ctx || !ctx->content_type)
        return total;

    // A new status line starts the headers of the next hop of a redirect.
    if (istarts_with(header, "HTTP/")) {
        ctx->content_type->clear();
        return total;
    }

    if (!istarts_with(header, CONTENT_TYPE_HEADER))
        return total;

    *ctx->content_type = std::string(trim_view(header.substr(CONTENT_TYPE_HEADER.size())));
    return total;
}

int CurlFetcher::progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<CurlFetcher::RequestContext*>(clientp);
    return (ctx && ctx->cancel && ctx->cancel->cancelled()) ? 1 : 0;
}

FetchError CurlFetcher::classify(CURLcode code, long status_code, bool cancelled) {
    FetchError error;
    error.status_code = status_code;

    if (cancelled || code == CURLE_ABORTED_BY_CALLBACK) {
        error.kind      = FetchErrorKind::Cancelled;
        error.retriable = false;
        error.message   = "transfer cancelled";
        return error;
    }

    if (code != CURLE_OK) {
        error.message = curl_easy_strerror(code);
        switch (code) {
            case CURLE_OPERATION_TIMEDOUT:
                error.kind      = FetchErrorKind::Timeout;
                error.retriable = true;
                break;
            case CURLE_COULDNT_CONNECT:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_RECV_ERROR:
            case CURLE_SEND_ERROR:
            case CURLE_GOT_NOTHING:
                error.kind      = FetchErrorKind::Proxy;
                error.retriable = true;
                break;
            case CURLE_UNSUPPORTED_PROTOCOL:
            case CURLE_URL_MALFORMAT:
            case CURLE_TOO_MANY_REDIRECTS:
                error.kind      = FetchErrorKind::Other;
                error.retriable = false;
                break;
            default:
                error.kind      = FetchErrorKind::Network;
                error.retriable = true;
        }
        return error;
    }

    error.kind    = FetchErrorKind::HttpStatus;
    error.message = "HTTP " + std::to_string(status_code);
    if (status_code == 407) {
        error.kind      = FetchErrorKind::Proxy;
        error.retriable = true;
    }
    else {
        error.retriable = status_code == 429 || status_code >= 500 || status_code == 0;
    }
    return error;
}

CurlFetcher::CurlFetcher() : CurlFetcher(Options{}) {
}

CurlFetcher::CurlFetcher(Options options) : options_(std::move(options)) {
}

void CurlFetcher::setup_curl_options(CURL*                                    curl,
                                     const std::string&                       url,
                                     RequestContext&                          ctx,
                                     const std::optional<Proxy::ProxyEntry>& proxy) const {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    if (!options_.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());

    if (proxy) {
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy->host.c_str());
        curl_easy_setopt(curl, CURLOPT_PROXYPORT, static_cast<long>(proxy->port));
        curl_easy_setopt(curl, CURLOPT_PROXYTYPE, static_cast<long>(CURLPROXY_HTTP));
        if (!proxy->username.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXYUSERNAME, proxy->username.c_str());
            curl_easy_setopt(curl, CURLOPT_PROXYPASSWORD, proxy->password.c_str());
        }
    }
    else {
        // Ignore *_proxy environment variables for direct fetches.
        curl_easy_setopt(curl, CURLOPT_PROXY, "");
    }
}

FetchResult CurlFetcher::perform(const std::string&                       url,
                                 const std::optional<Proxy::ProxyEntry>& proxy,
                                 const CancelToken&                       cancel) const {
    if (cancel.cancelled())
        return FetchResult::failure(FetchErrorKind::Cancelled, false, "transfer cancelled");

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl)
        return FetchResult::failure(FetchErrorKind::Other, false, "Failed to initialize CURL handle");

    std::string    body;
    std::string    content_type;
    RequestContext ctx{&body, &content_type, &cancel};

    setup_curl_options(curl.get(), url, ctx, proxy);
    CURLcode code = curl_easy_perform(curl.get());

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &eff_url_ptr);

    if (code != CURLE_OK || cancel.cancelled() || status_code < 200 || status_code >= 300) {
        FetchResult result;
        result.error = classify(code, status_code, cancel.cancelled());
        return result;
    }

    FetchOutcome outcome;
    outcome.status_code   = status_code;
    outcome.effective_url = eff_url_ptr ? std::string(eff_url_ptr) : url;
    outcome.content_type  = content_type;

    if (is_html(content_type)) {
        auto page               = Utils::Text::Converter::extract(body);
        outcome.raw_links       = std::move(page.links);
        outcome.anchor_contexts = std::move(page.anchor_texts);
        outcome.rendered_text   = std::move(page.text);
    }
    else {
        outcome.rendered_text = std::move(body);
    }
    return FetchResult::success(std::move(outcome));
}

boost::asio::awaitable<FetchResult> CurlFetcher::fetch(const std::string&                       url,
                                                       const std::optional<Proxy::ProxyEntry>& proxy,
                                                       const CancelToken&                       cancel) {
    co_return perform(url, proxy, cancel);
}

}  // namespace Http
}  // namespace Network
}  // namespace Trawl
