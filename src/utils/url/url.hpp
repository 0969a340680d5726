#pragma once
#include <string>

namespace Trawl {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;  // Without the leading '?'
    std::string fragment;
    std::string start_url;
};

class Url {
public:
    static UrlParsed parse(const std::string& url);

    // Resolves an href against the page it appeared on. Dot segments are
    // collapsed for relative and absolute references alike. Returns an empty
    // string for non-hierarchical schemes (mailto:, javascript:, tel:, ...).
    static std::string resolve(const std::string& base, const std::string& relative);

    // "/a/./b/../c" -> "/a/c". Never climbs above the root.
    static std::string remove_dot_segments(const std::string& path);

    // Identity key of a crawl target: lower-cased scheme and host, default
    // port dropped, dot segments collapsed, empty path as "/", query
    // parameters sorted, fragment removed.
    static std::string normalize(const std::string& url);
    static std::string strip_fragment(const std::string& url);

    // Lower-cased host with any trailing dot removed.
    static std::string host_of(const std::string& url);

    // True when host equals domain or is one of its subdomains.
    static bool is_host_in_domain(const std::string& host, const std::string& domain);
    static bool is_http(const std::string& url);

    // Relative file path for a page: <host>[_<port>]/<path>[__<query>].md.
    // Every component is a plain name (no "." or ".." and no separators), so
    // the result always stays below the directory it is joined to.
    static std::string to_filename(const std::string& url);
};

}  // namespace Utils
}  // namespace Trawl
