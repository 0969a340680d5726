#include "url.hpp"
#include <algorithm>
#include <functional>
#include <sstream>
#include <string_view>
#include <vector>
#include "../text/string_utils.hpp"

namespace Trawl {
namespace Utils {

using namespace Trawl::Utils::Text;

namespace {

// Longest single file or directory name written by to_filename.
constexpr size_t MAX_NAME_LENGTH = 200;

std::string clean_host(std::string host) {
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    return to_lower(host);
}

bool is_default_port(const std::string& scheme, const std::string& port) {
    return (scheme == "http" && port == "80") || (scheme == "https" && port == "443");
}

// [userinfo@]host[:port], with bracketed IPv6 hosts.
void split_authority(std::string_view authority, UrlParsed& out) {
    size_t at = authority.rfind('@');
    if (at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    size_t port_sep = std::string_view::npos;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            out.host = std::string(authority);
            return;
        }
        out.host = std::string(authority.substr(0, close + 1));
        port_sep = authority.find(':', close + 1);
    }
    else {
        port_sep = authority.rfind(':');
        out.host = std::string(authority.substr(0, port_sep));
    }
    if (port_sep != std::string_view::npos)
        out.port = std::string(authority.substr(port_sep + 1));
}

// path[?query][#fragment]
void split_tail(std::string_view tail, UrlParsed& out) {
    size_t hash = tail.find('#');
    if (hash != std::string_view::npos) {
        out.fragment = std::string(tail.substr(hash + 1));
        tail         = tail.substr(0, hash);
    }
    size_t q = tail.find('?');
    if (q != std::string_view::npos) {
        out.query = std::string(tail.substr(q + 1));
        tail      = tail.substr(0, q);
    }
    out.path = std::string(tail);
}

std::string compose(const UrlParsed& p) {
    std::string out = p.scheme + "://" + p.host;
    if (!p.port.empty())
        out += ":" + p.port;
    out += p.path.empty() ? "/" : p.path;
    if (!p.query.empty())
        out += "?" + p.query;
    if (!p.fragment.empty())
        out += "#" + p.fragment;
    return out;
}

std::string directory_of(const std::string& path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? "/" : path.substr(0, slash + 1);
}

std::string sorted_query(const std::string& query) {
    std::vector<std::string> params = split(query, '&');
    params.erase(std::remove(params.begin(), params.end(), std::string()), params.end());
    std::sort(params.begin(), params.end());

    std::string out;
    for (const auto& param : params) {
        if (!out.empty())
            out += "&";
        out += param;
    }
    return out;
}

// One directory or file name: separators and control bytes replaced, dot
// names rejected, overlong names cut and suffixed with a hash of the whole.
std::string file_component(const std::string& raw) {
    std::string name;
    name.reserve(raw.size());
    for (char c : raw) {
        bool unsafe = c == '/' || c == '\\' || static_cast<unsigned char>(c) < 0x20;
        name.push_back(unsafe ? '_' : c);
    }
    if (name.empty() || name == "." || name == "..")
        return "_";

    if (name.size() > MAX_NAME_LENGTH) {
        std::ostringstream digest;
        digest << std::hex << std::hash<std::string>{}(name);
        name = name.substr(0, MAX_NAME_LENGTH - digest.str().size() - 1) + "_" + digest.str();
    }
    return name;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    parsed.start_url = url;

    std::string_view rest = url;

    // A scheme ends at the first ':' that precedes any '/', '?' or '#'.
    size_t colon = rest.find(':');
    if (colon != std::string_view::npos && colon < rest.find_first_of("/?#")) {
        parsed.scheme = std::string(rest.substr(0, colon));
        rest.remove_prefix(colon + 1);
    }

    if (rest.substr(0, 2) == "//") {
        rest.remove_prefix(2);
        size_t end = std::min(rest.find_first_of("/?#"), rest.size());
        split_authority(rest.substr(0, end), parsed);
        rest.remove_prefix(end);
    }

    split_tail(rest, parsed);
    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::remove_dot_segments(const std::string& path) {
    std::vector<std::string_view> segments;
    std::string_view              last;

    for (size_t start = 0; start <= path.size();) {
        size_t           end = std::min(path.find('/', start), path.size());
        std::string_view segment(path.data() + start, end - start);
        last  = segment;
        start = end + 1;

        if (segment.empty() || segment == ".")
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string out = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0)
            out += "/";
        out += segments[i];
    }

    bool directory = last.empty() || last == "." || last == "..";
    if (directory && !segments.empty() && !path.empty())
        out += "/";
    return out;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    UrlParsed ref = parse(relative);
    if (!ref.scheme.empty()) {
        // mailto:, javascript:, tel: and friends
        if (relative.compare(ref.scheme.size(), 3, "://") != 0)
            return "";
        ref.path = remove_dot_segments(ref.path);
        return compose(ref);
    }

    UrlParsed out = parse(base);
    if (relative.compare(0, 2, "//") == 0) {
        ref.scheme = out.scheme;
        ref.path   = remove_dot_segments(ref.path);
        return compose(ref);
    }

    out.fragment = ref.fragment;
    switch (relative[0]) {
        case '#':
            break;
        case '?':
            out.query = ref.query;
            break;
        case '/':
            out.path  = remove_dot_segments(ref.path);
            out.query = ref.query;
            break;
        default:
            out.path  = remove_dot_segments(directory_of(out.path) + ref.path);
            out.query = ref.query;
    }
    return compose(out);
}

std::string Url::normalize(const std::string& url) {
    UrlParsed p = parse(url);

    std::string scheme = to_lower(p.scheme);
    std::string out    = scheme.empty() ? "" : scheme + "://";
    out += clean_host(p.host);
    if (!p.port.empty() && !is_default_port(scheme, p.port))
        out += ":" + p.port;
    out += p.path.front() == '/' ? remove_dot_segments(p.path) : p.path;

    std::string query = sorted_query(p.query);
    if (!query.empty())
        out += "?" + query;
    return out;
}

std::string Url::strip_fragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

std::string Url::host_of(const std::string& url) {
    return clean_host(parse(url).host);
}

bool Url::is_host_in_domain(const std::string& host, const std::string& domain) {
    std::string h = clean_host(host);
    std::string d = clean_host(domain);
    if (h.empty() || d.empty())
        return false;
    if (h == d)
        return true;
    return h.size() > d.size() && ends_with(h, d) && h[h.size() - d.size() - 1] == '.';
}

bool Url::is_http(const std::string& url) {
    std::string scheme = to_lower(parse(url).scheme);
    return scheme == "http" || scheme == "https";
}

std::string Url::to_filename(const std::string& url) {
    UrlParsed p = parse(url);

    std::string site = clean_host(p.host);
    if (!p.port.empty())
        site += "_" + p.port;
    std::string out = file_component(site);

    // "/a/b/" -> {"a", "b", ""}; a trailing empty name is a directory index
    std::vector<std::string> segments = split(remove_dot_segments(p.path).substr(1), '/');
    std::string              leaf     = segments.back();
    segments.pop_back();

    if (leaf.empty()) {
        leaf = "index";
    }
    else {
        size_t dot = leaf.find_last_of('.');
        if (dot != std::string::npos && dot > 0)
            leaf.erase(dot);
    }

    std::string query = sorted_query(p.query);
    if (!query.empty())
        leaf += "__" + query;

    for (const auto& segment : segments)
        out += "/" + file_component(segment);
    out += "/" + file_component(leaf) + ".md";
    return out;
}

}  // namespace Utils
}  // namespace Trawl
