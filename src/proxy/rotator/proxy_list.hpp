#pragma once
#include <istream>
#include <string>
#include <vector>
#include "proxy_entry.hpp"

namespace Trawl {
namespace Proxy {

// Loader for newline-delimited "ip:port:username:password" records.
//
// Blank lines are skipped. Anything else that does not parse aborts the
// whole load with a ConfigurationError naming the line; a partial list is
// never returned. An input without a single record is an error too.
class ProxyList {
public:
    static std::vector<ProxyEntry> load_file(const std::string& path);
    static std::vector<ProxyEntry> parse(std::istream& input, const std::string& source = "<input>");
    static ProxyEntry              parse_record(const std::string& record);
};

}  // namespace Proxy
}  // namespace Trawl
