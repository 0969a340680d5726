#include "proxy_list.hpp"
#include <fstream>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Trawl {
namespace Proxy {

using namespace Trawl::Core;
using namespace Trawl::Utils::Text;

ProxyEntry ProxyList::parse_record(const std::string& record) {
    std::vector<std::string> parts = split(record, ':');
    if (parts.size() != 4) {
        throw ConfigurationError("expected 'ip:port:username:password', got '" + record + "'");
    }

    ProxyEntry entry;
    entry.host = trim(parts[0]);
    if (entry.host.empty())
        throw ConfigurationError("empty proxy host in '" + record + "'");

    std::string port = trim(parts[1]);
    if (port.empty() || port.size() > 5
        || port.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigurationError("invalid proxy port '" + port + "'");
    }
    int port_value = std::stoi(port);
    if (port_value < 1 || port_value > 65535)
        throw ConfigurationError("proxy port out of range '" + port + "'");

    entry.port     = static_cast<std::uint16_t>(port_value);
    entry.username = parts[2];
    entry.password = parts[3];
    return entry;
}

std::vector<ProxyEntry> ProxyList::parse(std::istream& input, const std::string& source) {
    std::vector<ProxyEntry> proxies;
    std::string             line;
    size_t                  line_no = 0;

    while (std::getline(input, line)) {
        ++line_no;
        std::string record = trim(line);
        if (record.empty())
            continue;

        try {
            proxies.push_back(parse_record(record));
        } catch (const ConfigurationError& e) {
            throw ConfigurationError("Invalid proxy at " + source + ":" + std::to_string(line_no)
                                     + ": " + e.what());
        }
    }

    if (proxies.empty())
        throw ConfigurationError("Proxy list is empty: " + source);
    return proxies;
}

std::vector<ProxyEntry> ProxyList::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw ConfigurationError("Proxy file not found: " + path);

    auto proxies = parse(file, path);
    Logger::info("Loaded " + std::to_string(proxies.size()) + " proxies from " + path);
    return proxies;
}

}  // namespace Proxy
}  // namespace Trawl
