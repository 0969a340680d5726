#include "filter_chain.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Trawl {
namespace Filter {

using namespace Trawl::Core;
using namespace Trawl::Utils;
using namespace Trawl::Utils::Text;

DomainFilter::DomainFilter(std::set<std::string> allowed_domains)
    : allowed_domains_(std::move(allowed_domains)) {
}

bool DomainFilter::apply(const std::string& url, const std::optional<std::string>&) const {
    std::string host = Url::host_of(url);
    for (const auto& domain : allowed_domains_) {
        if (Url::is_host_in_domain(host, domain))
            return true;
    }
    return false;
}

UrlPatternFilter::UrlPatternFilter(const std::vector<std::string>& patterns) {
    globs_.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        globs_.emplace_back(pattern);
    }
}

bool UrlPatternFilter::apply(const std::string& url, const std::optional<std::string>&) const {
    if (globs_.empty())
        return true;
    for (const auto& glob : globs_) {
        if (glob.matches(url))
            return true;
    }
    return false;
}

ContentTypeFilter::ContentTypeFilter(const std::set<std::string>& allowed_types) {
    for (const auto& type : allowed_types) {
        allowed_types_.insert(primary_type(type));
    }
}

std::string ContentTypeFilter::primary_type(const std::string& content_type) {
    size_t semi = content_type.find(';');
    return to_lower(trim(content_type.substr(0, semi)));
}

bool ContentTypeFilter::apply(const std::string&,
                              const std::optional<std::string>& content_type) const {
    if (!content_type || allowed_types_.empty())
        return true;
    return allowed_types_.count(primary_type(*content_type)) > 0;
}

FilterChain::FilterChain(const FilterSpec& spec) {
    add(std::make_unique<DomainFilter>(spec.allowed_domains));
    add(std::make_unique<UrlPatternFilter>(spec.url_patterns));
    add(std::make_unique<ContentTypeFilter>(spec.allowed_content_types));
}

void FilterChain::add(std::unique_ptr<UrlFilter> filter) {
    filters_.push_back(std::move(filter));
}

bool FilterChain::admit(const std::string& url, const std::optional<std::string>& content_type) const {
    for (const auto& filter : filters_) {
        if (!filter->apply(url, content_type)) {
            Logger::debug("Filtered (" + filter->name() + "): " + url);
            return false;
        }
    }
    return true;
}

bool FilterChain::admit_content(const std::string& url, const std::string& content_type) const {
    for (const auto& filter : filters_) {
        if (!filter->inspects_content())
            continue;
        if (!filter->apply(url, content_type)) {
            Logger::debug("Filtered (" + filter->name() + ", " + content_type + "): " + url);
            return false;
        }
    }
    return true;
}

}  // namespace Filter
}  // namespace Trawl
