#pragma once
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "../utils/text/glob.hpp"

namespace Trawl {
namespace Filter {

struct FilterSpec {
    std::set<std::string>    allowed_domains;
    std::vector<std::string> url_patterns;           // Empty matches every URL
    std::set<std::string>    allowed_content_types;  // Empty accepts every type
};

class UrlFilter {
public:
    virtual ~UrlFilter() = default;

    // content_type is absent before the page has been fetched.
    virtual bool apply(const std::string&                url,
                       const std::optional<std::string>& content_type) const = 0;

    // Filters that only look at response metadata run again after the fetch.
    virtual bool inspects_content() const {
        return false;
    }
    virtual std::string name() const = 0;
};

class DomainFilter : public UrlFilter {
public:
    explicit DomainFilter(std::set<std::string> allowed_domains);

    bool apply(const std::string& url, const std::optional<std::string>& content_type) const override;
    std::string name() const override {
        return "domain";
    }

private:
    std::set<std::string> allowed_domains_;
};

class UrlPatternFilter : public UrlFilter {
public:
    // Throws ConfigurationError for a malformed pattern.
    explicit UrlPatternFilter(const std::vector<std::string>& patterns);

    bool apply(const std::string& url, const std::optional<std::string>& content_type) const override;
    std::string name() const override {
        return "url_pattern";
    }

private:
    std::vector<Utils::Text::Glob> globs_;
};

class ContentTypeFilter : public UrlFilter {
public:
    explicit ContentTypeFilter(const std::set<std::string>& allowed_types);

    bool apply(const std::string& url, const std::optional<std::string>& content_type) const override;
    bool inspects_content() const override {
        return true;
    }
    std::string name() const override {
        return "content_type";
    }

    // "Text/HTML; charset=utf-8" -> "text/html"
    static std::string primary_type(const std::string& content_type);

private:
    std::set<std::string> allowed_types_;
};

// AND-composition evaluated left to right, stopping at the first rejection.
class FilterChain {
public:
    FilterChain() = default;

    // Domain, pattern and content-type filters in that order.
    explicit FilterChain(const FilterSpec& spec);

    FilterChain(FilterChain&&)            = default;
    FilterChain& operator=(FilterChain&&) = default;

    void add(std::unique_ptr<UrlFilter> filter);

    bool admit(const std::string&                url,
               const std::optional<std::string>& content_type = std::nullopt) const;

    // Post-fetch pass: only the filters that inspect response metadata.
    bool admit_content(const std::string& url, const std::string& content_type) const;

    size_t size() const {
        return filters_.size();
    }

private:
    std::vector<std::unique_ptr<UrlFilter>> filters_;
};

}  // namespace Filter
}  // namespace Trawl
