#include "relevance_scorer.hpp"
#include <algorithm>
#include "../core/errors/errors.hpp"
#include "../utils/text/string_utils.hpp"

namespace Trawl {
namespace Scoring {

using namespace Trawl::Utils::Text;

RelevanceScorer::RelevanceScorer(const ScoreSpec& spec) : weight_(spec.weight) {
    if (!(spec.weight >= 0.0 && spec.weight <= 1.0)) {
        throw Core::ConfigurationError("Keyword weight must be within [0, 1], got "
                                       + std::to_string(spec.weight));
    }

    for (const auto& keyword : spec.keywords) {
        std::string lower = to_lower(trim(keyword));
        if (lower.empty())
            continue;
        if (std::find(keywords_.begin(), keywords_.end(), lower) == keywords_.end())
            keywords_.push_back(std::move(lower));
    }
}

double RelevanceScorer::score(const std::string& text) const {
    if (keywords_.empty() || text.empty())
        return 0.0;

    std::string haystack = to_lower(text);
    size_t      hits     = 0;
    for (const auto& keyword : keywords_) {
        if (haystack.find(keyword) != std::string::npos)
            ++hits;
    }

    double ratio = static_cast<double>(hits) / static_cast<double>(keywords_.size());
    return weight_ * ratio;
}

}  // namespace Scoring
}  // namespace Trawl
