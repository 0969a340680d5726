#pragma once
#include <set>
#include <string>
#include <vector>

namespace Trawl {
namespace Scoring {

struct ScoreSpec {
    std::set<std::string> keywords;
    double                weight = 0.7;  // In [0, 1]
};

// Keyword presence scorer.
//
//   score = weight * (keywords found in text / keywords configured)
//
// Matching is a case-insensitive substring test. No keywords, or no hits,
// scores 0. Immutable after construction, so concurrent calls are safe.
class RelevanceScorer {
public:
    // Throws ConfigurationError when weight is outside [0, 1].
    explicit RelevanceScorer(const ScoreSpec& spec);

    double score(const std::string& text) const;

    double weight() const {
        return weight_;
    }
    size_t keyword_count() const {
        return keywords_.size();
    }

private:
    std::vector<std::string> keywords_;  // Lower-cased, non-empty
    double                   weight_;
};

}  // namespace Scoring
}  // namespace Trawl
