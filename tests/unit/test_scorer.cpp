#include <gtest/gtest.h>
#include "../../src/core/errors/errors.hpp"
#include "../../src/scoring/relevance_scorer.hpp"

using namespace Trawl::Scoring;
using Trawl::Core::ConfigurationError;

TEST(RelevanceScorerTest, WeightTimesHitRatio) {
    RelevanceScorer scorer(ScoreSpec{{"rust", "async", "tokio", "futures"}, 0.8});
    EXPECT_DOUBLE_EQ(scorer.score("Async Rust in practice"), 0.8 * 0.5);
    EXPECT_DOUBLE_EQ(scorer.score("rust async tokio futures"), 0.8);
    EXPECT_DOUBLE_EQ(scorer.score("gardening tips"), 0.0);
}

TEST(RelevanceScorerTest, CaseInsensitiveSubstring) {
    RelevanceScorer scorer(ScoreSpec{{"News"}, 1.0});
    EXPECT_DOUBLE_EQ(scorer.score("https://example.com/NEWSROOM"), 1.0);
    EXPECT_DOUBLE_EQ(scorer.score("latest newsletter"), 1.0);
}

TEST(RelevanceScorerTest, RepeatedHitsCountOnce) {
    RelevanceScorer scorer(ScoreSpec{{"news", "sport"}, 1.0});
    EXPECT_DOUBLE_EQ(scorer.score("news news news news"), 0.5);
}

TEST(RelevanceScorerTest, EmptyInputsScoreZero) {
    RelevanceScorer no_keywords(ScoreSpec{{}, 0.7});
    EXPECT_EQ(no_keywords.keyword_count(), 0u);
    EXPECT_DOUBLE_EQ(no_keywords.score("anything at all"), 0.0);

    RelevanceScorer scorer(ScoreSpec{{"news"}, 0.7});
    EXPECT_DOUBLE_EQ(scorer.score(""), 0.0);
}

TEST(RelevanceScorerTest, KeywordsAreNormalized) {
    RelevanceScorer scorer(ScoreSpec{{"News", "news ", "  ", ""}, 1.0});
    EXPECT_EQ(scorer.keyword_count(), 1u);
    EXPECT_DOUBLE_EQ(scorer.score("news"), 1.0);
}

TEST(RelevanceScorerTest, ScoreStaysInRange) {
    RelevanceScorer scorer(ScoreSpec{{"a", "b", "c"}, 0.3});
    for (const char* text : {"", "a", "ab", "abc", "xyz", "cab cab"}) {
        double s = scorer.score(text);
        EXPECT_GE(s, 0.0);
        EXPECT_LE(s, scorer.weight());
    }
}

TEST(RelevanceScorerTest, WeightBounds) {
    EXPECT_NO_THROW(RelevanceScorer(ScoreSpec{{"x"}, 0.0}));
    EXPECT_NO_THROW(RelevanceScorer(ScoreSpec{{"x"}, 1.0}));
    EXPECT_THROW(RelevanceScorer(ScoreSpec{{"x"}, -0.1}), ConfigurationError);
    EXPECT_THROW(RelevanceScorer(ScoreSpec{{"x"}, 1.5}), ConfigurationError);
}

TEST(RelevanceScorerTest, ZeroWeightScoresZero) {
    RelevanceScorer scorer(ScoreSpec{{"news"}, 0.0});
    EXPECT_DOUBLE_EQ(scorer.score("news"), 0.0);
}
