#include <gtest/gtest.h>
#include "../../src/core/errors/errors.hpp"
#include "../../src/engine/frontier/frontier.hpp"

using namespace Trawl::Engine;
using Trawl::Core::ConfigurationError;

TEST(FrontierTest, BreadthFirstIsFifo) {
    BreadthFirstFrontier frontier(3);
    EXPECT_TRUE(frontier.push("https://example.com/a", 0));
    EXPECT_TRUE(frontier.push("https://example.com/b", 1));
    EXPECT_TRUE(frontier.push("https://example.com/c", 1));

    EXPECT_EQ(frontier.pop()->url, "https://example.com/a");
    EXPECT_EQ(frontier.pop()->url, "https://example.com/b");
    EXPECT_EQ(frontier.pop()->url, "https://example.com/c");
    EXPECT_FALSE(frontier.pop().has_value());
}

TEST(FrontierTest, BreadthFirstIgnoresPriority) {
    BreadthFirstFrontier frontier(2);
    frontier.push("https://example.com/low", 1, std::nullopt, 0.1);
    frontier.push("https://example.com/high", 1, std::nullopt, 0.9);
    EXPECT_EQ(frontier.pop()->url, "https://example.com/low");
}

TEST(FrontierTest, DeduplicatesNormalizedUrls) {
    BreadthFirstFrontier frontier(2);
    EXPECT_TRUE(frontier.push("https://example.com/news?b=2&a=1", 0));
    EXPECT_FALSE(frontier.push("https://EXAMPLE.com/news?a=1&b=2", 1));
    EXPECT_FALSE(frontier.push("https://example.com:443/news?a=1&b=2#frag", 1));
    EXPECT_EQ(frontier.size(), 1u);
    EXPECT_EQ(frontier.visited().size(), 1u);

    // Popping does not forget the URL.
    frontier.pop();
    EXPECT_FALSE(frontier.push("https://example.com/news?a=1&b=2", 1));
    EXPECT_TRUE(frontier.visited().contains("https://example.com/news?a=1&b=2"));
}

TEST(FrontierTest, DotSegmentsShareIdentity) {
    BreadthFirstFrontier frontier(2);
    EXPECT_TRUE(frontier.push("https://example.com/b", 0));
    EXPECT_FALSE(frontier.push("https://example.com/a/../b", 1));
    EXPECT_FALSE(frontier.push("https://example.com/./b", 1));
    EXPECT_EQ(frontier.size(), 1u);
}

TEST(FrontierTest, DepthLimit) {
    BreadthFirstFrontier frontier(1);
    EXPECT_TRUE(frontier.push("https://example.com/0", 0));
    EXPECT_TRUE(frontier.push("https://example.com/1", 1));
    EXPECT_FALSE(frontier.push("https://example.com/2", 2));
    EXPECT_FALSE(frontier.push("https://example.com/neg", -1));

    // A rejected deep push does not burn the URL.
    BreadthFirstFrontier deeper(2);
    EXPECT_FALSE(frontier.visited().contains("https://example.com/2"));
    EXPECT_TRUE(deeper.push("https://example.com/2", 2));
}

TEST(FrontierTest, TargetCarriesMetadata) {
    BreadthFirstFrontier frontier(2);
    frontier.push("https://example.com/child#x", 1, std::string("https://example.com/"));
    auto target = frontier.pop();
    ASSERT_TRUE(target.has_value());
    EXPECT_EQ(target->url, "https://example.com/child#x");
    EXPECT_EQ(target->key, "https://example.com/child");
    EXPECT_EQ(target->depth, 1);
    ASSERT_TRUE(target->parent_url.has_value());
    EXPECT_EQ(*target->parent_url, "https://example.com/");
}

TEST(FrontierTest, BestFirstHighestPriorityFirst) {
    BestFirstFrontier frontier(2);
    frontier.push("https://example.com/mid", 1, std::nullopt, 0.5);
    frontier.push("https://example.com/low", 1, std::nullopt, 0.1);
    frontier.push("https://example.com/high", 1, std::nullopt, 0.9);

    EXPECT_EQ(frontier.pop()->url, "https://example.com/high");
    EXPECT_EQ(frontier.pop()->url, "https://example.com/mid");
    EXPECT_EQ(frontier.pop()->url, "https://example.com/low");
}

TEST(FrontierTest, BestFirstTiesKeepDiscoveryOrder) {
    BestFirstFrontier frontier(2);
    for (int i = 0; i < 10; ++i) {
        frontier.push("https://example.com/" + std::to_string(i), 1, std::nullopt, 0.5);
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(frontier.pop()->url, "https://example.com/" + std::to_string(i));
    }
}

TEST(FrontierTest, BestFirstPopsInNonIncreasingOrder) {
    BestFirstFrontier frontier(5);
    double            scores[] = {0.3, 0.7, 0.0, 0.7, 0.1, 0.35, 1.0, 0.0};
    for (size_t i = 0; i < sizeof(scores) / sizeof(scores[0]); ++i) {
        frontier.push("https://example.com/p" + std::to_string(i), 1, std::nullopt, scores[i]);
    }

    std::vector<std::string> order;
    while (auto target = frontier.pop())
        order.push_back(target->url);

    std::vector<std::string> expected = {
        "https://example.com/p6", "https://example.com/p1", "https://example.com/p3",
        "https://example.com/p5", "https://example.com/p0", "https://example.com/p4",
        "https://example.com/p2", "https://example.com/p7"};
    EXPECT_EQ(order, expected);
}

TEST(FrontierTest, MakeFrontierAndModes) {
    EXPECT_NE(dynamic_cast<BestFirstFrontier*>(make_frontier(CrawlMode::BestFirst, 1).get()), nullptr);
    EXPECT_NE(dynamic_cast<BreadthFirstFrontier*>(make_frontier(CrawlMode::BreadthFirst, 1).get()),
              nullptr);

    EXPECT_EQ(parse_crawl_mode("bfs"), CrawlMode::BreadthFirst);
    EXPECT_EQ(parse_crawl_mode("BEST_FIRST"), CrawlMode::BestFirst);
    EXPECT_EQ(to_string(CrawlMode::BestFirst), "best_first");
    EXPECT_THROW(parse_crawl_mode("dfs"), ConfigurationError);
}
