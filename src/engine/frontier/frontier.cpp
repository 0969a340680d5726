#include "frontier.hpp"
#include "../../core/errors/errors.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Trawl {
namespace Engine {

using namespace Trawl::Utils;

std::string to_string(CrawlMode mode) {
    return mode == CrawlMode::BestFirst ? "best_first" : "bfs";
}

CrawlMode parse_crawl_mode(const std::string& name) {
    std::string lower = Text::to_lower(Text::trim(name));
    if (lower == "bfs" || lower == "breadth_first")
        return CrawlMode::BreadthFirst;
    if (lower == "best_first" || lower == "bestfirst")
        return CrawlMode::BestFirst;
    throw Core::ConfigurationError("Unknown crawl mode: '" + name + "' (expected bfs or best_first)");
}

Frontier::Frontier(int max_depth) : max_depth_(max_depth) {
}

bool Frontier::push(const std::string&         url,
                    int                        depth,
                    std::optional<std::string> parent_url,
                    double                     priority) {
    if (depth < 0 || depth > max_depth_)
        return false;

    std::string key = Url::normalize(url);
    if (!visited_.insert(key))
        return false;

    CrawlTarget target;
    target.url           = url;
    target.key           = std::move(key);
    target.depth         = depth;
    target.parent_url    = std::move(parent_url);
    target.discovered_at = next_order_++;
    enqueue(std::move(target), priority);
    return true;
}

std::optional<CrawlTarget> Frontier::pop() {
    if (empty())
        return std::nullopt;
    return dequeue();
}

void BreadthFirstFrontier::enqueue(CrawlTarget target, double) {
    queue_.push(std::move(target));
}

std::optional<CrawlTarget> BreadthFirstFrontier::dequeue() {
    CrawlTarget target = std::move(queue_.front());
    queue_.pop();
    return target;
}

void BestFirstFrontier::enqueue(CrawlTarget target, double priority) {
    heap_.push(Entry{priority, std::move(target)});
}

std::optional<CrawlTarget> BestFirstFrontier::dequeue() {
    CrawlTarget target = heap_.top().target;
    heap_.pop();
    return target;
}

std::unique_ptr<Frontier> make_frontier(CrawlMode mode, int max_depth) {
    if (mode == CrawlMode::BestFirst)
        return std::make_unique<BestFirstFrontier>(max_depth);
    return std::make_unique<BreadthFirstFrontier>(max_depth);
}

}  // namespace Engine
}  // namespace Trawl
