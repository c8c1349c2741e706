#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>
#include "../../utils/url/url.hpp"

namespace Harvest {
namespace Engine {

// Unbounded FIFO of links waiting for a render attempt. Pushed from
// completion handlers, polled by the crawl loop. Duplicates are kept.
class LinkQueue {
public:
    void push(Utils::Link link);
    void push_all(std::vector<Utils::Link> links);

    // Waits at most `timeout` for a link.
    std::optional<Utils::Link> poll(std::chrono::milliseconds timeout);

    bool        empty() const;
    std::size_t size() const;

private:
    mutable std::mutex      mutex_;
    std::condition_variable cv_;
    std::queue<Utils::Link> links_;
};

}  // namespace Engine
}  // namespace Harvest
