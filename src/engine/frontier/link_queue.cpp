#include "link_queue.hpp"

namespace Harvest {
namespace Engine {

void LinkQueue::push(Utils::Link link) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        links_.push(std::move(link));
    }
    cv_.notify_one();
}

void LinkQueue::push_all(std::vector<Utils::Link> links) {
    if (links.empty())
        return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& link : links)
            links_.push(std::move(link));
    }
    cv_.notify_all();
}

std::optional<Utils::Link> LinkQueue::poll(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !links_.empty(); }))
        return std::nullopt;

    auto link = std::move(links_.front());
    links_.pop();
    return link;
}

bool LinkQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return links_.empty();
}

std::size_t LinkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return links_.size();
}

}  // namespace Engine
}  // namespace Harvest
