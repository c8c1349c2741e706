#pragma once
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace Harvest {
namespace Engine {

// Words harvested for one domain, filled concurrently by site consumers.
class WordSet {
public:
    void insert(const std::vector<std::string>& words);

    std::size_t              size() const;
    std::vector<std::string> snapshot() const;

private:
    mutable std::mutex    mutex_;
    std::set<std::string> words_;
};

}  // namespace Engine
}  // namespace Harvest
