#include "word_set.hpp"

namespace Harvest {
namespace Engine {

void WordSet::insert(const std::vector<std::string>& words) {
    std::lock_guard<std::mutex> lock(mutex_);
    words_.insert(words.begin(), words.end());
}

std::size_t WordSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return words_.size();
}

std::vector<std::string> WordSet::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(words_.begin(), words_.end());
}

}  // namespace Engine
}  // namespace Harvest
