#pragma once
#include <string>
#include <vector>
#include "../utils/url/url.hpp"

namespace Harvest {
namespace Storage {

// Receives the vocabulary of one finished domain. Implementations report
// their own failures and never throw to the caller.
class WordStore {
public:
    virtual ~WordStore() = default;

    virtual void put_words(const Utils::Link& domain, const std::vector<std::string>& words) = 0;
};

}  // namespace Storage
}  // namespace Harvest
