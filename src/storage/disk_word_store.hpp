#pragma once
#include <string>
#include "word_store.hpp"

namespace Harvest {
namespace Storage {

// One `<host>.txt` file per domain, one word per line.
class DiskWordStore : public WordStore {
public:
    explicit DiskWordStore(const std::string& base_path);
    ~DiskWordStore() override = default;

    void put_words(const Utils::Link& domain, const std::vector<std::string>& words) override;

    std::string path_for(const Utils::Link& domain) const;

private:
    std::string base_path_;
};

}  // namespace Storage
}  // namespace Harvest
