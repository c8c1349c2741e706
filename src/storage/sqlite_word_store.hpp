#pragma once
#include <mutex>
#include <string>
#include <vector>
#include "word_store.hpp"

struct sqlite3;

namespace Harvest {
namespace Storage {

/**
 * Keeps every domain in one SQLite file:
 *   websites(id, website)
 *   words(id, website_id, word)
 * Each put_words call runs in its own transaction.
 */
class SqliteWordStore : public WordStore {
public:
    // Throws std::runtime_error when the database cannot be opened.
    explicit SqliteWordStore(const std::string& path);
    ~SqliteWordStore() override;

    SqliteWordStore(const SqliteWordStore&)            = delete;
    SqliteWordStore& operator=(const SqliteWordStore&) = delete;

    void put_words(const Utils::Link& domain, const std::vector<std::string>& words) override;

    int                      websites_size();
    int                      words_size();
    std::vector<std::string> words_of(const Utils::Link& domain);

private:
    bool exec(const char* sql);
    int  count(const char* sql);

    sqlite3*   db_ = nullptr;
    std::mutex mutex_;
};

}  // namespace Storage
}  // namespace Harvest
