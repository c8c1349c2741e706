#include "sqlite_word_store.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <stdexcept>
#include "../core/logger/logger.hpp"

namespace Harvest {
namespace Storage {

using Harvest::Core::Logger;

namespace {

constexpr const char* CREATE_WEBSITES =
    "CREATE TABLE IF NOT EXISTS websites ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "website TEXT NOT NULL)";

constexpr const char* CREATE_WORDS =
    "CREATE TABLE IF NOT EXISTS words ("
    "id INTEGER PRIMARY KEY AUTOINCREMENT, "
    "website_id INTEGER NOT NULL REFERENCES websites(id), "
    "word TEXT NOT NULL)";

struct StmtHandle {
    sqlite3_stmt* stmt = nullptr;
    ~StmtHandle() {
        if (stmt)
            sqlite3_finalize(stmt);
    }
};

}  // namespace

SqliteWordStore::SqliteWordStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open database " + path + ": " + message);
    }
    if (!exec(CREATE_WEBSITES) || !exec(CREATE_WORDS)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot create tables in " + path);
    }
}

SqliteWordStore::~SqliteWordStore() {
    if (db_)
        sqlite3_close(db_);
}

bool SqliteWordStore::exec(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        Logger::error("SqliteWordStore - " + std::string(error ? error : "unknown error"));
        sqlite3_free(error);
        return false;
    }
    return true;
}

int SqliteWordStore::count(const char* sql) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtHandle                  handle;
    if (sqlite3_prepare_v2(db_, sql, -1, &handle.stmt, nullptr) != SQLITE_OK)
        return -1;
    if (sqlite3_step(handle.stmt) != SQLITE_ROW)
        return -1;
    return sqlite3_column_int(handle.stmt, 0);
}

void SqliteWordStore::put_words(const Utils::Link& domain, const std::vector<std::string>& words) {
    const std::string website = domain.fix_www().host();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!exec("BEGIN TRANSACTION"))
        return;

    auto rollback = [&](const std::string& what) {
        Logger::error("SqliteWordStore - " + what + " for " + website + ": " + sqlite3_errmsg(db_));
        exec("ROLLBACK");
    };

    {
        StmtHandle insert_website;
        if (sqlite3_prepare_v2(db_, "INSERT INTO websites (website) VALUES (?)", -1,
                               &insert_website.stmt, nullptr)
                != SQLITE_OK
            || sqlite3_bind_text(insert_website.stmt, 1, website.c_str(), -1, SQLITE_TRANSIENT)
                   != SQLITE_OK
            || sqlite3_step(insert_website.stmt) != SQLITE_DONE) {
            rollback("Insert website failed");
            return;
        }
    }
    const std::int64_t website_id = sqlite3_last_insert_rowid(db_);

    {
        StmtHandle insert_word;
        if (sqlite3_prepare_v2(db_, "INSERT INTO words (website_id, word) VALUES (?, ?)", -1,
                               &insert_word.stmt, nullptr)
            != SQLITE_OK) {
            rollback("Prepare words failed");
            return;
        }
        for (const auto& word : words) {
            sqlite3_reset(insert_word.stmt);
            sqlite3_bind_int64(insert_word.stmt, 1, website_id);
            sqlite3_bind_text(insert_word.stmt, 2, word.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(insert_word.stmt) != SQLITE_DONE) {
                rollback("Insert word failed");
                return;
            }
        }
    }

    if (!exec("COMMIT")) {
        exec("ROLLBACK");
        return;
    }
    Logger::success("Saved " + std::to_string(words.size()) + " words of " + website);
}

int SqliteWordStore::websites_size() {
    return count("SELECT COUNT(*) FROM websites");
}

int SqliteWordStore::words_size() {
    return count("SELECT COUNT(*) FROM words");
}

std::vector<std::string> SqliteWordStore::words_of(const Utils::Link& domain) {
    std::vector<std::string> words;
    const std::string        website = domain.fix_www().host();

    std::lock_guard<std::mutex> lock(mutex_);
    StmtHandle                  handle;
    const char*                 sql =
        "SELECT w.word FROM words w JOIN websites s ON s.id = w.website_id "
        "WHERE s.website = ? ORDER BY w.word";
    if (sqlite3_prepare_v2(db_, sql, -1, &handle.stmt, nullptr) != SQLITE_OK) {
        Logger::error("SqliteWordStore - " + std::string(sqlite3_errmsg(db_)));
        return words;
    }
    sqlite3_bind_text(handle.stmt, 1, website.c_str(), -1, SQLITE_TRANSIENT);
    while (sqlite3_step(handle.stmt) == SQLITE_ROW) {
        if (const char* word = reinterpret_cast<const char*>(sqlite3_column_text(handle.stmt, 0)))
            words.emplace_back(word);
    }
    return words;
}

}  // namespace Storage
}  // namespace Harvest
