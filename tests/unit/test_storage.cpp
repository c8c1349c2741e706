#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/logger/logger.hpp"
#include "../../src/storage/disk_word_store.hpp"
#include "../../src/storage/sqlite_word_store.hpp"

using namespace Harvest::Storage;
using Harvest::Utils::Link;
namespace fs = std::filesystem;

class StorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        Harvest::Core::Logger::set_level(Harvest::Core::LOG_ERROR);
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }

    void TearDown() override {
        Harvest::Core::Logger::set_level(Harvest::Core::LOG_ALL);
        if (fs::exists("test_storage_out"))
            fs::remove_all("test_storage_out");
    }
};

TEST_F(StorageTest, DiskStoreWritesOneWordPerLine) {
    DiskWordStore store("test_storage_out");
    store.put_words(Link("https://www.example.com/"), {"alpha", "beta"});

    ASSERT_TRUE(fs::exists("test_storage_out/example.com.txt"));
    std::ifstream file("test_storage_out/example.com.txt");
    std::string   content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "alpha\nbeta\n");
}

TEST_F(StorageTest, DiskStoreNamesFileAfterDomainWithoutWww) {
    DiskWordStore store("test_storage_out");
    EXPECT_EQ(fs::path(store.path_for(Link("http://www.shop.example.org/x"))).filename(),
              "shop.example.org.txt");
}

TEST_F(StorageTest, DiskStoreWritesEmptyVocabulary) {
    DiskWordStore store("test_storage_out");
    store.put_words(Link("https://empty.example"), {});
    EXPECT_TRUE(fs::exists("test_storage_out/empty.example.txt"));
    EXPECT_EQ(fs::file_size("test_storage_out/empty.example.txt"), 0u);
}

TEST_F(StorageTest, SqliteStoreKeepsWordsPerWebsite) {
    fs::create_directories("test_storage_out");
    SqliteWordStore store("test_storage_out/words.db");

    store.put_words(Link("https://www.example.com"), {"gamma", "alpha"});
    store.put_words(Link("https://other.org"), {"delta"});

    EXPECT_EQ(store.websites_size(), 2);
    EXPECT_EQ(store.words_size(), 3);
    EXPECT_EQ(store.words_of(Link("https://example.com")), (std::vector<std::string>{"alpha", "gamma"}));
    EXPECT_EQ(store.words_of(Link("https://other.org")), (std::vector<std::string>{"delta"}));
}

TEST_F(StorageTest, SqliteStoreSurvivesReopen) {
    fs::create_directories("test_storage_out");
    {
        SqliteWordStore store("test_storage_out/words.db");
        store.put_words(Link("https://example.com"), {"kept"});
    }
    SqliteWordStore reopened("test_storage_out/words.db");
    EXPECT_EQ(reopened.words_size(), 1);
}

TEST_F(StorageTest, SqliteStoreRejectsUnopenablePath) {
    EXPECT_THROW(SqliteWordStore("test_storage_out/missing/dir/words.db"), std::runtime_error);
}
