#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>
#include "../../src/engine/frontier/link_queue.hpp"
#include "../../src/engine/frontier/word_set.hpp"

using namespace Harvest::Engine;
using Harvest::Utils::Link;
using std::chrono::milliseconds;

TEST(LinkQueueTest, FifoOrderAndDuplicates) {
    LinkQueue queue;
    queue.push(Link("https://example.com/a"));
    queue.push_all({Link("https://example.com/b"), Link("https://example.com/a")});

    EXPECT_EQ(queue.size(), 3u);
    EXPECT_EQ(queue.poll(milliseconds(1))->str(), "https://example.com/a");
    EXPECT_EQ(queue.poll(milliseconds(1))->str(), "https://example.com/b");
    EXPECT_EQ(queue.poll(milliseconds(1))->str(), "https://example.com/a");
    EXPECT_TRUE(queue.empty());
}

TEST(LinkQueueTest, PollTimesOutWhenEmpty) {
    LinkQueue queue;
    auto      started = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.poll(milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - started, milliseconds(25));
}

TEST(LinkQueueTest, PollWakesOnPushFromAnotherThread) {
    LinkQueue   queue;
    std::thread producer([&]() {
        std::this_thread::sleep_for(milliseconds(20));
        queue.push(Link("https://example.com/late"));
    });

    auto link = queue.poll(std::chrono::seconds(5));
    producer.join();
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->str(), "https://example.com/late");
}

TEST(LinkQueueTest, ConcurrentProducers) {
    LinkQueue                queue;
    std::vector<std::thread> producers;
    for (int t = 0; t < 8; ++t) {
        producers.emplace_back([&queue, t]() {
            for (int i = 0; i < 100; ++i)
                queue.push(Link("https://example.com/" + std::to_string(t) + "/" + std::to_string(i)));
        });
    }
    for (auto& producer : producers)
        producer.join();
    EXPECT_EQ(queue.size(), 800u);
}

TEST(WordSetTest, MergesConcurrentInserts) {
    WordSet                  words;
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&words]() {
            for (int i = 0; i < 50; ++i)
                words.insert({"shared", "word" + std::to_string(i)});
        });
    }
    for (auto& writer : writers)
        writer.join();

    EXPECT_EQ(words.size(), 51u);
    auto snapshot = words.snapshot();
    EXPECT_TRUE(std::is_sorted(snapshot.begin(), snapshot.end()));
}
