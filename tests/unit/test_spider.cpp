#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/spider/spider.hpp"
#include "../../src/extraction/html_context.hpp"
#include "../support/fake_http_client.hpp"
#include "../support/manual_retry_scheduler.hpp"

using namespace Harvest;
using namespace Harvest::Engine;
using namespace Harvest::Testing;
using Utils::Link;
using std::chrono::milliseconds;

namespace {

class RecordingStore : public Storage::WordStore {
public:
    void put_words(const Link& domain, const std::vector<std::string>& words) override {
        std::lock_guard<std::mutex> lock(mutex_);
        stored_[domain.fix_www().host()] = words;
    }

    std::map<std::string, std::vector<std::string>> stored() {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_;
    }

private:
    std::mutex                                      mutex_;
    std::map<std::string, std::vector<std::string>> stored_;
};

// Answers by host: "down" hosts refuse connections, "busy" hosts keep
// answering 503, everything else renders a page with a few words.
Response answer(const Request& request) {
    auto url  = url_of(request);
    auto host = Link(url).host();
    if (host.find("down") == 0)
        return transport_error(ErrorType::Network, "connection refused");
    if (host.find("busy") == 0)
        return status(503);
    return render_ok(url, "<html><body><p>Welcome to " + host + " bakery</p></body></html>");
}

std::vector<Link> links(const std::vector<std::string>& urls) {
    std::vector<Link> result;
    for (const auto& url : urls)
        result.emplace_back(url);
    return result;
}

}  // namespace

class SpiderTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_NONE);
        config_.domain_timeout = milliseconds(5000);
        config_.connect_fails  = 3;
        config_.poll_interval  = milliseconds(10);
        config_.shutdown_grace = milliseconds(2000);
        config_.retry          = RetryPolicy{milliseconds(5), milliseconds(1), 1};
    }
    void TearDown() override {
        Core::Logger::set_level(Core::LOG_ALL);
    }

    Extraction::ContextFactory contexts() {
        return []() { return std::make_shared<Extraction::HtmlContext>(); };
    }

    SpiderConfig   config_;
    RecordingStore store_;
};

TEST_F(SpiderTest, CrawlsEveryDomainAndStoresWords) {
    FakeHttpClient       client(answer);
    SerialRetryScheduler scheduler;
    Spider               spider(config_, client, scheduler, store_, contexts());

    auto summary = spider.run(links({"https://alpha.example", "https://beta.example"}));

    EXPECT_EQ(summary.processed, 2);
    EXPECT_EQ(summary.completed, 2);
    EXPECT_FALSE(summary.aborted);
    EXPECT_FALSE(summary.interrupted);

    auto stored = store_.stored();
    ASSERT_EQ(stored.size(), 2u);
    EXPECT_EQ(stored["alpha.example"],
              (std::vector<std::string>{"alpha", "bakery", "example", "welcome"}));
}

TEST_F(SpiderTest, SkipsDomainsAlreadyProcessed) {
    FakeHttpClient       client(answer);
    SerialRetryScheduler scheduler;
    Spider               spider(config_, client, scheduler, store_, contexts());

    auto summary =
        spider.run(links({"https://www.example.com", "http://example.com/", "https://example.org"}));

    EXPECT_EQ(summary.processed, 2);
    EXPECT_EQ(summary.skipped, 1);
    EXPECT_EQ(client.sent(), 2);
}

TEST_F(SpiderTest, ConsecutiveConnectionFailuresAbortTheRun) {
    FakeHttpClient       client(answer);
    SerialRetryScheduler scheduler;
    Spider               spider(config_, client, scheduler, store_, contexts());

    auto summary = spider.run(links({"https://down1.example", "https://down2.example",
                                     "https://down3.example", "https://alive.example"}));

    EXPECT_TRUE(summary.aborted);
    EXPECT_NE(summary.abort_reason.find("Too many connection failures"), std::string::npos);
    EXPECT_EQ(summary.connection_failures, 3);
    EXPECT_EQ(summary.processed, 3);
    EXPECT_EQ(client.sent(), 3);
    EXPECT_EQ(store_.stored().count("alive.example"), 0u);
}

TEST_F(SpiderTest, SuccessResetsTheFailureCounter) {
    FakeHttpClient       client(answer);
    SerialRetryScheduler scheduler;
    Spider               spider(config_, client, scheduler, store_, contexts());

    auto summary = spider.run(links({"https://down1.example", "https://down2.example",
                                     "https://alive.example", "https://down3.example",
                                     "https://down4.example"}));

    EXPECT_FALSE(summary.aborted);
    EXPECT_EQ(summary.connection_failures, 4);
    EXPECT_EQ(summary.completed, 1);
    EXPECT_EQ(summary.processed, 5);
}

TEST_F(SpiderTest, UnavailableBackendIsReportedButTolerated) {
    config_.connect_fails = 2;
    FakeHttpClient       client(answer);
    SerialRetryScheduler scheduler;
    Spider               spider(config_, client, scheduler, store_, contexts());

    auto summary = spider.run(
        links({"https://down1.example", "https://busy.example", "https://down2.example"}));

    EXPECT_FALSE(summary.aborted);
    EXPECT_EQ(summary.backend_unavailable, 1);
    EXPECT_EQ(summary.connection_failures, 2);
}

TEST_F(SpiderTest, SlowDomainTimesOutAndRunContinues) {
    config_.domain_timeout = milliseconds(200);
    config_.retry          = RetryPolicy{std::chrono::seconds(30), milliseconds(1), 5};
    FakeHttpClient       client(answer);
    SerialRetryScheduler scheduler;
    Spider               spider(config_, client, scheduler, store_, contexts());

    auto started = std::chrono::steady_clock::now();
    auto summary = spider.run(links({"https://busy.example", "https://alive.example"}));

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
    EXPECT_EQ(summary.timed_out, 1);
    EXPECT_EQ(summary.completed, 1);
    auto stored = store_.stored();
    EXPECT_EQ(stored.count("busy.example"), 1u);
    EXPECT_EQ(stored.count("alive.example"), 1u);
}

TEST_F(SpiderTest, SharedServicesAreShutDownAfterRun) {
    FakeHttpClient       client(answer);
    ManualRetryScheduler scheduler;
    {
        Spider spider(config_, client, scheduler, store_, contexts());
        spider.run(links({"https://alpha.example"}));
    }
    EXPECT_TRUE(client.is_shutdown());
    EXPECT_TRUE(scheduler.is_shutdown());
}

TEST_F(SpiderTest, StopInterruptsTheCurrentDomain) {
    FakeHttpClient       client;
    ManualRetryScheduler scheduler;
    Spider               spider(config_, client, scheduler, store_, contexts());

    RunSummary  summary;
    std::thread runner([&]() {
        summary = spider.run(links({"https://hanging.example", "https://never.example"}));
    });
    ASSERT_TRUE(client.wait_for_pending(1, std::chrono::seconds(5)));
    spider.stop();
    runner.join();

    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.processed, 1);
    EXPECT_TRUE(client.stop_requested(0));
    EXPECT_EQ(client.sent(), 1);
}

TEST_F(SpiderTest, StopBeforeRunProcessesNothing) {
    FakeHttpClient       client(answer);
    ManualRetryScheduler scheduler;
    Spider               spider(config_, client, scheduler, store_, contexts());

    spider.stop();
    auto summary = spider.run(links({"https://alpha.example"}));

    EXPECT_TRUE(summary.interrupted);
    EXPECT_EQ(summary.processed, 0);
    EXPECT_EQ(client.sent(), 0);
}

TEST_F(SpiderTest, ShutdownLogsOutstandingWork) {
    const std::string path = "test_spider_shutdown.log";
    std::filesystem::remove(path);
    ASSERT_TRUE(Core::Logger::set_log_file(path));
    Core::Logger::set_level(Core::LOG_DEBUG);

    config_.domain_timeout = milliseconds(100);
    FakeHttpClient       client;
    ManualRetryScheduler scheduler;
    RunSummary           summary;
    {
        Spider spider(config_, client, scheduler, store_, contexts());
        summary = spider.run(links({"https://hanging.example"}));
    }
    Core::Logger::set_level(Core::LOG_NONE);
    Core::Logger::close_log_file();

    EXPECT_EQ(summary.timed_out, 1);
    std::ifstream     in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("Spider - Closing services with 1 calls running and 0 retries pending"),
              std::string::npos);
    std::filesystem::remove(path);
}
