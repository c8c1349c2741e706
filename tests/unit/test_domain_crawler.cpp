#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include "../../src/core/errors/errors.hpp"
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/crawler/domain_crawler.hpp"
#include "../../src/extraction/html_context.hpp"
#include "../support/fake_http_client.hpp"
#include "../support/manual_retry_scheduler.hpp"

using namespace Harvest;
using namespace Harvest::Engine;
using namespace Harvest::Testing;
using Utils::Link;
using std::chrono::milliseconds;

namespace {

// Serves canned render results and remembers how often each URL was asked for.
class Backend {
public:
    void page(const std::string& url, Response response) {
        pages_[url] = std::move(response);
    }

    FakeHttpClient::Responder responder() {
        return [this](const Request& request) {
            auto                        url = url_of(request);
            std::lock_guard<std::mutex> lock(mutex_);
            hits_[url]++;
            auto it = pages_.find(url);
            return it != pages_.end() ? it->second : status(404);
        };
    }

    int hits(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        return hits_[url];
    }

private:
    std::map<std::string, Response> pages_;
    std::map<std::string, int>      hits_;
    std::mutex                      mutex_;
};

}  // namespace

class DomainCrawlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_NONE);
    }
    void TearDown() override {
        Core::Logger::set_level(Core::LOG_ALL);
    }

    std::unique_ptr<DomainCrawler> make_crawler(HttpClient&                    client,
                                                RetryScheduler&                scheduler,
                                                const std::string&             domain,
                                                Extraction::HtmlContextOptions options = {}) {
        engine_ = std::make_shared<RenderEngine>(client, scheduler, factory_, policy_);
        words_  = std::make_shared<WordSet>();
        return std::make_unique<DomainCrawler>(Link(domain),
                                               std::make_shared<Extraction::HtmlContext>(options),
                                               engine_, words_, milliseconds(20));
    }

    Network::Render::RenderRequestFactory factory_;
    RetryPolicy                           policy_{milliseconds(5), milliseconds(1), 2};
    std::shared_ptr<RenderEngine>         engine_;
    std::shared_ptr<WordSet>              words_;
};

TEST_F(DomainCrawlerTest, CrawlsLinkedPagesUntilExhausted) {
    Backend backend;
    backend.page("https://example.com",
                 render_ok("https://example.com",
                           "<html><body><a href='/a'>About harvest</a></body></html>"));
    backend.page("https://example.com/a",
                 render_ok("https://example.com/a", "<html><body><p>Nothing further here</p></body></html>"));

    FakeHttpClient       client(backend.responder());
    ManualRetryScheduler scheduler;
    auto                 crawler = make_crawler(client, scheduler, "https://example.com");

    crawler->crawl(std::stop_source().get_token());

    EXPECT_EQ(crawler->attempts(), 2);
    EXPECT_EQ(backend.hits("https://example.com/a"), 1);
    EXPECT_GT(words_->size(), 0u);
    EXPECT_TRUE(engine_->get_failed_sites().empty());
    EXPECT_EQ(engine_->scraping_sites_count(), 0);

    auto words = words_->snapshot();
    EXPECT_NE(std::find(words.begin(), words.end(), "harvest"), words.end());
    EXPECT_NE(std::find(words.begin(), words.end(), "further"), words.end());
}

TEST_F(DomainCrawlerTest, UnreachableRootIsFatal) {
    Backend backend;
    backend.page("https://down.example", transport_error(ErrorType::Network, "connection refused"));

    FakeHttpClient       client(backend.responder());
    ManualRetryScheduler scheduler;
    auto                 crawler = make_crawler(client, scheduler, "https://down.example");

    EXPECT_THROW(crawler->crawl(std::stop_source().get_token()), Core::ConnectionError);
    EXPECT_EQ(crawler->attempts(), 1);
}

TEST_F(DomainCrawlerTest, DeepConnectionFailureIsOnlyLogged) {
    Backend backend;
    backend.page("https://example.com",
                 render_ok("https://example.com", "<a href='/a'>one</a><a href='/b'>two</a>"));
    backend.page("https://example.com/a", render_ok("https://example.com/a", "<p>fine</p>"));
    backend.page("https://example.com/b", transport_error(ErrorType::Network, "reset"));

    FakeHttpClient       client(backend.responder());
    ManualRetryScheduler scheduler;
    auto                 crawler = make_crawler(client, scheduler, "https://example.com");

    EXPECT_NO_THROW(crawler->crawl(std::stop_source().get_token()));
    EXPECT_EQ(crawler->attempts(), 3);
    auto failed = engine_->get_failed_sites();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].failure.kind, Core::FailureKind::Connection);
}

TEST_F(DomainCrawlerTest, UnavailableBackendOnRootIsFatal) {
    Backend backend;
    backend.page("https://example.com", status(503));

    FakeHttpClient       client(backend.responder());
    SerialRetryScheduler scheduler;
    auto                 crawler = make_crawler(client, scheduler, "https://example.com");

    EXPECT_THROW(crawler->crawl(std::stop_source().get_token()), Core::BackendUnavailableError);
    EXPECT_EQ(backend.hits("https://example.com"), policy_.max_retries + 1);
    scheduler.shutdown();
}

TEST_F(DomainCrawlerTest, RejectedRootLanguageIsNotFatal) {
    Backend backend;
    backend.page("https://example.de",
                 render_ok("https://example.de", "<html lang='de'><body>Guten Tag</body></html>"));

    FakeHttpClient                 client(backend.responder());
    ManualRetryScheduler           scheduler;
    Extraction::HtmlContextOptions options;
    options.languages = {"en"};
    auto crawler      = make_crawler(client, scheduler, "https://example.de", options);

    EXPECT_NO_THROW(crawler->crawl(std::stop_source().get_token()));
    EXPECT_EQ(words_->size(), 0u);
    auto failed = engine_->get_failed_sites();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].failure.kind, Core::FailureKind::ContentRejected);
}

TEST_F(DomainCrawlerTest, LinkFoundTwiceIsRenderedTwice) {
    Backend backend;
    backend.page("https://example.com",
                 render_ok("https://example.com", "<a href='/a'>first</a><a href='/a'>again</a>"));
    backend.page("https://example.com/a", render_ok("https://example.com/a", "<p>leaf</p>"));

    FakeHttpClient       client(backend.responder());
    ManualRetryScheduler scheduler;
    auto                 crawler = make_crawler(client, scheduler, "https://example.com");

    crawler->crawl(std::stop_source().get_token());

    EXPECT_EQ(crawler->attempts(), 3);
    EXPECT_EQ(backend.hits("https://example.com/a"), 2);
}

TEST_F(DomainCrawlerTest, StopCancelsOutstandingCallsWithinPollInterval) {
    FakeHttpClient       client;
    ManualRetryScheduler scheduler;
    auto                 crawler = make_crawler(client, scheduler, "https://example.com");

    std::stop_source stop;
    std::thread      worker([&]() { crawler->crawl(stop.get_token()); });
    ASSERT_TRUE(client.wait_for_pending(1, std::chrono::seconds(5)));

    auto started = std::chrono::steady_clock::now();
    stop.request_stop();
    worker.join();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, milliseconds(1000));
    EXPECT_TRUE(client.stop_requested(0));
    EXPECT_TRUE(engine_->is_canceled());

    // A late answer is not delivered.
    client.complete_next(render_ok("https://example.com", "<a href='/late'>late</a>"));
    EXPECT_EQ(words_->size(), 0u);
}
