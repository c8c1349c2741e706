#pragma once
#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <memory>
#include <set>
#include <stop_token>
#include <string>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../../extraction/context.hpp"
#include "../../network/http/http_client.hpp"
#include "../../network/render/render_protocol.hpp"
#include "../../storage/word_store.hpp"
#include "../../utils/url/url.hpp"
#include "../frontier/word_set.hpp"
#include "../scraper/retry_scheduler.hpp"

namespace Harvest {
namespace Engine {

struct SpiderConfig {
    std::chrono::milliseconds domain_timeout{Core::Constants::DOMAIN_TIMEOUT_SECONDS * 1000};
    int                       connect_fails = Core::Constants::MAX_CONNECT_FAILS;
    std::chrono::milliseconds poll_interval{Core::Constants::FRONTIER_POLL_MS};
    std::chrono::milliseconds shutdown_grace{Core::Constants::SHUTDOWN_GRACE_SECONDS * 1000};

    RetryPolicy                    retry;
    Network::Render::RenderOptions render;
};

struct RunSummary {
    int processed           = 0;
    int skipped             = 0;
    int completed           = 0;
    int timed_out           = 0;
    int connection_failures = 0;
    int backend_unavailable = 0;
    int failed              = 0;

    bool        aborted     = false;
    bool        interrupted = false;
    std::string abort_reason;
};

/**
 * Crawls a batch of domains one after another.
 *
 * Each domain gets a fresh RenderEngine and extraction context and runs on a
 * single worker thread under a wall-clock timeout. Consecutive connection
 * failures trip a circuit breaker that aborts the run. Harvested words are
 * handed to the store on a second worker so the next domain starts at once.
 *
 * run() always shuts the shared client and retry scheduler down before it
 * returns, so a Spider runs exactly once.
 */
class Spider {
public:
    Spider(SpiderConfig                config,
           Network::Http::HttpClient&  client,
           RetryScheduler&             scheduler,
           Storage::WordStore&         store,
           Extraction::ContextFactory  context_factory);
    ~Spider();

    Spider(const Spider&)            = delete;
    Spider& operator=(const Spider&) = delete;

    RunSummary run(const std::vector<Utils::Link>& domains);

    // Thread safe. The current domain is cancelled and the run winds down.
    void stop();

private:
    enum class DomainOutcome {
        Completed,
        TimedOut,
        ConnectionFailure,
        BackendUnavailable,
        Failed,
        Interrupted
    };

    bool          already_processed(const Utils::Link& domain);
    DomainOutcome crawl_domain(const Utils::Link& domain, const std::shared_ptr<WordSet>& words);
    void          track_outcome(DomainOutcome outcome, RunSummary& summary);
    void          persist(const Utils::Link& domain, const std::shared_ptr<WordSet>& words);
    void          shutdown();

    SpiderConfig                          config_;
    Network::Http::HttpClient&            client_;
    RetryScheduler&                       scheduler_;
    Storage::WordStore&                   store_;
    Extraction::ContextFactory            context_factory_;
    Network::Render::RenderRequestFactory request_factory_;

    std::stop_source      stop_;
    std::set<std::string> processed_domains_;
    int                   connect_fails_in_a_row_ = 0;

    boost::asio::thread_pool domain_pool_{1};
    boost::asio::thread_pool store_pool_{1};
    std::atomic<bool>        accepting_{true};
    std::atomic<bool>        is_shutdown_{false};
};

}  // namespace Engine
}  // namespace Harvest
