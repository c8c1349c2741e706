#include "spider.hpp"
#include <boost/asio/post.hpp>
#include <exception>
#include <future>
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../crawler/domain_crawler.hpp"
#include "../scraper/render_engine.hpp"

namespace Harvest {
namespace Engine {

using Core::FailureKind;
using Core::Logger;
using Utils::Link;

Spider::Spider(SpiderConfig               config,
               Network::Http::HttpClient& client,
               RetryScheduler&            scheduler,
               Storage::WordStore&        store,
               Extraction::ContextFactory context_factory)
    : config_(std::move(config)),
      client_(client),
      scheduler_(scheduler),
      store_(store),
      context_factory_(std::move(context_factory)),
      request_factory_(config_.render) {
}

Spider::~Spider() {
    shutdown();
}

void Spider::stop() {
    if (stop_.request_stop())
        Logger::warn("Stopping, waiting for the current domain to wind down");
}

RunSummary Spider::run(const std::vector<Link>& domains) {
    RunSummary summary;
    try {
        for (const auto& domain : domains) {
            if (stop_.stop_requested()) {
                summary.interrupted = true;
                break;
            }
            if (already_processed(domain)) {
                summary.skipped++;
                continue;
            }
            summary.processed++;

            auto words   = std::make_shared<WordSet>();
            auto outcome = crawl_domain(domain, words);
            if (outcome == DomainOutcome::Interrupted) {
                summary.interrupted = true;
                break;
            }
            track_outcome(outcome, summary);
            persist(domain, words);
        }
    } catch (const Core::TooManyConnectionFailures& e) {
        summary.aborted      = true;
        summary.abort_reason = e.what();
        Logger::debug("Spider - Stopped: " + summary.abort_reason);
        Logger::error("Spider stopped, " + summary.abort_reason);
    }

    Logger::debug("Spider - Completed");
    shutdown();
    Logger::debug("Spider - Resources were closed");
    return summary;
}

bool Spider::already_processed(const Link& domain) {
    auto fixed = domain.fix_www().host();
    if (!processed_domains_.insert(fixed).second) {
        Logger::debug("Spider - Skip domain because it is already scraped " + domain.str());
        Logger::warn("Skip domain because it is already scraped " + domain.str());
        return true;
    }
    return false;
}

Spider::DomainOutcome Spider::crawl_domain(const Link& domain, const std::shared_ptr<WordSet>& words) {
    auto engine  = std::make_shared<RenderEngine>(client_, scheduler_, request_factory_, config_.retry);
    auto crawler = std::make_shared<DomainCrawler>(domain, context_factory_(), engine, words,
                                                   config_.poll_interval);

    std::stop_source domain_stop;
    auto             done   = std::make_shared<std::promise<void>>();
    auto             future = done->get_future();
    boost::asio::post(domain_pool_, [crawler, token = domain_stop.get_token(), done]() {
        try {
            crawler->crawl(token);
            done->set_value();
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    });

    auto cancel = [&](const std::string& reason) {
        domain_stop.request_stop();
        if (future.wait_for(config_.shutdown_grace) != std::future_status::ready)
            Logger::warn("Domain " + domain.str() + " did not stop after " + reason);
    };

    auto deadline = std::chrono::steady_clock::now() + config_.domain_timeout;
    while (future.wait_for(config_.poll_interval) != std::future_status::ready) {
        if (stop_.stop_requested()) {
            cancel("interruption");
            Logger::debug("Spider - Interrupted on " + domain.str());
            return DomainOutcome::Interrupted;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            cancel("timeout");
            Logger::debug("Spider - Waiting too long for scraping site " + domain.str());
            Logger::error("Waiting too long for scraping site " + domain.str());
            return DomainOutcome::TimedOut;
        }
    }

    Logger::info(engine->statistic().to_string() + " site " + domain.str());

    try {
        future.get();
        return DomainOutcome::Completed;
    } catch (const Core::CrawlError& e) {
        switch (e.kind()) {
            case FailureKind::Connection:
                Logger::debug("Spider - Request failed " + domain.str() + ": " + e.what());
                Logger::error("Request failed " + domain.str() + " " + e.what());
                return DomainOutcome::ConnectionFailure;
            case FailureKind::BackendUnavailable:
                Logger::debug("Spider - Backend unavailable on " + domain.str() + ": " + e.what());
                Logger::error(e.what());
                return DomainOutcome::BackendUnavailable;
            case FailureKind::TransientBackend:
            case FailureKind::ContentRejected:
            case FailureKind::Timeout:
            case FailureKind::Unexpected:
                Logger::debug("Spider - Failed " + domain.str() + ": " + e.what());
                return DomainOutcome::Failed;
        }
        return DomainOutcome::Failed;
    } catch (const std::exception& e) {
        Logger::debug("Spider - Failed " + domain.str() + ": " + e.what());
        return DomainOutcome::Failed;
    }
}

void Spider::track_outcome(DomainOutcome outcome, RunSummary& summary) {
    switch (outcome) {
        case DomainOutcome::ConnectionFailure:
            summary.connection_failures++;
            if (++connect_fails_in_a_row_ >= config_.connect_fails)
                throw Core::TooManyConnectionFailures(connect_fails_in_a_row_);
            return;
        case DomainOutcome::Completed:
            summary.completed++;
            break;
        case DomainOutcome::TimedOut:
            summary.timed_out++;
            break;
        case DomainOutcome::BackendUnavailable:
            summary.backend_unavailable++;
            break;
        case DomainOutcome::Failed:
            summary.failed++;
            break;
        case DomainOutcome::Interrupted:
            summary.interrupted = true;
            break;
    }
    connect_fails_in_a_row_ = 0;
}

void Spider::persist(const Link& domain, const std::shared_ptr<WordSet>& words) {
    if (!accepting_) {
        Logger::debug("Spider - Store closed, dropped words of " + domain.str());
        return;
    }
    // Snapshot now: a timed out crawl may still be delivering pages.
    auto snapshot = std::make_shared<std::vector<std::string>>(words->snapshot());
    boost::asio::post(store_pool_, [this, domain, snapshot]() {
        try {
            store_.put_words(domain, *snapshot);
        } catch (const std::exception& e) {
            Logger::error("Failed to store words of " + domain.str() + ": " + e.what());
        }
    });
}

void Spider::shutdown() {
    if (is_shutdown_.exchange(true))
        return;
    accepting_ = false;

    auto drained = std::make_shared<std::promise<void>>();
    auto future  = drained->get_future();
    boost::asio::post(store_pool_, [drained]() { drained->set_value(); });
    if (future.wait_for(config_.shutdown_grace) != std::future_status::ready)
        Logger::warn("Word store did not finish within the grace period");

    store_pool_.stop();
    domain_pool_.stop();
    store_pool_.join();
    domain_pool_.join();

    Logger::debug("Spider - Closing services with " + std::to_string(client_.running_calls_count())
                  + " calls running and " + std::to_string(scheduler_.pending()) + " retries pending");
    client_.shutdown();
    scheduler_.shutdown();
}

}  // namespace Engine
}  // namespace Harvest
