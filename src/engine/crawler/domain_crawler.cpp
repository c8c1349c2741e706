#include "domain_crawler.hpp"
#include "../../core/errors/errors.hpp"
#include "../../core/logger/logger.hpp"

namespace Harvest {
namespace Engine {

using Core::FailureKind;
using Core::Logger;

DomainCrawler::DomainCrawler(Utils::Link                          domain,
                             std::shared_ptr<Extraction::Context> context,
                             std::shared_ptr<RenderEngine>        engine,
                             std::shared_ptr<WordSet>             words,
                             std::chrono::milliseconds            poll_interval)
    : domain_(std::move(domain)),
      context_(std::move(context)),
      engine_(std::move(engine)),
      words_(std::move(words)),
      frontier_(std::make_shared<LinkQueue>()),
      poll_interval_(poll_interval) {
}

RenderEngine::SiteConsumer DomainCrawler::site_consumer() {
    // Handlers may outlive this crawler, so they share what they touch.
    return [context = context_, frontier = frontier_, words = words_](const Core::Site& site) {
        auto extracted = context->extract(site.html);
        auto links     = context->crawl(site.html);
        frontier->push_all(context->filter_links(std::move(links), site.html.link, site.initial_link));
        words->insert(context->filter_words(std::move(extracted)));
    };
}

void DomainCrawler::crawl(std::stop_token stop) {
    Logger::debug("DomainCrawler - Start crawling " + domain_.str());

    engine_->scrape(domain_, site_consumer());
    attempts_ = 1;

    // Engine first: a link is queued before its attempt stops being counted.
    while (engine_->scraping_sites_count() != 0 || !frontier_->empty()) {
        if (stop.stop_requested()) {
            Logger::debug("DomainCrawler - Interrupted " + domain_.str());
            engine_->cancel_all();
            return;
        }
        if (auto link = frontier_->poll(poll_interval_)) {
            engine_->scrape(*link, site_consumer());
            attempts_++;
        }
    }

    if (attempts_ == 1)
        check_root_failure();

    Logger::debug("DomainCrawler - Finished " + domain_.str() + " after "
                  + std::to_string(attempts_.load()) + " attempts: " + engine_->statistic().to_string());
}

void DomainCrawler::check_root_failure() {
    auto failed = engine_->get_failed_sites();
    if (failed.empty())
        return;

    const auto& failure = failed.front().failure;
    switch (failure.kind) {
        case FailureKind::Connection:
        case FailureKind::BackendUnavailable:
            Core::raise(failure);
        case FailureKind::ContentRejected:
            Logger::warn("Wrong html language, site is not taken into account " + domain_.str());
            return;
        case FailureKind::TransientBackend:
        case FailureKind::Timeout:
        case FailureKind::Unexpected:
            Logger::debug("DomainCrawler - Root of " + domain_.str() + " failed ("
                          + Core::to_string(failure.kind) + "): " + failure.message);
            return;
    }
}

}  // namespace Engine
}  // namespace Harvest
