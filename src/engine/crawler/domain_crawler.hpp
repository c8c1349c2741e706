#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <stop_token>
#include "../../core/types/constants.hpp"
#include "../../extraction/context.hpp"
#include "../../utils/url/url.hpp"
#include "../frontier/link_queue.hpp"
#include "../frontier/word_set.hpp"
#include "../scraper/render_engine.hpp"

namespace Harvest {
namespace Engine {

/**
 * Breadth-first crawl of one domain through a RenderEngine.
 *
 * crawl() blocks the calling thread until the frontier is drained and no
 * attempt is outstanding, or until a stop is requested. When the root link
 * was the only attempt and it failed with a connection or backend failure
 * the matching Core::CrawlError is thrown.
 */
class DomainCrawler {
public:
    DomainCrawler(Utils::Link                          domain,
                  std::shared_ptr<Extraction::Context> context,
                  std::shared_ptr<RenderEngine>        engine,
                  std::shared_ptr<WordSet>             words,
                  std::chrono::milliseconds            poll_interval =
                      std::chrono::milliseconds(Core::Constants::FRONTIER_POLL_MS));

    void crawl(std::stop_token stop);

    int attempts() const {
        return attempts_.load();
    }

    const RenderEngine& engine() const {
        return *engine_;
    }

private:
    RenderEngine::SiteConsumer site_consumer();
    void                       check_root_failure();

    Utils::Link                          domain_;
    std::shared_ptr<Extraction::Context> context_;
    std::shared_ptr<RenderEngine>        engine_;
    std::shared_ptr<WordSet>             words_;
    std::shared_ptr<LinkQueue>           frontier_;
    std::chrono::milliseconds            poll_interval_;
    std::atomic<int>                     attempts_{0};
};

}  // namespace Engine
}  // namespace Harvest
