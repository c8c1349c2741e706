#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <memory>
#include <thread>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/scraper/retry_scheduler.hpp"
#include "engine/spider/spider.hpp"
#include "extraction/html_context.hpp"
#include "input/domain_list.hpp"
#include "network/http/beast_client.hpp"
#include "storage/disk_word_store.hpp"
#include "storage/sqlite_word_store.hpp"

namespace {

using namespace Harvest;

std::vector<Utils::Link> load_domains(const Core::Config& config) {
    std::vector<Utils::Link> domains;
    if (!config.input_csv.empty())
        domains = Input::DomainList::from_csv(config.input_csv);
    for (auto& link : Input::DomainList::from_strings(config.urls))
        domains.push_back(std::move(link));
    return domains;
}

std::unique_ptr<Storage::WordStore> create_store(const Core::Config& config) {
    if (config.store == "sqlite")
        return std::make_unique<Storage::SqliteWordStore>(config.database);
    return std::make_unique<Storage::DiskWordStore>(config.output_dir);
}

Engine::SpiderConfig spider_config(const Core::Config& config) {
    Engine::SpiderConfig spider;
    spider.domain_timeout           = std::chrono::seconds(config.domain_timeout);
    spider.connect_fails            = config.connect_fails;
    spider.poll_interval            = std::chrono::milliseconds(config.poll_interval);
    spider.retry.cold_restart_delay = std::chrono::milliseconds(config.cold_restart_delay);
    spider.retry.retry_delay        = std::chrono::milliseconds(config.retry_delay);
    spider.retry.max_retries        = config.max_retries;
    spider.render.endpoint          = config.render_endpoint;
    spider.render.wait              = config.render_wait;
    spider.render.timeout           = config.render_timeout;
    return spider;
}

int run(const Core::Config& config) {
    auto domains = load_domains(config);
    if (domains.empty()) {
        Core::Logger::error("No domains provided. Use --input or pass URLs.");
        return 1;
    }

    Network::Http::BeastClientOptions client_options;
    client_options.base_url = config.backend_url;
    client_options.threads  = config.threads;

    Network::Http::BeastClient   client(client_options);
    Engine::SerialRetryScheduler scheduler;
    auto                         store = create_store(config);

    Extraction::HtmlContextOptions context_options;
    context_options.languages = config.languages;
    context_options.min_word  = config.min_word;
    context_options.max_word  = config.max_word;

    Engine::Spider spider(spider_config(config), client, scheduler, *store, [context_options]() {
        return std::make_shared<Extraction::HtmlContext>(context_options);
    });

    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&spider](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Core::Logger::info("Signal " + std::to_string(signal_number) + " received. Stopping...");
            spider.stop();
        }
    });
    std::thread signal_thread([&signal_ioc]() { signal_ioc.run(); });

    Core::Logger::info("Crawling " + std::to_string(domains.size()) + " domains via "
                       + config.backend_url);
    auto summary = spider.run(domains);

    signals.cancel();
    signal_ioc.stop();
    signal_thread.join();

    Core::Logger::info("Processed " + std::to_string(summary.processed) + ", skipped "
                       + std::to_string(summary.skipped) + ", completed "
                       + std::to_string(summary.completed) + ", timed out "
                       + std::to_string(summary.timed_out) + ", connection failures "
                       + std::to_string(summary.connection_failures) + ", backend unavailable "
                       + std::to_string(summary.backend_unavailable) + ", failed "
                       + std::to_string(summary.failed));

    if (summary.aborted) {
        Core::Logger::error("Run aborted: " + summary.abort_reason);
        return 2;
    }
    if (summary.interrupted)
        Core::Logger::warn("Run interrupted");
    else
        Core::Logger::success("Run completed");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto config = Harvest::Core::Config::parse(argc, argv);

        if (config.quiet)
            Harvest::Core::Logger::set_level(Harvest::Core::LOG_DEBUG | Harvest::Core::LOG_WARN
                                             | Harvest::Core::LOG_ERROR);
        if (!config.log_file.empty() && !Harvest::Core::Logger::set_log_file(config.log_file))
            Harvest::Core::Logger::warn("Cannot open log file " + config.log_file);

        int code = run(config);
        Harvest::Core::Logger::close_log_file();
        return code;
    } catch (const std::exception& e) {
        Harvest::Core::Logger::error(e.what());
        return 1;
    }
}
