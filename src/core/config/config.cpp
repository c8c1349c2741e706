#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace Harvest {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["input"])
            config.input_csv = yaml["input"].as<std::string>();
        if (yaml["output"])
            config.output_dir = yaml["output"].as<std::string>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["store"])
            config.store = yaml["store"].as<std::string>();
        if (yaml["database"])
            config.database = yaml["database"].as<std::string>();
        if (yaml["log_file"])
            config.log_file = yaml["log_file"].as<std::string>();

        if (yaml["backend"])
            config.backend_url = yaml["backend"].as<std::string>();
        if (yaml["endpoint"])
            config.render_endpoint = yaml["endpoint"].as<std::string>();
        if (yaml["render_wait"])
            config.render_wait = yaml["render_wait"].as<double>();
        if (yaml["render_timeout"])
            config.render_timeout = yaml["render_timeout"].as<int>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();

        if (yaml["domain_timeout"])
            config.domain_timeout = yaml["domain_timeout"].as<int>();
        if (yaml["connect_fails"])
            config.connect_fails = yaml["connect_fails"].as<int>();
        if (yaml["poll_interval"])
            config.poll_interval = yaml["poll_interval"].as<int>();

        // Retry section may be nested or flat.
        YAML::Node retry = yaml["retry"] ? yaml["retry"] : yaml;
        if (retry["cold_restart_delay"])
            config.cold_restart_delay = retry["cold_restart_delay"].as<int>();
        if (retry["retry_delay"])
            config.retry_delay = retry["retry_delay"].as<int>();
        if (retry["max_retries"])
            config.max_retries = retry["max_retries"].as<int>();

        if (yaml["languages"] && yaml["languages"].IsSequence()) {
            for (const auto& node : yaml["languages"])
                config.languages.push_back(node.as<std::string>());
        }
        if (yaml["min_word"])
            config.min_word = yaml["min_word"].as<size_t>();
        if (yaml["max_word"])
            config.max_word = yaml["max_word"].as<size_t>();

        if (yaml["domains"] && yaml["domains"].IsSequence()) {
            for (const auto& node : yaml["domains"])
                config.urls.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

namespace {

void validate(const Config& config) {
    if (config.threads < 1)
        throw std::runtime_error("threads must be at least 1");
    if (config.domain_timeout < 1)
        throw std::runtime_error("domain-timeout must be at least 1 second");
    if (config.connect_fails < 1)
        throw std::runtime_error("connect-fails must be at least 1");
    if (config.poll_interval < 1)
        throw std::runtime_error("poll-interval must be at least 1 ms");
    if (config.max_retries < 1)
        throw std::runtime_error("max-retries must be at least 1");
    if (config.min_word > config.max_word)
        throw std::runtime_error("min-word must not exceed max-word");
    if (config.store != "disk" && config.store != "sqlite")
        throw std::runtime_error("Unknown store: " + config.store);
}

}  // namespace

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Harvest - domain word spider on top of a headless render backend"};

    app.add_option("-i,--input", config.input_csv, "CSV file with domains (id;company_id;website)");
    app.add_option("-o,--output", config.output_dir, "Output directory for the disk store");
    app.add_option("--store", config.store, "Word store: disk or sqlite");
    app.add_option("--database", config.database, "SQLite database path");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("--log-file", config.log_file, "Append the detailed log to this file");
    app.add_flag("-q,--quiet", config.quiet, "Only print warnings and errors");

    app.add_option("--backend", config.backend_url, "Render backend base URL");
    app.add_option("--endpoint", config.render_endpoint, "Render endpoint path");
    app.add_option("--render-wait", config.render_wait, "Seconds the backend waits after load");
    app.add_option("--render-timeout", config.render_timeout, "Backend side render timeout (s)");
    app.add_option("-t,--threads", config.threads, "HTTP client I/O threads");

    app.add_option("--domain-timeout", config.domain_timeout, "Per domain timeout (s)");
    app.add_option("--connect-fails", config.connect_fails, "Connection failures in a row before abort");
    app.add_option("--poll-interval", config.poll_interval, "Frontier poll interval (ms)");
    app.add_option("--cold-restart-delay", config.cold_restart_delay, "First retry delay (ms)");
    app.add_option("--retry-delay", config.retry_delay, "Subsequent retry delay (ms)");
    app.add_option("--max-retries", config.max_retries, "Retries before the backend is unavailable");

    app.add_option("--languages", config.languages, "Accepted document languages")->delimiter(',');
    app.add_option("--min-word", config.min_word, "Minimum word length");
    app.add_option("--max-word", config.max_word, "Maximum word length");

    app.add_option("urls", config.urls, "Domains to crawl");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    validate(config);
    return config;
}

}  // namespace Core
}  // namespace Harvest
