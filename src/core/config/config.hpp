#pragma once
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Harvest {
namespace Core {

struct Config {
    std::vector<std::string> urls;
    std::string              input_csv;
    std::string              output_dir = Constants::DEFAULT_OUTPUT_DIR;
    std::string              store      = "disk";  // disk | sqlite
    std::string              database   = Constants::DEFAULT_DATABASE;
    std::string              config_path;
    std::string              log_file;
    bool                     quiet = false;

    std::string backend_url     = Constants::DEFAULT_BACKEND_URL;
    std::string render_endpoint = Constants::DEFAULT_RENDER_ENDPOINT;
    double      render_wait     = Constants::DEFAULT_RENDER_WAIT_S;
    int         render_timeout  = Constants::DEFAULT_RENDER_TIMEOUT_S;
    int         threads         = Constants::DEFAULT_IO_THREADS;

    int domain_timeout     = Constants::DOMAIN_TIMEOUT_SECONDS;  // seconds
    int connect_fails      = Constants::MAX_CONNECT_FAILS;
    int poll_interval      = Constants::FRONTIER_POLL_MS;       // milliseconds
    int cold_restart_delay = Constants::COLD_RESTART_DELAY_MS;  // milliseconds
    int retry_delay        = Constants::RETRY_DELAY_MS;         // milliseconds
    int max_retries        = Constants::MAX_BACKEND_RETRIES;

    std::vector<std::string> languages;
    size_t                   min_word = Constants::DEFAULT_MIN_WORD_LENGTH;
    size_t                   max_word = Constants::DEFAULT_MAX_WORD_LENGTH;

    static Config parse(int argc, char* argv[]);
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Harvest
