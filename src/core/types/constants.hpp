#pragma once
#include <string>
#include <cctype>
#include <vector>

namespace Harvest {
namespace Core {

struct Constants {
    static constexpr const char* VERSION    = "0.3.0";
    static constexpr const char* USER_AGENT = "Harvest-Spider/0.3";

    // Render backend
    static constexpr const char* DEFAULT_BACKEND_URL      = "http://127.0.0.1:8050";
    static constexpr const char* DEFAULT_RENDER_ENDPOINT  = "/render.json";
    static constexpr double      DEFAULT_RENDER_WAIT_S    = 0.5;
    static constexpr int         DEFAULT_RENDER_TIMEOUT_S = 90;
    static constexpr int         DEFAULT_IO_THREADS       = 4;
    static constexpr int         CONNECT_TIMEOUT_SECONDS  = 30;
    static constexpr int         READ_TIMEOUT_SECONDS     = 300;
    static constexpr int         MAX_IDLE_CONNECTIONS     = 16;

    // Retry policy, milliseconds
    static constexpr int COLD_RESTART_DELAY_MS = 6000;
    static constexpr int RETRY_DELAY_MS        = 500;
    static constexpr int MAX_BACKEND_RETRIES   = 5;

    // Crawl orchestration
    static constexpr int DOMAIN_TIMEOUT_SECONDS = 100;
    static constexpr int MAX_CONNECT_FAILS      = 10;
    static constexpr int FRONTIER_POLL_MS       = 500;
    static constexpr int SHUTDOWN_GRACE_SECONDS = 10;

    // Word filter
    static constexpr size_t DEFAULT_MIN_WORD_LENGTH = 3;
    static constexpr size_t DEFAULT_MAX_WORD_LENGTH = 32;

    static constexpr const char* DEFAULT_OUTPUT_DIR = "words";
    static constexpr const char* DEFAULT_DATABASE   = "harvest.db";
};

inline const std::vector<std::string>& get_image_extensions() {
    static const std::vector<std::string> extensions = {
        ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".webp", ".svg", ".ico", ".tiff", ".avif"};
    return extensions;
}

inline const std::vector<std::string>& get_file_extensions() {
    static const std::vector<std::string> extensions = {".pdf",
                                                        ".doc",
                                                        ".docx",
                                                        ".xls",
                                                        ".xlsx",
                                                        ".ppt",
                                                        ".pptx",
                                                        ".csv",
                                                        ".zip",
                                                        ".tar",
                                                        ".gz",
                                                        ".json",
                                                        ".xml",
                                                        ".mp3",
                                                        ".mp4",
                                                        ".css",
                                                        ".js"};
    return extensions;
}

inline std::string get_matching_extension(const std::string&              path,
                                          const std::vector<std::string>& extensions) {
    if (path.empty())
        return "";

    std::string lower = path;
    for (char& c : lower)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    for (const auto& ext : extensions) {
        if (lower.size() >= ext.size()
            && lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0) {
            return ext;
        }
    }
    return "";
}

inline bool has_extension(const std::string& path, const std::vector<std::string>& extensions) {
    return !get_matching_extension(path, extensions).empty();
}

}  // namespace Core
}  // namespace Harvest
