#include "disk_word_store.hpp"
#include <filesystem>
#include <fstream>
#include "../core/logger/logger.hpp"

namespace Harvest {
namespace Storage {

using Harvest::Core::Logger;

DiskWordStore::DiskWordStore(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(base_path_, ec);
        if (ec)
            Logger::error("Failed to create output directory " + base_path_ + ": " + ec.message());
    }
}

std::string DiskWordStore::path_for(const Utils::Link& domain) const {
    std::filesystem::path path(base_path_);
    path /= domain.fix_www().host() + ".txt";
    return path.string();
}

void DiskWordStore::put_words(const Utils::Link& domain, const std::vector<std::string>& words) {
    auto path = path_for(domain);
    try {
        std::ofstream file(path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("Write Error: " + path);
            return;
        }
        for (const auto& word : words)
            file << word << '\n';
        file.flush();
        if (!file) {
            Logger::error("Write Error: " + path);
            return;
        }
        Logger::success("Saved " + std::to_string(words.size()) + " words: " + path);
    } catch (const std::exception& e) {
        Logger::error("FS Error: " + std::string(e.what()));
    }
}

}  // namespace Storage
}  // namespace Harvest
