#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace Harvest {
namespace Core {

int Logger::level_ = LogLevel::LOG_ALL;

std::mutex    Logger::mutex_;
std::ofstream Logger::file_;

namespace {
const std::string RESET  = "\033[0m";
const std::string RED    = "\033[31m";
const std::string GREEN  = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string BLUE   = "\033[34m";

std::string timestamp() {
    auto               now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm            tm{};
    localtime_r(&now, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}
}  // namespace

void Logger::set_level(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open())
        file_.close();
    file_.open(path, std::ios::app);
    return file_.is_open();
}

void Logger::close_log_file() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open())
        file_.close();
}

void Logger::write_file(const char* tag, const std::string& message) {
    if (!file_.is_open())
        return;
    file_ << timestamp() << " " << tag << " " << message << '\n';
    file_.flush();
}

void Logger::debug(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_DEBUG) {
        write_file("[DEBUG]", message);
    }
}

void Logger::info(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_INFO) {
        std::cout << BLUE << "[INFO] " << RESET << message << std::endl;
        write_file("[INFO]", message);
    }
}

void Logger::success(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_SUCCESS) {
        std::cout << GREEN << "[SUCCESS] " << RESET << message << std::endl;
        write_file("[SUCCESS]", message);
    }
}

void Logger::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_WARN) {
        std::cerr << YELLOW << "[WARN] " << RESET << message << std::endl;
        write_file("[WARN]", message);
    }
}

void Logger::error(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level_ & LogLevel::LOG_ERROR) {
        std::cerr << RED << "[ERROR] " << RESET << message << std::endl;
        write_file("[ERROR]", message);
    }
}

}  // namespace Core
}  // namespace Harvest
