#pragma once
#include <fstream>
#include <mutex>
#include <string>

namespace Harvest {
namespace Core {

enum LogLevel {
    LOG_NONE    = 0,
    LOG_DEBUG   = 1 << 0,
    LOG_INFO    = 1 << 1,
    LOG_WARN    = 1 << 2,
    LOG_ERROR   = 1 << 3,
    LOG_SUCCESS = 1 << 4,
    LOG_ALL     = LOG_DEBUG | LOG_INFO | LOG_WARN | LOG_ERROR | LOG_SUCCESS
};

// Console logger with an optional log file. Debug messages are written to the
// log file only; every other level goes to the console and to the file.
class Logger {
public:
    static void set_level(int level);
    static bool set_log_file(const std::string& path);
    static void close_log_file();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void success(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

private:
    static void write_file(const char* tag, const std::string& message);

    static int           level_;
    static std::mutex    mutex_;
    static std::ofstream file_;
};

}  // namespace Core
}  // namespace Harvest
