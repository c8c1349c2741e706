#include "retry_scheduler.hpp"
#include <boost/asio/steady_timer.hpp>
#include "../../core/logger/logger.hpp"

namespace Harvest {
namespace Engine {

using Core::Logger;

SerialRetryScheduler::SerialRetryScheduler()
    : work_guard_(
          std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
              ioc_.get_executor())) {
    thread_ = std::thread([this]() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            Logger::error("RetryScheduler - Thread exception: " + std::string(e.what()));
        }
    });
}

SerialRetryScheduler::~SerialRetryScheduler() {
    shutdown();
}

bool SerialRetryScheduler::schedule(std::chrono::milliseconds delay, Task task) {
    if (!accepting_) {
        Logger::debug("RetryScheduler - Rejected task, scheduler is shut down");
        return false;
    }

    pending_++;
    auto timer = std::make_shared<boost::asio::steady_timer>(ioc_, delay);
    timer->async_wait([this, timer, task = std::move(task)](const boost::system::error_code& ec) {
        pending_--;
        if (ec || !accepting_)
            return;
        try {
            task();
        } catch (const std::exception& e) {
            Logger::error("RetryScheduler - Task threw: " + std::string(e.what()));
        }
    });
    return true;
}

void SerialRetryScheduler::shutdown() {
    if (!accepting_.exchange(false))
        return;

    work_guard_.reset();
    ioc_.stop();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id())
            thread_.detach();
        else
            thread_.join();
    }
    Logger::debug("RetryScheduler - Shutdown complete");
}

}  // namespace Engine
}  // namespace Harvest
