#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <thread>
#include "../../core/types/constants.hpp"

namespace Harvest {
namespace Engine {

struct RetryPolicy {
    std::chrono::milliseconds cold_restart_delay{Core::Constants::COLD_RESTART_DELAY_MS};
    std::chrono::milliseconds retry_delay{Core::Constants::RETRY_DELAY_MS};
    int                       max_retries = Core::Constants::MAX_BACKEND_RETRIES;

    // Delay before re-issuing an attempt that already failed `attempt` times,
    // or nothing once the backend is considered unavailable.
    std::optional<std::chrono::milliseconds> delay_for(int attempt) const {
        if (attempt == 0)
            return cold_restart_delay;
        if (attempt < max_retries)
            return retry_delay;
        return std::nullopt;
    }
};

class RetryScheduler {
public:
    using Task = std::function<void()>;

    virtual ~RetryScheduler() = default;

    // Returns false when the task was not accepted.
    virtual bool schedule(std::chrono::milliseconds delay, Task task) = 0;
    virtual int  pending() const                                      = 0;
    virtual void shutdown()                                           = 0;
};

// Runs every delayed task on one dedicated thread, one at a time.
class SerialRetryScheduler : public RetryScheduler {
public:
    SerialRetryScheduler();
    ~SerialRetryScheduler() override;

    SerialRetryScheduler(const SerialRetryScheduler&)            = delete;
    SerialRetryScheduler& operator=(const SerialRetryScheduler&) = delete;

    bool schedule(std::chrono::milliseconds delay, Task task) override;
    void shutdown() override;

    int pending() const override {
        return pending_.load();
    }

private:
    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                      work_guard_;
    std::thread       thread_;
    std::atomic<bool> accepting_{true};
    std::atomic<int>  pending_{0};
};

}  // namespace Engine
}  // namespace Harvest
