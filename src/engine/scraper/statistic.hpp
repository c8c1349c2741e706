#pragma once
#include <atomic>
#include <string>

namespace Harvest {
namespace Engine {

// Per domain counters, bumped from completion handlers on any thread.
class Statistic {
public:
    void request_sent() {
        sent_++;
    }
    void request_succeeded() {
        succeeded_++;
    }
    void request_failed() {
        failed_++;
    }
    void request_retried() {
        retried_++;
    }
    void request_timeout() {
        timed_out_++;
    }
    void response_rejected() {
        rejected_++;
    }
    void response_exception() {
        exceptioned_++;
    }
    void site_scraped() {
        scraped_++;
    }

    int sent() const {
        return sent_.load();
    }
    int succeeded() const {
        return succeeded_.load();
    }
    int failed() const {
        return failed_.load();
    }
    int retried() const {
        return retried_.load();
    }
    int timed_out() const {
        return timed_out_.load();
    }
    int rejected() const {
        return rejected_.load();
    }
    int exceptioned() const {
        return exceptioned_.load();
    }
    int scraped() const {
        return scraped_.load();
    }

    std::string to_string() const;

private:
    std::atomic<int> sent_{0};
    std::atomic<int> succeeded_{0};
    std::atomic<int> failed_{0};
    std::atomic<int> retried_{0};
    std::atomic<int> timed_out_{0};
    std::atomic<int> rejected_{0};
    std::atomic<int> exceptioned_{0};
    std::atomic<int> scraped_{0};
};

}  // namespace Engine
}  // namespace Harvest
