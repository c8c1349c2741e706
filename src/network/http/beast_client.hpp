#pragma once

#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "../../core/types/constants.hpp"
#include "http_client.hpp"

namespace Harvest {
namespace Network {
namespace Http {

struct BeastClientOptions {
    std::string               base_url = Core::Constants::DEFAULT_BACKEND_URL;
    int                       threads  = Core::Constants::DEFAULT_IO_THREADS;
    std::chrono::milliseconds connect_timeout{Core::Constants::CONNECT_TIMEOUT_SECONDS * 1000};
    std::chrono::milliseconds read_timeout{Core::Constants::READ_TIMEOUT_SECONDS * 1000};
    size_t                    max_idle_connections = Core::Constants::MAX_IDLE_CONNECTIONS;
};

// Shared HTTP/1.1 client bound to one backend endpoint. Runs its own I/O
// threads and keeps idle keep-alive connections for reuse.
class BeastClient : public HttpClient {
public:
    explicit BeastClient(const BeastClientOptions& options);
    ~BeastClient() override;

    BeastClient(const BeastClient&)            = delete;
    BeastClient& operator=(const BeastClient&) = delete;

    void send(Request request, std::stop_token stop, Handler handler) override;
    int  running_calls_count() const override;
    void shutdown() override;

    size_t idle_connections() const;

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    // A socket plus the strand every operation on it runs through.
    struct Connection {
        explicit Connection(Strand s) : strand(s), stream(s) {
        }
        Strand                   strand;
        boost::beast::tcp_stream stream;
        bool                     connected = false;
    };

    struct Call {
        Request                     request;
        Handler                     handler;
        std::shared_ptr<Connection> connection;
        bool                        reused = false;
        std::stop_token             stop;

        std::optional<std::stop_callback<std::function<void()>>> on_stop;
    };

    BeastClientOptions options_;
    std::string        host_;
    std::string        port_;

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;

    mutable std::mutex                      pool_mutex_;
    std::deque<std::shared_ptr<Connection>> idle_;

    std::atomic<int>  running_{0};
    std::atomic<bool> accepting_{true};
    std::atomic<bool> is_shutdown_{false};

    void init_io_services();

    std::shared_ptr<Connection> acquire(bool& reused);
    void                        release(std::shared_ptr<Connection> connection);
    void                        evict_all();
    void                        arm_cancellation(const std::shared_ptr<Call>& call);

    boost::asio::awaitable<void>     run_call(std::shared_ptr<Call> call);
    boost::asio::awaitable<void>     connect(Connection& connection);
    boost::asio::awaitable<Response> exchange(Connection&    connection,
                                              const Request& request,
                                              bool&          keep_alive);

    void finish(const std::shared_ptr<Call>& call, Response response, bool keep_alive);
};

}  // namespace Http
}  // namespace Network
}  // namespace Harvest
