#include "beast_client.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstdint>
#include <stdexcept>
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Harvest {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

using Core::Logger;

namespace {

constexpr std::uint64_t MAX_BODY_BYTES   = 64 * 1024 * 1024;
constexpr int           SHUTDOWN_POLL_MS = 10;

ErrorType classify(const boost::system::error_code& ec, bool stopped) {
    if (stopped || ec == net::error::operation_aborted)
        return ErrorType::SocketClosed;
    if (ec == beast::error::timeout)
        return ErrorType::Timeout;
    if (ec == http::error::end_of_stream || ec == http::error::partial_message
        || ec == net::error::eof)
        return ErrorType::PrematureEof;
    return ErrorType::Network;
}

// The backend may close an idle keep-alive connection at any time.
bool is_stale(const boost::system::error_code& ec) {
    return ec == http::error::end_of_stream || ec == net::error::eof
           || ec == net::error::connection_reset || ec == net::error::broken_pipe;
}

Response failure_response(ErrorType type, const std::string& message) {
    Response response;
    response.error_type = type;
    response.error      = message;
    return response;
}

}  // namespace

BeastClient::BeastClient(const BeastClientOptions& options) : options_(options) {
    auto parsed = Utils::Url::parse(options_.base_url);
    if (parsed.host.empty())
        throw std::invalid_argument("Invalid backend URL: " + options_.base_url);
    if (parsed.scheme != "http")
        throw std::invalid_argument("Only http:// backends are supported: " + options_.base_url);

    host_ = parsed.host;
    port_ = parsed.port.empty() ? "80" : parsed.port;
    init_io_services();
}

BeastClient::~BeastClient() {
    shutdown();
}

void BeastClient::init_io_services() {
    work_guard_ =
        std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < options_.threads; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("BeastClient - IO thread exception: " + std::string(e.what()));
            }
        });
    }
    Logger::debug("BeastClient - Started " + std::to_string(options_.threads) + " IO threads for "
                  + host_ + ":" + port_);
}

void BeastClient::send(Request request, std::stop_token stop, Handler handler) {
    if (!accepting_) {
        handler(failure_response(ErrorType::Rejected, "executor rejected"));
        return;
    }

    running_++;
    auto call        = std::make_shared<Call>();
    call->request    = std::move(request);
    call->handler    = std::move(handler);
    call->stop       = std::move(stop);
    call->connection = acquire(call->reused);
    arm_cancellation(call);

    net::co_spawn(call->connection->strand, run_call(call), net::detached);
}

int BeastClient::running_calls_count() const {
    return running_.load();
}

size_t BeastClient::idle_connections() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return idle_.size();
}

std::shared_ptr<BeastClient::Connection> BeastClient::acquire(bool& reused) {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!idle_.empty()) {
            auto connection = std::move(idle_.front());
            idle_.pop_front();
            reused = true;
            return connection;
        }
    }
    reused = false;
    return std::make_shared<Connection>(net::make_strand(ioc_));
}

void BeastClient::release(std::shared_ptr<Connection> connection) {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    if (accepting_ && idle_.size() < options_.max_idle_connections) {
        idle_.push_back(std::move(connection));
        return;
    }
    beast::error_code ec;
    connection->stream.socket().close(ec);
}

void BeastClient::evict_all() {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    for (auto& connection : idle_) {
        beast::error_code ec;
        connection->stream.socket().close(ec);
    }
    idle_.clear();
}

void BeastClient::arm_cancellation(const std::shared_ptr<Call>& call) {
    auto connection = call->connection;
    call->on_stop.emplace(call->stop, std::function<void()>([connection]() {
                              net::post(connection->strand,
                                        [connection]() { connection->stream.cancel(); });
                          }));
}

net::awaitable<void> BeastClient::run_call(std::shared_ptr<Call> call) {
    auto        held       = call->connection;
    Connection& connection = *held;

    if (call->stop.stop_requested()) {
        finish(call, failure_response(ErrorType::SocketClosed, "Canceled"), false);
        co_return;
    }

    Response                  response;
    bool                      keep_alive = false;
    boost::system::error_code ec;
    try {
        if (!connection.connected)
            co_await connect(connection);
        response = co_await exchange(connection, call->request, keep_alive);
    } catch (const boost::system::system_error& e) {
        ec = e.code();
    }

    if (!ec) {
        finish(call, std::move(response), keep_alive);
        co_return;
    }

    if (call->reused && !call->stop.stop_requested() && is_stale(ec)) {
        Logger::debug("BeastClient - Pooled connection went stale (" + ec.message()
                      + "), reconnecting");
        call->on_stop.reset();
        beast::error_code ignored;
        connection.stream.socket().close(ignored);

        call->reused     = false;
        call->connection = std::make_shared<Connection>(net::make_strand(ioc_));
        arm_cancellation(call);
        net::co_spawn(call->connection->strand, run_call(call), net::detached);
        co_return;
    }

    finish(call, failure_response(classify(ec, call->stop.stop_requested()), ec.message()), false);
}

net::awaitable<void> BeastClient::connect(Connection& connection) {
    tcp::resolver resolver(connection.strand);
    auto results = co_await resolver.async_resolve(host_, port_, net::use_awaitable);

    connection.stream.expires_after(options_.connect_timeout);
    co_await connection.stream.async_connect(results, net::use_awaitable);
    connection.connected = true;
}

net::awaitable<Response> BeastClient::exchange(Connection&    connection,
                                               const Request& request,
                                               bool&          keep_alive) {
    http::request<http::string_body> req{http::string_to_verb(request.method), request.target, 11};
    req.set(http::field::host, host_ + ":" + port_);
    req.set(http::field::user_agent, Core::Constants::USER_AGENT);
    if (!request.body.empty())
        req.set(http::field::content_type, request.content_type);
    req.body() = request.body;
    req.keep_alive(true);
    req.prepare_payload();

    connection.stream.expires_after(options_.read_timeout);
    co_await http::async_write(connection.stream, req, net::use_awaitable);

    beast::flat_buffer                       buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(MAX_BODY_BYTES);
    co_await http::async_read(connection.stream, buffer, parser, net::use_awaitable);
    connection.stream.expires_never();

    auto res   = parser.release();
    keep_alive = res.keep_alive();

    Response response;
    response.status_code = res.result_int();
    response.body        = std::move(res.body());
    response.has_body    = !response.body.empty();
    auto ct              = res.find(http::field::content_type);
    if (ct != res.end())
        response.content_type = std::string(ct->value());
    co_return response;
}

void BeastClient::finish(const std::shared_ptr<Call>& call, Response response, bool keep_alive) {
    call->on_stop.reset();

    auto connection = std::move(call->connection);
    if (keep_alive && !call->stop.stop_requested()) {
        release(std::move(connection));
    }
    else {
        beast::error_code ec;
        connection->stream.socket().close(ec);
    }

    try {
        call->handler(std::move(response));
    } catch (const std::exception& e) {
        Logger::error("BeastClient - Completion handler threw: " + std::string(e.what()));
    }
    running_--;
}

void BeastClient::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    accepting_ = false;
    evict_all();
    work_guard_.reset();

    // A completion handler may shut the client down; its own call is still running.
    bool on_io_thread = false;
    for (const auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            on_io_thread = true;
    }
    const int own_calls = on_io_thread ? 1 : 0;

    auto deadline =
        std::chrono::steady_clock::now()
        + std::chrono::seconds(Core::Constants::SHUTDOWN_GRACE_SECONDS);
    while (running_calls_count() > own_calls && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(SHUTDOWN_POLL_MS));
    }
    if (running_calls_count() > own_calls) {
        Logger::warn("BeastClient - " + std::to_string(running_calls_count() - own_calls)
                     + " calls still running at shutdown");
    }

    ioc_.stop();
    for (auto& t : io_threads_) {
        if (!t.joinable())
            continue;
        if (t.get_id() == std::this_thread::get_id())
            t.detach();
        else
            t.join();
    }
    io_threads_.clear();
    Logger::debug("BeastClient - Shutdown complete");
}

}  // namespace Http
}  // namespace Network
}  // namespace Harvest
