#include "render_engine.hpp"
#include <exception>
#include "../../core/logger/logger.hpp"

namespace Harvest {
namespace Engine {

using Core::FailureKind;
using Core::Logger;
using Network::Http::ErrorType;
using Network::Http::HTTPCode;
using Network::Http::Response;

RenderEngine::RenderEngine(Network::Http::HttpClient&                  client,
                           RetryScheduler&                             scheduler,
                           const Network::Render::RenderRequestFactory& factory,
                           RetryPolicy                                 policy)
    : client_(client), scheduler_(scheduler), factory_(factory), policy_(policy) {
}

void RenderEngine::scrape(const Utils::Link& link, SiteConsumer consumer) {
    auto attempt = register_attempt(CallContext{link, std::move(consumer), 0});
    if (!attempt) {
        Logger::debug("RenderEngine - Engine canceled, dropped " + link.str());
        return;
    }
    stat_.request_sent();
    send(std::move(attempt));
}

int RenderEngine::scraping_sites_count() const {
    // Both counts change together under calls_mutex_, so no transition reads as zero.
    std::lock_guard<std::mutex> lock(calls_mutex_);
    return scheduled_to_retry_ + static_cast<int>(calls_.size());
}

void RenderEngine::cancel_all() {
    std::vector<std::shared_ptr<Attempt>> attempts;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        canceled_ = true;
        attempts.reserve(calls_.size());
        for (const auto& [id, attempt] : calls_)
            attempts.push_back(attempt);
    }
    for (const auto& attempt : attempts)
        attempt->stop.request_stop();

    if (!attempts.empty())
        Logger::debug("RenderEngine - Canceled " + std::to_string(attempts.size()) + " calls");
}

std::vector<FailedSite> RenderEngine::get_failed_sites() const {
    std::lock_guard<std::mutex> lock(failed_mutex_);
    return failed_sites_;
}

std::optional<std::string> RenderEngine::domain() const {
    std::lock_guard<std::mutex> lock(domain_mutex_);
    return domain_;
}

std::shared_ptr<RenderEngine::Attempt> RenderEngine::register_attempt(CallContext context) {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    return register_attempt_locked(std::move(context));
}

std::shared_ptr<RenderEngine::Attempt> RenderEngine::register_attempt_locked(CallContext context) {
    if (canceled_)
        return nullptr;

    auto attempt = std::make_shared<Attempt>(next_id_++, std::move(context));
    calls_.emplace(attempt->id, attempt);
    return attempt;
}

void RenderEngine::send(std::shared_ptr<Attempt> attempt) {
    auto request = factory_.get_request(attempt->context.link);
    auto token   = attempt->stop.get_token();
    auto self    = shared_from_this();
    client_.send(std::move(request), token, [self, attempt](Response response) {
        self->on_complete(attempt, response);
    });
}

void RenderEngine::unregister(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    calls_.erase(id);
}

void RenderEngine::on_complete(const std::shared_ptr<Attempt>& attempt, const Response& response) {
    const auto& link = attempt->context.link;
    try {
        if (response.transport_failed())
            handle_transport_failure(attempt, response);
        else
            handle_response(attempt, response);
    } catch (const Core::ContentRejectedError& e) {
        Logger::debug("RenderEngine - Rejected content of " + link.str() + ": " + e.what());
        stat_.response_rejected();
        add_failed_site(link, e.kind(), e.what());
    } catch (const Core::CrawlError& e) {
        Logger::debug("RenderEngine - " + std::string(Core::to_string(e.kind())) + " on "
                      + link.str() + ": " + e.what());
        add_failed_site(link, e.kind(), e.what());
    } catch (const std::exception& e) {
        Logger::debug("RenderEngine - Exception while handling " + link.str() + ": " + e.what());
        stat_.response_exception();
        add_failed_site(link, FailureKind::Unexpected, e.what());
    }
    unregister(attempt->id);
}

void RenderEngine::handle_transport_failure(const std::shared_ptr<Attempt>& attempt,
                                            const Response&                 response) {
    const auto& link = attempt->context.link;
    switch (response.error_type) {
        case ErrorType::PrematureEof:
            handle_backend_restarting(attempt);
            return;
        case ErrorType::SocketClosed:
            Logger::debug("RenderEngine - Socket closed for " + link.str());
            break;
        case ErrorType::Rejected:
            Logger::debug("RenderEngine - Client rejected " + link.str());
            stat_.request_failed();
            break;
        case ErrorType::Network:
        case ErrorType::Timeout:
            Logger::debug("RenderEngine - Request failed for " + link.str() + ": " + response.error);
            stat_.request_failed();
            break;
        case ErrorType::None:
            return;
    }
    add_failed_site(link, FailureKind::Connection,
                    std::string(Network::Http::to_string(response.error_type)) + ": " + response.error);
}

void RenderEngine::handle_response(const std::shared_ptr<Attempt>& attempt, const Response& response) {
    const auto& link = attempt->context.link;
    switch (static_cast<HTTPCode>(response.status_code)) {
        case HTTPCode::BadGateway:
        case HTTPCode::ServiceUnavailable:
            handle_backend_restarting(attempt);
            return;
        case HTTPCode::GatewayTimeout:
            Logger::debug("RenderEngine - Backend timeout for " + link.str());
            stat_.request_timeout();
            add_failed_site(link, FailureKind::Timeout, "Render backend timed out");
            return;
        case HTTPCode::Ok:
            if (!response.has_body) {
                stat_.request_failed();
                add_failed_site(link, FailureKind::Connection, "Response body is absent");
                return;
            }
            stat_.request_succeeded();
            handle_body(*attempt, response.body);
            return;
    }

    Logger::debug("RenderEngine - Unexpected status " + std::to_string(response.status_code)
                  + " for " + link.str());
    stat_.request_failed();
    add_failed_site(link, FailureKind::Unexpected,
                    "Render backend answered HTTP " + std::to_string(response.status_code));
}

void RenderEngine::handle_body(const Attempt& attempt, const std::string& body) {
    const auto& initial = attempt.context.link;
    auto        result  = Network::Render::parse_render_result(body);
    Utils::Link resolved(result.url);

    if (!check_domain(initial, resolved))
        return;

    if (initial.without_protocol() != resolved.without_protocol())
        Logger::debug("RenderEngine - Redirected from " + initial.str() + " to " + resolved.str());

    if (attempt.stop.stop_requested() || canceled_)
        return;

    attempt.context.consumer(Core::Site{Core::Html{std::move(result.html), resolved}, initial});
    stat_.site_scraped();
}

bool RenderEngine::check_domain(const Utils::Link& initial, const Utils::Link& resolved) {
    auto host = resolved.fix_www().host();
    {
        std::lock_guard<std::mutex> lock(domain_mutex_);
        if (!domain_) {
            domain_ = host;
            return true;
        }
        if (host.find(*domain_) != std::string::npos)
            return true;
    }

    Logger::debug("RenderEngine - Tried to redirect from " + initial.str() + " to " + resolved.str());
    stat_.response_rejected();
    return false;
}

void RenderEngine::handle_backend_restarting(const std::shared_ptr<Attempt>& attempt) {
    const auto& context = attempt->context;
    auto        delay   = policy_.delay_for(context.retry_count);
    if (!delay) {
        throw Core::BackendUnavailableError("Render backend did not recover after "
                                            + std::to_string(context.retry_count) + " retries");
    }

    // Counted while the failed attempt is still registered.
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        scheduled_to_retry_++;
    }
    auto self     = shared_from_this();
    auto accepted = scheduler_.schedule(*delay, [self, attempt]() { self->retry(attempt); });
    if (!accepted) {
        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            scheduled_to_retry_--;
        }
        throw Core::BackendUnavailableError("Retry scheduler is shut down");
    }

    Logger::debug("RenderEngine - Backend restarting, retry #" + std::to_string(context.retry_count + 1)
                  + " of " + context.link.str() + " in " + std::to_string(delay->count()) + " ms");
}

void RenderEngine::retry(const std::shared_ptr<Attempt>& previous) {
    std::shared_ptr<Attempt> next;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        if (!previous->stop.stop_requested())
            next = register_attempt_locked(previous->context.for_new_retry());
        scheduled_to_retry_--;
    }

    if (!next) {
        Logger::debug("RenderEngine - Dropped retry of canceled " + previous->context.link.str());
        return;
    }
    stat_.request_retried();
    send(std::move(next));
}

void RenderEngine::add_failed_site(const Utils::Link& link, FailureKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lock(failed_mutex_);
    failed_sites_.push_back(FailedSite{link, Core::Failure{kind, message}});
}

}  // namespace Engine
}  // namespace Harvest
