#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../../core/errors/errors.hpp"
#include "../../core/types/site.hpp"
#include "../../network/http/http_client.hpp"
#include "../../network/render/render_protocol.hpp"
#include "../../utils/url/url.hpp"
#include "retry_scheduler.hpp"
#include "statistic.hpp"

namespace Harvest {
namespace Engine {

struct FailedSite {
    Utils::Link   link;
    Core::Failure failure;
};

/**
 * Issues render attempts against the backend for one domain and drives each
 * attempt through its retry state machine.
 *
 * Completion handlers run on HTTP client threads and retries on the retry
 * scheduler thread, so the engine must be owned by a std::shared_ptr; both
 * keep it alive until they are done.
 */
class RenderEngine : public std::enable_shared_from_this<RenderEngine> {
public:
    using SiteConsumer = std::function<void(const Core::Site&)>;

    RenderEngine(Network::Http::HttpClient&                  client,
                 RetryScheduler&                             scheduler,
                 const Network::Render::RenderRequestFactory& factory,
                 RetryPolicy                                 policy = {});

    RenderEngine(const RenderEngine&)            = delete;
    RenderEngine& operator=(const RenderEngine&) = delete;

    // Returns immediately; the consumer runs on a client thread.
    void scrape(const Utils::Link& link, SiteConsumer consumer);

    // Scheduled retries plus in-flight attempts. Zero means no more callbacks.
    int  scraping_sites_count() const;
    void cancel_all();

    bool is_canceled() const {
        return canceled_.load();
    }

    std::vector<FailedSite>    get_failed_sites() const;
    std::optional<std::string> domain() const;

    const Statistic& statistic() const {
        return stat_;
    }

private:
    struct CallContext {
        Utils::Link  link;
        SiteConsumer consumer;
        int          retry_count = 0;

        CallContext for_new_retry() const {
            return CallContext{link, consumer, retry_count + 1};
        }
    };

    struct Attempt {
        Attempt(std::uint64_t attempt_id, CallContext call_context)
            : id(attempt_id), context(std::move(call_context)) {
        }

        std::uint64_t    id;
        CallContext      context;
        std::stop_source stop;
    };

    std::shared_ptr<Attempt> register_attempt(CallContext context);
    // Requires calls_mutex_.
    std::shared_ptr<Attempt> register_attempt_locked(CallContext context);
    void                     send(std::shared_ptr<Attempt> attempt);
    void                     unregister(std::uint64_t id);

    void on_complete(const std::shared_ptr<Attempt>& attempt, const Network::Http::Response& response);
    void handle_transport_failure(const std::shared_ptr<Attempt>& attempt,
                                  const Network::Http::Response&  response);
    void handle_response(const std::shared_ptr<Attempt>& attempt,
                         const Network::Http::Response&  response);
    void handle_body(const Attempt& attempt, const std::string& body);
    void handle_backend_restarting(const std::shared_ptr<Attempt>& attempt);
    void retry(const std::shared_ptr<Attempt>& previous);

    bool check_domain(const Utils::Link& initial, const Utils::Link& resolved);
    void add_failed_site(const Utils::Link& link, Core::FailureKind kind, const std::string& message);

    Network::Http::HttpClient&                   client_;
    RetryScheduler&                              scheduler_;
    const Network::Render::RenderRequestFactory& factory_;
    RetryPolicy                                  policy_;
    Statistic                                    stat_;

    mutable std::mutex                                           calls_mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<Attempt>> calls_;
    std::uint64_t                                                next_id_ = 0;
    std::atomic<bool>                                            canceled_{false};
    int                                                          scheduled_to_retry_ = 0;

    mutable std::mutex      failed_mutex_;
    std::vector<FailedSite> failed_sites_;

    mutable std::mutex         domain_mutex_;
    std::optional<std::string> domain_;
};

}  // namespace Engine
}  // namespace Harvest
