#pragma once
#include <string>
#include "../../core/types/constants.hpp"
#include "../../utils/url/url.hpp"
#include "../http/http_client.hpp"

namespace Harvest {
namespace Network {
namespace Render {

struct RenderOptions {
    std::string endpoint = Core::Constants::DEFAULT_RENDER_ENDPOINT;
    double      wait     = Core::Constants::DEFAULT_RENDER_WAIT_S;
    int         timeout  = Core::Constants::DEFAULT_RENDER_TIMEOUT_S;
    bool        images   = false;
};

// Final URL after redirects plus the rendered document.
struct RenderResult {
    std::string url;
    std::string html;
};

class RenderRequestFactory {
public:
    explicit RenderRequestFactory(RenderOptions options = {});

    Http::Request get_request(const Utils::Link& link) const;

    const RenderOptions& options() const {
        return options_;
    }

private:
    RenderOptions options_;
};

// Throws std::runtime_error when the body is not a render result.
RenderResult parse_render_result(const std::string& body);

}  // namespace Render
}  // namespace Network
}  // namespace Harvest
