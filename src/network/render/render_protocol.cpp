#include "render_protocol.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

namespace Harvest {
namespace Network {
namespace Render {

RenderRequestFactory::RenderRequestFactory(RenderOptions options) : options_(std::move(options)) {
}

Http::Request RenderRequestFactory::get_request(const Utils::Link& link) const {
    nlohmann::json body = {{"url", link.str()},
                           {"html", 1},
                           {"wait", options_.wait},
                           {"timeout", options_.timeout},
                           {"images", options_.images ? 1 : 0}};

    Http::Request request;
    request.method       = "POST";
    request.target       = options_.endpoint;
    request.content_type = "application/json";
    request.body         = body.dump();
    return request;
}

RenderResult parse_render_result(const std::string& body) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Render result is not JSON: " + std::string(e.what()));
    }

    if (!json.is_object() || !json.contains("url") || !json["url"].is_string())
        throw std::runtime_error("Render result has no url");
    if (!json.contains("html") || !json["html"].is_string())
        throw std::runtime_error("Render result has no html");

    RenderResult result;
    result.url  = json["url"].get<std::string>();
    result.html = json["html"].get<std::string>();
    return result;
}

}  // namespace Render
}  // namespace Network
}  // namespace Harvest
