#include "url.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>
#include "../../core/types/constants.hpp"
#include "../text/string_utils.hpp"

namespace Harvest {
namespace Utils {

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;
    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t q_pos = sv.find('?');
    size_t h_pos = sv.find('#');

    size_t path_end = sv.length();
    if (q_pos != std::string_view::npos)
        path_end = std::min(path_end, q_pos);
    if (h_pos != std::string_view::npos)
        path_end = std::min(path_end, h_pos);

    parsed.path = std::string(sv.substr(0, path_end));

    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
    }
    if (q_pos != std::string_view::npos && (h_pos == std::string_view::npos || q_pos < h_pos)) {
        size_t q_end = (h_pos == std::string_view::npos) ? sv.length() : h_pos;
        parsed.query = std::string(sv.substr(q_pos + 1, q_end - q_pos - 1));
    }

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#') {
        size_t frag = base.find('#');
        if (frag == std::string::npos)
            return base + relative;
        return base.substr(0, frag) + relative;
    }

    if (relative[0] == '?') {
        size_t q = base.find('?');
        size_t f = base.find('#');
        if (q != std::string::npos)
            return base.substr(0, q) + relative;
        if (f != std::string::npos)
            return base.substr(0, f) + relative;
        return base + relative;
    }

    if (relative.find("://") != std::string::npos)
        return relative;

    size_t colon_pos = relative.find(':');
    if (colon_pos != std::string::npos && colon_pos < 10)
        return "";

    UrlParsed   base_parsed = parse(base);
    std::string result;

    if (relative.substr(0, 2) == "//") {
        return base_parsed.scheme + ":" + relative;
    }

    std::string auth = base_parsed.host;
    if (!base_parsed.port.empty())
        auth += ":" + base_parsed.port;

    if (relative[0] == '/') {
        result = base_parsed.scheme + "://" + auth + relative;
    }
    else {
        std::string dir        = base_parsed.path;
        size_t      last_slash = dir.find_last_of('/');
        if (last_slash != std::string::npos) {
            dir = dir.substr(0, last_slash + 1);
        }
        else {
            dir = "/";
        }
        result = base_parsed.scheme + "://" + auth + dir + relative;
    }

    size_t scheme_end = result.find("://");
    size_t domain_end = (scheme_end == std::string::npos) ? 0 : result.find('/', scheme_end + 3);
    if (domain_end == std::string::npos)
        domain_end = result.length();

    std::string path = result.substr(domain_end);
    std::string query_frag;
    size_t      qf = path.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path.substr(qf);
        path       = path.substr(0, qf);
    }

    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized_path = "/";
    for (size_t i = 0; i < segments.size(); ++i) {
        normalized_path += segments[i];
        if (i < segments.size() - 1)
            normalized_path += "/";
    }
    if (path.length() > 1 && path.back() == '/' && normalized_path.back() != '/') {
        normalized_path += "/";
    }

    return result.substr(0, domain_end) + normalized_path + query_frag;
}

bool Url::is_image(const std::string& url) {
    return Core::has_extension(parse(url).path, Core::get_image_extensions());
}

bool Url::is_file(const std::string& url) {
    return Core::has_extension(parse(url).path, Core::get_file_extensions());
}

std::string Url::strip_fragment(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

Link::Link(std::string url) : url_(Text::trim(url)) {
    if (url_.empty())
        throw std::invalid_argument("Link: empty URL");
    if (url_.find("://") == std::string::npos)
        url_ = "http://" + url_;
    parsed_ = Url::parse(url_);
    if (parsed_.host.empty())
        throw std::invalid_argument("Link: no host in " + url_);
    parsed_.host = Text::to_lower(parsed_.host);
}

std::string Link::without_protocol() const {
    std::string rest = url_.substr(url_.find("://") + 3);
    if (rest.size() > 1 && rest.back() == '/')
        rest.pop_back();
    return rest;
}

Link Link::fix_www() const {
    if (!Text::starts_with(parsed_.host, "www."))
        return *this;

    size_t start    = url_.find("://") + 3;
    size_t end_auth = url_.find_first_of("/?#", start);
    size_t at       = url_.find('@', start);
    if (at != std::string::npos && (end_auth == std::string::npos || at < end_auth))
        start = at + 1;

    std::string fixed = url_;
    fixed.erase(start, 4);
    return Link(std::move(fixed));
}

}  // namespace Utils
}  // namespace Harvest
