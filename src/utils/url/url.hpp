#pragma once
#include <cstddef>
#include <functional>
#include <string>

namespace Harvest {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static bool        is_image(const std::string& url);
    static bool        is_file(const std::string& url);
    static std::string strip_fragment(const std::string& url);
};

// Immutable absolute URL. Equality is textual; use without_protocol() to
// compare across http/https and fix_www() for domain identity.
class Link {
public:
    explicit Link(std::string url);

    const std::string& str() const {
        return url_;
    }
    const std::string& host() const {
        return parsed_.host;
    }
    const std::string& scheme() const {
        return parsed_.scheme;
    }

    std::string without_protocol() const;
    Link        fix_www() const;

    bool operator==(const Link& other) const {
        return url_ == other.url_;
    }
    bool operator!=(const Link& other) const {
        return url_ != other.url_;
    }
    bool operator<(const Link& other) const {
        return url_ < other.url_;
    }

private:
    std::string url_;
    UrlParsed   parsed_;
};

}  // namespace Utils
}  // namespace Harvest

template <>
struct std::hash<Harvest::Utils::Link> {
    size_t operator()(const Harvest::Utils::Link& link) const noexcept {
        return std::hash<std::string>{}(link.str());
    }
};
