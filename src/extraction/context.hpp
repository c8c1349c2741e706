#pragma once
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "../core/types/site.hpp"
#include "../utils/url/url.hpp"

namespace Harvest {
namespace Extraction {

// Turns a rendered page into outbound links and vocabulary. One instance
// serves one domain and is called concurrently from completion handlers.
class Context {
public:
    virtual ~Context() = default;

    virtual std::vector<Utils::Link> crawl(const Core::Html& html) = 0;
    virtual std::vector<Utils::Link> filter_links(std::vector<Utils::Link> links,
                                                  const Utils::Link&       current,
                                                  const Utils::Link&       initial) = 0;

    // Throws Core::ContentRejectedError when the document is not acceptable.
    virtual std::vector<std::string> extract(const Core::Html& html)                  = 0;
    virtual std::vector<std::string> filter_words(std::vector<std::string> words) = 0;
};

using ContextFactory = std::function<std::shared_ptr<Context>()>;

}  // namespace Extraction
}  // namespace Harvest
