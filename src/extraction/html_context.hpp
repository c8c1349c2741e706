#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "../core/types/constants.hpp"
#include "context.hpp"

namespace Harvest {
namespace Extraction {

struct HtmlContextOptions {
    std::vector<std::string> languages;  // empty accepts every document
    std::size_t              min_word = Core::Constants::DEFAULT_MIN_WORD_LENGTH;
    std::size_t              max_word = Core::Constants::DEFAULT_MAX_WORD_LENGTH;
};

class HtmlContext : public Context {
public:
    explicit HtmlContext(HtmlContextOptions options = {});

    std::vector<Utils::Link> crawl(const Core::Html& html) override;
    std::vector<Utils::Link> filter_links(std::vector<Utils::Link> links,
                                          const Utils::Link&       current,
                                          const Utils::Link&       initial) override;
    std::vector<std::string> extract(const Core::Html& html) override;
    std::vector<std::string> filter_words(std::vector<std::string> words) override;

    // Primary language subtag of <html lang>, lower-cased, or empty.
    static std::string document_language(const std::string& html);

private:
    bool is_accepted_language(const std::string& language) const;

    HtmlContextOptions options_;
};

}  // namespace Extraction
}  // namespace Harvest
