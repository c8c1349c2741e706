#include "html_context.hpp"
#include <gumbo.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include "../core/errors/errors.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"

namespace Harvest {
namespace Extraction {

using namespace Harvest::Utils;

namespace {

struct GumboDeleter {
    void operator()(GumboOutput* output) const {
        gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

using GumboDocument = std::unique_ptr<GumboOutput, GumboDeleter>;

GumboDocument parse(const std::string& html) {
    return GumboDocument(gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
}

void collect_links(const GumboNode* node, std::vector<std::string>& links) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    if (node->v.element.tag == GUMBO_TAG_A) {
        GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href) {
            links.emplace_back(href->value);
        }
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_links(static_cast<const GumboNode*>(children->data[i]), links);
    }
}

bool is_invisible(GumboTag tag) {
    return tag == GUMBO_TAG_SCRIPT || tag == GUMBO_TAG_STYLE || tag == GUMBO_TAG_NOSCRIPT
           || tag == GUMBO_TAG_TEMPLATE;
}

void collect_text(const GumboNode* node, std::string& text) {
    if (node->type == GUMBO_NODE_TEXT) {
        text.append(node->v.text.text);
        text.push_back(' ');
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT || is_invisible(node->v.element.tag))
        return;

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_text(static_cast<const GumboNode*>(children->data[i]), text);
    }
}

// Bytes of multi-byte UTF-8 sequences count as word characters.
bool is_word_byte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string              current;
    for (unsigned char c : text) {
        if (is_word_byte(c)) {
            current.push_back(static_cast<char>(c));
        }
        else if (!current.empty()) {
            words.push_back(Text::to_lower(current));
            current.clear();
        }
    }
    if (!current.empty())
        words.push_back(Text::to_lower(current));
    return words;
}

std::string primary_subtag(const std::string& lang) {
    auto end = lang.find_first_of("-_");
    return Text::to_lower(Text::trim(lang.substr(0, end)));
}

std::string language_of(const GumboOutput* output) {
    const GumboNode* root = output->root;
    if (!root || root->type != GUMBO_NODE_ELEMENT)
        return "";
    GumboAttribute* lang = gumbo_get_attribute(&root->v.element.attributes, "lang");
    return lang ? primary_subtag(lang->value) : "";
}

bool is_skipped_scheme(const std::string& href) {
    auto lower = Text::to_lower(Text::trim(href));
    return Text::starts_with(lower, "mailto:") || Text::starts_with(lower, "javascript:")
           || Text::starts_with(lower, "tel:");
}

}  // namespace

HtmlContext::HtmlContext(HtmlContextOptions options) : options_(std::move(options)) {
    for (auto& language : options_.languages)
        language = primary_subtag(language);
}

std::vector<Link> HtmlContext::crawl(const Core::Html& html) {
    std::vector<Link> links;
    if (html.content.empty())
        return links;

    std::vector<std::string> hrefs;
    {
        auto document = parse(html.content);
        collect_links(document->root, hrefs);
    }

    for (const auto& href : hrefs) {
        if (is_skipped_scheme(href))
            continue;
        std::string absolute = Url::strip_fragment(Url::resolve(html.link.str(), Text::trim(href)));
        if (absolute.empty())
            continue;
        try {
            links.emplace_back(absolute);
        } catch (const std::invalid_argument& e) {
            Core::Logger::debug("HtmlContext - Skipped link " + absolute + ": " + e.what());
        }
    }
    return links;
}

std::vector<Link> HtmlContext::filter_links(std::vector<Link> links,
                                            const Link&       current,
                                            const Link&       initial) {
    const std::string domain       = initial.fix_www().host();
    const std::string current_page = current.without_protocol();

    links.erase(std::remove_if(links.begin(), links.end(),
                               [&](const Link& link) {
                                   if (link.scheme() != "http" && link.scheme() != "https")
                                       return true;
                                   if (Url::is_image(link.str()) || Url::is_file(link.str()))
                                       return true;
                                   if (link.fix_www().host().find(domain) == std::string::npos)
                                       return true;
                                   return link.without_protocol() == current_page;
                               }),
                links.end());
    return links;
}

std::vector<std::string> HtmlContext::extract(const Core::Html& html) {
    if (html.content.empty())
        return {};

    std::string text;
    std::string language;
    {
        auto document = parse(html.content);
        language      = language_of(document.get());
        if (is_accepted_language(language))
            collect_text(document->root, text);
    }

    if (!is_accepted_language(language)) {
        throw Core::ContentRejectedError("Document language '" + language + "' of "
                                         + html.link.str() + " is not accepted");
    }
    return split_words(text);
}

std::vector<std::string> HtmlContext::filter_words(std::vector<std::string> words) {
    words.erase(std::remove_if(words.begin(), words.end(),
                               [this](const std::string& word) {
                                   auto length = Text::utf8_length(word);
                                   return length < options_.min_word || length > options_.max_word
                                          || Text::is_digits(word);
                               }),
                words.end());
    return words;
}

std::string HtmlContext::document_language(const std::string& html) {
    auto document = parse(html);
    return language_of(document.get());
}

bool HtmlContext::is_accepted_language(const std::string& language) const {
    if (options_.languages.empty() || language.empty())
        return true;
    return std::find(options_.languages.begin(), options_.languages.end(), language)
           != options_.languages.end();
}

}  // namespace Extraction
}  // namespace Harvest
