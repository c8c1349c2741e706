#include "domain_list.hpp"
#include <fstream>
#include <stdexcept>
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"

namespace Harvest {
namespace Input {

using Harvest::Core::Logger;
using namespace Harvest::Utils;

namespace {

bool looks_like_url(const std::string& value) {
    return value.find('.') != std::string::npos && value.find(' ') == std::string::npos;
}

void add_link(const std::string& value, std::vector<Link>& links) {
    try {
        links.emplace_back(value);
    } catch (const std::invalid_argument& e) {
        Logger::warn("Skipping invalid domain '" + value + "': " + e.what());
    }
}

}  // namespace

std::vector<std::string> DomainList::split_row(const std::string& line) {
    std::vector<std::string> columns;
    std::string              current;
    bool                     quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                ++i;
            }
            else {
                quoted = !quoted;
            }
        }
        else if (c == ';' && !quoted) {
            columns.push_back(Text::trim(current));
            current.clear();
        }
        else {
            current.push_back(c);
        }
    }
    columns.push_back(Text::trim(current));
    return columns;
}

std::vector<Link> DomainList::from_csv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::runtime_error("Cannot read domain list: " + path);

    std::vector<Link> links;
    std::string       line;
    bool              first = true;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (Text::trim(line).empty())
            continue;

        auto columns = split_row(line);
        auto website = columns.back();
        if (first) {
            first = false;
            if (!looks_like_url(website)) {
                Logger::debug("DomainList - Skipped header row of " + path);
                continue;
            }
        }
        if (website.empty())
            continue;
        add_link(website, links);
    }
    Logger::info("Loaded " + std::to_string(links.size()) + " domains from " + path);
    return links;
}

std::vector<Link> DomainList::from_strings(const std::vector<std::string>& urls) {
    std::vector<Link> links;
    for (const auto& url : urls) {
        if (!Text::trim(url).empty())
            add_link(url, links);
    }
    return links;
}

}  // namespace Input
}  // namespace Harvest
