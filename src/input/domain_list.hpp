#pragma once
#include <string>
#include <vector>
#include "../utils/url/url.hpp"

namespace Harvest {
namespace Input {

class DomainList {
public:
    // `"id";"company_id";"website"` rows; the website is the last column.
    // Throws std::runtime_error when the file cannot be read.
    static std::vector<Utils::Link> from_csv(const std::string& path);
    static std::vector<Utils::Link> from_strings(const std::vector<std::string>& urls);

    static std::vector<std::string> split_row(const std::string& line);
};

}  // namespace Input
}  // namespace Harvest
