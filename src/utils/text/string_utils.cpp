#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Harvest {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool is_digits(const std::string& str) {
    return !str.empty()
           && std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c); });
}

size_t utf8_length(const std::string& str) {
    size_t length = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80)
            ++length;
    }
    return length;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Harvest
