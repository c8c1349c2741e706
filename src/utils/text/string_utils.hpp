#pragma once

#include <string>

namespace Harvest {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        is_digits(const std::string& str);

// Counts UTF-8 code points, not bytes.
size_t utf8_length(const std::string& str);

}  // namespace Text
}  // namespace Utils
}  // namespace Harvest
