#pragma once
#include <string>
#include "../../utils/url/url.hpp"

namespace Harvest {
namespace Core {

// Rendered document and the URL it finally resolved to.
struct Html {
    std::string content;
    Utils::Link link;
};

struct Site {
    Html        html;
    Utils::Link initial_link;  // link that was requested, before redirects
};

}  // namespace Core
}  // namespace Harvest
