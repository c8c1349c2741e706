#include "statistic.hpp"

namespace Harvest {
namespace Engine {

std::string Statistic::to_string() const {
    return "Statistic{sent=" + std::to_string(sent()) + ", succeeded=" + std::to_string(succeeded())
           + ", scraped=" + std::to_string(scraped()) + ", failed=" + std::to_string(failed())
           + ", retried=" + std::to_string(retried()) + ", timeout=" + std::to_string(timed_out())
           + ", rejected=" + std::to_string(rejected())
           + ", exception=" + std::to_string(exceptioned()) + "}";
}

}  // namespace Engine
}  // namespace Harvest
