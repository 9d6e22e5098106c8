#pragma once

#include <chrono>
#include <nlohmann/json.hpp>

namespace makemcp {

using json = nlohmann::json;
using SteadyClock = std::chrono::steady_clock;

} // namespace makemcp
