#pragma once

#include <string_view>

namespace labscan::app {

/// Install the "labscan" stderr logger as spdlog's default and set its level
/// (trace, debug, info, warn, error, critical, off). stdout stays free for results.
/// Unknown levels fall back to info and return false. Safe to call more than once.
bool configure_logging(std::string_view level);

}  // namespace labscan::app
