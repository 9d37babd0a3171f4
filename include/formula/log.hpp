#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace formula {

/// The library's "formula" logger. Registered with spdlog on first use; sinks
/// and level follow spdlog's defaults unless the host reconfigures them.
std::shared_ptr<spdlog::logger> logger();

} // namespace formula
