#include "formula/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace formula {

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = [] {
        if (auto existing = spdlog::get("formula")) return existing;
        return spdlog::stderr_color_mt("formula");
    }();
    return instance;
}

} // namespace formula
