// =============================================================================
// log.cpp - Shared spdlog logger
// =============================================================================

#include "vperp/log.hpp"
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace vperp {
namespace log {

std::shared_ptr<spdlog::logger> get() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;

    std::call_once(once, [] {
        logger = spdlog::get("vperp");
        if (!logger) {
            logger = spdlog::stdout_color_mt("vperp");
            logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            logger->set_level(spdlog::level::info);
        }
    });
    return logger;
}

void set_level(const std::string& level) {
    get()->set_level(spdlog::level::from_str(level));
}

} // namespace log
} // namespace vperp
