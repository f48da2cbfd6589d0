#ifndef VPERP_LOG_HPP
#define VPERP_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace vperp {
namespace log {

// Shared "vperp" logger (stdout colour sink), created on first use
std::shared_ptr<spdlog::logger> get();

// "trace", "debug", "info", "warn", "error", "critical", "off"
void set_level(const std::string& level);

} // namespace log
} // namespace vperp

#endif // VPERP_LOG_HPP
