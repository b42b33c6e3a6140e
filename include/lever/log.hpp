#ifndef LEVER_LOG_HPP
#define LEVER_LOG_HPP

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace lever {
namespace log {

// Shared "lever" logger; created with a stdout color sink on first use
std::shared_ptr<spdlog::logger> logger();

// "trace", "debug", "info", "warn", "error", "critical", "off"
void set_level(std::string_view level);

} // namespace log
} // namespace lever

#endif // LEVER_LOG_HPP
