// =============================================================================
// log.cpp - Library Logger
// =============================================================================

#include "lever/log.hpp"

#include <mutex>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lever {
namespace log {

namespace {
constexpr const char* LOGGER_NAME = "lever";
std::mutex logger_mutex;
} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(logger_mutex);
    auto existing = spdlog::get(LOGGER_NAME);
    if (existing) return existing;

    auto created = spdlog::stdout_color_mt(LOGGER_NAME);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    created->set_level(spdlog::level::info);
    return created;
}

void set_level(std::string_view level) {
    logger()->set_level(spdlog::level::from_str(std::string(level)));
}

} // namespace log
} // namespace lever
