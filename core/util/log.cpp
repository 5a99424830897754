#include "util/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mazepath::log {

namespace {

std::shared_ptr<spdlog::logger> createLogger() {
    auto existing = spdlog::get("mazepath");
    if (existing) return existing;

    auto logger = spdlog::stderr_color_mt("mazepath");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::level::warn);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    static std::shared_ptr<spdlog::logger> logger = createLogger();
    return logger;
}

void setLevel(spdlog::level::level_enum level) {
    get()->set_level(level);
}

} // namespace mazepath::log
