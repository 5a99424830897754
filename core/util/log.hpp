#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace mazepath::log {

/// Project logger ("mazepath"), created on first use with a stderr sink.
std::shared_ptr<spdlog::logger> get();

/// Adjust verbosity; defaults to warn so library use stays quiet.
void setLevel(spdlog::level::level_enum level);

} // namespace mazepath::log
