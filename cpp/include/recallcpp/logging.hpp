#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace recallcpp::log {

inline constexpr const char* kLoggerName = "recallcpp";
inline constexpr const char* kLevelEnvVar = "RECALLCPP_LOG_LEVEL";

// Shared library logger. Created on first use with a stderr sink; the level comes from
// RECALLCPP_LOG_LEVEL and defaults to warn.
[[nodiscard]] std::shared_ptr<spdlog::logger> Logger();

// Level names are case-insensitive: trace, debug, info, warn, error, critical, off.
[[nodiscard]] bool IsKnownLevel(std::string_view level_name);

// Throws InvalidArgumentError for names spdlog does not know.
void SetLevel(std::string_view level_name);

}  // namespace recallcpp::log
