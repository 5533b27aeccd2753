#include "recallcpp/logging.hpp"
#include "recallcpp/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <string>

namespace recallcpp::log {
namespace {

bool TryParseLevel(std::string_view name, spdlog::level::level_enum& out) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  const auto parsed = spdlog::level::from_str(lowered);
  // from_str maps unknown names to off, so only trust "off" when it was spelled out.
  if (parsed == spdlog::level::off && lowered != "off") {
    return false;
  }
  out = parsed;
  return true;
}

std::shared_ptr<spdlog::logger> CreateLogger() {
  auto logger = spdlog::get(kLoggerName);
  if (logger != nullptr) {
    return logger;
  }
  logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

  spdlog::level::level_enum level = spdlog::level::warn;
  if (const char* env = std::getenv(kLevelEnvVar); env != nullptr) {
    if (!TryParseLevel(env, level)) {
      logger->warn("ignoring unknown {}='{}'", kLevelEnvVar, env);
      level = spdlog::level::warn;
    }
  }
  logger->set_level(level);
  return logger;
}

}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
  static std::once_flag once;
  static std::shared_ptr<spdlog::logger> logger;
  std::call_once(once, [] { logger = CreateLogger(); });
  return logger;
}

bool IsKnownLevel(std::string_view level_name) {
  spdlog::level::level_enum level = spdlog::level::warn;
  return TryParseLevel(level_name, level);
}

void SetLevel(std::string_view level_name) {
  spdlog::level::level_enum level = spdlog::level::warn;
  if (!TryParseLevel(level_name, level)) {
    throw InvalidArgumentError("log level: unknown level '" + std::string(level_name) + "'");
  }
  Logger()->set_level(level);
}

}  // namespace recallcpp::log
