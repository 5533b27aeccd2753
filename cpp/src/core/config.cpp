#include "recallcpp/config.hpp"
#include "recallcpp/errors.hpp"
#include "recallcpp/logging.hpp"

#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

namespace recallcpp {
namespace {

int ParseIntEnv(const char* name, std::string_view value) {
  int out = 0;
  const auto* begin = value.data();
  const auto* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  if (ec != std::errc{} || ptr != end) {
    throw InvalidArgumentError(std::string("config: ") + name + " is not an integer: '" + std::string(value) + "'");
  }
  return out;
}

}  // namespace

void ValidateConfig(const EngineConfig& config) {
  if (config.chunking.chunk_size <= 1) {
    throw InvalidArgumentError("config: chunking.chunk_size must be greater than 1");
  }
  const auto& query = config.query;
  if (query.default_top_k < 0) {
    throw InvalidArgumentError("config: query.default_top_k must be non-negative");
  }
  if (!(query.alpha >= 0.0F && query.alpha <= 1.0F)) {
    throw InvalidArgumentError("config: query.alpha must be within [0, 1]");
  }
  if (query.rrf_k <= 0) {
    throw InvalidArgumentError("config: query.rrf_k must be positive");
  }
  if (query.candidate_multiplier < 1) {
    throw InvalidArgumentError("config: query.candidate_multiplier must be at least 1");
  }
  if (query.preview_max_bytes < 0) {
    throw InvalidArgumentError("config: query.preview_max_bytes must be non-negative");
  }
  if (query.mode == SearchModeKind::kHybrid && !config.enable_keyword_index) {
    throw InvalidArgumentError("config: hybrid search mode requires the keyword index");
  }
  if (config.ingest_batch_size < 0) {
    throw InvalidArgumentError("config: ingest_batch_size must be non-negative");
  }
  if (config.log_level.has_value() && !log::IsKnownLevel(*config.log_level)) {
    throw InvalidArgumentError("config: unknown log_level '" + *config.log_level + "'");
  }
}

void ApplyEnvironmentOverrides(EngineConfig& config) {
  if (const char* env = std::getenv(kChunkSizeEnvVar); env != nullptr) {
    config.chunking.chunk_size = ParseIntEnv(kChunkSizeEnvVar, env);
  }
  if (const char* env = std::getenv(kTopKEnvVar); env != nullptr) {
    config.query.default_top_k = ParseIntEnv(kTopKEnvVar, env);
  }
  if (const char* env = std::getenv(log::kLevelEnvVar); env != nullptr) {
    config.log_level = std::string(env);
  }
}

}  // namespace recallcpp
