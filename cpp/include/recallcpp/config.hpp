#pragma once

#include "recallcpp/types.hpp"

namespace recallcpp {

inline constexpr const char* kChunkSizeEnvVar = "RECALLCPP_CHUNK_SIZE";
inline constexpr const char* kTopKEnvVar = "RECALLCPP_TOP_K";

// Throws InvalidArgumentError describing the first offending field.
void ValidateConfig(const EngineConfig& config);

// Reads RECALLCPP_CHUNK_SIZE, RECALLCPP_TOP_K and RECALLCPP_LOG_LEVEL into `config`.
void ApplyEnvironmentOverrides(EngineConfig& config);

}  // namespace recallcpp
