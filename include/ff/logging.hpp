#pragma once

#include <spdlog/common.h>

#include <optional>
#include <string_view>

namespace ff::logging
{

inline constexpr const char kLogLevelEnvVar[] = "FF_LOG_LEVEL";

std::optional<spdlog::level::level_enum> parseLevel(std::string_view value);

// Installs the stderr logger used by every ff component. The level defaults to
// warn and can be overridden through FF_LOG_LEVEL.
void initialize();

} // namespace ff::logging
