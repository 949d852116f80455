#include "ff/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <string>

namespace ff::logging
{

std::optional<spdlog::level::level_enum> parseLevel(std::string_view value)
{
    std::string v;
    v.reserve(value.size());
    for (char c : value)
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "off" || v == "none" || v == "silent")
        return spdlog::level::off;
    return std::nullopt;
}

void initialize()
{
    auto logger = spdlog::stderr_color_st("ff");
    logger->set_pattern("ff: [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);

    if (const char *envLevel = std::getenv(kLogLevelEnvVar); envLevel && *envLevel)
    {
        if (auto level = parseLevel(envLevel))
            spdlog::set_level(*level);
        else
            spdlog::warn("Ignoring unknown {} value '{}'", kLogLevelEnvVar, envLevel);
    }
}

} // namespace ff::logging
