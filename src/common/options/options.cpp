#include "ff/options.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>

namespace ff::config
{
namespace
{

// Scalars are accepted as their textual form so that `"linkMode": true` or a
// numeric folder name does not make the whole file unusable.
std::optional<std::string> stringFromJson(const nlohmann::json &value)
{
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_boolean() || value.is_number())
        return value.dump();
    return std::nullopt;
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "ff";
    if (const char *home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "ff";
    return std::filesystem::path(".config") / "ff";
}

} // namespace

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.find(key) != definitions.end();
}

void OptionRegistry::set(const std::string &key, std::string value)
{
    if (!hasOption(key))
        return;
    overrides[key] = std::move(value);
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    if (auto it = overrides.find(key); it != overrides.end())
        return it->second;
    if (auto it = definitions.find(key); it != definitions.end())
        return it->second.defaultValue;
    return fallback;
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data;
    try
    {
        in >> data;
    }
    catch (const nlohmann::json::exception &e)
    {
        spdlog::warn("Cannot parse options file '{}': {}", filePath.string(), e.what());
        return false;
    }

    if (!data.is_object())
    {
        spdlog::warn("Options file '{}' does not contain an object", filePath.string());
        return false;
    }

    for (const auto &item : data.items())
    {
        const std::string &key = item.key();
        if (!hasOption(key))
        {
            spdlog::debug("Ignoring unknown option '{}' in '{}'", key, filePath.string());
            continue;
        }
        if (auto text = stringFromJson(item.value()))
            overrides[key] = std::move(*text);
        else
            spdlog::warn("Option '{}' in '{}' is not a string, using the default", key, filePath.string());
    }
    return true;
}

bool OptionRegistry::loadDefaults()
{
    const std::filesystem::path path = defaultOptionsPath();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::filesystem::path OptionRegistry::configRoot()
{
    static const std::filesystem::path root = detectConfigRoot();
    return root;
}

} // namespace ff::config
