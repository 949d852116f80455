#pragma once

#include <filesystem>
#include <string>
#include <unordered_map>

namespace ff::config
{

struct OptionDefinition
{
    std::string key;
    std::string defaultValue;
    std::string displayName;
    std::string description;
};

// String options for one application id, read from
// <configRoot>/<appId>/defaults.json. Keys that were never registered are
// ignored, both in set() and in loaded files.
class OptionRegistry
{
public:
    explicit OptionRegistry(std::string appId);

    const std::string &appId() const noexcept { return id; }

    void registerOption(const OptionDefinition &definition);
    bool hasOption(const std::string &key) const noexcept;

    void set(const std::string &key, std::string value);
    void reset(const std::string &key);

    std::string getString(const std::string &key, const std::string &fallback = std::string()) const;

    // Returns false when the file is missing or is not a JSON object.
    bool loadFromFile(const std::filesystem::path &filePath);
    bool loadDefaults();
    std::filesystem::path defaultOptionsPath() const;

    static std::filesystem::path configRoot();

private:
    std::string id;
    std::unordered_map<std::string, OptionDefinition> definitions;
    std::unordered_map<std::string, std::string> overrides;
};

} // namespace ff::config
