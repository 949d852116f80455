#pragma once

#include "ff/find/query_flags.hpp"

#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ff::find
{

inline constexpr std::string_view kSelectorSeparator = "--";

// Folders the classifier resolves search folder tokens against. Built once at
// startup, see detectSearchEnvironment().
struct SearchEnvironment
{
    std::string homeFolder;
    std::string currentFolder;
    std::string parentFolder;
    std::string defaultFolder = "~";
};

struct Classification
{
    std::vector<std::string> folders;
    std::vector<std::string> includeFragments;
    std::set<std::string> excludeFragments;
    // Kept in command-line order so that the last sort flag wins.
    std::vector<FlagId> flags;
    // 1-based, as typed by the user.
    std::set<int> selectorIndices;
    // Tokens after the selector separator that are not result numbers, and
    // result numbers too large to parse.
    std::vector<std::string> ignoredTokens;

    bool hasFlag(FlagId id) const noexcept;

    bool operator==(const Classification &) const = default;
};

bool isFolderToken(std::string_view token) noexcept;
std::vector<std::string> splitFragments(std::string_view token);
std::string normalizeFolder(std::string_view folder, const SearchEnvironment &environment);

Classification classifyTokens(std::span<const std::string> args, const SearchEnvironment &environment);

// No arguments, or nothing but "-h".
bool isHelpRequest(std::span<const std::string> args) noexcept;

} // namespace ff::find
