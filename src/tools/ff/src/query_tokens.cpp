#include "ff/find/query_tokens.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>

namespace ff::find
{
namespace
{

bool isFragmentCharacter(unsigned char ch)
{
    return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '*';
}

bool isAllDigits(std::string_view value)
{
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

std::string toLowerCopy(std::string_view value)
{
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// Replaces prefix only when it is a whole leading path component, so ".config"
// is not read as "." followed by "config".
std::string resolvePrefixFolder(std::string_view folder, std::string_view prefix, std::string_view replacement)
{
    if (!folder.starts_with(prefix) || (folder.size() > prefix.size() && folder[prefix.size()] != '/'))
        return std::string(folder);
    std::string resolved(replacement);
    resolved.append(folder.substr(prefix.size()));
    return resolved;
}

bool parseSelectorNumber(std::string_view digits, int &number)
{
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
    return ec == std::errc() && ptr == digits.data() + digits.size();
}

void classifyFragment(const std::string &fragment, Classification &result)
{
    if (fragment.front() != '-')
    {
        std::string include;
        include.reserve(fragment.size());
        std::copy_if(fragment.begin(), fragment.end(), std::back_inserter(include), [](char ch) { return ch != '*'; });
        if (!include.empty())
            result.includeFragments.push_back(std::move(include));
        return;
    }

    if (fragment.size() == 1)
        return;

    std::string_view body = std::string_view(fragment).substr(1);
    if (isAllDigits(body))
    {
        int number = 0;
        if (parseSelectorNumber(body, number))
            result.selectorIndices.insert(number);
        else
            result.ignoredTokens.push_back(fragment);
        return;
    }

    if (const FlagDefinition *flag = findFlag(fragment))
    {
        result.flags.push_back(flag->id);
        return;
    }

    result.excludeFragments.insert(toLowerCopy(body));
}

void classifySelectorToken(const std::string &token, Classification &result)
{
    std::string_view digits = token;
    if (digits.starts_with('-'))
        digits.remove_prefix(1);
    int number = 0;
    if (isAllDigits(digits) && parseSelectorNumber(digits, number))
        result.selectorIndices.insert(number);
    else
        result.ignoredTokens.push_back(token);
}

} // namespace

bool Classification::hasFlag(FlagId id) const noexcept
{
    return std::find(flags.begin(), flags.end(), id) != flags.end();
}

bool isFolderToken(std::string_view token) noexcept
{
    return token == "." || token == ".." || token.starts_with("./") || token.starts_with("../") ||
           token.starts_with('/') || token.starts_with('~');
}

std::vector<std::string> splitFragments(std::string_view token)
{
    std::vector<std::string> fragments;
    std::size_t pos = 0;
    while (pos < token.size())
    {
        while (pos < token.size() && !isFragmentCharacter(static_cast<unsigned char>(token[pos])))
            ++pos;
        std::size_t end = pos;
        while (end < token.size() && isFragmentCharacter(static_cast<unsigned char>(token[end])))
            ++end;
        if (end > pos)
            fragments.emplace_back(token.substr(pos, end - pos));
        pos = end;
    }
    return fragments;
}

std::string normalizeFolder(std::string_view folder, const SearchEnvironment &environment)
{
    std::string resolved = resolvePrefixFolder(folder, "~", environment.homeFolder);
    resolved = resolvePrefixFolder(resolved, "..", environment.parentFolder);
    resolved = resolvePrefixFolder(resolved, ".", environment.currentFolder);
    if (!resolved.starts_with('/'))
    {
        std::string base = environment.currentFolder;
        if (base.empty() || base.back() != '/')
            base.push_back('/');
        resolved = base + resolved;
    }
    if (resolved.empty() || resolved.back() != '/')
        resolved.push_back('/');
    return resolved;
}

Classification classifyTokens(std::span<const std::string> args, const SearchEnvironment &environment)
{
    Classification result;
    std::vector<std::string> folderTokens;
    bool selectorsOnly = false;

    for (const std::string &token : args)
    {
        if (selectorsOnly)
        {
            classifySelectorToken(token, result);
            continue;
        }
        if (token == kSelectorSeparator)
        {
            selectorsOnly = true;
            continue;
        }
        if (isFolderToken(token))
        {
            folderTokens.push_back(token);
            continue;
        }
        for (const std::string &fragment : splitFragments(token))
            classifyFragment(fragment, result);
    }

    if (folderTokens.empty())
        folderTokens.push_back(environment.defaultFolder);
    for (const std::string &folder : folderTokens)
        result.folders.push_back(normalizeFolder(folder, environment));

    for (const std::string &ignored : result.ignoredTokens)
        spdlog::warn("Ignoring '{}': not a usable result number", ignored);

    spdlog::debug("Classified {} folder(s), {} include, {} exclude, {} flag(s), {} selector(s)",
                  result.folders.size(), result.includeFragments.size(), result.excludeFragments.size(),
                  result.flags.size(), result.selectorIndices.size());
    return result;
}

bool isHelpRequest(std::span<const std::string> args) noexcept
{
    return std::all_of(args.begin(), args.end(), [](const std::string &arg) {
        const FlagDefinition *flag = findFlag(arg);
        return flag && flag->id == FlagId::Help;
    });
}

} // namespace ff::find
