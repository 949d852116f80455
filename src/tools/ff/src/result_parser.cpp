#include "ff/find/result_parser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <unordered_set>

namespace ff::find
{
namespace
{

std::vector<std::string_view> splitOnBlanks(std::string_view text)
{
    std::vector<std::string_view> fields;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
            ++pos;
        std::size_t end = pos;
        while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end])))
            ++end;
        if (end > pos)
            fields.push_back(text.substr(pos, end - pos));
        pos = end;
    }
    return fields;
}

// Checks a value against a pattern where '9' stands for any digit.
bool matchesDigitPattern(std::string_view value, std::string_view pattern)
{
    if (value.size() != pattern.size())
        return false;
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        if (pattern[i] == '9')
        {
            if (!std::isdigit(static_cast<unsigned char>(value[i])))
                return false;
        }
        else if (value[i] != pattern[i])
        {
            return false;
        }
    }
    return true;
}

std::optional<std::uint64_t> parseSize(std::string_view text)
{
    std::uint64_t size = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), size);
    if (ec != std::errc() || ptr != text.data() + text.size())
        return std::nullopt;
    return size;
}

} // namespace

std::optional<ResultEntry> parseResultLine(std::string_view line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    const std::size_t pathStart = line.find('/');
    if (pathStart == std::string_view::npos)
        return std::nullopt;

    ResultEntry entry;
    entry.rawLine = std::string(line);
    entry.path = std::string(line.substr(pathStart));

    const std::string_view prefix = line.substr(0, pathStart);
    const auto fields = splitOnBlanks(prefix);
    if (fields.empty())
        return entry;

    if (fields.size() != 3 || !matchesDigitPattern(fields[1], "9999-99-99") ||
        !matchesDigitPattern(fields[2], "99:99:99"))
        return std::nullopt;

    entry.size = parseSize(fields[0]);
    if (!entry.size)
        return std::nullopt;
    entry.modifiedAt = std::string(fields[1]) + " " + std::string(fields[2]);
    return entry;
}

std::vector<ResultEntry> parseResults(std::string_view output)
{
    std::vector<ResultEntry> entries;
    std::unordered_set<std::string> seenPaths;

    std::size_t pos = 0;
    while (pos < output.size())
    {
        std::size_t end = output.find('\n', pos);
        if (end == std::string_view::npos)
            end = output.size();
        const std::string_view line = output.substr(pos, end - pos);
        pos = end + 1;

        if (line.empty())
            continue;
        auto entry = parseResultLine(line);
        if (!entry)
        {
            spdlog::debug("Dropping unrecognised output line: {}", line);
            continue;
        }
        if (!seenPaths.insert(entry->path).second)
        {
            spdlog::debug("Dropping repeated path: {}", entry->path);
            continue;
        }
        entry->index = entries.size() + 1;
        entries.push_back(std::move(*entry));
    }
    return entries;
}

} // namespace ff::find
