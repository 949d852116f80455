#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ff::find
{

struct ResultEntry
{
    std::string rawLine;
    // 1-based position in the parsed result list.
    std::size_t index = 0;
    std::optional<std::uint64_t> size;
    // "YYYY-MM-DD HH:MM:SS", empty when the line carried no metadata.
    std::string modifiedAt;
    std::string path;

    bool hasMetadata() const noexcept { return size.has_value(); }
};

// Parses one output line. Returns nullopt for lines without a path separator
// and for lines whose metadata prefix is not "<bytes> <date> <time>".
std::optional<ResultEntry> parseResultLine(std::string_view line);

// Parses the whole output, dropping malformed lines and repeated paths, and
// numbers the remaining entries from 1.
std::vector<ResultEntry> parseResults(std::string_view output);

} // namespace ff::find
