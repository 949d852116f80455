#pragma once

#include "ff/find/result_parser.hpp"
#include "ff/find/search_spec.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ff::find
{

inline constexpr std::string_view kSizeUnitMarker = "\xE1\xB4\xAE"; // ᴮ
inline constexpr std::string_view kNumberPadding = "\xC2\xB7";      // ·
inline constexpr std::size_t kSizeColumnWidth = 15;
inline constexpr std::string_view kFileLinkScheme = "file://";

// Half-open byte range of a line rendered in one terminal style.
struct StyleSpan
{
    std::size_t begin = 0;
    std::size_t end = 0;
    std::string_view style;

    bool operator==(const StyleSpan &) const = default;
};

struct RenderedLine
{
    std::string numberLabel;
    std::string displayText;
    std::string quotedPath;
    std::string linkEncodedPath;
};

std::string groupThousands(std::string_view digits, char separator = '\'');

// "<date> <time> <size>ᴮ " or an empty string for entries without metadata.
std::string formatMetadata(const ResultEntry &entry);

// Percent-encodes everything but unreserved URI characters and '/'.
std::string percentEncodePath(std::string_view path);

std::string longestFolderPrefix(std::string_view path, const std::vector<std::string> &folders);

// Everything up to and including the last '/'.
std::string containingFolder(std::string_view path);

// Case-insensitive fragment positions at or after minPosition. Sequential
// order searches each fragment after the end of the previous match; any order
// searches every fragment from minPosition and merges overlapping matches.
std::vector<StyleSpan> findFragmentSpans(std::string_view line,
                                         const std::vector<std::string> &fragments,
                                         FragmentOrder order,
                                         std::size_t minPosition);

// Wraps every span in its style and a reset code. Spans must not overlap.
std::string applyStyleSpans(std::string_view line, std::vector<StyleSpan> spans);

std::string formatResultNumber(std::size_t number, std::size_t total);

RenderedLine renderResult(const ResultEntry &entry,
                          const SearchSpec &spec,
                          const ActionOptions &actions,
                          std::size_t total);

} // namespace ff::find
