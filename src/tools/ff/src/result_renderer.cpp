#include "ff/find/result_renderer.hpp"

#include "ff/find/terminal_styles.hpp"

#include <algorithm>
#include <cctype>

namespace ff::find
{
namespace
{

std::string toLowerCopy(std::string_view value)
{
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool isUnreserved(unsigned char ch)
{
    return std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~';
}

std::string numberLabel(std::string_view digits)
{
    std::string label = "[";
    label += styles::kBlue;
    label += styles::kBold;
    label += digits;
    label += styles::kNone;
    label += styles::kNone;
    label += "]";
    return label;
}

void mergeOverlapping(std::vector<StyleSpan> &spans)
{
    std::sort(spans.begin(), spans.end(), [](const StyleSpan &a, const StyleSpan &b) { return a.begin < b.begin; });
    std::vector<StyleSpan> merged;
    for (const auto &span : spans)
    {
        if (!merged.empty() && span.begin < merged.back().end)
            merged.back().end = std::max(merged.back().end, span.end);
        else
            merged.push_back(span);
    }
    spans = std::move(merged);
}

} // namespace

std::string groupThousands(std::string_view digits, char separator)
{
    std::string grouped;
    grouped.reserve(digits.size() + digits.size() / 3);
    const std::size_t leading = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i)
    {
        if (i != 0 && (i + 3 - leading) % 3 == 0)
            grouped.push_back(separator);
        grouped.push_back(digits[i]);
    }
    return grouped;
}

std::string formatMetadata(const ResultEntry &entry)
{
    if (!entry.hasMetadata())
        return {};

    std::string size = groupThousands(std::to_string(*entry.size));
    std::string formatted = entry.modifiedAt;
    formatted.push_back(' ');
    if (size.size() < kSizeColumnWidth)
        formatted.append(kSizeColumnWidth - size.size(), ' ');
    formatted += size;
    formatted += kSizeUnitMarker;
    formatted.push_back(' ');
    return formatted;
}

std::string percentEncodePath(std::string_view path)
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(path.size());
    for (unsigned char ch : path)
    {
        if (ch == '/' || isUnreserved(ch))
        {
            encoded.push_back(static_cast<char>(ch));
            continue;
        }
        encoded.push_back('%');
        encoded.push_back(kHex[ch >> 4]);
        encoded.push_back(kHex[ch & 0x0F]);
    }
    return encoded;
}

std::string longestFolderPrefix(std::string_view path, const std::vector<std::string> &folders)
{
    std::string_view longest;
    for (const auto &folder : folders)
    {
        if (path.starts_with(folder) && folder.size() > longest.size())
            longest = folder;
    }
    return std::string(longest);
}

std::string containingFolder(std::string_view path)
{
    const std::size_t lastSlash = path.rfind('/');
    if (lastSlash == std::string_view::npos)
        return std::string(path);
    return std::string(path.substr(0, lastSlash + 1));
}

std::vector<StyleSpan> findFragmentSpans(std::string_view line,
                                         const std::vector<std::string> &fragments,
                                         FragmentOrder order,
                                         std::size_t minPosition)
{
    std::vector<StyleSpan> spans;
    const std::string lowerLine = toLowerCopy(line);
    std::size_t cursor = minPosition;
    for (const auto &fragment : fragments)
    {
        if (fragment.empty())
            continue;
        const std::size_t from = order == FragmentOrder::Sequential ? cursor : minPosition;
        const std::size_t found = lowerLine.find(toLowerCopy(fragment), from);
        if (found == std::string::npos)
            continue;
        spans.push_back({found, found + fragment.size(), styles::kYellow});
        cursor = found + fragment.size();
    }
    if (order == FragmentOrder::AnyOrder)
        mergeOverlapping(spans);
    return spans;
}

std::string applyStyleSpans(std::string_view line, std::vector<StyleSpan> spans)
{
    std::sort(spans.begin(), spans.end(), [](const StyleSpan &a, const StyleSpan &b) { return a.begin < b.begin; });
    std::string styled;
    std::size_t cursor = 0;
    for (const auto &span : spans)
    {
        if (span.begin >= span.end || span.begin < cursor || span.end > line.size())
            continue;
        styled.append(line.substr(cursor, span.begin - cursor));
        styled += span.style;
        styled.append(line.substr(span.begin, span.end - span.begin));
        styled += styles::kNone;
        cursor = span.end;
    }
    styled.append(line.substr(cursor));
    return styled;
}

std::string formatResultNumber(std::size_t number, std::size_t total)
{
    const std::string label = numberLabel(std::to_string(number));
    const std::size_t width = numberLabel(std::to_string(total)).size();
    std::string padded;
    for (std::size_t i = label.size(); i < width; ++i)
        padded += kNumberPadding;
    padded += label;
    return padded;
}

RenderedLine renderResult(const ResultEntry &entry,
                          const SearchSpec &spec,
                          const ActionOptions &actions,
                          std::size_t total)
{
    RenderedLine rendered;
    rendered.numberLabel = formatResultNumber(entry.index, total);

    const std::string encodedPath = percentEncodePath(entry.path);
    rendered.linkEncodedPath = std::string(kFileLinkScheme) + encodedPath;
    const bool useLink = actions.linkMode == LinkMode::Always ||
                         (actions.linkMode == LinkMode::OnDemand && encodedPath != entry.path);

    const std::string metadata = spec.showMetadata ? formatMetadata(entry) : std::string();
    const std::string folderPrefix = longestFolderPrefix(entry.path, spec.folders);

    std::string line = metadata;
    std::size_t grayEnd = metadata.size();
    if (useLink)
    {
        line += rendered.linkEncodedPath;
        grayEnd += kFileLinkScheme.size() + percentEncodePath(folderPrefix).size();
    }
    else
    {
        line += entry.path;
        grayEnd += folderPrefix.size();
    }

    std::vector<StyleSpan> spans = findFragmentSpans(line, spec.includeFragments, spec.fragmentOrder, grayEnd);
    if (grayEnd > 0)
        spans.push_back({0, grayEnd, styles::kGray});
    rendered.displayText = applyStyleSpans(line, std::move(spans));

    const std::string quoted = actions.outputMode == OutputMode::QuotedFolder ? containingFolder(entry.path) : entry.path;
    rendered.quotedPath = "\"" + quoted + "\"";
    return rendered;
}

} // namespace ff::find
