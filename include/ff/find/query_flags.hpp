#pragma once

#include <span>
#include <string_view>

namespace ff::find
{

struct CompiledQuery;

enum class FlagId : unsigned short
{
    SortByName = 0,
    SortByNameReversed,
    SortBySize,
    SortBySizeReversed,
    SortByModified,
    SortByModifiedReversed,
    IncludeAll,
    AnyOrder,
    Directories,
    SelectQuotedPath,
    SelectQuotedFolder,
    OpenPath,
    OpenFolder,
    ShowMetadata,
    LinksOnDemand,
    LinksAlways,
    PrintCommand,
    Help
};

enum class FlagGroup : unsigned short
{
    Sort = 0,
    Filter,
    Select,
    Info
};

struct FlagDefinition
{
    FlagId id;
    std::string_view literal;
    FlagGroup group;
    std::string_view summary;
    void (*apply)(CompiledQuery &query);
};

// Every reserved flag, in help-screen order. Flags are single tokens: "-pi"
// is never read as "-p -i".
std::span<const FlagDefinition> flagDefinitions() noexcept;

const FlagDefinition *findFlag(std::string_view literal) noexcept;
const FlagDefinition &requireFlag(FlagId id);

} // namespace ff::find
