#include "ff/find/query_flags.hpp"

#include "ff/find/search_spec.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>

namespace ff::find
{

namespace
{

void sortBy(CompiledQuery &query, SortKey key, bool ascending)
{
    query.search.sortKey = key;
    query.search.sortAscending = ascending;
}

void applySortByName(CompiledQuery &query)
{
    sortBy(query, SortKey::Name, true);
}

void applySortByNameReversed(CompiledQuery &query)
{
    sortBy(query, SortKey::Name, false);
}

void applySortBySize(CompiledQuery &query)
{
    sortBy(query, SortKey::Size, true);
}

void applySortBySizeReversed(CompiledQuery &query)
{
    sortBy(query, SortKey::Size, false);
}

void applySortByModified(CompiledQuery &query)
{
    sortBy(query, SortKey::ModifiedTime, false);
}

void applySortByModifiedReversed(CompiledQuery &query)
{
    sortBy(query, SortKey::ModifiedTime, true);
}

void applyIncludeAll(CompiledQuery &query)
{
    query.search.includeAll = true;
}

void applyAnyOrder(CompiledQuery &query)
{
    query.search.fragmentOrder = FragmentOrder::AnyOrder;
}

void applyDirectories(CompiledQuery &query)
{
    query.search.entityKind = EntityKind::Directory;
}

void applySelectQuotedPath(CompiledQuery &query)
{
    query.actions.outputMode = OutputMode::QuotedPath;
    query.actions.openResults = false;
}

void applySelectQuotedFolder(CompiledQuery &query)
{
    query.actions.outputMode = OutputMode::QuotedFolder;
    query.actions.openResults = false;
}

void applyOpenPath(CompiledQuery &query)
{
    query.actions.outputMode = OutputMode::QuotedPath;
    query.actions.openResults = true;
}

void applyOpenFolder(CompiledQuery &query)
{
    query.actions.outputMode = OutputMode::QuotedFolder;
    query.actions.openResults = true;
}

void applyShowMetadata(CompiledQuery &query)
{
    query.search.showMetadata = true;
}

void applyLinksOnDemand(CompiledQuery &query)
{
    if (query.actions.linkMode != LinkMode::Always)
        query.actions.linkMode = LinkMode::OnDemand;
}

void applyLinksAlways(CompiledQuery &query)
{
    query.actions.linkMode = LinkMode::Always;
}

void applyPrintCommand(CompiledQuery &query)
{
    query.actions.printCommand = true;
}

void applyHelp(CompiledQuery &)
{
}

constexpr std::array<FlagDefinition, 18> kFlags{{
    {FlagId::SortByName, "-n", FlagGroup::Sort, "sort by name, a to Z", applySortByName},
    {FlagId::SortByNameReversed, "-N", FlagGroup::Sort, "sort by name, Z to a", applySortByNameReversed},
    {FlagId::SortBySize, "-s", FlagGroup::Sort, "sort by size, small to big", applySortBySize},
    {FlagId::SortBySizeReversed, "-S", FlagGroup::Sort, "sort by size, big to small", applySortBySizeReversed},
    {FlagId::SortByModified, "-m", FlagGroup::Sort, "sort by modified time, new to old", applySortByModified},
    {FlagId::SortByModifiedReversed, "-M", FlagGroup::Sort, "sort by modified time, old to new (default)", applySortByModifiedReversed},
    {FlagId::IncludeAll, "-a", FlagGroup::Filter, "include hidden files, hidden and build directories", applyIncludeAll},
    {FlagId::AnyOrder, "-r", FlagGroup::Filter, "match path parts in any order, not only as given", applyAnyOrder},
    {FlagId::Directories, "-d", FlagGroup::Filter, "search directories instead of files, without entering found ones", applyDirectories},
    {FlagId::SelectQuotedPath, "-q", FlagGroup::Select, "print quoted unformatted file paths", applySelectQuotedPath},
    {FlagId::SelectQuotedFolder, "-Q", FlagGroup::Select, "print quoted containing directory paths", applySelectQuotedFolder},
    {FlagId::OpenPath, "-o", FlagGroup::Select, "print quoted and open each listed file", applyOpenPath},
    {FlagId::OpenFolder, "-O", FlagGroup::Select, "print quoted and open each containing directory", applyOpenFolder},
    {FlagId::ShowMetadata, "-i", FlagGroup::Info, "show modified times and sizes", applyShowMetadata},
    {FlagId::LinksOnDemand, "-f", FlagGroup::Info, "show file:// links for paths that need escaping", applyLinksOnDemand},
    {FlagId::LinksAlways, "-F", FlagGroup::Info, "show file:// links for all paths", applyLinksAlways},
    {FlagId::PrintCommand, "-p", FlagGroup::Info, "print the underlying find command", applyPrintCommand},
    {FlagId::Help, "-h", FlagGroup::Info, "show this help", applyHelp},
}};

} // namespace

std::span<const FlagDefinition> flagDefinitions() noexcept
{
    return std::span<const FlagDefinition>{kFlags};
}

const FlagDefinition *findFlag(std::string_view literal) noexcept
{
    auto it = std::find_if(kFlags.begin(), kFlags.end(), [&](const FlagDefinition &flag)
                           { return flag.literal == literal; });
    if (it == kFlags.end())
        return nullptr;
    return &*it;
}

const FlagDefinition &requireFlag(FlagId id)
{
    auto it = std::find_if(kFlags.begin(), kFlags.end(), [&](const FlagDefinition &flag)
                           { return flag.id == id; });
    if (it == kFlags.end())
        throw std::runtime_error("Unknown flag id: " + std::to_string(static_cast<unsigned>(id)));
    return *it;
}

} // namespace ff::find
