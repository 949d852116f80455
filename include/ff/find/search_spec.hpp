#pragma once

#include "ff/find/query_tokens.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ff::find
{

enum class EntityKind : unsigned short
{
    File = 0,
    Directory
};

enum class SortKey : unsigned short
{
    Name = 0,
    Size,
    ModifiedTime
};

enum class FragmentOrder : unsigned short
{
    Sequential = 0,
    AnyOrder
};

enum class OutputMode : unsigned short
{
    Numbered = 0,
    QuotedPath,
    QuotedFolder
};

enum class LinkMode : unsigned short
{
    Never = 0,
    OnDemand,
    Always
};

struct SearchSpec
{
    std::vector<std::string> folders;
    std::vector<std::string> includeFragments;
    std::set<std::string> excludeFragments;
    // find(1) tests, one argument per element.
    std::vector<std::string> matchExpression;
    std::vector<std::string> exclusionExpression;
    EntityKind entityKind = EntityKind::File;
    // Newest entries are listed last, right above the prompt.
    SortKey sortKey = SortKey::ModifiedTime;
    bool sortAscending = true;
    bool showMetadata = false;
    FragmentOrder fragmentOrder = FragmentOrder::Sequential;
    bool includeAll = false;
};

struct ActionOptions
{
    OutputMode outputMode = OutputMode::Numbered;
    bool openResults = false;
    LinkMode linkMode = LinkMode::Never;
    bool printCommand = false;
};

struct Selection
{
    // 1-based result numbers. Empty selects every result.
    std::set<int> indices;

    bool includes(std::size_t index) const noexcept;
};

struct CompiledQuery
{
    SearchSpec search;
    ActionOptions actions;
    Selection selection;
};

std::vector<std::string> buildMatchExpression(const std::vector<std::string> &fragments, FragmentOrder order);
std::vector<std::string> buildExclusionExpression(const std::set<std::string> &fragments, bool includeAll);

// Applies the flags in command-line order on top of the given action
// defaults, then derives the find expressions.
CompiledQuery compileQuery(const Classification &classification, const ActionOptions &defaults = {});

LinkMode parseLinkMode(std::string_view value, LinkMode fallback = LinkMode::Never) noexcept;

} // namespace ff::find
