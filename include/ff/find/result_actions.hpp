#pragma once

#include "ff/find/result_parser.hpp"
#include "ff/find/search_spec.hpp"
#include "ff/launcher.hpp"

#include <cstddef>
#include <ostream>
#include <vector>

namespace ff::find
{

struct ActionSummary
{
    std::size_t printed = 0;
    std::size_t opened = 0;
    std::size_t launchFailures = 0;
    std::vector<int> missingIndices;
};

// Prints the selected entries in the requested output mode and opens them when
// asked. Problems with single entries are reported inline on `out` and do not
// stop the remaining entries. launcher may be null when nothing is opened.
ActionSummary applyResultActions(const std::vector<ResultEntry> &entries,
                                 const CompiledQuery &query,
                                 launcher::Launcher *launcher,
                                 std::ostream &out);

} // namespace ff::find
