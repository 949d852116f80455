#pragma once

#include "ff/find/search_spec.hpp"

#include <string>
#include <vector>

namespace ff::find
{

struct SearchExecutionResult
{
    int exitCode = 0;
    std::string output;
    std::string errorOutput;
    std::string command;
};

// `find <folders> -type f|d <tests> [-prune]`, one argument per element.
std::vector<std::string> buildFindArguments(const SearchSpec &spec);
std::vector<std::string> buildSortArguments(const SearchSpec &spec);

// Search folders that do not exist. find's diagnostics are discarded, so
// these would otherwise just produce an empty listing.
std::vector<std::string> missingFolders(const SearchSpec &spec);

// The full shell pipeline: find, du for sizes and times, then sort. This is
// the exact string -p prints.
std::string buildSearchCommand(const SearchSpec &spec);

// Runs the command through /bin/sh and drains both output streams before
// returning. exitCode is the shell status, or the posix_spawn error when the
// shell could not be started.
SearchExecutionResult executeSearch(const std::string &command);

} // namespace ff::find
