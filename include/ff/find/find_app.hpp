#pragma once

#include "ff/find/query_tokens.hpp"
#include "ff/find/search_backend.hpp"
#include "ff/options.hpp"

#include <ostream>
#include <span>
#include <string>

namespace ff::find
{

using SearchExecutor = SearchExecutionResult (*)(const std::string &command);

void printHelp(std::ostream &out, const std::string &defaultFolder);

// One ff invocation after logging and options are set up: help, or search,
// list and act on the results. Listings go to out, fatal errors to err.
// Returns the process exit status.
int runSearch(std::span<const std::string> args,
              const SearchEnvironment &environment,
              const config::OptionRegistry &options,
              std::ostream &out,
              std::ostream &err,
              SearchExecutor execute = executeSearch);

} // namespace ff::find
