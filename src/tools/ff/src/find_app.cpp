#include "ff/find/find_app.hpp"

#include "ff/find/find_options.hpp"
#include "ff/find/query_flags.hpp"
#include "ff/find/result_actions.hpp"
#include "ff/find/result_parser.hpp"
#include "ff/find/search_spec.hpp"
#include "ff/find/terminal_styles.hpp"
#include "ff/launcher.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <string_view>
#include <vector>

namespace ff::find
{
namespace
{

std::string_view groupTitle(FlagGroup group)
{
    switch (group)
    {
    case FlagGroup::Sort:
        return "Sort (one at a time, the last one wins):";
    case FlagGroup::Filter:
        return "Filter:";
    case FlagGroup::Select:
        return "Select (one at a time):";
    case FlagGroup::Info:
    default:
        return "Info:";
    }
}

std::string trimTrailing(std::string value)
{
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' '))
        value.pop_back();
    return value;
}

} // namespace

void printHelp(std::ostream &out, const std::string &defaultFolder)
{
    out << "ff, a file search utility used like an online search engine.\n"
        << "    " << styles::kGray << "A find command wrapper with highlights and formatting." << styles::kNone << '\n'
        << "    Searches files whose paths contain the given parts, in " << defaultFolder << " by default.\n"
        << "    Excludes results containing any path part given with a leading dash.\n"
        << "    Shows results as a numbered list of full paths; result numbers select from it.\n"
        << "    " << styles::kGray << "Results may change between runs. Asterisks around path parts are implied." << styles::kNone << '\n'
        << "    " << styles::kGray << "The default directory can be set in " << kDefaultDirEnvVar << '.' << styles::kNone << '\n'
        << "    " << styles::kGray << "Pass flags separately, like -p -i -n (-pin is an excluded path part)." << styles::kNone << '\n'
        << "Usage:\n"
        << "    ff <include>\n"
        << "    ff <dir> <dir> <include> <include> -<exclude> -<exclude> -<result_number>\n"
        << "    ff <dir> <include> " << kSelectorSeparator << " <result_number> <result_number>\n";

    bool first = true;
    FlagGroup current = FlagGroup::Sort;
    for (const auto &flag : flagDefinitions())
    {
        if (first || flag.group != current)
        {
            out << groupTitle(flag.group) << '\n';
            current = flag.group;
            first = false;
        }
        out << "    " << styles::kBold << flag.literal << styles::kNone << "  "
            << styles::kGray << flag.summary << styles::kNone << '\n';
    }
}

int runSearch(std::span<const std::string> args,
              const SearchEnvironment &environment,
              const config::OptionRegistry &options,
              std::ostream &out,
              std::ostream &err,
              SearchExecutor execute)
{
    if (isHelpRequest(args))
    {
        printHelp(out, environment.defaultFolder);
        return EXIT_SUCCESS;
    }

    const Classification classification = classifyTokens(args, environment);
    const CompiledQuery query = compileQuery(classification, actionDefaults(options));

    for (const auto &folder : missingFolders(query.search))
        spdlog::warn("Search folder {} does not exist", folder);

    const std::string command = buildSearchCommand(query.search);
    const SearchExecutionResult result = execute(command);
    if (result.exitCode != 0)
    {
        err << "ff: command `" << command << "` failed with status " << result.exitCode;
        const std::string diagnostics = trimTrailing(result.errorOutput);
        if (!diagnostics.empty())
            err << ": " << diagnostics;
        err << std::endl;
        return EXIT_FAILURE;
    }

    const std::vector<ResultEntry> entries = parseResults(result.output);

    std::unique_ptr<launcher::Launcher> opener;
    if (query.actions.openResults)
        opener = std::make_unique<launcher::ProcessLauncher>(launcher::splitCommand(options.getString(kOptionOpenCommand)));

    applyResultActions(entries, query, opener.get(), out);

    if (query.actions.printCommand)
        out << styles::kGray << "Used command: " << command << styles::kNone << std::endl;

    return EXIT_SUCCESS;
}

} // namespace ff::find
