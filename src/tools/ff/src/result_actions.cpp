#include "ff/find/result_actions.hpp"

#include "ff/find/result_renderer.hpp"

#include <spdlog/spdlog.h>

namespace ff::find
{
namespace
{

void openEntry(const ResultEntry &entry,
               const CompiledQuery &query,
               launcher::Launcher *launcher,
               std::ostream &out,
               ActionSummary &summary)
{
    const std::string target = query.actions.outputMode == OutputMode::QuotedFolder
                                   ? containingFolder(entry.path)
                                   : entry.path;
    if (!launcher)
    {
        out << "Cannot open result " << entry.index << ": no launcher available" << '\n';
        ++summary.launchFailures;
        return;
    }

    launcher::LaunchResult launched = launcher->open(target);
    if (launched.launched)
    {
        ++summary.opened;
        return;
    }
    spdlog::debug("Opening {} failed with error {}", target, launched.error);
    out << "Cannot open result " << entry.index << ": " << launched.message << '\n';
    ++summary.launchFailures;
}

} // namespace

ActionSummary applyResultActions(const std::vector<ResultEntry> &entries,
                                 const CompiledQuery &query,
                                 launcher::Launcher *launcher,
                                 std::ostream &out)
{
    ActionSummary summary;
    const ActionOptions &actions = query.actions;
    const std::size_t total = entries.size();

    for (const auto &entry : entries)
    {
        if (!query.selection.includes(entry.index))
            continue;

        RenderedLine rendered = renderResult(entry, query.search, actions, total);
        if (actions.outputMode == OutputMode::Numbered)
            out << rendered.numberLabel << ' ' << rendered.displayText << '\n';
        else
            out << rendered.quotedPath << '\n';
        ++summary.printed;

        if (actions.openResults)
            openEntry(entry, query, launcher, out, summary);
    }

    for (int index : query.selection.indices)
    {
        if (index >= 1 && static_cast<std::size_t>(index) <= total)
            continue;
        out << "No result " << index << (actions.openResults ? " to open" : " to show") << '\n';
        summary.missingIndices.push_back(index);
    }

    out.flush();
    return summary;
}

} // namespace ff::find
