#include "ff/find/query_tokens.hpp"
#include "ff/find/result_actions.hpp"
#include "ff/find/result_parser.hpp"
#include "ff/find/search_spec.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace ff::find;

namespace
{

class RecordingLauncher : public ff::launcher::Launcher
{
public:
    ff::launcher::LaunchResult open(const std::string &path) override
    {
        openedPaths.push_back(path);
        ff::launcher::LaunchResult result;
        if (failingPaths.count(path) != 0)
        {
            result.error = ENOENT;
            result.message = "boom";
            return result;
        }
        result.launched = true;
        return result;
    }

    std::vector<std::string> openedPaths;
    std::set<std::string> failingPaths;
};

CompiledQuery compile(const std::vector<std::string> &args)
{
    SearchEnvironment environment;
    environment.homeFolder = "/home/tester";
    environment.currentFolder = "/work";
    environment.parentFolder = "/";
    return compileQuery(classifyTokens(args, environment));
}

// What the pipeline prints for `/a src -test` once find has dropped
// /a/src/test/bar.txt.
std::vector<ResultEntry> excludedFragmentResults()
{
    return parseResults("4\t2024-01-01 10:00:00\t/a/src/foo.txt\n"
                        "4\t2024-01-03 10:00:00\t/a/src/baz.txt\n");
}

} // namespace

TEST(ResultActions, PrintsEveryEntryWhenNothingIsSelected)
{
    auto entries = excludedFragmentResults();
    std::ostringstream out;
    auto summary = applyResultActions(entries, compile({"/a", "src", "-test"}), nullptr, out);

    EXPECT_EQ(summary.printed, 2u);
    EXPECT_TRUE(summary.missingIndices.empty());
    const std::string text = out.str();
    EXPECT_NE(text.find("foo.txt"), std::string::npos);
    EXPECT_NE(text.find("baz.txt"), std::string::npos);
    EXPECT_LT(text.find("foo.txt"), text.find("baz.txt"));
}

TEST(ResultActions, SelectorRefersToNumberAfterExclusion)
{
    auto entries = excludedFragmentResults();
    std::ostringstream out;
    auto summary = applyResultActions(entries, compile({"/a", "src", "-test", "-2", "-q"}), nullptr, out);

    EXPECT_EQ(summary.printed, 1u);
    EXPECT_EQ(out.str(), "\"/a/src/baz.txt\"\n");
}

TEST(ResultActions, ReportsMissingSelectionsAfterValidOnes)
{
    auto entries = excludedFragmentResults();
    RecordingLauncher launcher;
    std::ostringstream out;
    auto summary = applyResultActions(entries, compile({"/a", "src", "-o", "-2", "-5"}), &launcher, out);

    EXPECT_EQ(out.str(), "\"/a/src/baz.txt\"\nNo result 5 to open\n");
    EXPECT_EQ(launcher.openedPaths, std::vector<std::string>{"/a/src/baz.txt"});
    EXPECT_EQ(summary.opened, 1u);
    EXPECT_EQ(summary.missingIndices, std::vector<int>{5});
}

TEST(ResultActions, ReportsMissingSelectionsWhenShowing)
{
    auto entries = excludedFragmentResults();
    std::ostringstream out;
    auto summary = applyResultActions(entries, compile({"/a", "--", "3"}), nullptr, out);

    EXPECT_EQ(summary.printed, 0u);
    EXPECT_EQ(out.str(), "No result 3 to show\n");
}

TEST(ResultActions, LaunchFailureDoesNotStopRemainingEntries)
{
    auto entries = excludedFragmentResults();
    RecordingLauncher launcher;
    launcher.failingPaths.insert("/a/src/foo.txt");
    std::ostringstream out;
    auto summary = applyResultActions(entries, compile({"/a", "-o"}), &launcher, out);

    EXPECT_EQ(launcher.openedPaths, (std::vector<std::string>{"/a/src/foo.txt", "/a/src/baz.txt"}));
    EXPECT_EQ(summary.opened, 1u);
    EXPECT_EQ(summary.launchFailures, 1u);
    EXPECT_EQ(out.str(), "\"/a/src/foo.txt\"\nCannot open result 1: boom\n\"/a/src/baz.txt\"\n");
}

TEST(ResultActions, OpensContainingFolder)
{
    auto entries = excludedFragmentResults();
    RecordingLauncher launcher;
    std::ostringstream out;
    applyResultActions(entries, compile({"/a", "-O", "-1"}), &launcher, out);

    EXPECT_EQ(launcher.openedPaths, std::vector<std::string>{"/a/src/"});
    EXPECT_EQ(out.str(), "\"/a/src/\"\n");
}

TEST(ResultActions, MissingLauncherIsReportedPerEntry)
{
    auto entries = excludedFragmentResults();
    std::ostringstream out;
    auto summary = applyResultActions(entries, compile({"/a", "-o", "-1"}), nullptr, out);

    EXPECT_EQ(summary.launchFailures, 1u);
    EXPECT_NE(out.str().find("Cannot open result 1"), std::string::npos);
}
