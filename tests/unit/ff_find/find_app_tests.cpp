#include "ff/find/find_app.hpp"
#include "ff/find/find_options.hpp"
#include "ff/find/search_spec.hpp"
#include "ff/find/terminal_styles.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace ff::find;

namespace
{

std::string lastCommand;
int executions = 0;

const char kListing[] = "4\t2024-01-01 10:00:00\t/a/src/foo.txt\n"
                        "4\t2024-01-03 10:00:00\t/a/src/baz.txt\n";

SearchExecutionResult failingSearch(const std::string &command)
{
    lastCommand = command;
    ++executions;
    SearchExecutionResult result;
    result.command = command;
    result.exitCode = 2;
    result.output = kListing;
    result.errorOutput = "sort: read failed\n";
    return result;
}

SearchExecutionResult cannedSearch(const std::string &command)
{
    lastCommand = command;
    ++executions;
    SearchExecutionResult result;
    result.command = command;
    result.output = kListing;
    return result;
}

SearchEnvironment testEnvironment()
{
    SearchEnvironment environment;
    environment.homeFolder = "/home/tester";
    environment.currentFolder = "/work";
    environment.parentFolder = "/";
    return environment;
}

std::string expectedCommand(const std::vector<std::string> &args)
{
    return buildSearchCommand(compileQuery(classifyTokens(args, testEnvironment())).search);
}

class FindAppTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        lastCommand.clear();
        executions = 0;
        registerFindOptions(options);
    }

    int run(const std::vector<std::string> &args, SearchExecutor execute)
    {
        return runSearch(args, testEnvironment(), options, out, err, execute);
    }

    ff::config::OptionRegistry options{kAppId};
    std::ostringstream out;
    std::ostringstream err;
};

} // namespace

TEST_F(FindAppTest, FailedSearchIsFatalAndPrintsNoResults)
{
    const std::vector<std::string> args = {"/a", "src", "-p"};
    EXPECT_EQ(run(args, failingSearch), 1);

    EXPECT_EQ(lastCommand, expectedCommand(args));
    EXPECT_TRUE(out.str().empty()) << out.str();
    EXPECT_EQ(err.str(), "ff: command `" + expectedCommand(args) + "` failed with status 2: sort: read failed\n");
}

TEST_F(FindAppTest, PrintsUsedCommandAfterResults)
{
    const std::vector<std::string> args = {"/a", "src", "-p"};
    EXPECT_EQ(run(args, cannedSearch), 0);
    EXPECT_TRUE(err.str().empty());

    const std::string text = out.str();
    const std::string trailer = std::string(styles::kGray) + "Used command: " + expectedCommand(args) +
                                std::string(styles::kNone) + "\n";
    ASSERT_GE(text.size(), trailer.size());
    EXPECT_EQ(text.substr(text.size() - trailer.size()), trailer);
    EXPECT_LT(text.find("baz.txt"), text.size() - trailer.size());
}

TEST_F(FindAppTest, OmitsUsedCommandWithoutFlag)
{
    EXPECT_EQ(run({"/a", "src", "-q"}, cannedSearch), 0);
    EXPECT_EQ(out.str(), "\"/a/src/foo.txt\"\n\"/a/src/baz.txt\"\n");
}

TEST_F(FindAppTest, HelpDoesNotSearch)
{
    EXPECT_EQ(run({}, cannedSearch), 0);
    EXPECT_EQ(run({"-h"}, cannedSearch), 0);
    EXPECT_EQ(executions, 0);

    const std::string text = out.str();
    EXPECT_NE(text.find("Usage:"), std::string::npos);
    for (const auto &flag : flagDefinitions())
        EXPECT_NE(text.find(std::string(flag.literal)), std::string::npos) << flag.literal;
}

TEST_F(FindAppTest, LinkModeOptionAppliesToListing)
{
    options.set(kOptionLinkMode, "always");
    EXPECT_EQ(run({"/a", "baz"}, cannedSearch), 0);
    EXPECT_NE(out.str().find("file:///a/"), std::string::npos);
}
