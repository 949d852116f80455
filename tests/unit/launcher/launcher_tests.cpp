#include <gtest/gtest.h>

#include "ff/launcher.hpp"

#include <cerrno>
#include <string>
#include <vector>

TEST(Launcher, QuotesArguments)
{
    EXPECT_EQ(ff::launcher::quoteArgument("plain"), "'plain'");
    EXPECT_EQ(ff::launcher::quoteArgument("it's"), "'it'\\''s'");
    EXPECT_EQ(ff::launcher::quoteArgument(""), "''");
}

TEST(Launcher, QuotesOnlyWhenNeeded)
{
    EXPECT_EQ(ff::launcher::quoteArgumentIfNeeded("/home/u/src/"), "/home/u/src/");
    EXPECT_EQ(ff::launcher::quoteArgumentIfNeeded("!"), "!");
    EXPECT_EQ(ff::launcher::quoteArgumentIfNeeded("1,1"), "1,1");
    EXPECT_EQ(ff::launcher::quoteArgumentIfNeeded("*src*"), "'*src*'");
    EXPECT_EQ(ff::launcher::quoteArgumentIfNeeded("my dir"), "'my dir'");
    EXPECT_EQ(ff::launcher::quoteArgumentIfNeeded(""), "''");
}

TEST(Launcher, SplitsConfiguredCommands)
{
    EXPECT_EQ(ff::launcher::splitCommand("xdg-open"), std::vector<std::string>{"xdg-open"});
    EXPECT_EQ(ff::launcher::splitCommand("  open -a 'Preview App' "),
              (std::vector<std::string>{"open", "-a", "Preview App"}));
    EXPECT_EQ(ff::launcher::splitCommand(R"(code "--new window" a\ b)"),
              (std::vector<std::string>{"code", "--new window", "a b"}));
    EXPECT_EQ(ff::launcher::splitCommand("tool ''"), (std::vector<std::string>{"tool", ""}));
    EXPECT_TRUE(ff::launcher::splitCommand("   ").empty());
}

TEST(Launcher, StartsCommandWithoutWaiting)
{
    ff::launcher::ProcessLauncher launcher(std::vector<std::string>{"true"});
    auto result = launcher.open("/tmp");
    EXPECT_TRUE(result.launched) << result.message;
    EXPECT_EQ(result.error, 0);
}

TEST(Launcher, ReportsMissingCommand)
{
    ff::launcher::ProcessLauncher launcher(std::vector<std::string>{"ff-no-such-viewer-command"});
    auto result = launcher.open("/tmp");
    EXPECT_FALSE(result.launched);
    EXPECT_NE(result.error, 0);
    EXPECT_FALSE(result.message.empty());
}

TEST(Launcher, RejectsEmptyCommand)
{
    ff::launcher::ProcessLauncher launcher(std::vector<std::string>{});
    auto result = launcher.open("/tmp");
    EXPECT_FALSE(result.launched);
    EXPECT_EQ(result.error, EINVAL);
    EXPECT_TRUE(launcher.command().empty());
}
