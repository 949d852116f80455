#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ff::launcher
{

std::string quoteArgument(std::string_view value);

// Quotes only when the shell would otherwise split or expand the value.
std::string quoteArgumentIfNeeded(std::string_view value);

// Splits a configured command line on whitespace, honouring single quotes,
// double quotes and backslash escapes.
std::vector<std::string> splitCommand(const std::string &command);

struct LaunchResult
{
    bool launched = false;
    int error = 0;
    std::string message;
};

// Opens a path in whatever viewer the platform associates with it.
class Launcher
{
public:
    virtual ~Launcher() = default;
    virtual LaunchResult open(const std::string &path) = 0;
};

// Spawns `command... path` in its own process group with stdio redirected to
// /dev/null and does not wait for it.
class ProcessLauncher : public Launcher
{
public:
    explicit ProcessLauncher(std::vector<std::string> command);

    LaunchResult open(const std::string &path) override;

    const std::vector<std::string> &command() const noexcept { return m_command; }

private:
    std::vector<std::string> m_command;
};

} // namespace ff::launcher
