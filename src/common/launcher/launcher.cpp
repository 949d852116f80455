#include "ff/launcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/types.h>
#include <unistd.h>

extern char **environ;

namespace ff::launcher
{
namespace
{

bool isShellSafe(unsigned char ch)
{
    return std::isalnum(ch) || std::strchr("_-./=+,:@%!", ch) != nullptr;
}

} // namespace

std::string quoteArgument(std::string_view value)
{
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (char ch : value)
    {
        if (ch == '\'')
            quoted.append("'\\''");
        else
            quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

std::string quoteArgumentIfNeeded(std::string_view value)
{
    if (!value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char ch) { return isShellSafe(ch); }))
        return std::string(value);
    return quoteArgument(value);
}

std::vector<std::string> splitCommand(const std::string &command)
{
    std::vector<std::string> tokens;
    std::string current;
    bool inSingle = false;
    bool inDouble = false;
    bool quoted = false;
    for (std::size_t i = 0; i < command.size(); ++i)
    {
        char ch = command[i];
        if (ch == '\'' && !inDouble)
        {
            inSingle = !inSingle;
            quoted = true;
            continue;
        }
        if (ch == '"' && !inSingle)
        {
            inDouble = !inDouble;
            quoted = true;
            continue;
        }
        if (!inSingle && !inDouble && std::isspace(static_cast<unsigned char>(ch)))
        {
            if (!current.empty() || quoted)
            {
                tokens.push_back(current);
                current.clear();
                quoted = false;
            }
            continue;
        }
        if (ch == '\\' && !inSingle && i + 1 < command.size())
        {
            current.push_back(command[++i]);
            continue;
        }
        current.push_back(ch);
    }
    if (!current.empty() || quoted)
        tokens.push_back(current);
    return tokens;
}

ProcessLauncher::ProcessLauncher(std::vector<std::string> command)
    : m_command(std::move(command))
{
}

LaunchResult ProcessLauncher::open(const std::string &path)
{
    LaunchResult result;
    if (m_command.empty())
    {
        result.error = EINVAL;
        result.message = "no open command configured";
        return result;
    }

    std::vector<std::string> command = m_command;
    command.push_back(path);

    std::vector<char *> argv;
    argv.reserve(command.size() + 1);
    for (const auto &token : command)
        argv.push_back(const_cast<char *>(token.c_str()));
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    pid_t childPid = -1;
    int spawnStatus = posix_spawnp(&childPid, command.front().c_str(), &actions, &attributes, argv.data(), environ);
    posix_spawnattr_destroy(&attributes);
    posix_spawn_file_actions_destroy(&actions);

    if (spawnStatus != 0)
    {
        result.error = spawnStatus;
        result.message = std::strerror(spawnStatus);
        spdlog::debug("Cannot start '{}': {}", command.front(), result.message);
        return result;
    }

    spdlog::debug("Started '{}' for {} as pid {}", command.front(), path, static_cast<long>(childPid));
    result.launched = true;
    return result;
}

} // namespace ff::launcher
