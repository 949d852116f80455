#include "ff/find/search_backend.hpp"

#include "ff/launcher.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <string_view>

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace ff::find
{
namespace
{

constexpr std::string_view kMetadataCommand =
    "-exec du -b -s --time '--time-style=+%Y-%m-%d %H:%M:%S' {} + 2>/dev/null";

std::string joinQuoted(const std::vector<std::string> &arguments)
{
    std::string joined;
    for (const auto &argument : arguments)
    {
        if (!joined.empty())
            joined.push_back(' ');
        joined += launcher::quoteArgumentIfNeeded(argument);
    }
    return joined;
}

int waitForChild(pid_t pid)
{
    int status = 0;
    while (waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            return -1;
        }
    }
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    return status;
}

void drainInto(int fd, std::string &target)
{
    constexpr std::size_t kBufferSize = 8192;
    std::array<char, kBufferSize> buffer{};
    while (true)
    {
        ssize_t bytesRead = read(fd, buffer.data(), buffer.size());
        if (bytesRead > 0)
        {
            target.append(buffer.data(), static_cast<std::size_t>(bytesRead));
            continue;
        }
        if (bytesRead < 0 && errno == EINTR)
            continue;
        break;
    }
    close(fd);
}

} // namespace

std::vector<std::string> buildFindArguments(const SearchSpec &spec)
{
    std::vector<std::string> args;
    args.emplace_back("find");
    args.insert(args.end(), spec.folders.begin(), spec.folders.end());

    args.emplace_back("-type");
    args.emplace_back(spec.entityKind == EntityKind::Directory ? "d" : "f");

    args.insert(args.end(), spec.matchExpression.begin(), spec.matchExpression.end());
    args.insert(args.end(), spec.exclusionExpression.begin(), spec.exclusionExpression.end());

    if (spec.entityKind == EntityKind::Directory)
        args.emplace_back("-prune");
    return args;
}

std::vector<std::string> buildSortArguments(const SearchSpec &spec)
{
    std::vector<std::string> args;
    args.emplace_back("sort");
    if (!spec.sortAscending)
        args.emplace_back("-r");

    // du prints "<size>\t<date> <time>\t<path>", so the path starts at field 4.
    switch (spec.sortKey)
    {
    case SortKey::Name:
        args.emplace_back("-k");
        args.emplace_back("4");
        break;
    case SortKey::Size:
        args.emplace_back("-k");
        args.emplace_back("1,1");
        args.emplace_back("-n");
        break;
    case SortKey::ModifiedTime:
    default:
        args.emplace_back("-k");
        args.emplace_back("2,3");
        break;
    }
    return args;
}

std::vector<std::string> missingFolders(const SearchSpec &spec)
{
    std::vector<std::string> missing;
    for (const auto &folder : spec.folders)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(folder, ec))
            missing.push_back(folder);
    }
    return missing;
}

std::string buildSearchCommand(const SearchSpec &spec)
{
    std::string command = joinQuoted(buildFindArguments(spec));
    command.push_back(' ');
    command += kMetadataCommand;
    command += " | ";
    command += joinQuoted(buildSortArguments(spec));
    return command;
}

SearchExecutionResult executeSearch(const std::string &command)
{
    SearchExecutionResult result;
    result.command = command;
    spdlog::debug("Running: {}", command);

    int stdoutPipe[2]{-1, -1};
    int stderrPipe[2]{-1, -1};
    if (pipe(stdoutPipe) == -1)
    {
        result.exitCode = errno;
        result.errorOutput = "cannot create output pipe";
        return result;
    }
    if (pipe(stderrPipe) == -1)
    {
        close(stdoutPipe[0]);
        close(stdoutPipe[1]);
        result.exitCode = errno;
        result.errorOutput = "cannot create error pipe";
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[0]);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[1]);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, stderrPipe[0]);
    posix_spawn_file_actions_addclose(&actions, stderrPipe[1]);

    std::string shell = "/bin/sh";
    std::string flag = "-c";
    std::string script = command;
    std::array<char *, 4> argv{shell.data(), flag.data(), script.data(), nullptr};

    pid_t childPid = -1;
    int spawnStatus = posix_spawn(&childPid, shell.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(stdoutPipe[1]);
    close(stderrPipe[1]);

    if (spawnStatus != 0)
    {
        close(stdoutPipe[0]);
        close(stderrPipe[0]);
        result.exitCode = spawnStatus;
        result.errorOutput = "cannot start /bin/sh";
        return result;
    }

    drainInto(stdoutPipe[0], result.output);
    drainInto(stderrPipe[0], result.errorOutput);

    result.exitCode = waitForChild(childPid);
    spdlog::debug("Search finished with status {} and {} bytes of output", result.exitCode, result.output.size());
    return result;
}

} // namespace ff::find
