#include "ff/find/find_options.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

namespace ff::find
{
namespace
{

bool isBlank(std::string_view value)
{
    return std::all_of(value.begin(), value.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
}

const char *defaultOpenCommand()
{
#ifdef __APPLE__
    return "open";
#else
    return "xdg-open";
#endif
}

std::string detectHomeFolder()
{
    if (const char *home = std::getenv("HOME"); home && *home)
        return home;
    if (const passwd *pw = getpwuid(getuid()); pw && pw->pw_dir)
        return pw->pw_dir;
    return "/";
}

std::string detectCurrentFolder()
{
    // PWD keeps the symlinked path the user sees in the shell.
    if (const char *pwd = std::getenv("PWD"); pwd && *pwd == '/')
    {
        std::error_code ec;
        if (std::filesystem::equivalent(pwd, std::filesystem::current_path(ec), ec))
            return pwd;
    }
    std::error_code ec;
    std::filesystem::path current = std::filesystem::current_path(ec);
    if (ec)
    {
        spdlog::warn("Cannot determine the current directory: {}", ec.message());
        return "/";
    }
    return current.string();
}

std::string parentOf(const std::string &folder)
{
    std::filesystem::path path(folder);
    if (path.has_relative_path() && !path.has_filename())
        path = path.parent_path();
    std::filesystem::path parent = path.parent_path();
    if (parent.empty())
        return "/";
    return parent.string();
}

} // namespace

void registerFindOptions(config::OptionRegistry &registry)
{
    registry.registerOption({kOptionDefaultFolder, std::string(), "Default Folder",
                             "Folder searched when no folder is given and FF_DEFAULT_DIR is not set."});
    registry.registerOption({kOptionOpenCommand, defaultOpenCommand(), "Open Command",
                             "Command used by -o and -O to open results."});
    registry.registerOption({kOptionLinkMode, "never", "File Links",
                             "Default file:// link mode: never, on-demand or always."});
}

std::string resolveDefaultFolder(const char *environmentValue, const std::string &configured)
{
    if (environmentValue && !isBlank(environmentValue))
        return environmentValue;
    if (!isBlank(configured))
        return configured;
    return "~";
}

SearchEnvironment detectSearchEnvironment(const config::OptionRegistry &options)
{
    SearchEnvironment environment;
    environment.homeFolder = detectHomeFolder();
    environment.currentFolder = detectCurrentFolder();
    environment.parentFolder = parentOf(environment.currentFolder);
    environment.defaultFolder = resolveDefaultFolder(std::getenv(kDefaultDirEnvVar),
                                                     options.getString(kOptionDefaultFolder));
    spdlog::debug("Default folder: {}", environment.defaultFolder);
    return environment;
}

ActionOptions actionDefaults(const config::OptionRegistry &options)
{
    ActionOptions defaults;
    const std::string linkMode = options.getString(kOptionLinkMode);
    defaults.linkMode = parseLinkMode(linkMode, LinkMode::Never);
    if (parseLinkMode(linkMode, LinkMode::Always) != defaults.linkMode)
        spdlog::warn("Unknown {} value '{}', using 'never'", kOptionLinkMode, linkMode);
    return defaults;
}

} // namespace ff::find
