#pragma once

#include "ff/find/query_tokens.hpp"
#include "ff/find/search_spec.hpp"
#include "ff/options.hpp"

#include <string>

namespace ff::find
{

inline constexpr const char kAppId[] = "find";
inline constexpr const char kDefaultDirEnvVar[] = "FF_DEFAULT_DIR";

inline constexpr const char kOptionDefaultFolder[] = "defaultFolder";
inline constexpr const char kOptionOpenCommand[] = "openCommand";
inline constexpr const char kOptionLinkMode[] = "linkMode";

void registerFindOptions(config::OptionRegistry &registry);

// First non-blank of the environment value and the configured folder, "~"
// otherwise. environmentValue may be null.
std::string resolveDefaultFolder(const char *environmentValue, const std::string &configured);

SearchEnvironment detectSearchEnvironment(const config::OptionRegistry &options);
ActionOptions actionDefaults(const config::OptionRegistry &options);

} // namespace ff::find
