#ifndef ARGBIND_ENV_HPP
#define ARGBIND_ENV_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace argbind::env {

// Prefix override that disables prefixing.
inline constexpr std::string_view kNoPrefix = "-";

// "/usr/local/bin/my-tool.sh" -> "MY_TOOL_"
std::string prefixFromProgramName(std::string_view path);

// `override` wins when set ("-" meaning no prefix); otherwise the prefix comes from args[0].
std::string effectivePrefix(const std::string& override, const std::vector<std::string>& args);

// Value of `name`, or nullopt when it is unset. A variable set to "" yields an empty string.
std::optional<std::string> lookup(const std::string& name);

} // namespace argbind::env

#endif // ARGBIND_ENV_HPP
