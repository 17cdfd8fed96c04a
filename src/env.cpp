#include "argbind/env.hpp"

#include <cctype>
#include <cstdlib>

namespace argbind::env {

std::string prefixFromProgramName(std::string_view path) {
    while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
    const auto slash = path.find_last_of('/');
    std::string_view base = (slash == std::string_view::npos || path.size() == 1) ? path : path.substr(slash + 1);
    const auto dot = base.find_last_of('.');
    if (dot != std::string_view::npos) base = base.substr(0, dot);

    std::string out;
    out.reserve(base.size() + 1);
    for (const char ch : base) {
        if (ch == '-') {
            out.push_back('_');
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    out.push_back('_');
    return out;
}

std::string effectivePrefix(const std::string& override, const std::vector<std::string>& args) {
    std::string prefix = override;
    if (prefix.empty() && !args.empty()) prefix = prefixFromProgramName(args.front());
    if (prefix == kNoPrefix) prefix.clear();
    return prefix;
}

std::optional<std::string> lookup(const std::string& name) {
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    return std::string(v);
}

} // namespace argbind::env
