#include "argbind/schema.hpp"

namespace argbind::detail {

std::vector<std::string_view> splitList(std::string_view s, char sep) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

std::vector<std::string> splitAliases(std::string_view list) {
    std::vector<std::string> out;
    for (const auto part : splitList(list, ',')) {
        const auto name = trimWs(part);
        if (name.empty()) continue;
        out.emplace_back(name);
    }
    return out;
}

} // namespace argbind::detail
