#include "argbind/scanner.hpp"

#include <cstddef>

namespace argbind {

std::optional<Error> scanArguments(FlagSet& flags,
                                   const std::vector<std::string>& args,
                                   std::vector<std::string>& positionals) {
    std::size_t pos = 0;
    while (pos < args.size()) {
        if (auto err = flags.parseRun(args, pos)) return err;

        while (pos < args.size()) {
            const std::string& arg = args[pos];
            if (arg == "--") {
                positionals.insert(positionals.end(), args.begin() + static_cast<std::ptrdiff_t>(pos) + 1, args.end());
                return std::nullopt;
            }
            if (FlagSet::isFlagToken(arg)) break;
            positionals.push_back(arg);
            ++pos;
        }
    }
    return std::nullopt;
}

} // namespace argbind
