#ifndef ARGBIND_SCANNER_HPP
#define ARGBIND_SCANNER_HPP

#include <optional>
#include <string>
#include <vector>

#include "error.hpp"
#include "flagset.hpp"

namespace argbind {

// Splits `args` (program name already removed) into flag assignments, applied through `flags`, and
// positional arguments appended to `positionals` in the order they appear. Flags and positionals may
// interleave freely; everything after a "--" token is positional and the "--" itself is dropped.
// Stops at the first error.
[[nodiscard]] std::optional<Error> scanArguments(FlagSet& flags,
                                                 const std::vector<std::string>& args,
                                                 std::vector<std::string>& positionals);

} // namespace argbind

#endif // ARGBIND_SCANNER_HPP
