#ifndef ARGBIND_PARSER_HPP
#define ARGBIND_PARSER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "binder.hpp"
#include "contract.hpp"
#include "env.hpp"
#include "error.hpp"
#include "scanner.hpp"
#include "schema.hpp"

namespace argbind {

// Binds command-line flags (and optionally environment variables) onto the fields a target type declares
// in its Schema. Nothing is printed: every failure is returned, and -h/-help are ordinary flags.
//
// Order of operations for one call:
//   1. environment variables, when enabled (flags parsed later override them);
//   2. flag bindings are built from the schema (duplicate aliases throw ConfigError);
//   3. args[1:] is scanned, flags and positionals may interleave, "--" ends flag parsing;
//   4. setArgs / setFlags / setFlagsCount on the target, when it has them;
//   5. validate() on the target, when it has it.
// An empty `args` skips steps 2 to 4.
class Parser {
public:
    struct Options {
        // Read field values from environment variables before parsing flags.
        bool envVars{false};
        // Prepended to each variable name. Empty: derived from args[0] ("my-tool" -> "MY_TOOL_"). "-": none.
        std::string envPrefix;
    };

    Parser() = default;
    explicit Parser(Options options) : options_(std::move(options)) {}

    [[nodiscard]] const Options& options() const { return options_; }

    template <typename T>
    [[nodiscard]] std::optional<Error> parse(const std::vector<std::string>& args, T* target) const {
        checkTarget(target);
        return parse(args, target, schemaOf<T>());
    }

    template <typename T>
    [[nodiscard]] std::optional<Error> parse(int argc, char** argv, T* target) const {
        std::vector<std::string> args;
        args.reserve(argc > 0 ? static_cast<std::size_t>(argc) : 0);
        for (int i = 0; i < argc; ++i) args.emplace_back(argv[i]);
        return parse(args, target);
    }

    template <typename T>
    [[nodiscard]] std::optional<Error> parse(const std::vector<std::string>& args, T* target, const Schema<T>& schema) const {
        checkTarget(target);

        if (options_.envVars) {
            if (auto err = resolveEnv(schema, *target, env::effectivePrefix(options_.envPrefix, args))) return err;
        }

        if (!args.empty()) {
            if (auto err = parseFlags(args, *target, schema)) return err;
        }

        if constexpr (hasValidate<T>::value) {
            if (std::optional<std::string> msg = target->validate()) return Error(ErrorKind::Validation, std::move(*msg));
        }
        return std::nullopt;
    }

private:
    template <typename T>
    static void checkTarget(const T* target) {
        static_assert(std::is_class_v<T>, "parse target must be a pointer to a struct or class");
        if (!target) throw ConfigError("parse target must be a non-null pointer to " + typeName<T>());
    }

    template <typename T>
    static std::optional<Error> parseFlags(const std::vector<std::string>& args, T& target, const Schema<T>& schema) {
        Bindings bindings(schema, target, hasSetFlagsCount<T>::value);

        const std::vector<std::string> rest(args.begin() + 1, args.end());
        std::vector<std::string> positionals;
        if (auto err = scanArguments(bindings.flags(), rest, positionals)) return err;

        if constexpr (hasSetArgs<T>::value) {
            target.setArgs(std::move(positionals));
        }
        if constexpr (hasSetFlags<T>::value) {
            target.setFlags(bindings.setFlags());
        }
        if constexpr (hasSetFlagsCount<T>::value) {
            target.setFlagsCount(bindings.counts());
        }
        return std::nullopt;
    }

    Options options_;
};

} // namespace argbind

#endif // ARGBIND_PARSER_HPP
