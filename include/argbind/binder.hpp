#ifndef ARGBIND_BINDER_HPP
#define ARGBIND_BINDER_HPP

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "env.hpp"
#include "error.hpp"
#include "flagset.hpp"
#include "schema.hpp"

namespace argbind {

// Per-call flag bindings of one target: the flag table, alias -> canonical name, and occurrence counts.
// Setters point into the target and into `counts_`, so instances are neither copied nor moved.
class Bindings {
public:
    // Registers every alias of every flag field. Throws ConfigError on a repeated alias.
    template <typename T>
    Bindings(const Schema<T>& schema, T& target, bool countOccurrences) {
        for (const auto& field : schema.fields()) {
            if (field->aliases().empty()) continue;
            const auto setter = field->makeSetter(target);
            for (const auto& alias : field->aliases()) {
                flags_.define(alias, setter);
                canonical_[alias] = field->canonicalName();
            }
        }
        if (countOccurrences) {
            flags_.decorate([this](const std::string& name, std::shared_ptr<Setter> inner) -> std::shared_ptr<Setter> {
                return std::make_shared<CountingSetter>(std::move(inner), canonical_.at(name), counts_);
            });
        }
    }

    Bindings(const Bindings&) = delete;
    Bindings& operator=(const Bindings&) = delete;

    [[nodiscard]] FlagSet& flags() { return flags_; }
    [[nodiscard]] const std::unordered_map<std::string, std::string>& canonical() const { return canonical_; }

    // Canonical names of the flags set on the command line.
    [[nodiscard]] std::unordered_set<std::string> setFlags() const {
        std::unordered_set<std::string> out;
        for (const auto& name : flags_.actual()) out.insert(canonical_.at(name));
        return out;
    }

    [[nodiscard]] const std::unordered_map<std::string, int>& counts() const { return counts_; }

private:
    FlagSet flags_;
    std::unordered_map<std::string, std::string> canonical_;
    std::unordered_map<std::string, int> counts_;
};

// Assigns every field with an environment annotation from `prefix + var`, before any flag is parsed.
// envDefault applies only when the variable is unset.
template <typename T>
[[nodiscard]] std::optional<Error> resolveEnv(const Schema<T>& schema, T& target, const std::string& prefix) {
    for (const auto& field : schema.fields()) {
        if (field->envVar().empty()) continue;
        const std::string var = prefix + field->envVar();

        auto value = env::lookup(var);
        if (!value) value = field->envDefault();
        if (!value) {
            if (field->isRequired()) {
                return Error(ErrorKind::MissingEnv, "required environment variable \"" + var + "\" is not set");
            }
            continue;
        }
        // Set but empty counts as present; the field keeps its value.
        if (value->empty()) continue;

        if (auto err = field->assign(target, *value)) {
            return Error(ErrorKind::Coercion,
                         "invalid value \"" + *value + "\" for environment variable " + var + " (field " + field->name() +
                             " of type " + field->typeName() + "): " + *err);
        }
    }
    return std::nullopt;
}

} // namespace argbind

#endif // ARGBIND_BINDER_HPP
