#include "argbind/flagset.hpp"

namespace argbind {

void FlagSet::define(const std::string& name, std::shared_ptr<Setter> setter) {
    if (formal_.find(name) != formal_.end()) {
        throw ConfigError("flag redefined: " + name);
    }
    formal_.emplace(name, std::move(setter));
}

Setter* FlagSet::lookup(const std::string& name) const {
    const auto it = formal_.find(name);
    if (it == formal_.end()) return nullptr;
    return it->second.get();
}

void FlagSet::decorate(const Decorator& fn) {
    for (auto& [name, setter] : formal_) {
        setter = fn(name, setter);
    }
}

bool FlagSet::isFlagToken(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    if (s == "--") return false;
    return s.rfind("---", 0) != 0;
}

std::optional<Error> FlagSet::parseRun(const std::vector<std::string>& args, std::size_t& pos) {
    while (pos < args.size() && isFlagToken(args[pos])) {
        if (auto err = parseOne(args, pos)) return err;
    }
    return std::nullopt;
}

std::optional<Error> FlagSet::parseOne(const std::vector<std::string>& args, std::size_t& pos) {
    const std::string& token = args[pos++];
    const std::size_t dashes = token[1] == '-' ? 2 : 1;
    std::string name = token.substr(dashes);
    if (name.empty() || name[0] == '=') {
        return Error(ErrorKind::Syntax, "bad flag syntax: " + token);
    }

    std::optional<std::string> value;
    const auto eq = name.find('=');
    if (eq != std::string::npos) {
        value = name.substr(eq + 1);
        name.resize(eq);
    }

    // -h/-help have no built-in meaning; undeclared, they are unknown like any other name.
    Setter* setter = lookup(name);
    if (!setter) {
        return Error(ErrorKind::UnknownFlag, "flag provided but not defined: -" + name);
    }

    if (setter->isBoolFlag()) {
        const std::string literal = value ? *value : "true";
        if (auto err = setter->set(literal)) {
            return Error(ErrorKind::Coercion, "invalid boolean value \"" + literal + "\" for -" + name + ": " + *err);
        }
    } else {
        if (!value) {
            if (pos >= args.size()) {
                return Error(ErrorKind::MissingValue, "flag needs an argument: -" + name);
            }
            value = args[pos++];
        }
        if (auto err = setter->set(*value)) {
            return Error(ErrorKind::Coercion, "invalid value \"" + *value + "\" for flag -" + name + ": " + *err);
        }
    }

    if (seen_.insert(name).second) actual_.push_back(name);
    return std::nullopt;
}

} // namespace argbind
