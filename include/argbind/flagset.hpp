#ifndef ARGBIND_FLAGSET_HPP
#define ARGBIND_FLAGSET_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "coerce.hpp"
#include "error.hpp"

namespace argbind {

// Accepts the textual value of one flag occurrence.
class Setter {
public:
    virtual ~Setter() = default;

    [[nodiscard]] virtual std::optional<std::string> set(std::string_view value) = 0;
    // Bool flags do not consume the next argument: `-b` means `-b=true`.
    [[nodiscard]] virtual bool isBoolFlag() const { return false; }
};

// Overwrites a scalar or codec field (last write wins).
template <typename T>
class FieldSetter final : public Setter {
public:
    explicit FieldSetter(T& field) : field_(&field) {}

    std::optional<std::string> set(std::string_view value) override { return coerce(value, *field_); }
    bool isBoolFlag() const override { return kindOf<T>() == Kind::Bool; }

private:
    T* field_;
};

// Appends one element per occurrence to a sequence field.
template <typename V>
class AppendSetter final : public Setter {
public:
    explicit AppendSetter(V& seq) : seq_(&seq) {}

    std::optional<std::string> set(std::string_view value) override { return append(value, *seq_); }

private:
    V* seq_;
};

// Counts occurrences under a canonical name, then delegates.
class CountingSetter final : public Setter {
public:
    CountingSetter(std::shared_ptr<Setter> inner, std::string canonical, std::unordered_map<std::string, int>& counts)
        : inner_(std::move(inner)), canonical_(std::move(canonical)), counts_(&counts) {}

    std::optional<std::string> set(std::string_view value) override {
        ++(*counts_)[canonical_];
        return inner_->set(value);
    }
    bool isBoolFlag() const override { return inner_->isBoolFlag(); }

private:
    std::shared_ptr<Setter> inner_;
    std::string canonical_;
    std::unordered_map<std::string, int>* counts_;
};

// Flag table: name -> setter, plus the run parser used by the argument scanner.
// Accepted syntax: -name, --name, -name=value, --name=value, and -name value for non-bool flags.
class FlagSet {
public:
    using Decorator = std::function<std::shared_ptr<Setter>(const std::string& name, std::shared_ptr<Setter> inner)>;

    // Throws ConfigError if `name` is already defined.
    void define(const std::string& name, std::shared_ptr<Setter> setter);

    [[nodiscard]] Setter* lookup(const std::string& name) const;

    // Replaces every registered setter with `fn(name, setter)`.
    void decorate(const Decorator& fn);

    // Parses a maximal run of flags starting at args[pos]. On return `pos` indexes the first token that is
    // not a flag (possibly "--", which is left for the caller), or args.size().
    [[nodiscard]] std::optional<Error> parseRun(const std::vector<std::string>& args, std::size_t& pos);

    // Flag names set on the command line, as typed, in first-seen order.
    [[nodiscard]] const std::vector<std::string>& actual() const { return actual_; }

    [[nodiscard]] std::size_t size() const { return formal_.size(); }

    // At least two characters, a leading dash, not the "--" terminator and not three or more dashes.
    static bool isFlagToken(std::string_view s);

private:
    std::optional<Error> parseOne(const std::vector<std::string>& args, std::size_t& pos);

    std::unordered_map<std::string, std::shared_ptr<Setter>> formal_;
    std::vector<std::string> actual_;
    std::unordered_set<std::string> seen_;
};

} // namespace argbind

#endif // ARGBIND_FLAGSET_HPP
