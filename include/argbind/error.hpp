#ifndef ARGBIND_ERROR_HPP
#define ARGBIND_ERROR_HPP

#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace argbind {

enum class ErrorKind {
    UnknownFlag,  // -z when no field declares z
    Syntax,       // -=x
    MissingValue, // trailing non-bool flag
    Coercion,     // value does not fit the field's type
    MissingEnv,   // required environment variable unset
    Validation,   // returned by the target's validate()
};

// Recoverable, data-dependent parse failure. Returned, never thrown.
class Error {
public:
    Error(ErrorKind kind, std::string message) : kind_(kind), message_(std::move(message)) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string& message() const { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

inline std::ostream& operator<<(std::ostream& os, const Error& e) { return os << e.message(); }

// Developer mistake in a schema or call site (duplicate alias, unsupported field type, null target).
// Callers are not expected to recover from it, only to fix the declaration.
class ConfigError : public std::logic_error {
public:
    explicit ConfigError(const std::string& what) : std::logic_error(what) {}
};

} // namespace argbind

#endif // ARGBIND_ERROR_HPP
