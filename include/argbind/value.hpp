#ifndef ARGBIND_VALUE_HPP
#define ARGBIND_VALUE_HPP

#include <optional>
#include <string>
#include <string_view>

namespace argbind {

// Text codec base for custom field types.
//
// Notes:
// - Deriving is optional: any type with the same `string()`/`set()` pair is treated as a codec.
// - Codec detection wins over the built-in kinds, so a codec deriving from std::string is still a codec.
// - `set()` should return an error string on failure; empty optional indicates success.
class Value {
public:
    virtual ~Value() = default;

    // Current value in string form.
    [[nodiscard]] virtual std::string string() const = 0;
    // Parse one occurrence.
    [[nodiscard]] virtual std::optional<std::string> set(std::string_view value) = 0;
};

} // namespace argbind

#endif // ARGBIND_VALUE_HPP
