#ifndef ARGBIND_COERCE_HPP
#define ARGBIND_COERCE_HPP

#include <chrono>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace argbind {

// Duration fields are parsed with nanosecond precision, then converted to the field's own type.
using Duration = std::chrono::nanoseconds;

namespace detail {

std::string_view trimWs(std::string_view s);

// Each returns an error reason on failure; empty optional indicates success.
std::optional<std::string> parseBool(std::string_view s, bool& out);
std::optional<std::string> parseSigned(std::string_view s, long long min, long long max, long long& out);
std::optional<std::string> parseUnsigned(std::string_view s, unsigned long long max, unsigned long long& out);
std::optional<std::string> parseFloat(std::string_view s, float& out);
std::optional<std::string> parseFloat(std::string_view s, double& out);
std::optional<std::string> parseDuration(std::string_view s, Duration& out);

std::string demangle(const char* name);

template <typename T, typename = void>
struct isTextCodec : std::false_type {};

template <typename T>
struct isTextCodec<T,
                   std::void_t<decltype(std::declval<const T&>().string()),
                               decltype(std::declval<T&>().set(std::declval<std::string_view>()))>>
    : std::bool_constant<
          std::is_convertible_v<decltype(std::declval<const T&>().string()), std::string> &&
          std::is_same_v<decltype(std::declval<T&>().set(std::declval<std::string_view>())), std::optional<std::string>>> {};

template <typename T>
struct isCodecPointer : std::false_type {};

template <typename U>
struct isCodecPointer<std::unique_ptr<U>>
    : std::bool_constant<isTextCodec<U>::value && std::is_default_constructible_v<U> && !std::is_abstract_v<U>> {};

template <typename U>
struct isCodecPointer<std::shared_ptr<U>>
    : std::bool_constant<isTextCodec<U>::value && std::is_default_constructible_v<U> && !std::is_abstract_v<U>> {};

template <typename T>
struct isDuration : std::false_type {};

template <typename Rep, typename Period>
struct isDuration<std::chrono::duration<Rep, Period>> : std::true_type {};

template <typename T>
struct isVector : std::false_type {};

template <typename E, typename A>
struct isVector<std::vector<E, A>> : std::true_type {};

template <typename T, typename... Ts>
inline constexpr bool isOneOf = (std::is_same_v<T, Ts> || ...);

} // namespace detail

enum class Kind { Codec, PointerCodec, Duration, Bool, String, Signed, Unsigned, Float, Sequence, Unsupported };

// Resolves how text becomes a T. Codec detection comes first so that a user type built on a
// scalar (e.g. a std::string subclass with set/string) is never treated as the scalar.
template <typename T>
constexpr Kind kindOf() {
    if constexpr (detail::isTextCodec<T>::value) {
        return Kind::Codec;
    } else if constexpr (detail::isCodecPointer<T>::value) {
        return Kind::PointerCodec;
    } else if constexpr (detail::isDuration<T>::value) {
        return Kind::Duration;
    } else if constexpr (std::is_same_v<T, bool>) {
        return Kind::Bool;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return Kind::String;
    } else if constexpr (detail::isOneOf<T, int, long, long long>) {
        return Kind::Signed;
    } else if constexpr (detail::isOneOf<T, unsigned int, unsigned long, unsigned long long>) {
        return Kind::Unsigned;
    } else if constexpr (detail::isOneOf<T, float, double>) {
        return Kind::Float;
    } else if constexpr (detail::isVector<T>::value) {
        using E = typename T::value_type;
        constexpr Kind elem = kindOf<E>();
        if constexpr (elem != Kind::Sequence && elem != Kind::Unsupported && std::is_default_constructible_v<E>) {
            return Kind::Sequence;
        } else {
            return Kind::Unsupported;
        }
    } else {
        return Kind::Unsupported;
    }
}

template <typename T>
inline constexpr bool isSupported = kindOf<T>() != Kind::Unsupported;

template <typename T>
std::string typeName() {
    return detail::demangle(typeid(T).name());
}

// Parses one textual value into `out`. Scalars are only assigned on success; codecs get `set()`
// called in place, pointer codecs always receive a freshly allocated pointee.
template <typename T>
[[nodiscard]] std::optional<std::string> coerce(std::string_view text, T& out) {
    constexpr Kind kind = kindOf<T>();
    static_assert(kind != Kind::Unsupported && kind != Kind::Sequence, "coerce() needs a scalar or codec type");

    if constexpr (kind == Kind::Codec) {
        return out.set(text);
    } else if constexpr (kind == Kind::PointerCodec) {
        using U = typename T::element_type;
        auto fresh = std::make_unique<U>();
        if (auto err = fresh->set(text)) return err;
        out = std::move(fresh);
        return std::nullopt;
    } else if constexpr (kind == Kind::Duration) {
        Duration parsed{};
        if (auto err = detail::parseDuration(text, parsed)) return err;
        out = std::chrono::duration_cast<T>(parsed);
        return std::nullopt;
    } else if constexpr (kind == Kind::Bool) {
        bool parsed = false;
        if (auto err = detail::parseBool(text, parsed)) return err;
        out = parsed;
        return std::nullopt;
    } else if constexpr (kind == Kind::String) {
        out = std::string(text);
        return std::nullopt;
    } else if constexpr (kind == Kind::Signed) {
        long long parsed = 0;
        if (auto err = detail::parseSigned(text, std::numeric_limits<T>::min(), std::numeric_limits<T>::max(), parsed)) {
            return err;
        }
        out = static_cast<T>(parsed);
        return std::nullopt;
    } else if constexpr (kind == Kind::Unsigned) {
        unsigned long long parsed = 0;
        if (auto err = detail::parseUnsigned(text, std::numeric_limits<T>::max(), parsed)) return err;
        out = static_cast<T>(parsed);
        return std::nullopt;
    } else {
        T parsed{};
        if (auto err = detail::parseFloat(text, parsed)) return err;
        out = parsed;
        return std::nullopt;
    }
}

// Coerces one element and appends it. Each call builds its own element so no two entries share storage.
template <typename E, typename A>
[[nodiscard]] std::optional<std::string> append(std::string_view text, std::vector<E, A>& seq) {
    E elem{};
    if (auto err = coerce(text, elem)) return err;
    seq.push_back(std::move(elem));
    return std::nullopt;
}

} // namespace argbind

#endif // ARGBIND_COERCE_HPP
