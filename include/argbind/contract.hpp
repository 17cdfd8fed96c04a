#ifndef ARGBIND_CONTRACT_HPP
#define ARGBIND_CONTRACT_HPP

#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

// Optional members a parse target may provide. Each is detected on its own; a target may have any subset:
//
//   std::optional<std::string> validate();
//   void setArgs(std::vector<std::string> args);
//   void setFlags(std::unordered_set<std::string> flags);
//   void setFlagsCount(std::unordered_map<std::string, int> counts);

namespace argbind {

template <typename T, typename = void>
struct hasValidate : std::false_type {};

template <typename T>
struct hasValidate<T, std::void_t<decltype(std::declval<T&>().validate())>>
    : std::is_convertible<decltype(std::declval<T&>().validate()), std::optional<std::string>> {};

template <typename T, typename = void>
struct hasSetArgs : std::false_type {};

template <typename T>
struct hasSetArgs<T, std::void_t<decltype(std::declval<T&>().setArgs(std::declval<std::vector<std::string>>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct hasSetFlags : std::false_type {};

template <typename T>
struct hasSetFlags<T, std::void_t<decltype(std::declval<T&>().setFlags(std::declval<std::unordered_set<std::string>>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct hasSetFlagsCount : std::false_type {};

template <typename T>
struct hasSetFlagsCount<
    T,
    std::void_t<decltype(std::declval<T&>().setFlagsCount(std::declval<std::unordered_map<std::string, int>>()))>>
    : std::true_type {};

} // namespace argbind

#endif // ARGBIND_CONTRACT_HPP
