#ifndef ARGBIND_SCHEMA_HPP
#define ARGBIND_SCHEMA_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "coerce.hpp"
#include "error.hpp"
#include "flagset.hpp"

namespace argbind {

namespace detail {

// Splits on `sep`, keeping empty parts.
std::vector<std::string_view> splitList(std::string_view s, char sep);

// "s, string,,long" -> {"s", "string", "long"}
std::vector<std::string> splitAliases(std::string_view list);

} // namespace detail

// Declarative description of the bindable fields of T. Each entry pairs a member pointer with its
// flag aliases and environment variable, e.g.
//
//   static void describe(argbind::Schema<Server>& s) {
//       s.field("Addr", &Server::addr).flag("a,addr").env("ADDR");
//       s.field("Tags", &Server::tags).flag("t,tag");
//   }
//
// The member's type is checked when the field is declared: unsupported types throw ConfigError.
template <typename T>
class Schema {
public:
    class Field {
    public:
        using SetterFactory = std::function<std::shared_ptr<Setter>(T&)>;
        using TextAssign = std::function<std::optional<std::string>(T&, std::string_view)>;

        Field(std::string name, std::string typeName, bool repeatable, SetterFactory makeSetter, TextAssign assign)
            : name_(std::move(name)),
              typeName_(std::move(typeName)),
              repeatable_(repeatable),
              makeSetter_(std::move(makeSetter)),
              assign_(std::move(assign)) {}

        // Comma-separated alias list; the first non-empty alias is the canonical name.
        Field& flag(std::string_view aliases) {
            for (auto& a : detail::splitAliases(aliases)) aliases_.push_back(std::move(a));
            return *this;
        }

        // Variable name, without the parser's prefix.
        Field& env(std::string var) {
            envVar_ = std::move(var);
            return *this;
        }

        // Used when the variable is unset or empty.
        Field& envDefault(std::string value) {
            envDefault_ = std::move(value);
            return *this;
        }

        // Fails the parse when the variable is unset or empty and has no default.
        Field& required(bool v = true) {
            required_ = v;
            return *this;
        }

        [[nodiscard]] const std::string& name() const { return name_; }
        [[nodiscard]] const std::string& typeName() const { return typeName_; }
        [[nodiscard]] bool repeatable() const { return repeatable_; }
        [[nodiscard]] const std::vector<std::string>& aliases() const { return aliases_; }
        [[nodiscard]] const std::string& canonicalName() const {
            static const std::string none;
            return aliases_.empty() ? none : aliases_.front();
        }
        [[nodiscard]] const std::string& envVar() const { return envVar_; }
        [[nodiscard]] const std::optional<std::string>& envDefault() const { return envDefault_; }
        [[nodiscard]] bool isRequired() const { return required_; }

        [[nodiscard]] std::shared_ptr<Setter> makeSetter(T& target) const { return makeSetter_(target); }
        // Assigns a whole value at once; sequences are split on ',' and replaced.
        [[nodiscard]] std::optional<std::string> assign(T& target, std::string_view text) const {
            return assign_(target, text);
        }

    private:
        std::string name_;
        std::string typeName_;
        bool repeatable_;
        SetterFactory makeSetter_;
        TextAssign assign_;
        std::vector<std::string> aliases_;
        std::string envVar_;
        std::optional<std::string> envDefault_;
        bool required_{false};
    };

    template <typename M>
    Field& field(std::string name, M T::*member) {
        if constexpr (!isSupported<M>) {
            throw ConfigError("unsupported flag field type: " + typeName<M>() + " (" + name + ")");
        } else {
            constexpr bool repeatable = kindOf<M>() == Kind::Sequence;
            auto makeSetter = [member](T& target) -> std::shared_ptr<Setter> {
                if constexpr (kindOf<M>() == Kind::Sequence) {
                    return std::make_shared<AppendSetter<M>>(target.*member);
                } else {
                    return std::make_shared<FieldSetter<M>>(target.*member);
                }
            };
            auto assign = [member](T& target, std::string_view text) -> std::optional<std::string> {
                if constexpr (kindOf<M>() == Kind::Sequence) {
                    M parsed{};
                    for (const auto part : detail::splitList(text, ',')) {
                        if (auto err = append(part, parsed)) return err;
                    }
                    target.*member = std::move(parsed);
                    return std::nullopt;
                } else {
                    return coerce(text, target.*member);
                }
            };
            fields_.push_back(std::make_unique<Field>(std::move(name), typeName<M>(), repeatable, std::move(makeSetter), std::move(assign)));
            return *fields_.back();
        }
    }

    [[nodiscard]] const std::vector<std::unique_ptr<Field>>& fields() const { return fields_; }

private:
    std::vector<std::unique_ptr<Field>> fields_;
};

template <typename T, typename = void>
struct hasDescribe : std::false_type {};

template <typename T>
struct hasDescribe<T, std::void_t<decltype(T::describe(std::declval<Schema<T>&>()))>> : std::true_type {};

// Builds the schema T declares through `static void describe(Schema<T>&)`; empty if it declares none.
template <typename T>
Schema<T> schemaOf() {
    Schema<T> schema;
    if constexpr (hasDescribe<T>::value) {
        T::describe(schema);
    }
    return schema;
}

} // namespace argbind

#endif // ARGBIND_SCHEMA_HPP
