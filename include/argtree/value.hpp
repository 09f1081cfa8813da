#ifndef ARGTREE_VALUE_HPP
#define ARGTREE_VALUE_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace argtree {

namespace detail {

inline constexpr std::string_view kDefaultArgDelims{",;"};

// Built-in coercion. Errors carry only the reason; TypedValue::parse adds
// the token and argument identity.
std::optional<Error> parseBool(std::string_view arg, bool& out);
std::optional<Error> parseSigned(std::string_view arg,
                                 int base,
                                 std::int64_t min,
                                 std::int64_t max,
                                 std::int64_t& out);
std::optional<Error> parseUnsigned(std::string_view arg, int base, std::uint64_t max, std::uint64_t& out);
std::optional<Error> parseFloating(std::string_view arg, float& out);
std::optional<Error> parseFloating(std::string_view arg, double& out);
std::optional<Error> parseFloating(std::string_view arg, long double& out);

// First character of `delims` (in order) that occurs in `arg`.
std::optional<char> findDelim(std::string_view arg, std::string_view delims);

template <typename T>
std::optional<Error> parseBuiltin(std::string_view arg, T& out, int base = 0) {
    if constexpr (std::is_same_v<T, bool>) {
        (void)base;
        return parseBool(arg, out);
    } else if constexpr (std::is_same_v<T, std::string>) {
        (void)base;
        out.assign(arg.data(), arg.size());
        return std::nullopt;
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        std::int64_t v{};
        if (auto err = parseSigned(arg, base, std::numeric_limits<T>::min(), std::numeric_limits<T>::max(), v)) {
            return err;
        }
        out = static_cast<T>(v);
        return std::nullopt;
    } else if constexpr (std::is_integral_v<T>) {
        std::uint64_t v{};
        if (auto err = parseUnsigned(arg, base, std::numeric_limits<T>::max(), v)) return err;
        out = static_cast<T>(v);
        return std::nullopt;
    } else if constexpr (std::is_floating_point_v<T>) {
        (void)base;
        return parseFloating(arg, out);
    } else {
        (void)base;
        (void)out;
        return Error(ErrorKind::CannotParseArgToValue, "no parser registered for this type", std::string(arg));
    }
}

template <typename T>
constexpr const char* builtinTypeName() {
    if constexpr (std::is_same_v<T, bool>) return "bool";
    else if constexpr (std::is_same_v<T, std::string>) return "string";
    else if constexpr (std::is_same_v<T, std::int8_t>) return "int8";
    else if constexpr (std::is_same_v<T, std::int16_t>) return "int16";
    else if constexpr (std::is_same_v<T, std::int32_t>) return "int32";
    else if constexpr (std::is_same_v<T, std::int64_t>) return "int64";
    else if constexpr (std::is_same_v<T, std::uint8_t>) return "uint8";
    else if constexpr (std::is_same_v<T, std::uint16_t>) return "uint16";
    else if constexpr (std::is_same_v<T, std::uint32_t>) return "uint32";
    else if constexpr (std::is_same_v<T, std::uint64_t>) return "uint64";
    else if constexpr (std::is_same_v<T, float>) return "float";
    else if constexpr (std::is_same_v<T, double>) return "double";
    else return nullptr;
}

template <typename T, typename Variant>
struct IsAlternative;

template <typename T, typename... Ts>
struct IsAlternative<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

} // namespace detail

// Storage and coercion for 0..maxArgs parsed instances of one type.
template <typename T>
class TypedValue {
public:
    using ChildType = T;

    TypedValue() = default;
    explicit TypedValue(std::string name, std::string description = {})
        : name_(std::move(name)),
          description_(std::move(description)) {}

    TypedValue& setName(std::string v) {
        name_ = std::move(v);
        return *this;
    }

    TypedValue& setDescription(std::string v) {
        description_ = std::move(v);
        return *this;
    }

    TypedValue& setGroup(std::string v) {
        group_ = std::move(v);
        return *this;
    }

    // Type hint shown in usage/help instead of the type name.
    TypedValue& setTypeAlias(std::string v) {
        typeAlias_ = std::move(v);
        return *this;
    }

    TypedValue& setBehavior(SetBehavior v) {
        behavior_ = v;
        return *this;
    }

    TypedValue& setArgDelims(std::string v) {
        argDelims_ = std::move(v);
        return *this;
    }

    TypedValue& setMaxArgs(std::size_t v) {
        maxArgs_ = v;
        return *this;
    }

    TypedValue& setDefault(T v) {
        default_ = std::move(v);
        return *this;
    }

    TypedValue& setParseFn(ParseFn<T> fn) {
        parseFn_ = std::move(fn);
        return *this;
    }

    TypedValue& setValidFn(ValidFn<T> fn) {
        validFn_ = std::move(fn);
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::optional<std::string>& group() const { return group_; }

    [[nodiscard]] std::string typeName() const {
        if (typeAlias_) return *typeAlias_;
        if (const char* builtin = detail::builtinTypeName<T>()) return builtin;
        return registeredTypeName_.empty() ? std::string("custom") : registeredTypeName_;
    }

    [[nodiscard]] SetBehavior behavior() const { return behavior_.value_or(SetBehavior::Last); }
    [[nodiscard]] std::string_view argDelims() const {
        return argDelims_ ? std::string_view(*argDelims_) : detail::kDefaultArgDelims;
    }
    [[nodiscard]] std::size_t maxArgs() const { return maxArgs_; }
    [[nodiscard]] std::size_t argIdx() const { return argIdx_; }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] bool isSet() const { return isSet_; }
    [[nodiscard]] bool isMaxed() const { return argIdx_ == maxArgs_; }
    [[nodiscard]] bool hasDefault() const { return default_.has_value(); }
    [[nodiscard]] const std::optional<T>& defaultValue() const { return default_; }
    [[nodiscard]] bool hasCustomParseFn() const { return static_cast<bool>(parseFn_); }
    [[nodiscard]] bool hasCustomValidFn() const { return static_cast<bool>(validFn_); }

    // Fills unset behavior/delimiters from the global defaults and picks up
    // the type-level parse function.
    void bind(const ValueConfig& config) {
        if (!behavior_) behavior_ = config.globalSetBehavior;
        if (!argDelims_) argDelims_ = config.globalArgDelims;
        capacity_ = std::min(config.maxChildren, kMaxChildren);
        if (const auto* fn = config.typeParsers.find<T>()) typeParseFn_ = *fn;
        registeredTypeName_ = config.typeParsers.typeName<T>();
    }

    // Instance parse function, then type-level parse function, then the
    // built-in coercion.
    std::optional<Error> parse(std::string_view arg, T& out) const {
        const ParseFn<T>* fn = parseFn_ ? &parseFn_ : (typeParseFn_ ? &typeParseFn_ : nullptr);
        if (fn) {
            if (auto msg = (*fn)(arg, out)) {
                return Error(ErrorKind::CannotParseArgToValue,
                             invalidArgument(arg) + ": " + *msg,
                             std::string(arg),
                             name_);
            }
            return std::nullopt;
        }
        if (auto err = detail::parseBuiltin(arg, out)) {
            err->message = invalidArgument(arg) + ": " + err->message;
            err->token = std::string(arg);
            err->argument = name_;
            return err;
        }
        return std::nullopt;
    }

    std::optional<Error> set(std::string_view arg) {
        if constexpr (!std::is_same_v<T, std::string>) {
            if (behavior() == SetBehavior::Multi && detail::findDelim(arg, argDelims())) {
                return setDelimited(arg);
            }
        }
        T parsed{};
        if (auto err = parseAndValidate(arg, parsed)) return err;
        if (behavior() == SetBehavior::Multi && argIdx_ >= slotLimit()) return maxedError(arg);
        store(std::move(parsed));
        return std::nullopt;
    }

    // Slot 0, else the default, else false for bool. Empty when unset.
    [[nodiscard]] std::optional<T> get() const {
        if (isSet_) return slots_[0];
        if (default_) return default_;
        if constexpr (std::is_same_v<T, bool>) {
            return false;
        } else {
            return std::nullopt;
        }
    }

    [[nodiscard]] std::optional<std::vector<T>> getAll() const {
        if (!isSet_) {
            if (default_) return std::vector<T>{*default_};
            return std::nullopt;
        }
        std::vector<T> out;
        out.reserve(argIdx_);
        for (std::size_t i = 0; i < argIdx_; ++i) out.push_back(*slots_[i]);
        return out;
    }

private:
    std::string invalidArgument(std::string_view arg) const {
        return "invalid argument \"" + std::string(arg) + "\" for \"" + name_ + "\"";
    }

    std::size_t slotLimit() const { return std::min(maxArgs_, capacity_); }

    Error maxedError(std::string_view arg) const {
        return Error(ErrorKind::ValueMaxed,
                     "too many arguments for \"" + name_ + "\" (accepts at most " + std::to_string(maxArgs_) + ")",
                     std::string(arg),
                     name_);
    }

    std::optional<Error> parseAndValidate(std::string_view arg, T& out) const {
        if (auto err = parse(arg, out)) return err;
        if (validFn_ && !validFn_(out)) {
            return Error(ErrorKind::InvalidValue,
                         "invalid value \"" + std::string(arg) + "\" for \"" + name_ + "\"",
                         std::string(arg),
                         name_);
        }
        return std::nullopt;
    }

    // Splits on the first listed delimiter present; each piece may split
    // again on a later delimiter.
    std::optional<Error> collectPieces(std::string_view arg, std::vector<T>& out) const {
        const auto delim = detail::findDelim(arg, argDelims());
        if (!delim) {
            T parsed{};
            if (auto err = parseAndValidate(arg, parsed)) return err;
            out.push_back(std::move(parsed));
            return std::nullopt;
        }
        std::size_t start = 0;
        while (true) {
            const auto pos = arg.find(*delim, start);
            const auto piece = arg.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start);
            if (auto err = collectPieces(piece, out)) return err;
            if (pos == std::string_view::npos) break;
            start = pos + 1;
        }
        return std::nullopt;
    }

    std::optional<Error> setDelimited(std::string_view arg) {
        std::vector<T> pieces;
        if (auto err = collectPieces(arg, pieces)) return err;
        if (argIdx_ + pieces.size() > slotLimit()) return maxedError(arg);
        for (auto&& piece : pieces) store(std::move(piece));
        return std::nullopt;
    }

    void store(T v) {
        switch (behavior()) {
            case SetBehavior::First:
                if (!slots_[0]) {
                    slots_[0] = std::move(v);
                    argIdx_ = 1;
                }
                break;
            case SetBehavior::Last:
                slots_[0] = std::move(v);
                if (argIdx_ < 1) argIdx_ = 1;
                break;
            case SetBehavior::Multi:
                slots_[argIdx_] = std::move(v);
                ++argIdx_;
                break;
        }
        isSet_ = true;
    }

    std::string name_;
    std::string description_;
    std::optional<std::string> group_;
    std::optional<std::string> typeAlias_;
    std::string registeredTypeName_;

    std::optional<SetBehavior> behavior_;
    std::optional<std::string> argDelims_;
    std::size_t maxArgs_{1};
    std::size_t capacity_{kMaxChildren};
    std::optional<T> default_;

    ParseFn<T> parseFn_;
    ParseFn<T> typeParseFn_;
    ValidFn<T> validFn_;

    std::array<std::optional<T>, kMaxChildren> slots_{};
    std::size_t argIdx_{0};
    bool isSet_{false};
};

// Holds a TypedValue of a type outside the built-in set.
class CustomValue {
public:
    template <typename T>
    explicit CustomValue(TypedValue<T> value) : self_(std::make_unique<Model<T>>(std::move(value))) {}

    CustomValue(const CustomValue& other) : self_(other.self_->clone()) {}
    CustomValue& operator=(const CustomValue& other) {
        if (this != &other) self_ = other.self_->clone();
        return *this;
    }
    CustomValue(CustomValue&&) noexcept = default;
    CustomValue& operator=(CustomValue&&) noexcept = default;

    [[nodiscard]] const std::string& name() const { return self_->name(); }
    [[nodiscard]] const std::string& description() const { return self_->description(); }
    [[nodiscard]] const std::optional<std::string>& group() const { return self_->group(); }
    [[nodiscard]] std::string typeName() const { return self_->typeName(); }
    [[nodiscard]] SetBehavior behavior() const { return self_->behavior(); }
    [[nodiscard]] std::size_t maxArgs() const { return self_->maxArgs(); }
    [[nodiscard]] std::size_t argIdx() const { return self_->argIdx(); }
    [[nodiscard]] bool isSet() const { return self_->isSet(); }
    [[nodiscard]] bool isMaxed() const { return self_->isMaxed(); }
    [[nodiscard]] bool hasDefault() const { return self_->hasDefault(); }
    [[nodiscard]] bool hasCustomParseFn() const { return self_->hasCustomParseFn(); }
    [[nodiscard]] bool hasCustomValidFn() const { return self_->hasCustomValidFn(); }

    std::optional<Error> set(std::string_view arg) { return self_->set(arg); }
    void bind(const ValueConfig& config) { self_->bind(config); }

    template <typename T>
    [[nodiscard]] TypedValue<T>* target() {
        auto* model = dynamic_cast<Model<T>*>(self_.get());
        return model ? &model->value : nullptr;
    }

    template <typename T>
    [[nodiscard]] const TypedValue<T>* target() const {
        const auto* model = dynamic_cast<const Model<T>*>(self_.get());
        return model ? &model->value : nullptr;
    }

private:
    struct Concept {
        virtual ~Concept() = default;
        [[nodiscard]] virtual std::unique_ptr<Concept> clone() const = 0;
        [[nodiscard]] virtual const std::string& name() const = 0;
        [[nodiscard]] virtual const std::string& description() const = 0;
        [[nodiscard]] virtual const std::optional<std::string>& group() const = 0;
        [[nodiscard]] virtual std::string typeName() const = 0;
        [[nodiscard]] virtual SetBehavior behavior() const = 0;
        [[nodiscard]] virtual std::size_t maxArgs() const = 0;
        [[nodiscard]] virtual std::size_t argIdx() const = 0;
        [[nodiscard]] virtual bool isSet() const = 0;
        [[nodiscard]] virtual bool isMaxed() const = 0;
        [[nodiscard]] virtual bool hasDefault() const = 0;
        [[nodiscard]] virtual bool hasCustomParseFn() const = 0;
        [[nodiscard]] virtual bool hasCustomValidFn() const = 0;
        virtual std::optional<Error> set(std::string_view arg) = 0;
        virtual void bind(const ValueConfig& config) = 0;
    };

    template <typename T>
    struct Model final : Concept {
        explicit Model(TypedValue<T> v) : value(std::move(v)) {}

        std::unique_ptr<Concept> clone() const override { return std::make_unique<Model>(value); }
        const std::string& name() const override { return value.name(); }
        const std::string& description() const override { return value.description(); }
        const std::optional<std::string>& group() const override { return value.group(); }
        std::string typeName() const override { return value.typeName(); }
        SetBehavior behavior() const override { return value.behavior(); }
        std::size_t maxArgs() const override { return value.maxArgs(); }
        std::size_t argIdx() const override { return value.argIdx(); }
        bool isSet() const override { return value.isSet(); }
        bool isMaxed() const override { return value.isMaxed(); }
        bool hasDefault() const override { return value.hasDefault(); }
        bool hasCustomParseFn() const override { return value.hasCustomParseFn(); }
        bool hasCustomValidFn() const override { return value.hasCustomValidFn(); }
        std::optional<Error> set(std::string_view arg) override { return value.set(arg); }
        void bind(const ValueConfig& config) override { value.bind(config); }

        TypedValue<T> value;
    };

    std::unique_ptr<Concept> self_;
};

// One TypedValue of any supported kind. The kind is fixed at construction.
class Value {
public:
    using Storage = std::variant<TypedValue<bool>,
                                 TypedValue<std::string>,
                                 TypedValue<std::int8_t>,
                                 TypedValue<std::int16_t>,
                                 TypedValue<std::int32_t>,
                                 TypedValue<std::int64_t>,
                                 TypedValue<std::uint8_t>,
                                 TypedValue<std::uint16_t>,
                                 TypedValue<std::uint32_t>,
                                 TypedValue<std::uint64_t>,
                                 TypedValue<float>,
                                 TypedValue<double>,
                                 CustomValue>;

    Value() = default;

    template <typename T>
    Value(TypedValue<T> value) : storage_(wrap(std::move(value))) {}

    template <typename T>
    static Value ofType(TypedValue<T> value) {
        return Value(std::move(value));
    }

    template <typename T>
    static constexpr bool isBuiltinType() {
        return detail::IsAlternative<TypedValue<T>, Storage>::value;
    }

    [[nodiscard]] const std::string& name() const {
        return std::visit([](const auto& v) -> const std::string& { return v.name(); }, storage_);
    }
    [[nodiscard]] const std::string& description() const {
        return std::visit([](const auto& v) -> const std::string& { return v.description(); }, storage_);
    }
    [[nodiscard]] const std::optional<std::string>& group() const {
        return std::visit([](const auto& v) -> const std::optional<std::string>& { return v.group(); }, storage_);
    }
    [[nodiscard]] std::string typeName() const {
        return std::visit([](const auto& v) { return v.typeName(); }, storage_);
    }
    [[nodiscard]] SetBehavior behavior() const {
        return std::visit([](const auto& v) { return v.behavior(); }, storage_);
    }
    [[nodiscard]] std::size_t maxArgs() const {
        return std::visit([](const auto& v) { return v.maxArgs(); }, storage_);
    }
    [[nodiscard]] std::size_t argIdx() const {
        return std::visit([](const auto& v) { return v.argIdx(); }, storage_);
    }
    [[nodiscard]] bool isSet() const {
        return std::visit([](const auto& v) { return v.isSet(); }, storage_);
    }
    [[nodiscard]] bool isMaxed() const {
        return std::visit([](const auto& v) { return v.isMaxed(); }, storage_);
    }
    [[nodiscard]] bool hasDefault() const {
        return std::visit([](const auto& v) { return v.hasDefault(); }, storage_);
    }
    [[nodiscard]] bool hasCustomParseFn() const {
        return std::visit([](const auto& v) { return v.hasCustomParseFn(); }, storage_);
    }
    [[nodiscard]] bool hasCustomValidFn() const {
        return std::visit([](const auto& v) { return v.hasCustomValidFn(); }, storage_);
    }

    [[nodiscard]] bool isBool() const { return std::holds_alternative<TypedValue<bool>>(storage_); }
    [[nodiscard]] bool isCustom() const { return std::holds_alternative<CustomValue>(storage_); }

    std::optional<Error> set(std::string_view arg) {
        return std::visit([arg](auto& v) { return v.set(arg); }, storage_);
    }

    void bind(const ValueConfig& config) {
        std::visit([&config](auto& v) { v.bind(config); }, storage_);
    }

    template <typename T>
    [[nodiscard]] TypedValue<T>* as() {
        if constexpr (isBuiltinType<T>()) {
            return std::get_if<TypedValue<T>>(&storage_);
        } else {
            auto* custom = std::get_if<CustomValue>(&storage_);
            return custom ? custom->target<T>() : nullptr;
        }
    }

    template <typename T>
    [[nodiscard]] const TypedValue<T>* as() const {
        if constexpr (isBuiltinType<T>()) {
            return std::get_if<TypedValue<T>>(&storage_);
        } else {
            const auto* custom = std::get_if<CustomValue>(&storage_);
            return custom ? custom->target<T>() : nullptr;
        }
    }

    // Empty when the Value is unset or holds another type. An enum type is
    // accepted for a Value holding the enum's underlying integer type.
    template <typename T>
    [[nodiscard]] std::optional<T> getAs() const {
        if (const auto* typed = as<T>()) return typed->get();
        if constexpr (std::is_enum_v<T>) {
            if (const auto* typed = as<std::underlying_type_t<T>>()) {
                if (const auto v = typed->get()) return static_cast<T>(*v);
            }
        }
        return std::nullopt;
    }

    template <typename T>
    [[nodiscard]] std::optional<std::vector<T>> getAllAs() const {
        if (const auto* typed = as<T>()) return typed->getAll();
        return std::nullopt;
    }

    [[nodiscard]] const Storage& storage() const { return storage_; }

private:
    template <typename T>
    static Storage wrap(TypedValue<T> value) {
        if constexpr (isBuiltinType<T>()) {
            return Storage(std::in_place_type<TypedValue<T>>, std::move(value));
        } else {
            return Storage(std::in_place_type<CustomValue>, CustomValue(std::move(value)));
        }
    }

    Storage storage_;
};

} // namespace argtree

#endif // ARGTREE_VALUE_HPP
