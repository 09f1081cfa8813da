#ifndef ARGTREE_PARSING_FNS_HPP
#define ARGTREE_PARSING_FNS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "value.hpp"

// Ready-made functions for TypedValue::setParseFn / setValidFn.

namespace argtree::parsing {

enum class BoolNoMatch {
    True,
    False,
    Error,
};

// Bool parser over custom word lists; `noMatch` decides unknown words.
ParseFn<bool> altBool(std::vector<std::string> trueWords, std::vector<std::string> falseWords, BoolNoMatch noMatch);

// Integer parser for a fixed base (2..36). Base 0 reads a 0x/0o/0b prefix.
template <typename T>
ParseFn<T> asBase(int base) {
    static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>, "integer type required");
    return [base](std::string_view arg, T& out) -> std::optional<std::string> {
        if (auto err = detail::parseBuiltin(arg, out, base)) return err->message;
        return std::nullopt;
    };
}

std::string_view trimView(std::string_view arg);

// Maps enum tag names to the enum's underlying integer, which getAs<E>()
// turns back into E.
template <typename E>
ParseFn<std::underlying_type_t<E>> asEnum(std::vector<std::pair<std::string, E>> tags) {
    static_assert(std::is_enum_v<E>, "enum type required");
    using Underlying = std::underlying_type_t<E>;
    return [tags = std::move(tags)](std::string_view arg, Underlying& out) -> std::optional<std::string> {
        const auto name = trimView(arg);
        for (const auto& [tag, value] : tags) {
            if (tag == name) {
                out = static_cast<Underlying>(value);
                return std::nullopt;
            }
        }
        return "enum tag \"" + std::string(name) + "\" does not exist";
    };
}

std::optional<std::string> trimWhitespace(std::string_view arg, std::string& out);
std::optional<std::string> toUpper(std::string_view arg, std::string& out);
std::optional<std::string> toLower(std::string_view arg, std::string& out);

} // namespace argtree::parsing

namespace argtree::validation {

template <typename T>
ValidFn<T> inRange(T start, T end, bool inclusive = true) {
    static_assert(std::is_arithmetic_v<T>, "numeric type required");
    if (inclusive) return [start, end](const T& v) { return v >= start && v <= end; };
    return [start, end](const T& v) { return v > start && v < end; };
}

// True when `path` can be opened for reading.
bool validFilepath(const std::string& path);

// "first" through "tenth", case-insensitive.
bool ordinalNum(const std::string& word);

} // namespace argtree::validation

#endif // ARGTREE_PARSING_FNS_HPP
