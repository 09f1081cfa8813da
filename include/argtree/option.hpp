#ifndef ARGTREE_OPTION_HPP
#define ARGTREE_OPTION_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "value.hpp"

namespace argtree {

// A named, prefix-identified wrapper around one Value.
class Option {
public:
    explicit Option(std::string name, std::string description = {})
        : name_(std::move(name)),
          description_(std::move(description)),
          value_(TypedValue<bool>(name_)) {}

    Option& setShortName(char c) {
        shortName_ = c;
        return *this;
    }

    Option& setLongName(std::string v) {
        longName_ = std::move(v);
        return *this;
    }

    Option& setValue(Value v) {
        value_ = std::move(v);
        return *this;
    }

    Option& setDescription(std::string v) {
        description_ = std::move(v);
        return *this;
    }

    Option& setGroup(std::string v) {
        group_ = std::move(v);
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::optional<char>& shortName() const { return shortName_; }
    [[nodiscard]] const std::optional<std::string>& longName() const { return longName_; }
    [[nodiscard]] const std::optional<std::string>& group() const { return group_; }
    [[nodiscard]] Value& value() { return value_; }
    [[nodiscard]] const Value& value() const { return value_; }

    [[nodiscard]] bool isSet() const { return value_.isSet(); }
    [[nodiscard]] bool isBool() const { return value_.isBool(); }
    [[nodiscard]] std::string typeName() const { return value_.typeName(); }

    std::optional<Error> set(std::string_view arg) {
        auto err = value_.set(arg);
        if (err) err->argument = name_;
        return err;
    }

    template <typename T>
    [[nodiscard]] std::optional<T> getAs() const {
        return value_.getAs<T>();
    }

    template <typename T>
    [[nodiscard]] std::optional<std::vector<T>> getAllAs() const {
        return value_.getAllAs<T>();
    }

    [[nodiscard]] bool matchesShort(char c) const { return shortName_ && *shortName_ == c; }
    [[nodiscard]] bool matchesLong(std::string_view name) const { return longName_ && *longName_ == name; }
    // True when `abbrev` is a non-empty prefix of the long name.
    [[nodiscard]] bool matchesLongPrefix(std::string_view abbrev) const {
        return longName_ && !abbrev.empty() && std::string_view(*longName_).substr(0, abbrev.size()) == abbrev;
    }

private:
    std::string name_;
    std::string description_;
    std::optional<char> shortName_;
    std::optional<std::string> longName_;
    std::optional<std::string> group_;
    Value value_;
};

} // namespace argtree

#endif // ARGTREE_OPTION_HPP
