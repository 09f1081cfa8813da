#include "argtree/parsing_fns.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "argtree/utils.hpp"

namespace argtree::parsing {

ParseFn<bool> altBool(std::vector<std::string> trueWords, std::vector<std::string> falseWords, BoolNoMatch noMatch) {
    return [trueWords = std::move(trueWords), falseWords = std::move(falseWords), noMatch](
               std::string_view arg, bool& out) -> std::optional<std::string> {
        const auto matches = [arg](const std::string& word) { return word == arg; };
        if (std::any_of(trueWords.begin(), trueWords.end(), matches)) {
            out = true;
            return std::nullopt;
        }
        if (std::any_of(falseWords.begin(), falseWords.end(), matches)) {
            out = false;
            return std::nullopt;
        }
        switch (noMatch) {
            case BoolNoMatch::True:
                out = true;
                return std::nullopt;
            case BoolNoMatch::False:
                out = false;
                return std::nullopt;
            case BoolNoMatch::Error:
                break;
        }
        return "unrecognized boolean value \"" + std::string(arg) + "\"";
    };
}

std::string_view trimView(std::string_view arg) {
    const auto isWs = [](char c) { return c == '\0' || std::isspace(static_cast<unsigned char>(c)); };
    std::size_t start = 0;
    while (start < arg.size() && isWs(arg[start])) ++start;
    std::size_t end = arg.size();
    while (end > start && isWs(arg[end - 1])) --end;
    return arg.substr(start, end - start);
}

std::optional<std::string> trimWhitespace(std::string_view arg, std::string& out) {
    out = std::string(trimView(arg));
    return std::nullopt;
}

std::optional<std::string> toUpper(std::string_view arg, std::string& out) {
    out = utils::toUpper(arg);
    return std::nullopt;
}

std::optional<std::string> toLower(std::string_view arg, std::string& out) {
    out = utils::toLower(arg);
    return std::nullopt;
}

} // namespace argtree::parsing

namespace argtree::validation {

bool validFilepath(const std::string& path) {
    std::ifstream file(path);
    return file.is_open();
}

bool ordinalNum(const std::string& word) {
    static const char* const kOrdinals[] = {
        "first", "second", "third", "fourth", "fifth", "sixth", "seventh", "eighth", "ninth", "tenth",
    };
    const auto lower = utils::toLower(word);
    return std::any_of(std::begin(kOrdinals), std::end(kOrdinals), [&lower](const char* o) { return lower == o; });
}

} // namespace argtree::validation
