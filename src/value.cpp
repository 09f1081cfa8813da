#include "argtree/value.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <string>
#include <system_error>

namespace argtree::detail {

namespace {

constexpr std::string_view kTrueWords[] = {"true", "t", "yes", "y", "1"};

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

Error invalidCharacter() { return Error(ErrorKind::InvalidCharacter, "invalid character"); }
Error overflow() { return Error(ErrorKind::Overflow, "value out of range"); }

// Strips the sign and, for base 0, a 0x/0o/0b prefix. Base 0 without a
// prefix is decimal.
std::optional<Error> parseMagnitude(std::string_view arg, int base, bool& negative, std::uint64_t& out) {
    std::string_view s = arg;
    negative = false;
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }

    int radix = base;
    if (base == 0) {
        radix = 10;
        if (s.size() > 2 && s[0] == '0') {
            switch (s[1]) {
                case 'x':
                case 'X': radix = 16; break;
                case 'o':
                case 'O': radix = 8; break;
                case 'b':
                case 'B': radix = 2; break;
                default: break;
            }
            if (radix != 10) s.remove_prefix(2);
        }
    }
    if (radix < 2 || radix > 36) return Error(ErrorKind::InvalidCharacter, "unsupported base " + std::to_string(base));
    if (s.empty()) return invalidCharacter();

    const char* first = s.data();
    const char* last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, out, radix);
    if (ec == std::errc::result_out_of_range) return overflow();
    if (ec != std::errc{} || ptr != last) return invalidCharacter();
    return std::nullopt;
}

template <typename F>
std::optional<Error> parseFloatWith(std::string_view arg, F&& convert) {
    if (arg.empty() || std::isspace(static_cast<unsigned char>(arg.front()))) return invalidCharacter();
    const std::string tmp(arg);
    char* end = nullptr;
    errno = 0;
    const auto result = convert(tmp.c_str(), &end);
    if (!end || static_cast<std::size_t>(end - tmp.c_str()) != tmp.size()) return invalidCharacter();
    // Underflow also sets ERANGE but yields a usable denormal or zero.
    if (errno == ERANGE && std::isinf(result)) return overflow();
    return std::nullopt;
}

} // namespace

std::optional<Error> parseBool(std::string_view arg, bool& out) {
    out = false;
    for (const auto word : kTrueWords) {
        if (equalsIgnoreCase(arg, word)) {
            out = true;
            break;
        }
    }
    return std::nullopt;
}

std::optional<Error> parseSigned(std::string_view arg,
                                 int base,
                                 std::int64_t min,
                                 std::int64_t max,
                                 std::int64_t& out) {
    bool negative = false;
    std::uint64_t magnitude = 0;
    if (auto err = parseMagnitude(arg, base, negative, magnitude)) return err;

    if (!negative) {
        if (magnitude > static_cast<std::uint64_t>(max)) return overflow();
        out = static_cast<std::int64_t>(magnitude);
        return std::nullopt;
    }
    // |min| as unsigned, computed without overflowing int64.
    const std::uint64_t bound = static_cast<std::uint64_t>(-(min + 1)) + 1;
    if (magnitude > bound) return overflow();
    out = magnitude == bound ? min : -static_cast<std::int64_t>(magnitude);
    return std::nullopt;
}

std::optional<Error> parseUnsigned(std::string_view arg, int base, std::uint64_t max, std::uint64_t& out) {
    bool negative = false;
    std::uint64_t magnitude = 0;
    if (auto err = parseMagnitude(arg, base, negative, magnitude)) return err;
    if (negative && magnitude != 0) return overflow();
    if (magnitude > max) return overflow();
    out = magnitude;
    return std::nullopt;
}

std::optional<Error> parseFloating(std::string_view arg, float& out) {
    return parseFloatWith(arg, [&out](const char* s, char** end) { return out = std::strtof(s, end); });
}

std::optional<Error> parseFloating(std::string_view arg, double& out) {
    return parseFloatWith(arg, [&out](const char* s, char** end) { return out = std::strtod(s, end); });
}

std::optional<Error> parseFloating(std::string_view arg, long double& out) {
    return parseFloatWith(arg, [&out](const char* s, char** end) { return out = std::strtold(s, end); });
}

std::optional<char> findDelim(std::string_view arg, std::string_view delims) {
    for (const char d : delims) {
        if (arg.find(d) != std::string_view::npos) return d;
    }
    return std::nullopt;
}

} // namespace argtree::detail
