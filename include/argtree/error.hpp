#ifndef ARGTREE_ERROR_HPP
#define ARGTREE_ERROR_HPP

#include <ostream>
#include <string>
#include <utility>

namespace argtree {

enum class ErrorKind {
    // Schema (detected by Command::init)
    DuplicateName,
    MissingOptionName,
    MissingPrefix,
    CapacityExceeded,
    // Parse
    CannotParseArgToValue,
    InvalidCharacter,
    Overflow,
    // Validation
    InvalidValue,
    // Arity
    ValueMaxed,
    ExpectedMoreValues,
    ExpectedSubCommand,
    TooManyValues,
    EmptyArgumentProvidedToOption,
    BoolCannotTakeArgument,
    // Classification
    UnexpectedArgument,
    UnknownOption,
};

enum class ErrorCategory {
    Schema,
    Parse,
    Validation,
    Arity,
    Classification,
};

[[nodiscard]] ErrorCategory categoryOf(ErrorKind kind);
[[nodiscard]] const char* toString(ErrorKind kind);
[[nodiscard]] const char* toString(ErrorCategory category);

struct Error {
    ErrorKind kind{ErrorKind::UnexpectedArgument};
    std::string message;
    // Raw token (or delimited piece of one) that failed, if any.
    std::string token;
    // Name of the Command, Option or Value the failure belongs to.
    std::string argument;

    Error() = default;
    Error(ErrorKind k, std::string msg, std::string tok = {}, std::string arg = {})
        : kind(k),
          message(std::move(msg)),
          token(std::move(tok)),
          argument(std::move(arg)) {}

    [[nodiscard]] ErrorCategory category() const { return categoryOf(kind); }
};

std::ostream& operator<<(std::ostream& os, const Error& err);

} // namespace argtree

#endif // ARGTREE_ERROR_HPP
