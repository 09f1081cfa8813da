#include "argtree/error.hpp"

namespace argtree {

ErrorCategory categoryOf(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DuplicateName:
        case ErrorKind::MissingOptionName:
        case ErrorKind::MissingPrefix:
        case ErrorKind::CapacityExceeded:
            return ErrorCategory::Schema;
        case ErrorKind::CannotParseArgToValue:
        case ErrorKind::InvalidCharacter:
        case ErrorKind::Overflow:
            return ErrorCategory::Parse;
        case ErrorKind::InvalidValue:
            return ErrorCategory::Validation;
        case ErrorKind::ValueMaxed:
        case ErrorKind::ExpectedMoreValues:
        case ErrorKind::ExpectedSubCommand:
        case ErrorKind::TooManyValues:
        case ErrorKind::EmptyArgumentProvidedToOption:
        case ErrorKind::BoolCannotTakeArgument:
            return ErrorCategory::Arity;
        case ErrorKind::UnexpectedArgument:
        case ErrorKind::UnknownOption:
            return ErrorCategory::Classification;
    }
    return ErrorCategory::Classification;
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DuplicateName: return "DuplicateName";
        case ErrorKind::MissingOptionName: return "MissingOptionName";
        case ErrorKind::MissingPrefix: return "MissingPrefix";
        case ErrorKind::CapacityExceeded: return "CapacityExceeded";
        case ErrorKind::CannotParseArgToValue: return "CannotParseArgToValue";
        case ErrorKind::InvalidCharacter: return "InvalidCharacter";
        case ErrorKind::Overflow: return "Overflow";
        case ErrorKind::InvalidValue: return "InvalidValue";
        case ErrorKind::ValueMaxed: return "ValueMaxed";
        case ErrorKind::ExpectedMoreValues: return "ExpectedMoreValues";
        case ErrorKind::ExpectedSubCommand: return "ExpectedSubCommand";
        case ErrorKind::TooManyValues: return "TooManyValues";
        case ErrorKind::EmptyArgumentProvidedToOption: return "EmptyArgumentProvidedToOption";
        case ErrorKind::BoolCannotTakeArgument: return "BoolCannotTakeArgument";
        case ErrorKind::UnexpectedArgument: return "UnexpectedArgument";
        case ErrorKind::UnknownOption: return "UnknownOption";
    }
    return "Unknown";
}

const char* toString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Schema: return "SchemaError";
        case ErrorCategory::Parse: return "ParseError";
        case ErrorCategory::Validation: return "ValidationError";
        case ErrorCategory::Arity: return "ArityError";
        case ErrorCategory::Classification: return "ClassificationError";
    }
    return "Error";
}

std::ostream& operator<<(std::ostream& os, const Error& err) {
    return os << err.message;
}

} // namespace argtree
