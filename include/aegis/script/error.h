// AEGIS - Extension Language Error Codes
// Copyright (c) 2024 AEGIS Developers
// MIT License

#ifndef AEGIS_SCRIPT_ERROR_H
#define AEGIS_SCRIPT_ERROR_H

#include <string>

namespace aegis {
namespace script {

/// Error codes returned by parsing and evaluation
enum class ScriptError {
    OK = 0,

    // Syntax errors
    UNEXPECTED_EOF,
    UNEXPECTED_CLOSE,
    TRAILING_INPUT,
    UNTERMINATED_STRING,
    NESTING_TOO_DEEP,

    // Name resolution
    UNKNOWN_SYMBOL,
    UNDEFINED_VARIABLE,

    // Application and typing
    NOT_A_FUNCTION,
    MALFORMED_FORM,
    ARITY_MISMATCH,
    TYPE_ERROR,
    DIVISION_BY_ZERO,

    // Resource budget
    STEP_LIMIT,
    DEPTH_LIMIT,

    ERROR_COUNT
};

/// Stable identifier for an error code ("UnknownSymbol", "NotAFunction", ...)
const char* ScriptErrorName(ScriptError err);

/// Human-readable description of an error code
std::string ScriptErrorString(ScriptError err);

/// True for errors raised while reading source text
bool IsSyntaxError(ScriptError err);

} // namespace script
} // namespace aegis

#endif // AEGIS_SCRIPT_ERROR_H
