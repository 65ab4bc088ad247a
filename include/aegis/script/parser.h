// AEGIS - Extension Language Reader
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Converts source text into Values. The reader tokenizes the input into a
// flat stream and builds forms with recursive descent.

#ifndef AEGIS_SCRIPT_PARSER_H
#define AEGIS_SCRIPT_PARSER_H

#include "aegis/script/error.h"
#include "aegis/script/value.h"

#include <cstddef>
#include <string>
#include <vector>

namespace aegis {
namespace script {

/// Maximum list nesting accepted by the reader
constexpr size_t MAX_PARSE_DEPTH = 512;

// ============================================================================
// Tokens
// ============================================================================

enum class TokenType {
    Open,       ///< (
    Close,      ///< )
    Quote,      ///< '
    String,     ///< "..." with escapes already resolved
    Atom        ///< number, boolean or symbol text
};

struct Token {
    TokenType type;
    std::string text;
    size_t offset{0};
};

/**
 * Split source text into tokens.
 * Whitespace separates tokens; `;` starts a comment running to end of line.
 * @param source Program text
 * @param tokens Output token stream
 * @param error Set to UNTERMINATED_STRING on failure
 * @return true on success
 */
bool Tokenize(const std::string& source, std::vector<Token>& tokens,
              ScriptError* error = nullptr);

/// Interpret a single atom token as an integer, real, boolean or symbol
Value ParseAtom(const std::string& text);

// ============================================================================
// Parser
// ============================================================================

/**
 * Read every top-level form in source.
 * @param source Program text
 * @param forms Output forms in source order
 * @param error Error code on failure
 * @param detail Human-readable failure detail
 * @return true on success
 */
bool ParseProgram(const std::string& source, ValueList& forms,
                  ScriptError* error = nullptr, std::string* detail = nullptr);

/**
 * Read exactly one form. Trailing input other than whitespace and comments
 * is a syntax error.
 */
bool ParseExpression(const std::string& source, Value& form,
                     ScriptError* error = nullptr, std::string* detail = nullptr);

} // namespace script
} // namespace aegis

#endif // AEGIS_SCRIPT_PARSER_H
