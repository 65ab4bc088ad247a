// AEGIS - Extension Language Reader Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/script/parser.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace aegis {
namespace script {

namespace {

bool IsDelimiter(char c) {
    return std::isspace(static_cast<unsigned char>(c)) ||
           c == '(' || c == ')' || c == '"' || c == ';' || c == '\'';
}

bool LooksNumeric(const std::string& text) {
    size_t i = 0;
    if (text[i] == '+' || text[i] == '-') {
        ++i;
    }
    if (i < text.size() && text[i] == '.') {
        ++i;
    }
    return i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]));
}

/// Recursive descent over a token stream
class Reader {
public:
    explicit Reader(const std::vector<Token>& tokens) : tokens_(tokens) {}

    bool AtEnd() const { return pos_ >= tokens_.size(); }

    bool Read(Value& out, size_t depth) {
        if (AtEnd()) {
            return Fail(ScriptError::UNEXPECTED_EOF, "unexpected end of input");
        }
        if (depth > MAX_PARSE_DEPTH) {
            return Fail(ScriptError::NESTING_TOO_DEEP, "nesting exceeds limit");
        }

        const Token& tok = tokens_[pos_++];
        switch (tok.type) {
            case TokenType::Open: {
                ValueList items;
                while (true) {
                    if (AtEnd()) {
                        return Fail(ScriptError::UNEXPECTED_EOF, "unterminated list");
                    }
                    if (tokens_[pos_].type == TokenType::Close) {
                        ++pos_;
                        break;
                    }
                    Value item;
                    if (!Read(item, depth + 1)) {
                        return false;
                    }
                    items.push_back(std::move(item));
                }
                out = Value::FromList(std::move(items));
                return true;
            }
            case TokenType::Close:
                return Fail(ScriptError::UNEXPECTED_CLOSE,
                            "unexpected ')' at offset " + std::to_string(tok.offset));
            case TokenType::Quote: {
                Value quoted;
                if (!Read(quoted, depth + 1)) {
                    return false;
                }
                out = Value::FromList({Value::FromSymbol("quote"), std::move(quoted)});
                return true;
            }
            case TokenType::String:
                out = Value::FromString(tok.text);
                return true;
            case TokenType::Atom:
                out = ParseAtom(tok.text);
                return true;
        }
        return Fail(ScriptError::UNEXPECTED_EOF, "unreadable token");
    }

    ScriptError error{ScriptError::OK};
    std::string detail;

private:
    bool Fail(ScriptError err, std::string msg) {
        error = err;
        detail = std::move(msg);
        return false;
    }

    const std::vector<Token>& tokens_;
    size_t pos_{0};
};

void Report(ScriptError err, const std::string& msg,
            ScriptError* error, std::string* detail) {
    if (error) *error = err;
    if (detail) *detail = msg;
}

} // namespace

// ============================================================================
// Tokenizer
// ============================================================================

bool Tokenize(const std::string& source, std::vector<Token>& tokens,
              ScriptError* error) {
    tokens.clear();
    size_t i = 0;
    const size_t n = source.size();

    while (i < n) {
        char c = source[i];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (c == ';') {
            while (i < n && source[i] != '\n') ++i;
            continue;
        }
        if (c == '(') {
            tokens.push_back({TokenType::Open, "(", i++});
            continue;
        }
        if (c == ')') {
            tokens.push_back({TokenType::Close, ")", i++});
            continue;
        }
        if (c == '\'') {
            tokens.push_back({TokenType::Quote, "'", i++});
            continue;
        }

        if (c == '"') {
            size_t start = i++;
            std::string text;
            bool closed = false;
            while (i < n) {
                char ch = source[i++];
                if (ch == '"') {
                    closed = true;
                    break;
                }
                if (ch == '\\' && i < n) {
                    char esc = source[i++];
                    switch (esc) {
                        case 'n': text += '\n'; break;
                        case 't': text += '\t'; break;
                        default: text += esc; break;
                    }
                    continue;
                }
                text += ch;
            }
            if (!closed) {
                if (error) *error = ScriptError::UNTERMINATED_STRING;
                return false;
            }
            tokens.push_back({TokenType::String, std::move(text), start});
            continue;
        }

        size_t start = i;
        while (i < n && !IsDelimiter(source[i])) ++i;
        tokens.push_back({TokenType::Atom, source.substr(start, i - start), start});
    }

    if (error) *error = ScriptError::OK;
    return true;
}

Value ParseAtom(const std::string& text) {
    if (text == "#t") return Value::FromBool(true);
    if (text == "#f") return Value::FromBool(false);

    if (!text.empty() && LooksNumeric(text)) {
        const char* begin = text.c_str();
        char* end = nullptr;

        errno = 0;
        long long n = std::strtoll(begin, &end, 10);
        if (*end == '\0' && errno != ERANGE) {
            return Value::FromInt(static_cast<int64_t>(n));
        }

        errno = 0;
        double d = std::strtod(begin, &end);
        if (*end == '\0') {
            return Value::FromReal(d);
        }
    }

    return Value::FromSymbol(text);
}

// ============================================================================
// Parser
// ============================================================================

bool ParseProgram(const std::string& source, ValueList& forms,
                  ScriptError* error, std::string* detail) {
    forms.clear();

    std::vector<Token> tokens;
    ScriptError tokErr = ScriptError::OK;
    if (!Tokenize(source, tokens, &tokErr)) {
        Report(tokErr, "unterminated string literal", error, detail);
        return false;
    }

    Reader reader(tokens);
    while (!reader.AtEnd()) {
        Value form;
        if (!reader.Read(form, 0)) {
            forms.clear();
            Report(reader.error, reader.detail, error, detail);
            return false;
        }
        forms.push_back(std::move(form));
    }

    Report(ScriptError::OK, "", error, detail);
    return true;
}

bool ParseExpression(const std::string& source, Value& form,
                     ScriptError* error, std::string* detail) {
    ValueList forms;
    if (!ParseProgram(source, forms, error, detail)) {
        return false;
    }
    if (forms.empty()) {
        Report(ScriptError::UNEXPECTED_EOF, "no expression", error, detail);
        return false;
    }
    if (forms.size() > 1) {
        Report(ScriptError::TRAILING_INPUT, std::to_string(forms.size() - 1) +
               " further form(s)", error, detail);
        return false;
    }
    form = std::move(forms.front());
    return true;
}

} // namespace script
} // namespace aegis
