// AEGIS - Extension Language Primitives
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// The complete capability surface visible to extension programs. Nothing
// here touches the host: no files, sockets or controller state.

#include "aegis/script/interpreter.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace aegis {
namespace script {

namespace {

// ============================================================================
// Argument Checks
// ============================================================================

bool ExpectArity(Interpreter& in, const char* name, const ValueList& args, size_t n) {
    if (args.size() != n) {
        return in.Fail(ScriptError::ARITY_MISMATCH,
                       std::string(name) + " expects " + std::to_string(n) +
                       " argument" + (n == 1 ? "" : "s") + ", got " +
                       std::to_string(args.size()));
    }
    return true;
}

bool ExpectNumbers(Interpreter& in, const char* name, const ValueList& args) {
    for (const Value& arg : args) {
        if (!arg.IsNumber()) {
            return in.Fail(ScriptError::TYPE_ERROR,
                           std::string(name) + " expects numbers, got " +
                           arg.ToString(Interpreter::MAX_ERROR_RENDER_NODES));
        }
    }
    return true;
}

bool ExpectList(Interpreter& in, const char* name, const Value& arg) {
    if (!arg.IsList()) {
        return in.Fail(ScriptError::TYPE_ERROR,
                       std::string(name) + " expects a list, got " +
                       arg.ToString(Interpreter::MAX_ERROR_RENDER_NODES));
    }
    return true;
}

// ============================================================================
// Structural Work
// ============================================================================

// Nested values compared or rendered beyond the outermost one cost a step
// each. The allowance runs one past the remaining budget so that running
// out is reported by Charge.

bool ChargedEqual(Interpreter& in, const Value& a, const Value& b, bool& equal) {
    const uint64_t allowance = in.StepsRemaining() + 2;
    uint64_t budget = allowance;
    std::optional<bool> eq = a.EqualsWithin(b, budget);
    if (!in.Charge(allowance - budget - 1)) return false;
    equal = eq.value_or(false);
    return true;
}

bool ChargedDisplay(Interpreter& in, const Value& v, std::string& text) {
    size_t rendered = 0;
    std::string part = v.ToDisplayString(in.StepsRemaining() + 2, &rendered);
    if (!in.Charge(rendered - 1)) return false;
    text += part;
    return true;
}

// ============================================================================
// Arithmetic
// ============================================================================

// Integer arithmetic that overflows falls back to reals

Value Add(const Value& a, const Value& b) {
    int64_t r;
    if (a.IsInt() && b.IsInt() && !__builtin_add_overflow(a.AsInt(), b.AsInt(), &r)) {
        return Value::FromInt(r);
    }
    return Value::FromReal(a.AsNumber() + b.AsNumber());
}

Value Sub(const Value& a, const Value& b) {
    int64_t r;
    if (a.IsInt() && b.IsInt() && !__builtin_sub_overflow(a.AsInt(), b.AsInt(), &r)) {
        return Value::FromInt(r);
    }
    return Value::FromReal(a.AsNumber() - b.AsNumber());
}

Value Mul(const Value& a, const Value& b) {
    int64_t r;
    if (a.IsInt() && b.IsInt() && !__builtin_mul_overflow(a.AsInt(), b.AsInt(), &r)) {
        return Value::FromInt(r);
    }
    return Value::FromReal(a.AsNumber() * b.AsNumber());
}

bool Div(Interpreter& in, const Value& a, const Value& b, Value& out) {
    if (b.AsNumber() == 0.0) {
        return in.Fail(ScriptError::DIVISION_BY_ZERO, a.ToString() + " / " + b.ToString());
    }
    if (a.IsInt() && b.IsInt()) {
        int64_t x = a.AsInt();
        int64_t y = b.AsInt();
        bool overflow = x == std::numeric_limits<int64_t>::min() && y == -1;
        if (!overflow && x % y == 0) {
            out = Value::FromInt(x / y);
            return true;
        }
    }
    out = Value::FromReal(a.AsNumber() / b.AsNumber());
    return true;
}

bool Less(const Value& a, const Value& b) {
    if (a.IsInt() && b.IsInt()) {
        return a.AsInt() < b.AsInt();
    }
    return a.AsNumber() < b.AsNumber();
}

// ============================================================================
// Sequences
// ============================================================================

/// Shared body of map and filter: apply fn to each element of a list
template <typename Collect>
bool ForEachApplied(Interpreter& in, const char* name, const ValueList& args,
                    Collect&& collect) {
    if (!ExpectArity(in, name, args, 2)) return false;
    if (!args[0].IsProcedure()) {
        return in.Fail(ScriptError::NOT_A_FUNCTION,
                       std::string(name) + ": " +
                       args[0].ToString(Interpreter::MAX_ERROR_RENDER_NODES));
    }
    if (!ExpectList(in, name, args[1])) return false;

    for (const Value& item : args[1].AsList()) {
        Value applied;
        if (!in.Apply(args[0], {item}, applied)) {
            return false;
        }
        collect(item, applied);
    }
    return true;
}

} // namespace

// ============================================================================
// Registration
// ============================================================================

void RegisterBuiltins(Interpreter& interp) {
    interp.DefinePrimitive("+", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectNumbers(in, "+", args)) return false;
        Value acc = Value::FromInt(0);
        for (const Value& arg : args) acc = Add(acc, arg);
        out = acc;
        return true;
    });

    interp.DefinePrimitive("*", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectNumbers(in, "*", args)) return false;
        Value acc = Value::FromInt(1);
        for (const Value& arg : args) acc = Mul(acc, arg);
        out = acc;
        return true;
    });

    interp.DefinePrimitive("-", [](Interpreter& in, const ValueList& args, Value& out) {
        if (args.empty()) {
            return in.Fail(ScriptError::ARITY_MISMATCH, "- expects at least 1 argument");
        }
        if (!ExpectNumbers(in, "-", args)) return false;
        if (args.size() == 1) {
            out = Sub(Value::FromInt(0), args[0]);
            return true;
        }
        Value acc = args[0];
        for (size_t i = 1; i < args.size(); ++i) acc = Sub(acc, args[i]);
        out = acc;
        return true;
    });

    interp.DefinePrimitive("/", [](Interpreter& in, const ValueList& args, Value& out) {
        if (args.empty()) {
            return in.Fail(ScriptError::ARITY_MISMATCH, "/ expects at least 1 argument");
        }
        if (!ExpectNumbers(in, "/", args)) return false;
        if (args.size() == 1) {
            return Div(in, Value::FromInt(1), args[0], out);
        }
        Value acc = args[0];
        for (size_t i = 1; i < args.size(); ++i) {
            Value next;
            if (!Div(in, acc, args[i], next)) return false;
            acc = next;
        }
        out = acc;
        return true;
    });

    // Comparisons are binary. `=` also compares non-numeric values
    // structurally so that strings and symbols can be matched.
    interp.DefinePrimitive("=", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectArity(in, "=", args, 2)) return false;
        bool equal = false;
        if (!ChargedEqual(in, args[0], args[1], equal)) return false;
        out = Value::FromBool(equal);
        return true;
    });

    interp.DefinePrimitive("<", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectArity(in, "<", args, 2) || !ExpectNumbers(in, "<", args)) return false;
        out = Value::FromBool(Less(args[0], args[1]));
        return true;
    });

    interp.DefinePrimitive(">", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectArity(in, ">", args, 2) || !ExpectNumbers(in, ">", args)) return false;
        out = Value::FromBool(Less(args[1], args[0]));
        return true;
    });

    interp.DefinePrimitive("list", [](Interpreter&, const ValueList& args, Value& out) {
        out = Value::FromList(args);
        return true;
    });

    interp.DefinePrimitive("car", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectArity(in, "car", args, 1) || !ExpectList(in, "car", args[0])) return false;
        if (args[0].IsNil()) {
            return in.Fail(ScriptError::TYPE_ERROR, "car of empty list");
        }
        out = args[0].AsList().front();
        return true;
    });

    interp.DefinePrimitive("cdr", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectArity(in, "cdr", args, 1) || !ExpectList(in, "cdr", args[0])) return false;
        if (args[0].IsNil()) {
            return in.Fail(ScriptError::TYPE_ERROR, "cdr of empty list");
        }
        const ValueList& items = args[0].AsList();
        out = Value::FromList(ValueList(items.begin() + 1, items.end()));
        return true;
    });

    interp.DefinePrimitive("cons", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectArity(in, "cons", args, 2) || !ExpectList(in, "cons", args[1])) return false;
        ValueList items;
        items.reserve(args[1].AsList().size() + 1);
        items.push_back(args[0]);
        for (const Value& item : args[1].AsList()) items.push_back(item);
        out = Value::FromList(std::move(items));
        return true;
    });

    interp.DefinePrimitive("null?", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectArity(in, "null?", args, 1)) return false;
        out = Value::FromBool(args[0].IsNil());
        return true;
    });

    interp.DefinePrimitive("filter", [](Interpreter& in, const ValueList& args, Value& out) {
        ValueList kept;
        bool ok = ForEachApplied(in, "filter", args,
            [&](const Value& item, const Value& verdict) {
                if (verdict.IsTruthy()) kept.push_back(item);
            });
        if (ok) out = Value::FromList(std::move(kept));
        return ok;
    });

    interp.DefinePrimitive("map", [](Interpreter& in, const ValueList& args, Value& out) {
        ValueList mapped;
        bool ok = ForEachApplied(in, "map", args,
            [&](const Value&, const Value& result) {
                mapped.push_back(result);
            });
        if (ok) out = Value::FromList(std::move(mapped));
        return ok;
    });

    // (assoc key alist): first entry whose head equals key, else #f
    interp.DefinePrimitive("assoc", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectArity(in, "assoc", args, 2) || !ExpectList(in, "assoc", args[1])) return false;
        for (const Value& entry : args[1].AsList()) {
            if (!entry.IsList() || entry.IsNil()) continue;
            bool equal = false;
            if (!ChargedEqual(in, entry.AsList().front(), args[0], equal)) return false;
            if (equal) {
                out = entry;
                return true;
            }
        }
        out = Value::FromBool(false);
        return true;
    });

    interp.DefinePrimitive("display", [](Interpreter& in, const ValueList& args, Value& out) {
        std::string text;
        for (size_t i = 0; i < args.size(); ++i) {
            if (i > 0) text += ' ';
            if (!ChargedDisplay(in, args[i], text)) return false;
        }
        in.Output(text);
        out = Value();
        return true;
    });

    interp.DefinePrimitive("eval", [](Interpreter& in, const ValueList& args, Value& out) {
        if (!ExpectArity(in, "eval", args, 1)) return false;
        return in.Eval(args[0], Interpreter::GLOBAL_ENV, out);
    });
}

} // namespace script
} // namespace aegis
