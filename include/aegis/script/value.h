// AEGIS - Extension Language Values
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Every datum the extension language manipulates (source forms as well as
// runtime results) is a Value: a tagged union over undefined, booleans,
// integers, reals, strings, symbols, lists and procedures. Lists are
// immutable and shared, so copying a Value is cheap.

#ifndef AEGIS_SCRIPT_VALUE_H
#define AEGIS_SCRIPT_VALUE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace aegis {
namespace script {

class Interpreter;
class Value;
struct Procedure;

/// Index of an environment frame inside an Interpreter
using EnvId = size_t;

using ValueList = std::vector<Value>;
using ProcedurePtr = std::shared_ptr<const Procedure>;

/// Native implementation of a primitive. Returns false after reporting an
/// error through Interpreter::Fail.
using PrimitiveFn = std::function<bool(Interpreter&, const ValueList& args, Value& result)>;

// ============================================================================
// Value Types
// ============================================================================

enum class ValueType {
    Undefined,
    Boolean,
    Integer,
    Real,
    String,
    Symbol,
    List,
    Procedure
};

/// Convert value type to string
const char* ValueTypeToString(ValueType type);

// ============================================================================
// Value
// ============================================================================

class Value {
public:
    /// Default value is undefined
    Value() = default;

    static Value FromBool(bool b);
    static Value FromInt(int64_t n);
    static Value FromReal(double d);
    static Value FromString(std::string s);
    static Value FromSymbol(std::string name);
    static Value FromList(ValueList items);
    static Value FromProcedure(ProcedurePtr proc);

    /// The empty list
    static Value Nil() { return FromList({}); }

    ValueType Type() const;

    bool IsUndefined() const { return Type() == ValueType::Undefined; }
    bool IsBool() const { return Type() == ValueType::Boolean; }
    bool IsInt() const { return Type() == ValueType::Integer; }
    bool IsReal() const { return Type() == ValueType::Real; }
    bool IsNumber() const { return IsInt() || IsReal(); }
    bool IsString() const { return Type() == ValueType::String; }
    bool IsSymbol() const { return Type() == ValueType::Symbol; }
    bool IsList() const { return Type() == ValueType::List; }
    bool IsProcedure() const { return Type() == ValueType::Procedure; }

    /// True for the empty list
    bool IsNil() const { return IsList() && AsList().empty(); }

    /// Test whether this value is the given symbol
    bool IsSymbolNamed(const char* name) const;

    // Accessors; calling the wrong one is a programming error (std::bad_variant_access)
    bool AsBool() const;
    int64_t AsInt() const;
    double AsReal() const;
    const std::string& AsString() const;
    const std::string& AsSymbol() const;
    const ValueList& AsList() const;
    const ProcedurePtr& AsProcedure() const;

    /// Numeric value of an integer or real
    double AsNumber() const;

    /// Conditional truth: everything except #f and undefined
    bool IsTruthy() const;

    /// Printed representation; strings are quoted and escaped
    std::string ToString() const;

    /// Representation used by `display`; strings are written raw
    std::string ToDisplayString() const;

    /// As above, but rendering stops with "..." once maxNodes values have
    /// been written. If rendered is non-null it receives that count.
    std::string ToString(size_t maxNodes, size_t* rendered = nullptr) const;
    std::string ToDisplayString(size_t maxNodes, size_t* rendered = nullptr) const;

    /// Structural equality. Numbers compare by value across integer and
    /// real, procedures by identity.
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    /// Structural equality that compares at most `budget` pairs of values,
    /// decrementing it as it goes. Lists sharing storage are equal without
    /// further work. Returns nullopt if the budget runs out first.
    std::optional<bool> EqualsWithin(const Value& other, uint64_t& budget) const;

private:
    struct Undefined {};
    struct Symbol { std::string name; };
    using ListPtr = std::shared_ptr<const ValueList>;

    std::variant<Undefined, bool, int64_t, double, std::string, Symbol,
                 ListPtr, ProcedurePtr> data_;
};

// ============================================================================
// Procedure
// ============================================================================

/// A callable: either a native primitive or a closure created by `lambda`
struct Procedure {
    enum class Kind { Primitive, Lambda };

    Kind kind{Kind::Primitive};

    /// Primitive name; empty for lambdas
    std::string name;

    /// Primitive implementation
    PrimitiveFn primitive;

    /// Lambda parameter names, bound positionally
    std::vector<std::string> params;

    /// Lambda body (a single expression)
    Value body;

    /// Frame captured when the lambda was created
    EnvId env{0};
};

} // namespace script
} // namespace aegis

#endif // AEGIS_SCRIPT_VALUE_H
