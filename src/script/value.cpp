// AEGIS - Extension Language Values Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/script/value.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace aegis {
namespace script {

// ============================================================================
// Value Types
// ============================================================================

const char* ValueTypeToString(ValueType type) {
    switch (type) {
        case ValueType::Undefined: return "undefined";
        case ValueType::Boolean: return "boolean";
        case ValueType::Integer: return "integer";
        case ValueType::Real: return "real";
        case ValueType::String: return "string";
        case ValueType::Symbol: return "symbol";
        case ValueType::List: return "list";
        case ValueType::Procedure: return "procedure";
    }
    return "unknown";
}

// ============================================================================
// Construction and Access
// ============================================================================

Value Value::FromBool(bool b) {
    Value v;
    v.data_ = b;
    return v;
}

Value Value::FromInt(int64_t n) {
    Value v;
    v.data_ = n;
    return v;
}

Value Value::FromReal(double d) {
    Value v;
    v.data_ = d;
    return v;
}

Value Value::FromString(std::string s) {
    Value v;
    v.data_ = std::move(s);
    return v;
}

Value Value::FromSymbol(std::string name) {
    Value v;
    v.data_ = Symbol{std::move(name)};
    return v;
}

Value Value::FromList(ValueList items) {
    Value v;
    v.data_ = std::make_shared<const ValueList>(std::move(items));
    return v;
}

Value Value::FromProcedure(ProcedurePtr proc) {
    Value v;
    v.data_ = std::move(proc);
    return v;
}

ValueType Value::Type() const {
    // Alternative order matches the variant declaration
    return static_cast<ValueType>(data_.index());
}

bool Value::IsSymbolNamed(const char* name) const {
    return IsSymbol() && AsSymbol() == name;
}

bool Value::AsBool() const { return std::get<bool>(data_); }
int64_t Value::AsInt() const { return std::get<int64_t>(data_); }
double Value::AsReal() const { return std::get<double>(data_); }
const std::string& Value::AsString() const { return std::get<std::string>(data_); }
const std::string& Value::AsSymbol() const { return std::get<Symbol>(data_).name; }
const ValueList& Value::AsList() const { return *std::get<ListPtr>(data_); }
const ProcedurePtr& Value::AsProcedure() const { return std::get<ProcedurePtr>(data_); }

double Value::AsNumber() const {
    return IsInt() ? static_cast<double>(AsInt()) : AsReal();
}

bool Value::IsTruthy() const {
    if (IsUndefined()) return false;
    if (IsBool()) return AsBool();
    return true;
}

// ============================================================================
// Printing
// ============================================================================

namespace {

std::string FormatReal(double d) {
    if (std::isnan(d)) return "+nan.0";
    if (std::isinf(d)) return d > 0 ? "+inf.0" : "-inf.0";

    std::ostringstream oss;
    oss << std::setprecision(15) << d;
    std::string out = oss.str();
    // Keep reals distinguishable from integers when printed
    if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::string QuoteString(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    out += '"';
    return out;
}

struct RenderState {
    bool display;
    size_t remaining;
    size_t rendered{0};
    bool truncated{false};
};

void Render(const Value& v, RenderState& st, std::string& out) {
    if (st.remaining == 0) {
        if (!st.truncated) {
            out += "...";
            st.truncated = true;
        }
        return;
    }
    --st.remaining;
    ++st.rendered;

    switch (v.Type()) {
        case ValueType::Undefined:
            out += "undefined";
            return;
        case ValueType::Boolean:
            out += v.AsBool() ? "#t" : "#f";
            return;
        case ValueType::Integer:
            out += std::to_string(v.AsInt());
            return;
        case ValueType::Real:
            out += FormatReal(v.AsReal());
            return;
        case ValueType::String:
            out += st.display ? v.AsString() : QuoteString(v.AsString());
            return;
        case ValueType::Symbol:
            out += v.AsSymbol();
            return;
        case ValueType::List: {
            out += '(';
            const ValueList& items = v.AsList();
            for (size_t i = 0; i < items.size() && !st.truncated; ++i) {
                if (i > 0) out += ' ';
                Render(items[i], st, out);
            }
            out += ')';
            return;
        }
        case ValueType::Procedure: {
            const ProcedurePtr& proc = v.AsProcedure();
            if (proc->kind == Procedure::Kind::Primitive) {
                out += "#<primitive " + proc->name + ">";
            } else {
                out += "#<lambda>";
            }
            return;
        }
    }
    out += '?';
}

std::string RenderBounded(const Value& v, bool display, size_t maxNodes, size_t* rendered) {
    RenderState st{display, maxNodes};
    std::string out;
    Render(v, st, out);
    if (rendered) *rendered = st.rendered;
    return out;
}

} // namespace

std::string Value::ToString() const {
    return RenderBounded(*this, false, std::numeric_limits<size_t>::max(), nullptr);
}

std::string Value::ToDisplayString() const {
    return RenderBounded(*this, true, std::numeric_limits<size_t>::max(), nullptr);
}

std::string Value::ToString(size_t maxNodes, size_t* rendered) const {
    return RenderBounded(*this, false, maxNodes, rendered);
}

std::string Value::ToDisplayString(size_t maxNodes, size_t* rendered) const {
    return RenderBounded(*this, true, maxNodes, rendered);
}

// ============================================================================
// Equality
// ============================================================================

bool Value::operator==(const Value& other) const {
    if (IsNumber() && other.IsNumber()) {
        if (IsInt() && other.IsInt()) {
            return AsInt() == other.AsInt();
        }
        return AsNumber() == other.AsNumber();
    }
    if (Type() != other.Type()) {
        return false;
    }

    switch (Type()) {
        case ValueType::Undefined: return true;
        case ValueType::Boolean: return AsBool() == other.AsBool();
        case ValueType::String: return AsString() == other.AsString();
        case ValueType::Symbol: return AsSymbol() == other.AsSymbol();
        case ValueType::List:
            return &AsList() == &other.AsList() || AsList() == other.AsList();
        case ValueType::Procedure: return AsProcedure() == other.AsProcedure();
        default: return false;
    }
}

std::optional<bool> Value::EqualsWithin(const Value& other, uint64_t& budget) const {
    if (budget == 0) {
        return std::nullopt;
    }
    --budget;

    if (!IsList() || !other.IsList()) {
        return *this == other;
    }

    const ValueList& a = AsList();
    const ValueList& b = other.AsList();
    if (&a == &b) return true;
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        std::optional<bool> eq = a[i].EqualsWithin(b[i], budget);
        if (!eq || !*eq) return eq;
    }
    return true;
}

} // namespace script
} // namespace aegis
