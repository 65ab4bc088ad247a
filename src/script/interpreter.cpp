// AEGIS - Extension Language Interpreter Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/script/interpreter.h"
#include "aegis/script/parser.h"
#include "aegis/util/logging.h"

namespace aegis {
namespace script {

// ============================================================================
// Helper Functions
// ============================================================================

const char* ScriptErrorName(ScriptError err) {
    switch (err) {
        case ScriptError::OK: return "OK";
        case ScriptError::UNEXPECTED_EOF:
        case ScriptError::UNEXPECTED_CLOSE:
        case ScriptError::TRAILING_INPUT:
        case ScriptError::UNTERMINATED_STRING:
        case ScriptError::NESTING_TOO_DEEP: return "SyntaxError";
        case ScriptError::UNKNOWN_SYMBOL: return "UnknownSymbol";
        case ScriptError::UNDEFINED_VARIABLE: return "UndefinedVariable";
        case ScriptError::NOT_A_FUNCTION: return "NotAFunction";
        case ScriptError::MALFORMED_FORM: return "MalformedForm";
        case ScriptError::ARITY_MISMATCH: return "ArityMismatch";
        case ScriptError::TYPE_ERROR: return "TypeError";
        case ScriptError::DIVISION_BY_ZERO: return "DivisionByZero";
        case ScriptError::STEP_LIMIT: return "StepLimitExceeded";
        case ScriptError::DEPTH_LIMIT: return "DepthLimitExceeded";
        default: return "Unknown";
    }
}

std::string ScriptErrorString(ScriptError err) {
    switch (err) {
        case ScriptError::OK: return "No error";
        case ScriptError::UNEXPECTED_EOF: return "Syntax error: unexpected end of input";
        case ScriptError::UNEXPECTED_CLOSE: return "Syntax error: unexpected ')'";
        case ScriptError::TRAILING_INPUT: return "Syntax error: trailing input after expression";
        case ScriptError::UNTERMINATED_STRING: return "Syntax error: unterminated string literal";
        case ScriptError::NESTING_TOO_DEEP: return "Syntax error: nesting too deep";
        case ScriptError::UNKNOWN_SYMBOL: return "Unknown symbol";
        case ScriptError::UNDEFINED_VARIABLE: return "Undefined variable";
        case ScriptError::NOT_A_FUNCTION: return "Not a function";
        case ScriptError::MALFORMED_FORM: return "Malformed special form";
        case ScriptError::ARITY_MISMATCH: return "Wrong number of arguments";
        case ScriptError::TYPE_ERROR: return "Type error";
        case ScriptError::DIVISION_BY_ZERO: return "Division by zero";
        case ScriptError::STEP_LIMIT: return "Execution step limit exceeded";
        case ScriptError::DEPTH_LIMIT: return "Evaluation depth limit exceeded";
        default: return "Unknown error";
    }
}

bool IsSyntaxError(ScriptError err) {
    return err == ScriptError::UNEXPECTED_EOF ||
           err == ScriptError::UNEXPECTED_CLOSE ||
           err == ScriptError::TRAILING_INPUT ||
           err == ScriptError::UNTERMINATED_STRING ||
           err == ScriptError::NESTING_TOO_DEEP;
}

namespace {

std::string FormatFailure(ScriptError err, const std::string& detail) {
    if (detail.empty()) {
        return ScriptErrorString(err);
    }
    if (IsSyntaxError(err)) {
        return "Syntax error: " + detail;
    }
    return ScriptErrorString(err) + ": " + detail;
}

const char* const SPECIAL_FORMS[] = {
    "quote", "if", "define", "set!", "lambda", "begin"
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

Interpreter::Interpreter(InterpreterLimits limits) : limits_(limits) {
    Frame global;
    global.live = true;
    frames_.push_back(std::move(global));
    RegisterBuiltins(*this);
}

// ============================================================================
// Top-level Runs
// ============================================================================

template <typename Fn>
ExecResult Interpreter::Run(Fn&& body) {
    // Nested runs (a host callback re-entering the interpreter) share the
    // outer run's budget
    if (activeRuns_ == 0) {
        steps_ = 0;
        depth_ = 0;
    }
    ++activeRuns_;
    lastError_ = ScriptError::OK;
    lastDetail_.clear();

    Value result;
    bool ok = body(result);
    --activeRuns_;

    ExecResult r = ok ? ExecResult::Success(result)
                      : ExecResult::Failure(lastError_, FormatFailure(lastError_, lastDetail_));

    if (activeRuns_ == 0) {
        size_t released = CollectGarbage({result});
        if (released > 0) {
            LOG_TRACE(util::LogCategory::SCRIPT) << "Released " << released << " frames";
        }
    }
    return r;
}

ExecResult Interpreter::Execute(const std::string& source) {
    ValueList forms;
    ScriptError err = ScriptError::OK;
    std::string detail;
    if (!ParseProgram(source, forms, &err, &detail)) {
        lastError_ = err;
        lastDetail_ = detail;
        LOG_DEBUG(util::LogCategory::SCRIPT) << "Parse failed: " << detail;
        return ExecResult::Failure(err, FormatFailure(err, detail));
    }

    return Run([&](Value& result) {
        for (const Value& form : forms) {
            if (!Eval(form, GLOBAL_ENV, result)) {
                return false;
            }
        }
        return true;
    });
}

ExecResult Interpreter::Evaluate(const Value& expr) {
    return Run([&](Value& result) {
        return Eval(expr, GLOBAL_ENV, result);
    });
}

// ============================================================================
// Evaluation
// ============================================================================

bool Interpreter::Fail(ScriptError err, const std::string& detail) {
    lastError_ = err;
    lastDetail_ = detail;
    LOG_DEBUG(util::LogCategory::SCRIPT) << ScriptErrorName(err) << ": " << detail;
    return false;
}

bool Interpreter::Charge(uint64_t units) {
    steps_ += units;
    if (steps_ > limits_.maxSteps) {
        return Fail(ScriptError::STEP_LIMIT,
                    "budget of " + std::to_string(limits_.maxSteps) + " steps");
    }
    return true;
}

bool Interpreter::Eval(const Value& expr, EnvId env, Value& out) {
    if (!Charge(1)) {
        return false;
    }

    switch (expr.Type()) {
        case ValueType::Symbol: {
            auto value = Lookup(expr.AsSymbol(), env);
            if (!value) {
                return Fail(ScriptError::UNKNOWN_SYMBOL, expr.AsSymbol());
            }
            out = std::move(*value);
            return true;
        }

        case ValueType::List: {
            if (depth_ >= limits_.maxDepth) {
                return Fail(ScriptError::DEPTH_LIMIT,
                            "nesting beyond " + std::to_string(limits_.maxDepth));
            }
            ++depth_;
            bool ok = EvalList(expr.AsList(), env, out);
            --depth_;
            return ok;
        }

        default:
            // Self-evaluating
            out = expr;
            return true;
    }
}

bool Interpreter::EvalList(const ValueList& form, EnvId env, Value& out) {
    if (form.empty()) {
        out = Value::Nil();
        return true;
    }

    const Value& head = form[0];
    if (head.IsSymbol() && IsSpecialForm(head.AsSymbol())) {
        return EvalSpecial(head.AsSymbol(), form, env, out);
    }

    Value fn;
    if (!Eval(head, env, fn)) {
        return false;
    }

    ValueList args;
    args.reserve(form.size() - 1);
    for (size_t i = 1; i < form.size(); ++i) {
        Value arg;
        if (!Eval(form[i], env, arg)) {
            return false;
        }
        args.push_back(std::move(arg));
    }

    if (!fn.IsProcedure()) {
        return Fail(ScriptError::NOT_A_FUNCTION, head.ToString(MAX_ERROR_RENDER_NODES));
    }
    return Apply(fn, args, out);
}

bool Interpreter::EvalSpecial(const std::string& keyword, const ValueList& form,
                              EnvId env, Value& out) {
    auto Malformed = [&](const std::string& why) {
        return Fail(ScriptError::MALFORMED_FORM, keyword + ": " + why);
    };

    if (keyword == "quote") {
        if (form.size() != 2) return Malformed("expects 1 operand");
        out = form[1];
        return true;
    }

    if (keyword == "if") {
        if (form.size() != 3 && form.size() != 4) {
            return Malformed("expects a condition and 1 or 2 branches");
        }
        Value cond;
        if (!Eval(form[1], env, cond)) return false;
        if (cond.IsTruthy()) {
            return Eval(form[2], env, out);
        }
        if (form.size() == 4) {
            return Eval(form[3], env, out);
        }
        out = Value();
        return true;
    }

    if (keyword == "define" || keyword == "set!") {
        if (form.size() != 3 || !form[1].IsSymbol()) {
            return Malformed("expects a symbol and a value");
        }
        const std::string& name = form[1].AsSymbol();
        if (IsSpecialForm(name)) {
            return Malformed("cannot rebind keyword " + name);
        }

        EnvId target = env;
        if (keyword == "set!") {
            target = FindOwner(name, env);
            if (target == NO_ENV) {
                return Fail(ScriptError::UNDEFINED_VARIABLE, name);
            }
        }

        Value value;
        if (!Eval(form[2], env, value)) return false;
        // Frame storage may have moved during evaluation; index afresh
        frames_[target].vars[name] = value;
        out = std::move(value);
        return true;
    }

    if (keyword == "lambda") {
        if (form.size() < 3 || !form[1].IsList()) {
            return Malformed("expects a parameter list and a body");
        }
        auto proc = std::make_shared<Procedure>();
        proc->kind = Procedure::Kind::Lambda;
        for (const Value& param : form[1].AsList()) {
            if (!param.IsSymbol()) {
                return Malformed("parameter is not a symbol: " +
                                 param.ToString(MAX_ERROR_RENDER_NODES));
            }
            proc->params.push_back(param.AsSymbol());
        }
        // Single-expression body; further forms are ignored
        proc->body = form[2];
        proc->env = env;
        out = Value::FromProcedure(std::move(proc));
        return true;
    }

    if (keyword == "begin") {
        out = Value();
        for (size_t i = 1; i < form.size(); ++i) {
            Value v;
            if (!Eval(form[i], env, v)) return false;
            out = std::move(v);
        }
        return true;
    }

    return Malformed("unknown keyword");
}

bool Interpreter::Apply(const Value& fn, const ValueList& args, Value& out) {
    if (!fn.IsProcedure()) {
        return Fail(ScriptError::NOT_A_FUNCTION, fn.ToString(MAX_ERROR_RENDER_NODES));
    }

    // Keep the procedure alive even if a call rebinds its name
    ProcedurePtr proc = fn.AsProcedure();
    if (proc->kind == Procedure::Kind::Primitive) {
        return proc->primitive(*this, args, out);
    }

    EnvId frame = NewFrame(proc->env);
    for (size_t i = 0; i < proc->params.size(); ++i) {
        frames_[frame].vars[proc->params[i]] = i < args.size() ? args[i] : Value();
    }
    return Eval(proc->body, frame, out);
}

// ============================================================================
// Environment
// ============================================================================

bool Interpreter::IsSpecialForm(const std::string& name) {
    for (const char* keyword : SPECIAL_FORMS) {
        if (name == keyword) return true;
    }
    return false;
}

void Interpreter::DefinePrimitive(const std::string& name, PrimitiveFn fn) {
    auto proc = std::make_shared<Procedure>();
    proc->kind = Procedure::Kind::Primitive;
    proc->name = name;
    proc->primitive = std::move(fn);
    Define(name, Value::FromProcedure(std::move(proc)), GLOBAL_ENV);
}

void Interpreter::Define(const std::string& name, Value value, EnvId env) {
    frames_.at(env).vars[name] = std::move(value);
}

std::optional<Value> Interpreter::Lookup(const std::string& name, EnvId env) const {
    EnvId owner = FindOwner(name, env);
    if (owner == NO_ENV) {
        return std::nullopt;
    }
    return frames_[owner].vars.at(name);
}

EnvId Interpreter::FindOwner(const std::string& name, EnvId env) const {
    EnvId current = env;
    while (current < frames_.size() && frames_[current].live) {
        const Frame& frame = frames_[current];
        if (frame.vars.count(name)) {
            return current;
        }
        if (current == GLOBAL_ENV) {
            break;
        }
        current = frame.parent;
    }
    return NO_ENV;
}

EnvId Interpreter::NewFrame(EnvId parent) {
    EnvId id;
    if (!freeFrames_.empty()) {
        id = freeFrames_.back();
        freeFrames_.pop_back();
    } else {
        id = frames_.size();
        frames_.emplace_back();
    }
    Frame& frame = frames_[id];
    frame.vars.clear();
    frame.parent = parent;
    frame.live = true;
    frame.marked = false;
    return id;
}

// ============================================================================
// Output
// ============================================================================

void Interpreter::SetOutputCallback(OutputCallback callback) {
    output_ = std::move(callback);
}

void Interpreter::Output(const std::string& text) {
    if (output_) {
        output_(text);
        return;
    }
    LOG_INFO(util::LogCategory::SCRIPT) << text;
}

// ============================================================================
// Frame Collection
// ============================================================================

size_t Interpreter::FrameCount() const {
    size_t count = 0;
    for (const Frame& frame : frames_) {
        if (frame.live) ++count;
    }
    return count;
}

void Interpreter::MarkValue(const Value& root, std::vector<EnvId>& work,
                            std::unordered_set<const void*>& seen) {
    // Lists and closures may be shared many times over; walk each once
    std::vector<const Value*> pending{&root};
    while (!pending.empty()) {
        const Value* v = pending.back();
        pending.pop_back();
        if (v->IsList()) {
            const ValueList& items = v->AsList();
            if (!seen.insert(&items).second) continue;
            for (const Value& item : items) {
                pending.push_back(&item);
            }
        } else if (v->IsProcedure()) {
            const ProcedurePtr& proc = v->AsProcedure();
            if (proc->kind != Procedure::Kind::Lambda || !seen.insert(proc.get()).second) {
                continue;
            }
            work.push_back(proc->env);
            pending.push_back(&proc->body);
        }
    }
}

size_t Interpreter::CollectGarbage(const ValueList& roots) {
    if (activeRuns_ > 0) {
        return 0;
    }

    for (Frame& frame : frames_) {
        frame.marked = false;
    }

    std::vector<EnvId> work{GLOBAL_ENV};
    std::unordered_set<const void*> seen;
    for (const Value& root : roots) {
        MarkValue(root, work, seen);
    }

    while (!work.empty()) {
        EnvId id = work.back();
        work.pop_back();
        if (id >= frames_.size() || !frames_[id].live || frames_[id].marked) {
            continue;
        }
        frames_[id].marked = true;
        if (id != GLOBAL_ENV) {
            work.push_back(frames_[id].parent);
        }
        for (const auto& [name, value] : frames_[id].vars) {
            MarkValue(value, work, seen);
        }
    }

    size_t released = 0;
    for (EnvId id = GLOBAL_ENV + 1; id < frames_.size(); ++id) {
        Frame& frame = frames_[id];
        if (frame.live && !frame.marked) {
            frame.live = false;
            frame.vars.clear();
            freeFrames_.push_back(id);
            ++released;
        }
    }
    return released;
}

} // namespace script
} // namespace aegis
