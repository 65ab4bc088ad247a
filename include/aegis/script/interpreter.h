// AEGIS - Extension Language Interpreter
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Evaluates extension-language programs. Update payloads run through this
// interpreter, so it is the boundary between accepted package code and the
// controller. The only capabilities exposed to programs are the primitives
// registered by RegisterBuiltins(); there is no host I/O.
//
// Scopes are frames in an arena owned by the interpreter and referenced by
// index (EnvId). Frame 0 is the global environment and lives as long as the
// interpreter, so definitions made by one program are visible to the next.

#ifndef AEGIS_SCRIPT_INTERPRETER_H
#define AEGIS_SCRIPT_INTERPRETER_H

#include "aegis/script/error.h"
#include "aegis/script/value.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace aegis {
namespace script {

// ============================================================================
// Limits and Results
// ============================================================================

/// Default evaluation step budget per top-level run
constexpr uint64_t DEFAULT_MAX_STEPS = 100000;

/// Default nesting limit for evaluation
constexpr size_t DEFAULT_MAX_DEPTH = 256;

/// Resource budget applied to each top-level run
struct InterpreterLimits {
    uint64_t maxSteps{DEFAULT_MAX_STEPS};
    size_t maxDepth{DEFAULT_MAX_DEPTH};
};

/// Outcome of running a program
struct ExecResult {
    bool success{false};
    ScriptError error{ScriptError::OK};
    std::string message;
    Value value;

    static ExecResult Success(Value v) {
        ExecResult r;
        r.success = true;
        r.value = std::move(v);
        return r;
    }

    static ExecResult Failure(ScriptError err, std::string msg) {
        ExecResult r;
        r.error = err;
        r.message = std::move(msg);
        return r;
    }
};

/// Receives text written by `display`
using OutputCallback = std::function<void(const std::string&)>;

// ============================================================================
// Interpreter
// ============================================================================

class Interpreter {
public:
    /// Global environment frame
    static constexpr EnvId GLOBAL_ENV = 0;

    explicit Interpreter(InterpreterLimits limits = InterpreterLimits{});

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    /**
     * Parse and evaluate every form of a program in the global environment.
     * The value of the last form is returned; an empty program yields
     * undefined. Definitions persist after the call, even on failure.
     */
    ExecResult Execute(const std::string& source);

    /// Evaluate an already-parsed form in the global environment
    ExecResult Evaluate(const Value& expr);

    // ========================================================================
    // Evaluation core (used by primitives)
    // ========================================================================

    /**
     * Evaluate expr in env.
     * @return false after recording an error via Fail()
     */
    bool Eval(const Value& expr, EnvId env, Value& out);

    /// Invoke a procedure value with already-evaluated arguments
    bool Apply(const Value& fn, const ValueList& args, Value& out);

    /// Record an error for the current run. Always returns false.
    bool Fail(ScriptError err, const std::string& detail = "");

    // ========================================================================
    // Environment
    // ========================================================================

    /// Bind a native primitive in the global environment
    void DefinePrimitive(const std::string& name, PrimitiveFn fn);

    /// Bind (or overwrite) a name in the given frame
    void Define(const std::string& name, Value value, EnvId env = GLOBAL_ENV);

    /// Resolve a name by walking the frame chain from env
    std::optional<Value> Lookup(const std::string& name, EnvId env = GLOBAL_ENV) const;

    /// True if name is a special form keyword
    static bool IsSpecialForm(const std::string& name);

    // ========================================================================
    // Output
    // ========================================================================

    /// Replace the `display` sink. An empty callback restores the default,
    /// which logs in the script category.
    void SetOutputCallback(OutputCallback callback);

    /// Write text through the output sink
    void Output(const std::string& text);

    // ========================================================================
    // Budget and Frames
    // ========================================================================

    void SetLimits(const InterpreterLimits& limits) { limits_ = limits; }
    const InterpreterLimits& GetLimits() const { return limits_; }

    /// Steps consumed by the current (or most recent) top-level run
    uint64_t StepsUsed() const { return steps_; }

    /// Steps left before the current run hits its budget
    uint64_t StepsRemaining() const {
        return steps_ >= limits_.maxSteps ? 0 : limits_.maxSteps - steps_;
    }

    /**
     * Charge structural work done by a primitive (comparing or rendering
     * nested lists) against the current run's budget.
     * @return false after recording STEP_LIMIT once the budget is exceeded
     */
    bool Charge(uint64_t units);

    /// Values rendered into an error message before it is cut short
    static constexpr size_t MAX_ERROR_RENDER_NODES = 32;

    /// Number of live frames, including the global frame
    size_t FrameCount() const;

    /**
     * Release frames unreachable from the global environment or roots.
     * Runs automatically after each top-level run, rooted at the run's
     * result; a closure held only by the host is not a root. Calling it
     * while a run is in progress does nothing.
     * @return Number of frames released
     */
    size_t CollectGarbage(const ValueList& roots = {});

    /// Error of the most recent failure
    ScriptError LastError() const { return lastError_; }

private:
    struct Frame {
        std::map<std::string, Value> vars;
        EnvId parent{GLOBAL_ENV};
        bool live{false};
        bool marked{false};
    };

    static constexpr EnvId NO_ENV = static_cast<EnvId>(-1);

    EnvId NewFrame(EnvId parent);
    EnvId FindOwner(const std::string& name, EnvId env) const;

    bool EvalList(const ValueList& form, EnvId env, Value& out);
    bool EvalSpecial(const std::string& keyword, const ValueList& form,
                     EnvId env, Value& out);

    /// Wrap a top-level run with budget reset and frame collection
    template <typename Fn>
    ExecResult Run(Fn&& body);

    void MarkValue(const Value& root, std::vector<EnvId>& work,
                   std::unordered_set<const void*>& seen);

    std::vector<Frame> frames_;
    std::vector<EnvId> freeFrames_;

    InterpreterLimits limits_;
    uint64_t steps_{0};
    size_t depth_{0};
    int activeRuns_{0};

    ScriptError lastError_{ScriptError::OK};
    std::string lastDetail_;

    OutputCallback output_;
};

/// Install the standard primitive set into the global environment
void RegisterBuiltins(Interpreter& interp);

} // namespace script
} // namespace aegis

#endif // AEGIS_SCRIPT_INTERPRETER_H
