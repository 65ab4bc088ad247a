// AEGIS - OTA Update Pipeline
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Every update package passes the same gates in a fixed order:
//
//   1. structure      - version, code, signature and keyId are present
//   2. authorization  - keyId names an authorized key
//   3. signature      - the signature over the code verifies under that key
//   4. anti-downgrade - the version is not below the controller version
//
// Packages that pass are routed by target. Self-updates are staged and run
// only on an explicit ApplyPendingUpdates(); contract updates run at once.
// No gate failure mutates any state.
//
// The anti-downgrade gate always compares against the controller's own
// version, including for contract-targeted packages.

#ifndef AEGIS_CONTROLLER_UPDATE_H
#define AEGIS_CONTROLLER_UPDATE_H

#include "aegis/controller/events.h"
#include "aegis/crypto/signature.h"
#include "aegis/registry/keys.h"
#include "aegis/script/interpreter.h"

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace aegis {
namespace controller {

/// Target of updates to the controller itself
constexpr const char* SELF_TARGET = "self";

/// Event target of contract updates without a contractId
constexpr const char* CONTRACT_TARGET = "contract";

/// Default bound on staged self-updates; 0 leaves the queue unbounded
constexpr size_t DEFAULT_MAX_PENDING_UPDATES = 0;

// ============================================================================
// Update Package
// ============================================================================

struct UpdatePackage {
    std::string version;
    std::string code;
    std::string signature;
    std::string keyId;
    std::string target;
    std::optional<std::string> contractId;

    bool IsSelfTargeted() const { return target == SELF_TARGET; }

    /// Target reported in events: "self", the contractId, the target, or "contract"
    std::string EventTarget() const;
};

// ============================================================================
// Results
// ============================================================================

enum class UpdateError {
    None,
    InvalidPackageFormat,
    UnauthorizedKey,
    InvalidSignature,
    VersionDowngradeRejected,
    NoPendingUpdates,
    ExecutionFailed
};

const char* UpdateErrorToString(UpdateError error);

enum class UpdateStatus {
    None,
    Staged,
    Success
};

const char* UpdateStatusToString(UpdateStatus status);

struct UpdateResult {
    bool success{false};
    UpdateError error{UpdateError::None};
    UpdateStatus status{UpdateStatus::None};

    /// Failure detail; the interpreter message for ExecutionFailed
    std::string message;

    static UpdateResult Success(UpdateStatus status) {
        UpdateResult r;
        r.success = true;
        r.status = status;
        return r;
    }

    static UpdateResult Failure(UpdateError err, std::string msg = "") {
        UpdateResult r;
        r.error = err;
        r.message = std::move(msg);
        return r;
    }
};

// ============================================================================
// Update Pipeline
// ============================================================================

class UpdatePipeline {
public:
    UpdatePipeline(const registry::AuthorizedKeyRegistry& keys,
                   const crypto::ISignatureVerifier& verifier,
                   script::Interpreter& interpreter,
                   EventBus& events,
                   std::string initialVersion,
                   size_t maxPendingUpdates = DEFAULT_MAX_PENDING_UPDATES);

    /// Run the gates and route an accepted package
    UpdateResult ProcessUpdate(const UpdatePackage& update);

    /**
     * Queue a self-update that has passed the gates. When a bound is set
     * and the queue is full, the oldest entry is dropped. Emits
     * update-staged.
     */
    UpdateResult StageBootloaderUpdate(const UpdatePackage& update);

    /**
     * Execute the most recently staged self-update in the live global
     * environment. On success the controller version advances and the whole
     * queue is cleared; on failure nothing changes.
     */
    UpdateResult ApplyPendingUpdates();

    /// Execute a contract update immediately
    UpdateResult ProcessContractUpdate(const UpdatePackage& update);

    const std::string& GetVersion() const { return version_; }
    size_t GetPendingUpdateCount() const { return pending_.size(); }
    const std::deque<UpdatePackage>& GetPendingUpdates() const { return pending_; }

private:
    UpdateResult Reject(const UpdatePackage& update, UpdateError error,
                        const std::string& detail);
    void PublishFailed(const std::string& version, const std::string& target,
                       const std::string& error);

    const registry::AuthorizedKeyRegistry& keys_;
    const crypto::ISignatureVerifier& verifier_;
    script::Interpreter& interpreter_;
    EventBus& events_;

    std::string version_;
    size_t maxPending_;
    std::deque<UpdatePackage> pending_;
};

} // namespace controller
} // namespace aegis

#endif // AEGIS_CONTROLLER_UPDATE_H
