// AEGIS - Secure Update Controller
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// The Controller owns every piece of controller state (registries, admission
// state, pending updates, controller version and the extension interpreter)
// and is the public entry point for hosts. Independent instances share
// nothing. Each public operation holds one coarse lock, so a multi-threaded
// host may call in from any thread; event handlers run under that lock and
// may call back into the same controller.

#ifndef AEGIS_CONTROLLER_CONTROLLER_H
#define AEGIS_CONTROLLER_CONTROLLER_H

#include "aegis/controller/admission.h"
#include "aegis/controller/events.h"
#include "aegis/controller/options.h"
#include "aegis/controller/update.h"
#include "aegis/crypto/signature.h"
#include "aegis/registry/contract.h"
#include "aegis/registry/keys.h"
#include "aegis/script/interpreter.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace aegis {
namespace controller {

class Controller {
public:
    /**
     * Create a controller.
     * @param options Runtime options; provisioned keys are registered here
     * @param verifier Signature scheme; defaults to Ed25519
     */
    explicit Controller(ControllerOptions options = ControllerOptions{},
                        std::shared_ptr<const crypto::ISignatureVerifier> verifier = nullptr);

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // ========================================================================
    // Admission
    // ========================================================================

    AdmissionResult SubmitContract(const registry::Contract& contract);
    AdmissionState GetState() const;

    /**
     * Return to Idle and clear the contract registry.
     * Authorized keys and pending self-updates are kept.
     */
    void Reset();

    // ========================================================================
    // Keys
    // ========================================================================

    /// Authorize a public key (upsert). Emits key-registered.
    void RegisterPublicKey(const std::string& keyId, const std::string& publicKey);

    /**
     * Demo bootstrap: generate a key pair and authorize it as "admin".
     * Only permitted when options allow demo keys; otherwise nothing is
     * registered and nullopt is returned. Production deployments provision
     * keys through the authorizedkey option instead.
     */
    std::optional<crypto::KeyPair> Initialize();

    // ========================================================================
    // Updates
    // ========================================================================

    UpdateResult ProcessUpdate(const UpdatePackage& update);
    UpdateResult ApplyPendingUpdates();
    std::string GetVersion() const;

    // ========================================================================
    // Events
    // ========================================================================

    SubscriptionId On(EventType type, EventHandler handler);
    SubscriptionId OnAll(EventHandler handler);
    bool Off(SubscriptionId id);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<registry::Contract> GetContract(const std::string& id) const;
    std::vector<std::string> GetSegment(const std::string& segment) const;
    std::vector<std::string> GetSegments() const;
    size_t GetContractCount() const;
    size_t GetPendingUpdateCount() const;

    /// Ids of all authorized keys
    std::vector<std::string> GetKeys() const;

    // ========================================================================
    // Extension Environment
    // ========================================================================

    /// Route `display` output of update code
    void SetScriptOutput(script::OutputCallback callback);

    /// Look up a binding in the live global environment
    std::optional<script::Value> LookupGlobal(const std::string& name) const;

    const ControllerOptions& GetOptions() const { return options_; }

private:
    mutable std::recursive_mutex mutex_;

    const ControllerOptions options_;
    std::shared_ptr<const crypto::ISignatureVerifier> verifier_;

    EventBus events_;
    registry::ContractRegistry contracts_;
    registry::AuthorizedKeyRegistry keys_;
    script::Interpreter interpreter_;

    AdmissionStateMachine admission_;
    UpdatePipeline pipeline_;
};

} // namespace controller
} // namespace aegis

#endif // AEGIS_CONTROLLER_CONTROLLER_H
