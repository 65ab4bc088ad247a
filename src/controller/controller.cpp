// AEGIS - Secure Update Controller Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/controller/controller.h"
#include "aegis/util/logging.h"

namespace aegis {
namespace controller {

namespace {

std::shared_ptr<const crypto::ISignatureVerifier> DefaultVerifier(
        std::shared_ptr<const crypto::ISignatureVerifier> verifier) {
    if (verifier) {
        return verifier;
    }
    return std::make_shared<crypto::Ed25519Verifier>();
}

} // namespace

Controller::Controller(ControllerOptions options,
                       std::shared_ptr<const crypto::ISignatureVerifier> verifier)
    : options_(std::move(options)),
      verifier_(DefaultVerifier(std::move(verifier))),
      interpreter_(options_.scriptLimits),
      admission_(contracts_, events_),
      pipeline_(keys_, *verifier_, interpreter_, events_,
                options_.initialVersion, options_.maxPendingUpdates) {
    for (const ProvisionedKey& key : options_.authorizedKeys) {
        keys_.Register(key.keyId, key.publicKey);
        LOG_INFO(util::LogCategory::KEYS) << "Provisioned key '" << key.keyId << "'";
    }
    LOG_DEBUG(util::LogCategory::DEFAULT)
        << "Controller ready at version " << pipeline_.GetVersion()
        << " with " << keys_.Size() << " authorized keys";
}

// ============================================================================
// Admission
// ============================================================================

AdmissionResult Controller::SubmitContract(const registry::Contract& contract) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return admission_.SubmitContract(contract);
}

AdmissionState Controller::GetState() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return admission_.GetState();
}

void Controller::Reset() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    admission_.Reset();
}

// ============================================================================
// Keys
// ============================================================================

void Controller::RegisterPublicKey(const std::string& keyId, const std::string& publicKey) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    keys_.Register(keyId, publicKey);
    LOG_INFO(util::LogCategory::KEYS) << "Registered key '" << keyId << "'";

    ControllerEvent event;
    event.type = EventType::KeyRegistered;
    event.keyId = keyId;
    events_.Publish(event);
}

std::optional<crypto::KeyPair> Controller::Initialize() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!options_.allowDemoKeys) {
        LOG_WARN(util::LogCategory::KEYS)
            << "Demo key bootstrap is disabled; provision keys with "
            << util::ConfigKeys::AUTHORIZED_KEY << "=<id>:<hex>";
        return std::nullopt;
    }

    auto pair = crypto::GenerateEd25519KeyPair();
    if (!pair) {
        LOG_ERROR(util::LogCategory::KEYS) << "Demo key generation failed";
        return std::nullopt;
    }

    LOG_WARN(util::LogCategory::KEYS)
        << "Registering demo key '" << registry::DEMO_KEY_ID
        << "'; its private half leaves the controller";
    RegisterPublicKey(registry::DEMO_KEY_ID, pair->publicKey);
    return pair;
}

// ============================================================================
// Updates
// ============================================================================

UpdateResult Controller::ProcessUpdate(const UpdatePackage& update) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return pipeline_.ProcessUpdate(update);
}

UpdateResult Controller::ApplyPendingUpdates() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return pipeline_.ApplyPendingUpdates();
}

std::string Controller::GetVersion() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return pipeline_.GetVersion();
}

// ============================================================================
// Events
// ============================================================================

SubscriptionId Controller::On(EventType type, EventHandler handler) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_.Subscribe(type, std::move(handler));
}

SubscriptionId Controller::OnAll(EventHandler handler) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_.SubscribeAll(std::move(handler));
}

bool Controller::Off(SubscriptionId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_.Unsubscribe(id);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<registry::Contract> Controller::GetContract(const std::string& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return contracts_.Find(id);
}

std::vector<std::string> Controller::GetSegment(const std::string& segment) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return contracts_.GetSegment(segment);
}

std::vector<std::string> Controller::GetSegments() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return contracts_.GetSegments();
}

size_t Controller::GetContractCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return contracts_.Size();
}

size_t Controller::GetPendingUpdateCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return pipeline_.GetPendingUpdateCount();
}

std::vector<std::string> Controller::GetKeys() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return keys_.KeyIds();
}

// ============================================================================
// Extension Environment
// ============================================================================

void Controller::SetScriptOutput(script::OutputCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    interpreter_.SetOutputCallback(std::move(callback));
}

std::optional<script::Value> Controller::LookupGlobal(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return interpreter_.Lookup(name);
}

} // namespace controller
} // namespace aegis
