// AEGIS - OTA Update Pipeline Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/controller/update.h"
#include "aegis/controller/version.h"
#include "aegis/util/logging.h"

namespace aegis {
namespace controller {

std::string UpdatePackage::EventTarget() const {
    if (IsSelfTargeted()) {
        return SELF_TARGET;
    }
    if (contractId && !contractId->empty()) {
        return *contractId;
    }
    if (!target.empty()) {
        return target;
    }
    return CONTRACT_TARGET;
}

const char* UpdateErrorToString(UpdateError error) {
    switch (error) {
        case UpdateError::None: return "None";
        case UpdateError::InvalidPackageFormat: return "InvalidPackageFormat";
        case UpdateError::UnauthorizedKey: return "UnauthorizedKey";
        case UpdateError::InvalidSignature: return "InvalidSignature";
        case UpdateError::VersionDowngradeRejected: return "VersionDowngradeRejected";
        case UpdateError::NoPendingUpdates: return "NoPendingUpdates";
        case UpdateError::ExecutionFailed: return "ExecutionFailed";
    }
    return "Unknown";
}

const char* UpdateStatusToString(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::None: return "None";
        case UpdateStatus::Staged: return "Staged";
        case UpdateStatus::Success: return "Success";
    }
    return "Unknown";
}

// ============================================================================
// UpdatePipeline
// ============================================================================

UpdatePipeline::UpdatePipeline(const registry::AuthorizedKeyRegistry& keys,
                               const crypto::ISignatureVerifier& verifier,
                               script::Interpreter& interpreter,
                               EventBus& events,
                               std::string initialVersion,
                               size_t maxPendingUpdates)
    : keys_(keys),
      verifier_(verifier),
      interpreter_(interpreter),
      events_(events),
      version_(std::move(initialVersion)),
      maxPending_(maxPendingUpdates) {}

UpdateResult UpdatePipeline::ProcessUpdate(const UpdatePackage& update) {
    if (update.version.empty() || update.code.empty() ||
        update.signature.empty() || update.keyId.empty()) {
        return Reject(update, UpdateError::InvalidPackageFormat,
                      "version, code, signature and keyId are required");
    }

    auto publicKey = keys_.Find(update.keyId);
    if (!publicKey) {
        return Reject(update, UpdateError::UnauthorizedKey,
                      "key '" + update.keyId + "' is not authorized");
    }

    if (!verifier_.Verify(update.code, update.signature, *publicKey)) {
        return Reject(update, UpdateError::InvalidSignature,
                      "signature does not verify under key '" + update.keyId + "'");
    }

    if (CompareVersions(update.version, version_) < 0) {
        return Reject(update, UpdateError::VersionDowngradeRejected,
                      update.version + " is below controller version " + version_);
    }

    LOG_INFO(util::LogCategory::UPDATE)
        << "Accepted update " << update.version << " for " << update.EventTarget()
        << " signed by '" << update.keyId << "'";

    if (update.IsSelfTargeted()) {
        return StageBootloaderUpdate(update);
    }
    return ProcessContractUpdate(update);
}

UpdateResult UpdatePipeline::StageBootloaderUpdate(const UpdatePackage& update) {
    while (maxPending_ > 0 && !pending_.empty() && pending_.size() >= maxPending_) {
        LOG_WARN(util::LogCategory::UPDATE)
            << "Pending queue full; dropping staged update " << pending_.front().version;
        pending_.pop_front();
    }
    pending_.push_back(update);

    LOG_INFO(util::LogCategory::UPDATE)
        << "Staged self-update " << update.version
        << " (" << pending_.size() << " pending)";

    ControllerEvent event;
    event.type = EventType::UpdateStaged;
    event.version = update.version;
    event.target = SELF_TARGET;
    events_.Publish(event);

    return UpdateResult::Success(UpdateStatus::Staged);
}

UpdateResult UpdatePipeline::ApplyPendingUpdates() {
    if (pending_.empty()) {
        LOG_DEBUG(util::LogCategory::UPDATE) << "Apply requested with no pending updates";
        return UpdateResult::Failure(UpdateError::NoPendingUpdates, "no pending updates");
    }

    // Copy: the queue is only touched after execution completes
    const UpdatePackage update = pending_.back();

    script::ExecResult exec = interpreter_.Execute(update.code);
    if (!exec.success) {
        LOG_WARN(util::LogCategory::UPDATE)
            << "Self-update " << update.version << " failed: " << exec.message;
        PublishFailed(update.version, SELF_TARGET, exec.message);
        return UpdateResult::Failure(UpdateError::ExecutionFailed, exec.message);
    }

    std::string previous = version_;
    version_ = update.version;
    // A host callback may have re-entered and already drained the queue
    size_t discarded = pending_.empty() ? 0 : pending_.size() - 1;
    pending_.clear();

    LOG_INFO(util::LogCategory::UPDATE)
        << "Applied self-update " << previous << " -> " << version_
        << (discarded > 0 ? " (discarded " + std::to_string(discarded) + " older)" : "");

    ControllerEvent event;
    event.type = EventType::UpdateApplied;
    event.version = update.version;
    event.target = SELF_TARGET;
    event.status = UpdateStatusToString(UpdateStatus::Success);
    events_.Publish(event);

    return UpdateResult::Success(UpdateStatus::Success);
}

UpdateResult UpdatePipeline::ProcessContractUpdate(const UpdatePackage& update) {
    const std::string target = update.EventTarget();

    script::ExecResult exec = interpreter_.Execute(update.code);
    if (!exec.success) {
        LOG_WARN(util::LogCategory::UPDATE)
            << "Contract update " << update.version << " for " << target
            << " failed: " << exec.message;
        PublishFailed(update.version, target, exec.message);
        return UpdateResult::Failure(UpdateError::ExecutionFailed, exec.message);
    }

    LOG_INFO(util::LogCategory::UPDATE)
        << "Applied contract update " << update.version << " for " << target;

    ControllerEvent event;
    event.type = EventType::UpdateApplied;
    event.version = update.version;
    event.target = target;
    event.status = UpdateStatusToString(UpdateStatus::Success);
    events_.Publish(event);

    return UpdateResult::Success(UpdateStatus::Success);
}

UpdateResult UpdatePipeline::Reject(const UpdatePackage& update, UpdateError error,
                                    const std::string& detail) {
    LOG_WARN(util::LogCategory::UPDATE)
        << "Rejected update " << update.version << ": "
        << UpdateErrorToString(error) << " (" << detail << ")";
    PublishFailed(update.version, update.EventTarget(), UpdateErrorToString(error));
    return UpdateResult::Failure(error, detail);
}

void UpdatePipeline::PublishFailed(const std::string& version, const std::string& target,
                                   const std::string& error) {
    ControllerEvent event;
    event.type = EventType::UpdateFailed;
    event.version = version;
    event.target = target;
    event.error = error;
    events_.Publish(event);
}

} // namespace controller
} // namespace aegis
