// AEGIS - Contract Admission State Machine
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Governs a single contract submission: Idle -> Validation -> Active on
// success, or back to Idle on rejection. Admission is single-shot: once a
// contract has been accepted the machine rests in Active and further
// submissions fail with InvalidState until Reset().

#ifndef AEGIS_CONTROLLER_ADMISSION_H
#define AEGIS_CONTROLLER_ADMISSION_H

#include "aegis/controller/events.h"
#include "aegis/registry/contract.h"

#include <optional>

namespace aegis {
namespace controller {

// ============================================================================
// States and Errors
// ============================================================================

enum class AdmissionState {
    Idle,
    Validation,
    Active
};

const char* AdmissionStateToString(AdmissionState state);

enum class AdmissionError {
    None,
    InvalidState,
    MissingId,
    MissingVersion,
    MissingSegment
};

const char* AdmissionErrorToString(AdmissionError error);

/// Result of a submission
struct AdmissionResult {
    bool success{false};
    AdmissionError error{AdmissionError::None};

    /// The stored record on success
    std::optional<registry::Contract> contract;

    static AdmissionResult Success(registry::Contract stored) {
        AdmissionResult r;
        r.success = true;
        r.contract = std::move(stored);
        return r;
    }

    static AdmissionResult Failure(AdmissionError err) {
        AdmissionResult r;
        r.error = err;
        return r;
    }
};

/**
 * Check the required identity fields in priority order.
 * @return The first missing field's error, or None
 */
AdmissionError ValidateContractFields(const registry::Contract& contract);

// ============================================================================
// Admission State Machine
// ============================================================================

class AdmissionStateMachine {
public:
    AdmissionStateMachine(registry::ContractRegistry& contracts, EventBus& events);

    /**
     * Submit a contract for admission.
     * Emits state-change for every transition, then rejected or registered.
     * An InvalidState failure changes nothing and emits nothing.
     */
    AdmissionResult SubmitContract(const registry::Contract& contract);

    AdmissionState GetState() const { return state_; }

    /// Force Idle and clear the contract registry. Emits reset.
    void Reset();

private:
    void Transition(AdmissionState to);

    registry::ContractRegistry& contracts_;
    EventBus& events_;
    AdmissionState state_{AdmissionState::Idle};
};

} // namespace controller
} // namespace aegis

#endif // AEGIS_CONTROLLER_ADMISSION_H
