// AEGIS - Contract Admission State Machine Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/controller/admission.h"
#include "aegis/util/logging.h"
#include "aegis/util/time.h"

namespace aegis {
namespace controller {

const char* AdmissionStateToString(AdmissionState state) {
    switch (state) {
        case AdmissionState::Idle: return "Idle";
        case AdmissionState::Validation: return "Validation";
        case AdmissionState::Active: return "Active";
    }
    return "Unknown";
}

const char* AdmissionErrorToString(AdmissionError error) {
    switch (error) {
        case AdmissionError::None: return "None";
        case AdmissionError::InvalidState: return "InvalidState";
        case AdmissionError::MissingId: return "MissingId";
        case AdmissionError::MissingVersion: return "MissingVersion";
        case AdmissionError::MissingSegment: return "MissingSegment";
    }
    return "Unknown";
}

AdmissionError ValidateContractFields(const registry::Contract& contract) {
    if (contract.id.empty()) return AdmissionError::MissingId;
    if (contract.version.empty()) return AdmissionError::MissingVersion;
    if (contract.segment.empty()) return AdmissionError::MissingSegment;
    return AdmissionError::None;
}

// ============================================================================
// AdmissionStateMachine
// ============================================================================

AdmissionStateMachine::AdmissionStateMachine(registry::ContractRegistry& contracts,
                                             EventBus& events)
    : contracts_(contracts), events_(events) {}

AdmissionResult AdmissionStateMachine::SubmitContract(const registry::Contract& contract) {
    if (state_ != AdmissionState::Idle) {
        LOG_WARN(util::LogCategory::ADMISSION)
            << "Submission of '" << contract.id << "' refused in state "
            << AdmissionStateToString(state_);
        return AdmissionResult::Failure(AdmissionError::InvalidState);
    }

    Transition(AdmissionState::Validation);

    AdmissionError error = ValidateContractFields(contract);
    if (error != AdmissionError::None) {
        LOG_WARN(util::LogCategory::ADMISSION)
            << "Contract rejected: " << AdmissionErrorToString(error);
        Transition(AdmissionState::Idle);

        ControllerEvent event;
        event.type = EventType::Rejected;
        event.contract = contract;
        event.error = AdmissionErrorToString(error);
        events_.Publish(event);
        return AdmissionResult::Failure(error);
    }

    registry::Contract stored = contract;
    stored.status = registry::ContractStatus::Active;
    stored.registrationTime = util::GetMonotonicMillis();
    contracts_.Insert(stored);

    LOG_INFO(util::LogCategory::ADMISSION)
        << "Registered contract '" << stored.id << "' in segment '" << stored.segment << "'";

    Transition(AdmissionState::Active);

    ControllerEvent event;
    event.type = EventType::Registered;
    event.contract = stored;
    events_.Publish(event);

    return AdmissionResult::Success(std::move(stored));
}

void AdmissionStateMachine::Reset() {
    state_ = AdmissionState::Idle;
    contracts_.Clear();
    LOG_INFO(util::LogCategory::ADMISSION) << "Admission reset";

    ControllerEvent event;
    event.type = EventType::Reset;
    events_.Publish(event);
}

void AdmissionStateMachine::Transition(AdmissionState to) {
    AdmissionState from = state_;
    state_ = to;
    LOG_DEBUG(util::LogCategory::ADMISSION)
        << AdmissionStateToString(from) << " -> " << AdmissionStateToString(to);

    ControllerEvent event;
    event.type = EventType::StateChange;
    event.fromState = AdmissionStateToString(from);
    event.toState = AdmissionStateToString(to);
    events_.Publish(event);
}

} // namespace controller
} // namespace aegis
