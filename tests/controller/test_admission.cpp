// AEGIS - Contract Admission Tests
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include <gtest/gtest.h>

#include "aegis/controller/admission.h"
#include "aegis/util/time.h"

#include <string>
#include <vector>

namespace aegis {
namespace controller {
namespace {

class AdmissionTest : public ::testing::Test {
protected:
    void SetUp() override {
        events_.SubscribeAll([this](const ControllerEvent& e) { log_.push_back(e); });
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    std::vector<std::string> EventLog() const {
        std::vector<std::string> out;
        for (const auto& e : log_) out.push_back(e.ToString());
        return out;
    }

    registry::ContractRegistry contracts_;
    EventBus events_;
    AdmissionStateMachine machine_{contracts_, events_};
    std::vector<ControllerEvent> log_;
};

// ============================================================================
// Field Validation
// ============================================================================

TEST(ContractValidationTest, PriorityOrder) {
    using registry::Contract;
    EXPECT_EQ(ValidateContractFields(Contract("c1", "1.0", "energy")), AdmissionError::None);
    EXPECT_EQ(ValidateContractFields(Contract("", "", "")), AdmissionError::MissingId);
    EXPECT_EQ(ValidateContractFields(Contract("c1", "", "")), AdmissionError::MissingVersion);
    EXPECT_EQ(ValidateContractFields(Contract("c1", "1.0", "")), AdmissionError::MissingSegment);
    EXPECT_EQ(ValidateContractFields(Contract("", "1.0", "energy")), AdmissionError::MissingId);
}

TEST(ContractValidationTest, Names) {
    EXPECT_STREQ(AdmissionStateToString(AdmissionState::Validation), "Validation");
    EXPECT_STREQ(AdmissionErrorToString(AdmissionError::InvalidState), "InvalidState");
    EXPECT_STREQ(AdmissionErrorToString(AdmissionError::MissingSegment), "MissingSegment");
}

// ============================================================================
// Submission
// ============================================================================

TEST_F(AdmissionTest, StartsIdle) {
    EXPECT_EQ(machine_.GetState(), AdmissionState::Idle);
}

TEST_F(AdmissionTest, SuccessfulSubmission) {
    util::EnableMockTime();
    util::SetMockTime(5000);

    AdmissionResult r = machine_.SubmitContract(registry::Contract("c1", "1.0", "energy"));
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.error, AdmissionError::None);
    ASSERT_TRUE(r.contract.has_value());
    EXPECT_EQ(r.contract->status, registry::ContractStatus::Active);
    EXPECT_EQ(r.contract->registrationTime, 5000);

    EXPECT_EQ(machine_.GetState(), AdmissionState::Active);

    auto stored = contracts_.Find("c1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, registry::ContractStatus::Active);
    EXPECT_EQ(contracts_.GetSegment("energy"), std::vector<std::string>{"c1"});

    EXPECT_EQ(EventLog(), (std::vector<std::string>{
        "state-change{from=Idle, to=Validation}",
        "state-change{from=Validation, to=Active}",
        "registered{contract=c1}",
    }));
    ASSERT_TRUE(log_[2].contract.has_value());
    EXPECT_EQ(log_[2].contract->status, registry::ContractStatus::Active);
}

TEST_F(AdmissionTest, ExtraFieldsAreKept) {
    registry::Contract c("c1", "1.0", "energy");
    c.fields["region"] = "north";
    ASSERT_TRUE(machine_.SubmitContract(c).success);
    EXPECT_EQ(contracts_.Find("c1")->fields.at("region"), "north");
}

TEST_F(AdmissionTest, SecondSubmissionIsInvalidState) {
    ASSERT_TRUE(machine_.SubmitContract(registry::Contract("c1", "1.0", "energy")).success);
    log_.clear();

    AdmissionResult r = machine_.SubmitContract(registry::Contract("c2", "1.0", "energy"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, AdmissionError::InvalidState);
    EXPECT_FALSE(r.contract.has_value());

    // No mutation and no events
    EXPECT_EQ(machine_.GetState(), AdmissionState::Active);
    EXPECT_FALSE(contracts_.Contains("c2"));
    EXPECT_EQ(contracts_.Size(), 1u);
    EXPECT_TRUE(log_.empty());
}

TEST_F(AdmissionTest, MissingFieldRejectsAndReturnsToIdle) {
    AdmissionResult r = machine_.SubmitContract(registry::Contract("c1", "", "energy"));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, AdmissionError::MissingVersion);

    EXPECT_EQ(machine_.GetState(), AdmissionState::Idle);
    EXPECT_TRUE(contracts_.Empty());
    EXPECT_EQ(EventLog(), (std::vector<std::string>{
        "state-change{from=Idle, to=Validation}",
        "state-change{from=Validation, to=Idle}",
        "rejected{contract=c1, error=MissingVersion}",
    }));
}

TEST_F(AdmissionTest, RejectionAllowsRetry) {
    EXPECT_EQ(machine_.SubmitContract(registry::Contract("", "1.0", "energy")).error,
              AdmissionError::MissingId);
    EXPECT_EQ(machine_.SubmitContract(registry::Contract("c1", "1.0", "")).error,
              AdmissionError::MissingSegment);
    EXPECT_TRUE(machine_.SubmitContract(registry::Contract("c1", "1.0", "energy")).success);
}

// ============================================================================
// Reset
// ============================================================================

TEST_F(AdmissionTest, ResetReturnsToIdleAndClearsRegistry) {
    ASSERT_TRUE(machine_.SubmitContract(registry::Contract("c1", "1.0", "energy")).success);
    log_.clear();

    machine_.Reset();
    EXPECT_EQ(machine_.GetState(), AdmissionState::Idle);
    EXPECT_TRUE(contracts_.Empty());
    EXPECT_TRUE(contracts_.GetSegment("energy").empty());
    EXPECT_EQ(EventLog(), std::vector<std::string>{"reset{}"});

    EXPECT_TRUE(machine_.SubmitContract(registry::Contract("c2", "1.0", "water")).success);
    EXPECT_EQ(contracts_.Size(), 1u);
}

TEST_F(AdmissionTest, ResetFromIdleStillEmits) {
    machine_.Reset();
    EXPECT_EQ(machine_.GetState(), AdmissionState::Idle);
    EXPECT_EQ(EventLog(), std::vector<std::string>{"reset{}"});
}

TEST_F(AdmissionTest, StateVisibleInsideHandlers) {
    std::vector<AdmissionState> observed;
    events_.Subscribe(EventType::StateChange, [&](const ControllerEvent&) {
        observed.push_back(machine_.GetState());
    });

    ASSERT_TRUE(machine_.SubmitContract(registry::Contract("c1", "1.0", "energy")).success);
    EXPECT_EQ(observed, (std::vector<AdmissionState>{AdmissionState::Validation,
                                                     AdmissionState::Active}));
}

TEST_F(AdmissionTest, ThrowingHandlerDoesNotStrandSubmission) {
    events_.Subscribe(EventType::StateChange, [](const ControllerEvent&) { throw 7; });

    AdmissionResult r = machine_.SubmitContract(registry::Contract("c1", "1.0", "energy"));
    EXPECT_TRUE(r.success);
    EXPECT_EQ(machine_.GetState(), AdmissionState::Active);
    EXPECT_EQ(events_.HandlerErrorCount(), 2u);
}

} // namespace
} // namespace controller
} // namespace aegis
