// AEGIS - Registry Tests
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include <gtest/gtest.h>

#include "aegis/registry/contract.h"
#include "aegis/registry/keys.h"

#include <string>
#include <vector>

namespace aegis {
namespace registry {
namespace {

using Ids = std::vector<std::string>;

// ============================================================================
// Contract Tests
// ============================================================================

TEST(ContractTest, DefaultsToUnregistered) {
    Contract c("c1", "1.0", "energy");
    EXPECT_EQ(c.status, ContractStatus::Unregistered);
    EXPECT_EQ(c.registrationTime, 0);
    EXPECT_TRUE(c.fields.empty());
}

TEST(ContractTest, ToString) {
    Contract c("c1", "1.0", "energy");
    c.status = ContractStatus::Active;
    EXPECT_EQ(c.ToString(), "Contract(id=c1, version=1.0, segment=energy, status=Active)");
    EXPECT_STREQ(ContractStatusToString(ContractStatus::Unregistered), "Unregistered");
}

// ============================================================================
// Contract Registry Tests
// ============================================================================

class ContractRegistryTest : public ::testing::Test {
protected:
    ContractRegistry registry_;
};

TEST_F(ContractRegistryTest, StartsEmpty) {
    EXPECT_TRUE(registry_.Empty());
    EXPECT_EQ(registry_.Size(), 0u);
    EXPECT_FALSE(registry_.Find("c1").has_value());
    EXPECT_TRUE(registry_.GetSegment("energy").empty());
    EXPECT_TRUE(registry_.GetSegments().empty());
}

TEST_F(ContractRegistryTest, InsertAndFind) {
    Contract c("c1", "1.0", "energy");
    c.fields["owner"] = "grid-ops";
    registry_.Insert(c);

    EXPECT_TRUE(registry_.Contains("c1"));
    auto found = registry_.Find("c1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->version, "1.0");
    EXPECT_EQ(found->fields.at("owner"), "grid-ops");
    EXPECT_EQ(registry_.GetSegment("energy"), Ids{"c1"});
}

TEST_F(ContractRegistryTest, SegmentsKeepRegistrationOrder) {
    registry_.Insert(Contract("c2", "1.0", "energy"));
    registry_.Insert(Contract("c1", "1.0", "energy"));
    registry_.Insert(Contract("w1", "1.0", "water"));

    EXPECT_EQ(registry_.GetSegment("energy"), (Ids{"c2", "c1"}));
    EXPECT_EQ(registry_.GetSegment("water"), Ids{"w1"});
    EXPECT_EQ(registry_.GetSegments(), (Ids{"energy", "water"}));
    EXPECT_EQ(registry_.Size(), 3u);
}

TEST_F(ContractRegistryTest, ReinsertMovesSegment) {
    registry_.Insert(Contract("c1", "1.0", "energy"));
    registry_.Insert(Contract("c2", "1.0", "energy"));
    registry_.Insert(Contract("c1", "2.0", "water"));

    EXPECT_EQ(registry_.Size(), 2u);
    EXPECT_EQ(registry_.Find("c1")->version, "2.0");
    EXPECT_EQ(registry_.GetSegment("energy"), Ids{"c2"});
    EXPECT_EQ(registry_.GetSegment("water"), Ids{"c1"});
}

TEST_F(ContractRegistryTest, ReinsertSameSegmentHasNoDuplicates) {
    registry_.Insert(Contract("c1", "1.0", "energy"));
    registry_.Insert(Contract("c1", "1.1", "energy"));
    EXPECT_EQ(registry_.GetSegment("energy"), Ids{"c1"});
}

TEST_F(ContractRegistryTest, EmptiedSegmentDisappears) {
    registry_.Insert(Contract("c1", "1.0", "energy"));
    registry_.Insert(Contract("c1", "1.0", "water"));
    EXPECT_EQ(registry_.GetSegments(), Ids{"water"});
}

TEST_F(ContractRegistryTest, Clear) {
    registry_.Insert(Contract("c1", "1.0", "energy"));
    registry_.Insert(Contract("w1", "1.0", "water"));
    registry_.Clear();

    EXPECT_TRUE(registry_.Empty());
    EXPECT_FALSE(registry_.Contains("c1"));
    EXPECT_TRUE(registry_.GetSegment("energy").empty());
    EXPECT_TRUE(registry_.GetSegments().empty());
}

// ============================================================================
// Authorized Key Registry Tests
// ============================================================================

class KeyRegistryTest : public ::testing::Test {
protected:
    AuthorizedKeyRegistry keys_;
};

TEST_F(KeyRegistryTest, RegisterAndFind) {
    EXPECT_FALSE(keys_.Contains("ops"));
    keys_.Register("ops", "aa11");

    EXPECT_TRUE(keys_.Contains("ops"));
    EXPECT_EQ(keys_.Find("ops"), std::optional<std::string>("aa11"));
    EXPECT_FALSE(keys_.Find("other").has_value());
    EXPECT_EQ(keys_.Size(), 1u);
}

TEST_F(KeyRegistryTest, LastWriteWins) {
    keys_.Register("ops", "aa11");
    keys_.Register("ops", "bb22");
    EXPECT_EQ(keys_.Size(), 1u);
    EXPECT_EQ(*keys_.Find("ops"), "bb22");
}

TEST_F(KeyRegistryTest, KeyIdsAreSorted) {
    keys_.Register("zeta", "01");
    keys_.Register(DEMO_KEY_ID, "02");
    keys_.Register("ops", "03");
    EXPECT_EQ(keys_.KeyIds(), (Ids{"admin", "ops", "zeta"}));
}

} // namespace
} // namespace registry
} // namespace aegis
