// AEGIS - Configuration File Parser Tests
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include <gtest/gtest.h>

#include "aegis/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace aegis {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/aegis_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
# initialversion=9.9.9
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePairs) {
    std::string content = R"(
initialversion = 2.1.0
  maxpendingupdates=4
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::INITIAL_VERSION, ""), "2.1.0");
    EXPECT_EQ(config_.GetInt(ConfigKeys::MAX_PENDING_UPDATES, 0), 4);
}

TEST_F(ConfigTest, ParseQuotedValue) {
    std::string content = R"(
key1="value with spaces"
key2='single quoted'
key3="with \"escaped\" quotes"
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString("key1", ""), "value with spaces");
    EXPECT_EQ(config_.GetString("key2", ""), "single quoted");
    EXPECT_EQ(config_.GetString("key3", ""), "with \"escaped\" quotes");
}

TEST_F(ConfigTest, ParseSections) {
    std::string content = R"(
loglevel=debug

[script]
maxsteps=5000
maxdepth=64
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_LEVEL, ""), "debug");
    EXPECT_EQ(config_.GetUInt(ConfigKeys::MAX_STEPS, 0, ConfigKeys::SCRIPT_SECTION), 5000u);
    EXPECT_EQ(config_.GetUInt(ConfigKeys::MAX_DEPTH, 0, ConfigKeys::SCRIPT_SECTION), 64u);

    // Section keys are not visible globally
    EXPECT_FALSE(config_.HasKey(ConfigKeys::MAX_STEPS));

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 1u);
    EXPECT_EQ(sections[0], "script");
}

TEST_F(ConfigTest, ParseFlagsAndNegation) {
    std::string content = R"(
allowdemokeys
noprinttoconsole
)";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::ALLOW_DEMO_KEYS, false));
    EXPECT_FALSE(config_.GetBool(ConfigKeys::PRINT_TO_CONSOLE, true));
}

TEST_F(ConfigTest, ParseLineContinuation) {
    std::string content = "logfile=/var/log/\\\naegis.log\n";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_FILE, ""), "/var/log/aegis.log");
}

// ============================================================================
// Error Reporting Tests
// ============================================================================

TEST_F(ConfigTest, MissingSectionBracket) {
    auto result = config_.ParseString("a=1\n[script\nb=2", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    auto result = config_.ParseString("bad key=1");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Invalid character"), std::string::npos);
}

TEST_F(ConfigTest, EmptyKey) {
    auto result = config_.ParseString("=value");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Empty key");
}

TEST_F(ConfigTest, LineTooLong) {
    std::string content = "key=" + std::string(MAX_LINE_LENGTH + 1, 'x');
    auto result = config_.ParseString(content);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

// ============================================================================
// Typed Retrieval Tests
// ============================================================================

TEST_F(ConfigTest, IntegerRetrieval) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12abc\nd=").success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.TryGetInt("b"), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.GetInt("missing", 99), 99);

    // Negative values are not unsigned
    EXPECT_FALSE(config_.TryGetUInt("b").has_value());
    EXPECT_EQ(config_.GetUInt("b", 5), 5u);
}

TEST_F(ConfigTest, BoolRetrieval) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=OFF\nc=1\nd=maybe").success);
    EXPECT_EQ(config_.TryGetBool("a"), true);
    EXPECT_EQ(config_.TryGetBool("b"), false);
    EXPECT_EQ(config_.TryGetBool("c"), true);
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
    EXPECT_TRUE(config_.GetBool("d", true));
}

TEST_F(ConfigTest, RepeatedKeysFormList) {
    std::string content = R"(
authorizedkey=ops:aa
authorizedkey=release:bb
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    auto keys = config_.GetList(ConfigKeys::AUTHORIZED_KEY);
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "ops:aa");
    EXPECT_EQ(keys[1], "release:bb");

    // Scalar lookup sees the last definition
    EXPECT_EQ(config_.GetString(ConfigKeys::AUTHORIZED_KEY, ""), "release:bb");
}

TEST_F(ConfigTest, CommaSeparatedList) {
    ASSERT_TRUE(config_.ParseString("debug=update, script ,keys").success);
    auto categories = config_.GetList(ConfigKeys::DEBUG);
    ASSERT_EQ(categories.size(), 3u);
    EXPECT_EQ(categories[0], "update");
    EXPECT_EQ(categories[1], "script");
    EXPECT_EQ(categories[2], "keys");
}

TEST_F(ConfigTest, ListOfMissingKeyIsEmpty) {
    EXPECT_TRUE(config_.GetList("nothing").empty());
}

// ============================================================================
// Setting and Defaults
// ============================================================================

TEST_F(ConfigTest, SetOverridesParsedValue) {
    ASSERT_TRUE(config_.ParseString("loglevel=info").success);
    config_.Set(ConfigKeys::LOG_LEVEL, "trace");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_LEVEL, ""), "trace");
    EXPECT_EQ(config_.GetList(ConfigKeys::LOG_LEVEL).size(), 1u);
}

TEST_F(ConfigTest, SetDefaultDoesNotOverride) {
    ASSERT_TRUE(config_.ParseString("initialversion=3.0").success);
    config_.SetDefault(ConfigKeys::INITIAL_VERSION, "1.0.0");
    config_.SetDefault(ConfigKeys::MAX_PENDING_UPDATES, "16");
    EXPECT_EQ(config_.GetString(ConfigKeys::INITIAL_VERSION, ""), "3.0");
    EXPECT_EQ(config_.GetInt(ConfigKeys::MAX_PENDING_UPDATES, 0), 16);
}

TEST_F(ConfigTest, ParsedValueReplacesDefault) {
    config_.SetDefault("debug", "all");
    ASSERT_TRUE(config_.ParseString("debug=update").success);
    auto list = config_.GetList("debug");
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0], "update");
}

// ============================================================================
// Environment Expansion
// ============================================================================

TEST_F(ConfigTest, ExpandEnvironmentVariables) {
    setenv("AEGIS_TEST_DIR", "/opt/aegis", 1);
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${AEGIS_TEST_DIR}/log"), "/opt/aegis/log");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("$AEGIS_TEST_DIR/log"), "/opt/aegis/log");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("cost $"), "cost $");
    unsetenv("AEGIS_TEST_DIR");
    EXPECT_EQ(ConfigManager::ExpandEnvVars("${AEGIS_TEST_DIR}/log"), "/log");
}

TEST_F(ConfigTest, ExpansionAppliesToParsedValues) {
    setenv("AEGIS_TEST_LOG", "/tmp/aegis.log", 1);
    ASSERT_TRUE(config_.ParseString("logfile=${AEGIS_TEST_LOG}").success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_FILE, ""), "/tmp/aegis.log");
    unsetenv("AEGIS_TEST_LOG");
}

// ============================================================================
// File and Command Line
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("initialversion=4.2\n[script]\nmaxsteps=10\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString(ConfigKeys::INITIAL_VERSION, ""), "4.2");
    EXPECT_EQ(config_.GetInt(ConfigKeys::MAX_STEPS, 0, ConfigKeys::SCRIPT_SECTION), 10);
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/aegis.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open"), std::string::npos);
}

TEST_F(ConfigTest, ParseCommandLine) {
    const char* argv[] = {
        "aegis", "-loglevel=debug", "--allowdemokeys", "-noprinttoconsole",
        "--logfile", "/tmp/x.log", "positional"
    };
    auto result = config_.ParseCommandLine(7, argv);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_LEVEL, ""), "debug");
    EXPECT_TRUE(config_.GetBool(ConfigKeys::ALLOW_DEMO_KEYS, false));
    EXPECT_FALSE(config_.GetBool(ConfigKeys::PRINT_TO_CONSOLE, true));
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_FILE, ""), "/tmp/x.log");
    EXPECT_FALSE(config_.HasKey("positional"));
}

TEST_F(ConfigTest, CommandLineOverridesFile) {
    ASSERT_TRUE(config_.ParseString("initialversion=1.0").success);
    const char* argv[] = {"aegis", "-initialversion=2.0"};
    ASSERT_TRUE(config_.ParseCommandLine(2, argv).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::INITIAL_VERSION, ""), "2.0");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, ValidateRequiredAndAllowedKeys) {
    config_.RequireKey(ConfigKeys::INITIAL_VERSION);
    config_.AllowKey(ConfigKeys::LOG_LEVEL);

    ASSERT_TRUE(config_.ParseString("loglevel=info\nbogus=1").success);
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 2u);

    bool sawMissing = false;
    bool sawUnknown = false;
    for (const auto& e : errors) {
        if (e.find("Required key missing: initialversion") != std::string::npos) sawMissing = true;
        if (e.find("Unknown key: bogus") != std::string::npos) sawUnknown = true;
    }
    EXPECT_TRUE(sawMissing);
    EXPECT_TRUE(sawUnknown);
}

TEST_F(ConfigTest, HelperFunctions) {
    EXPECT_EQ(ConfigManager::Trim("  x y \t\n"), "x y");
    EXPECT_EQ(ConfigManager::Trim("   "), "");
    EXPECT_EQ(ConfigManager::ParseBool("On"), true);
    EXPECT_EQ(ConfigManager::ParseBool("no"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("2").has_value());
}

} // namespace test
} // namespace util
} // namespace aegis
