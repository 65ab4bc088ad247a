// AEGIS - Util Module Tests
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include <gtest/gtest.h>

#include <aegis/core/hex.h>
#include <aegis/util/logging.h>
#include <aegis/util/time.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace aegis {
namespace util {
namespace {

// ============================================================================
// Logging Tests
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Trace);
        Logger::Instance().EnableAllCategories();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& e) { entries_.push_back(e); }, LogLevel::Trace);
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().ClearSinks();
        Logger::Instance().SetLevel(LogLevel::Info);
        Logger::Instance().EnableAllCategories();
    }

    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

TEST_F(LoggingTest, LogLevelToString) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelToString(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelToString(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
    EXPECT_STREQ(LogLevelToString(LogLevel::Fatal), "FATAL");
    EXPECT_STREQ(LogLevelToString(LogLevel::Off), "OFF");
}

TEST_F(LoggingTest, LogLevelFromString) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("garbage"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroReachesSink) {
    LOG_WARN(LogCategory::UPDATE) << "rejected " << 3 << " packages";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warn);
    EXPECT_EQ(entries_[0].category, LogCategory::UPDATE);
    EXPECT_EQ(entries_[0].message, "rejected 3 packages");
    EXPECT_EQ(GetBasename(entries_[0].file), "test_util.cpp");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, LevelFiltering) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::DEFAULT) << "hidden";
    LOG_INFO(LogCategory::DEFAULT) << "hidden";
    LOG_ERROR(LogCategory::DEFAULT) << "shown";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST_F(LoggingTest, FilteredStreamIsNotEvaluated) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluated = 0;
    auto sideEffect = [&]() { ++evaluated; return "x"; };
    LOG_DEBUG(LogCategory::DEFAULT) << sideEffect();
    EXPECT_EQ(evaluated, 0);
}

TEST_F(LoggingTest, CategoryFiltering) {
    Logger& logger = Logger::Instance();
    logger.DisableCategory(LogCategory::SCRIPT);
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::SCRIPT));
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::UPDATE));

    LOG_INFO(LogCategory::SCRIPT) << "hidden";
    LOG_INFO(LogCategory::UPDATE) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");

    logger.DisableAllCategories();
    logger.EnableCategory(LogCategory::KEYS);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::KEYS));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::UPDATE));

    logger.EnableAllCategories();
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::SCRIPT));
}

TEST_F(LoggingTest, SinkLevelFiltersIndependently) {
    std::vector<std::string> errorsOnly;
    Logger::Instance().AddSink(std::make_shared<CallbackSink>(
        [&](const LogEntry& e) { errorsOnly.push_back(e.message); }, LogLevel::Error));

    LOG_INFO(LogCategory::DEFAULT) << "info";
    LOG_ERROR(LogCategory::DEFAULT) << "error";

    EXPECT_EQ(entries_.size(), 2u);
    ASSERT_EQ(errorsOnly.size(), 1u);
    EXPECT_EQ(errorsOnly[0], "error");
}

TEST_F(LoggingTest, RemoveSink) {
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    Logger::Instance().RemoveSink(sink_);
    EXPECT_EQ(Logger::Instance().SinkCount(), 0u);
    LOG_ERROR(LogCategory::DEFAULT) << "nobody hears this";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, FileSinkWritesLines) {
    std::string path = "/tmp/aegis_log_test_" + std::to_string(::getpid()) + ".log";
    std::remove(path.c_str());
    {
        auto file = std::make_shared<FileSink>(path, LogLevel::Info);
        ASSERT_TRUE(file->IsOpen());
        Logger::Instance().AddSink(file);
        LOG_INFO(LogCategory::KEYS) << "registered key 'ops'";
        LOG_DEBUG(LogCategory::KEYS) << "below file level";
        Logger::Instance().Flush();
        Logger::Instance().RemoveSink(file);
    }

    std::ifstream in(path);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) lines.push_back(line);
    std::remove(path.c_str());

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[INFO ]"), std::string::npos);
    EXPECT_NE(lines[0].find("[keys]"), std::string::npos);
    EXPECT_NE(lines[0].find("registered key 'ops'"), std::string::npos);
}

TEST_F(LoggingTest, FormatLogEntry) {
    LogEntry entry;
    entry.level = LogLevel::Warn;
    entry.category = LogCategory::ADMISSION;
    entry.message = "refused";
    entry.file = "/src/controller/admission.cpp";
    entry.line = 42;

    EXPECT_EQ(FormatLogEntry(entry, false, true, true),
              "[WARN ] [admission] admission.cpp:42 refused");
    EXPECT_EQ(FormatLogEntry(entry, false, false, false), "[WARN ] refused");

    // The default category is not printed
    entry.category = LogCategory::DEFAULT;
    EXPECT_EQ(FormatLogEntry(entry, false, true, false), "[WARN ] refused");
}

TEST_F(LoggingTest, GetBasename) {
    EXPECT_EQ(GetBasename("/a/b/c.cpp"), "c.cpp");
    EXPECT_EQ(GetBasename("c:\\src\\x.cpp"), "x.cpp");
    EXPECT_EQ(GetBasename("plain.cpp"), "plain.cpp");
}

TEST_F(LoggingTest, ScopedLogTimerLogsAtDebug) {
    {
        ScopedLogTimer timer(LogCategory::SCRIPT, "execute");
    }
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Debug);
    EXPECT_EQ(entries_[0].message.rfind("execute took ", 0), 0u);
}

// ============================================================================
// Time Tests
// ============================================================================

class TimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, RealClocksAdvance) {
    int64_t wall = GetTimeMillis();
    EXPECT_GT(wall, 1600000000000LL);

    int64_t a = GetMonotonicMillis();
    int64_t b = GetMonotonicMillis();
    EXPECT_GE(b, a);
}

TEST_F(TimeTest, MockTime) {
    EXPECT_FALSE(IsMockTimeEnabled());
    EnableMockTime();
    SetMockTime(1000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTimeMillis(), 1000);
    EXPECT_EQ(GetMonotonicMillis(), 1000);

    AdvanceMockTime(Milliseconds(250));
    EXPECT_EQ(GetMockTime(), 1250);
    EXPECT_EQ(GetMonotonicMillis(), 1250);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_EQ(GetMockTime(), 0);
}

TEST_F(TimeTest, FormatISO8601Millis) {
    EXPECT_EQ(FormatISO8601Millis(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(FormatISO8601Millis(1700000000123LL), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(FormatISO8601Millis(-1), "1969-12-31T23:59:59.999Z");
}

} // namespace
} // namespace util

// ============================================================================
// Hex Tests
// ============================================================================

namespace {

TEST(HexTest, Encode) {
    Bytes data = {0x00, 0x7f, 0xa5, 0xff};
    EXPECT_EQ(BytesToHex(data), "007fa5ff");
    EXPECT_EQ(BytesToHex(Bytes{}), "");
}

TEST(HexTest, DecodeAcceptsEitherCase) {
    Bytes expected = {0xde, 0xad, 0xbe, 0xef};
    EXPECT_EQ(HexToBytes("deadbeef"), expected);
    EXPECT_EQ(HexToBytes("DEADBEEF"), expected);
}

TEST(HexTest, DecodeRejectsMalformed) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0g"));
}

} // namespace
} // namespace aegis
