// AEGIS - Time Utilities Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace aegis {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

// ============================================================================
// Timestamps
// ============================================================================

int64_t GetTimeMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Milliseconds>(
        SystemClock::now().time_since_epoch()).count();
}

int64_t GetMonotonicMillis() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Milliseconds>(
        SteadyClock::now().time_since_epoch()).count();
}

std::string FormatISO8601Millis(int64_t timestampMs) {
    std::time_t seconds = static_cast<std::time_t>(timestampMs / 1000);
    int64_t ms = timestampMs % 1000;
    if (ms < 0) {
        ms += 1000;
        --seconds;
    }

    std::tm tmBuf;
    gmtime_r(&seconds, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
    g_mockTime.store(0);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestampMs) {
    g_mockTime.store(timestampMs);
}

void AdvanceMockTime(Milliseconds duration) {
    g_mockTime.fetch_add(duration.count());
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

} // namespace util
} // namespace aegis
