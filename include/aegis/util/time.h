// AEGIS - Time Utilities
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Wall-clock and monotonic timestamps with a mock clock for tests.
// Contract registration times are taken from the monotonic clock so they
// never run backwards when the device's wall clock is corrected.

#ifndef AEGIS_UTIL_TIME_H
#define AEGIS_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace aegis {
namespace util {

using Milliseconds = std::chrono::milliseconds;
using SystemClock = std::chrono::system_clock;
using SteadyClock = std::chrono::steady_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

// ============================================================================
// Timestamps
// ============================================================================

/// Current Unix time in milliseconds
int64_t GetTimeMillis();

/// Milliseconds on the process-monotonic clock
int64_t GetMonotonicMillis();

/// Format a millisecond Unix timestamp as ISO 8601 ("2024-01-15T10:30:00.123Z")
std::string FormatISO8601Millis(int64_t timestampMs);

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Both GetTimeMillis and GetMonotonicMillis return the mock value while enabled
void EnableMockTime();
void DisableMockTime();
bool IsMockTimeEnabled();

void SetMockTime(int64_t timestampMs);
void AdvanceMockTime(Milliseconds duration);
int64_t GetMockTime();

} // namespace util
} // namespace aegis

#endif // AEGIS_UTIL_TIME_H
