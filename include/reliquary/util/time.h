// RELIQUARY - Time Utilities
// Copyright (c) 2024 RELIQUARY Developers
// MIT License
//
// Injectable time sources and formatting helpers. Governance logic never
// reads the wall clock directly; it asks the Clock it was constructed with.

#ifndef RELIQUARY_UTIL_TIME_H
#define RELIQUARY_UTIL_TIME_H

#include <atomic>
#include <cstdint>
#include <string>

#include "reliquary/core/types.h"

namespace reliquary {
namespace util {

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 60 * SECONDS_PER_MINUTE;
constexpr int64_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;

// ============================================================================
// Clock Interface
// ============================================================================

/// Source of Unix timestamps (seconds)
class Clock {
public:
    virtual ~Clock() = default;
    
    virtual Timestamp Now() const = 0;
};

/// Wall clock
class SystemClock : public Clock {
public:
    Timestamp Now() const override;
};

/// Manually driven clock for tests and replays
class MockClock : public Clock {
public:
    explicit MockClock(Timestamp start = 0) : now_(start) {}
    
    Timestamp Now() const override { return now_.load(); }
    
    void Set(Timestamp t) { now_.store(t); }
    
    /// Move time forward (or backward for negative seconds)
    void Advance(int64_t seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<Timestamp> now_;
};

// ============================================================================
// Helpers
// ============================================================================

/// Current Unix timestamp in seconds
Timestamp GetTime();

/// Format as ISO 8601 UTC (e.g., "2024-01-15T10:30:00Z")
std::string FormatISO8601(Timestamp t);

/// Format a duration as "1d 2h 3m 4s" (zero components omitted)
std::string FormatDuration(int64_t seconds);

} // namespace util
} // namespace reliquary

#endif // RELIQUARY_UTIL_TIME_H
