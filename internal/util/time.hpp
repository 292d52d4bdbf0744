#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace roster::util {

/*
  Time utilities. Every timestamp the ledger stores is unix millis (UTC).
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injectable clock; components default to NowMs.
using ClockFn = std::function<uint64_t()>;

TimePoint Now();
uint64_t  NowMs();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// "2026-01-17T08:00:00Z"
std::string FormatUtc(uint64_t unix_ms);

// "HH:MM" <-> minutes after midnight. Throws std::invalid_argument.
uint32_t    ParseTimeOfDay(const std::string& hhmm);
std::string FormatTimeOfDay(uint32_t minutes);

constexpr uint64_t kMillisPerMinute = 60ULL * 1000ULL;
constexpr uint64_t kMillisPerHour   = 60ULL * kMillisPerMinute;
constexpr uint64_t kMillisPerDay    = 24ULL * kMillisPerHour;

} // namespace roster::util
