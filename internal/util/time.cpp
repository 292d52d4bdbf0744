#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace roster::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatUtc(uint64_t unix_ms) {
  const std::time_t secs = static_cast<std::time_t>(unix_ms / 1000);
  std::tm           tm{};
  gmtime_r(&secs, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

uint32_t ParseTimeOfDay(const std::string& hhmm) {
  const auto colon = hhmm.find(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= hhmm.size()) {
    throw std::invalid_argument("time of day must be HH:MM: " + hhmm);
  }

  int hours   = 0;
  int minutes = 0;
  try {
    std::size_t used = 0;
    hours            = std::stoi(hhmm.substr(0, colon), &used);
    if (used != colon) throw std::invalid_argument("hours");
    minutes = std::stoi(hhmm.substr(colon + 1), &used);
    if (used != hhmm.size() - colon - 1) throw std::invalid_argument("minutes");
  } catch (const std::logic_error&) {
    throw std::invalid_argument("time of day must be HH:MM: " + hhmm);
  }

  if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
    throw std::invalid_argument("time of day out of range: " + hhmm);
  }
  return static_cast<uint32_t>(hours * 60 + minutes);
}

std::string FormatTimeOfDay(uint32_t minutes) {
  std::ostringstream out;
  out << std::setw(2) << std::setfill('0') << (minutes / 60) % 24 << ':' << std::setw(2) << std::setfill('0') << minutes % 60;
  return out.str();
}

} // namespace roster::util
