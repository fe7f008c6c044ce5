#pragma once

#include <cstdint>
#include <string>

namespace autopay::util {

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerMinute = 60 * kMillisPerSecond;
constexpr std::int64_t kMillisPerHour = 60 * kMillisPerMinute;
constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

// Wall-clock source in Unix milliseconds. Everything with a TTL or an expiry
// takes one so tests can move time explicitly.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual std::int64_t NowMs() const = 0;
};

class SystemClock final : public Clock {
 public:
  std::int64_t NowMs() const override;
};

const Clock& DefaultClock();

// UTC calendar date of a Unix millisecond timestamp, "YYYY-MM-DD".
std::string UtcDateString(std::int64_t unix_ms);

}  // namespace autopay::util
