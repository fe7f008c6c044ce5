#include "util/clock.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace autopay::util {

std::int64_t SystemClock::NowMs() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

const Clock& DefaultClock() {
  static const SystemClock clock;
  return clock;
}

std::string UtcDateString(std::int64_t unix_ms) {
  std::int64_t seconds = unix_ms / kMillisPerSecond;
  if (unix_ms < 0 && unix_ms % kMillisPerSecond != 0) {
    --seconds;
  }
  const std::time_t time = static_cast<std::time_t>(seconds);
  std::tm tm_buf{};
  gmtime_r(&time, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d");
  return oss.str();
}

}  // namespace autopay::util
