#include "time.hpp"

namespace x402::util {

TimePoint Now() {
  return Clock::now();
}

std::uint64_t ToUnixSeconds(TimePoint tp) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count());
}

std::uint64_t UnixNow() {
  return ToUnixSeconds(Now());
}

} // namespace x402::util
