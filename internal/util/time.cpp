#include "time.hpp"

namespace piecework::util {

TimePoint Now() {
  return Clock::now();
}

std::uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

std::uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

} // namespace piecework::util
