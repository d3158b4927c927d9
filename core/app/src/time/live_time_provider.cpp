#include "tradegate/time/live_time_provider.hpp"

#include <chrono>

namespace tradegate {

// ---- now_ms: system_clock converted to epoch milliseconds ----
std::int64_t LiveTimeProvider::now_ms() const {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch)
      .count();
}

}  // namespace tradegate
