#pragma once

#include "tradegate/market/i_atr_source.hpp"
#include "tradegate/resilience/circuit_breaker.hpp"
#include "tradegate/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tradegate {

inline constexpr std::int64_t kAtrCacheTtlMs = 5 * 60 * 1000;

// -----------------------------------------------------------------------------
// CachedAtrSource — TTL cache and circuit breaker in front of an IAtrSource
// -----------------------------------------------------------------------------
//
// @brief  Serves repeated ATR lookups from memory and stops hammering a
//         failing vendor.
//
// @details
// Cache key is "<SYMBOL>:<asset class>" with the symbol upper-cased. Only
// positive values are cached; a miss or an expired entry goes to the inner
// source through the breaker. Expired entries are dropped on lookup and
// swept on every write, so the map only holds live symbols.
//
// Failure translation (logged to std::cerr with a [CachedAtrSource] prefix):
//   CircuitOpenError       -> std::nullopt, inner source not called
//   std::exception thrown  -> std::nullopt, counted by the breaker
//   nullopt / value <= 0   -> std::nullopt
//
// Thread model:
//   cache_ is guarded by mutex_, which is never held across the inner call.
//   Two threads missing the same key may both fetch; the later write wins.
//
// Ownership:
//   Borrows the inner source, the breaker and the clock; all must outlive
//   this object.
// -----------------------------------------------------------------------------
class CachedAtrSource final : public IAtrSource {
 public:
  CachedAtrSource(IAtrSource& inner, CircuitBreaker& breaker,
                  const ITimeProvider& clock,
                  std::int64_t ttl_ms = kAtrCacheTtlMs);

  CachedAtrSource(const CachedAtrSource&) = delete;
  CachedAtrSource& operator=(const CachedAtrSource&) = delete;

  std::optional<double> fetch_atr(const std::string& symbol,
                                  domain::AssetClass asset_class) override;

  std::size_t cached_entries() const;

 private:
  struct Entry {
    double atr{0.0};
    std::int64_t fetched_ms{0};
  };

  void pruneExpired(std::int64_t now_ms);

  IAtrSource& inner_;
  CircuitBreaker& breaker_;
  const ITimeProvider& clock_;
  const std::int64_t ttl_ms_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> cache_;
};

}  // namespace tradegate
