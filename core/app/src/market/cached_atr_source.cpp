#include "tradegate/market/cached_atr_source.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>

namespace tradegate {

namespace {

std::string cacheKey(const std::string& symbol, domain::AssetClass a) {
  std::string key(symbol);
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  key += ':';
  key += domain::toString(a);
  return key;
}

}  // namespace

CachedAtrSource::CachedAtrSource(IAtrSource& inner, CircuitBreaker& breaker,
                                 const ITimeProvider& clock,
                                 std::int64_t ttl_ms)
    : inner_(inner), breaker_(breaker), clock_(clock), ttl_ms_(ttl_ms) {}

std::optional<double> CachedAtrSource::fetch_atr(
    const std::string& symbol, domain::AssetClass asset_class) {
  const std::string key = cacheKey(symbol, asset_class);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = cache_.find(key);
    if (it != cache_.end()) {
      if (clock_.now_ms() - it->second.fetched_ms < ttl_ms_) {
        return it->second.atr;
      }
      cache_.erase(it);
    }
  }

  std::optional<double> atr;
  try {
    atr = breaker_.call(
        [&]() { return inner_.fetch_atr(symbol, asset_class); });
  } catch (const CircuitOpenError& e) {
    std::cerr << "[CachedAtrSource] " << key << ": " << e.what() << "\n";
    return std::nullopt;
  } catch (const std::exception& e) {
    std::cerr << "[CachedAtrSource] " << key
              << ": ATR source failed: " << e.what() << "\n";
    return std::nullopt;
  }

  if (!atr || !(*atr > 0.0)) {
    std::cerr << "[CachedAtrSource] " << key << ": no ATR available\n";
    return std::nullopt;
  }

  const std::int64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);
  pruneExpired(now);
  cache_[key] = Entry{*atr, now};
  return atr;
}

// Caller holds mutex_.
void CachedAtrSource::pruneExpired(std::int64_t now_ms) {
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (now_ms - it->second.fetched_ms >= ttl_ms_) {
      it = cache_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t CachedAtrSource::cached_entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

}  // namespace tradegate
