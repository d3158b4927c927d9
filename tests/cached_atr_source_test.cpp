// =============================================================================
// cached_atr_source_test.cpp
// =============================================================================
// Unit tests for the ATR sources: the Wilder ATR helper, the in-memory
// StaticAtrSource and the breaker-protected CachedAtrSource.
//
// Validates:
//   - Wilder smoothing over true ranges, unsorted input, short series
//   - StaticAtrSource set / candles / erase
//   - cache hit within the TTL, refetch after it, keyed per asset class
//   - a throwing inner source returns empty and counts toward the breaker
//   - empty lookups are never cached
//   - expired entries are evicted, not just overwritten
// =============================================================================

#include "tradegate/market/atr.hpp"
#include "tradegate/market/cached_atr_source.hpp"
#include "tradegate/market/static_atr_source.hpp"
#include "tradegate/resilience/circuit_breaker.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using tradegate::Candle;
using tradegate::domain::AssetClass;

namespace {

// Flat candles: every bar spans close +/- half, so each true range is
// `range`.
std::vector<Candle> flatCandles(std::size_t n, double range) {
  std::vector<Candle> out;
  for (std::size_t i = 0; i < n; ++i) {
    Candle c;
    c.timestamp_ms = static_cast<std::int64_t>(i) * 60000;
    c.open = 100.0;
    c.close = 100.0;
    c.high = 100.0 + range / 2.0;
    c.low = 100.0 - range / 2.0;
    out.push_back(c);
  }
  return out;
}

class ScriptedAtrSource final : public tradegate::IAtrSource {
 public:
  std::optional<double> fetch_atr(const std::string& /*symbol*/,
                                  AssetClass /*asset_class*/) override {
    ++calls;
    if (fail) throw std::runtime_error("feed unavailable");
    return value;
  }

  std::optional<double> value{1.5};
  bool fail{false};
  int calls{0};
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. Constant true range gives that range back as the ATR.
// -----------------------------------------------------------------------------
TEST(AtrTest, ConstantRange) {
  const auto atr = tradegate::computeAtrFromCandles(flatCandles(15, 2.0));
  ASSERT_TRUE(atr.has_value());
  EXPECT_NEAR(*atr, 2.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 2. Wilder smoothing with period 2 over a gap bar, input out of order.
//    TR = [2, 6, 2]: seed (2+6)/2 = 4, then (4*1 + 2)/2 = 3.
// -----------------------------------------------------------------------------
TEST(AtrTest, WilderSmoothingSortsInput) {
  const std::vector<Candle> candles = {
      {3, 104, 105, 103, 104},
      {0, 100, 101, 99, 100},
      {2, 104, 106, 103, 104},
      {1, 100, 101, 99, 100},
  };
  const auto atr = tradegate::computeAtrFromCandles(candles, 2);
  ASSERT_TRUE(atr.has_value());
  EXPECT_NEAR(*atr, 3.0, 1e-12);
}

// -----------------------------------------------------------------------------
// 3. Too few candles or a bad period yields nothing.
// -----------------------------------------------------------------------------
TEST(AtrTest, ShortSeries) {
  EXPECT_FALSE(tradegate::computeAtrFromCandles(flatCandles(14, 2.0)).has_value());
  EXPECT_FALSE(tradegate::computeAtrFromCandles(flatCandles(5, 2.0), 0).has_value());
  EXPECT_FALSE(tradegate::computeAtrFromCandles(flatCandles(20, 0.0)).has_value());
}

// -----------------------------------------------------------------------------
// 4. StaticAtrSource: explicit values, candle-derived values, erase.
// -----------------------------------------------------------------------------
TEST(StaticAtrSourceTest, SetCandlesErase) {
  tradegate::StaticAtrSource src;
  EXPECT_FALSE(src.fetch_atr("SPY", AssetClass::Equity).has_value());

  src.set_atr("SPY", 2.5);
  EXPECT_DOUBLE_EQ(*src.fetch_atr("SPY", AssetClass::Equity), 2.5);

  EXPECT_FALSE(src.set_candles("SPY", flatCandles(3, 1.0)));
  EXPECT_DOUBLE_EQ(*src.fetch_atr("SPY", AssetClass::Equity), 2.5);

  EXPECT_TRUE(src.set_candles("SPY", flatCandles(15, 1.0)));
  EXPECT_NEAR(*src.fetch_atr("SPY", AssetClass::Equity), 1.0, 1e-12);

  src.erase("SPY");
  EXPECT_FALSE(src.fetch_atr("SPY", AssetClass::Equity).has_value());
}

class CachedAtrSourceTest : public ::testing::Test {
 protected:
  CachedAtrSourceTest()
      : clock(1000000),
        breaker("market_data", clock, {2, 60000, {}}),
        cached(inner, breaker, clock, 1000) {}

  tradegate::SimulationTimeProvider clock;
  ScriptedAtrSource inner;
  tradegate::CircuitBreaker breaker;
  tradegate::CachedAtrSource cached;
};

// -----------------------------------------------------------------------------
// 5. Within the TTL the cache answers; after it the inner source is asked.
// -----------------------------------------------------------------------------
TEST_F(CachedAtrSourceTest, TtlCache) {
  EXPECT_DOUBLE_EQ(*cached.fetch_atr("spy", AssetClass::Equity), 1.5);
  inner.value = 2.0;
  EXPECT_DOUBLE_EQ(*cached.fetch_atr("SPY", AssetClass::Equity), 1.5);
  EXPECT_EQ(inner.calls, 1);
  EXPECT_EQ(cached.cached_entries(), 1u);

  clock.advance_by(1000);
  EXPECT_DOUBLE_EQ(*cached.fetch_atr("SPY", AssetClass::Equity), 2.0);
  EXPECT_EQ(inner.calls, 2);
}

// -----------------------------------------------------------------------------
// 6. The same symbol under another asset class is a separate entry.
// -----------------------------------------------------------------------------
TEST_F(CachedAtrSourceTest, KeyedByAssetClass) {
  cached.fetch_atr("BTC", AssetClass::Crypto);
  cached.fetch_atr("BTC", AssetClass::Futures);
  EXPECT_EQ(inner.calls, 2);
  EXPECT_EQ(cached.cached_entries(), 2u);
}

// -----------------------------------------------------------------------------
// 7. Failures return empty and trip the breaker; then the inner is skipped.
// -----------------------------------------------------------------------------
TEST_F(CachedAtrSourceTest, FailuresTripBreaker) {
  inner.fail = true;
  EXPECT_FALSE(cached.fetch_atr("SPY", AssetClass::Equity).has_value());
  EXPECT_FALSE(cached.fetch_atr("SPY", AssetClass::Equity).has_value());
  EXPECT_EQ(breaker.state(), tradegate::CircuitState::Open);

  inner.fail = false;
  EXPECT_FALSE(cached.fetch_atr("SPY", AssetClass::Equity).has_value());
  EXPECT_EQ(inner.calls, 2);

  clock.advance_by(60000);
  EXPECT_DOUBLE_EQ(*cached.fetch_atr("SPY", AssetClass::Equity), 1.5);
  EXPECT_EQ(breaker.state(), tradegate::CircuitState::Closed);
}

// -----------------------------------------------------------------------------
// 8. A missing ATR is not a breaker failure and is not cached.
// -----------------------------------------------------------------------------
TEST_F(CachedAtrSourceTest, EmptyNotCached) {
  inner.value.reset();
  EXPECT_FALSE(cached.fetch_atr("SPY", AssetClass::Equity).has_value());
  EXPECT_FALSE(cached.fetch_atr("SPY", AssetClass::Equity).has_value());
  EXPECT_EQ(inner.calls, 2);
  EXPECT_EQ(cached.cached_entries(), 0u);
  EXPECT_EQ(breaker.snapshot().failure_count, 0);
}

// -----------------------------------------------------------------------------
// 9. Symbols that are never asked again do not linger past the TTL.
// -----------------------------------------------------------------------------
TEST_F(CachedAtrSourceTest, ExpiredEntriesEvicted) {
  cached.fetch_atr("SPY", AssetClass::Equity);
  cached.fetch_atr("QQQ", AssetClass::Equity);
  cached.fetch_atr("IWM", AssetClass::Equity);
  EXPECT_EQ(cached.cached_entries(), 3u);

  clock.advance_by(1000);
  cached.fetch_atr("DIA", AssetClass::Equity);
  EXPECT_EQ(cached.cached_entries(), 1u);

  clock.advance_by(1000);
  inner.value.reset();
  EXPECT_FALSE(cached.fetch_atr("DIA", AssetClass::Equity).has_value());
  EXPECT_EQ(cached.cached_entries(), 0u);
}
