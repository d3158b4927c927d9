#pragma once

#include "tradegate/market/atr.hpp"
#include "tradegate/market/i_atr_source.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// StaticAtrSource
// -----------------------------------------------------------------------------
//
// @brief  In-process ATR feed: values set directly or derived from candles.
//
// @details
// Used by the host binary (seeded from config) and by tests. Lookups are
// keyed by symbol only; the asset class is ignored. An unknown symbol reads
// as std::nullopt, never as an error.
//
// Thread model:
//   Readers take a shared lock, setters an exclusive one.
// -----------------------------------------------------------------------------
class StaticAtrSource final : public IAtrSource {
 public:
  StaticAtrSource() = default;

  StaticAtrSource(const StaticAtrSource&) = delete;
  StaticAtrSource& operator=(const StaticAtrSource&) = delete;

  void set_atr(const std::string& symbol, double atr);

  // Wilder ATR over the candles. Returns false, leaving any previous value
  // untouched, when the series is too short.
  bool set_candles(const std::string& symbol, std::vector<Candle> candles,
                   int period = kDefaultAtrPeriod);

  void erase(const std::string& symbol);

  std::optional<double> fetch_atr(const std::string& symbol,
                                  domain::AssetClass asset_class) override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, double> atr_;
};

}  // namespace tradegate
