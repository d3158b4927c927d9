#pragma once

#include "tradegate/domain/market_types.hpp"

#include <optional>
#include <string>

namespace tradegate {

// -----------------------------------------------------------------------------
// IAtrSource — volatility collaborator
// -----------------------------------------------------------------------------
//
// @brief  Supplies the 14-period daily ATR for a symbol.
//
// @details
// Implementations live outside the core (vendor HTTP clients, replay files).
// Contract:
//   - std::nullopt when the source has no usable value (unknown symbol,
//     too few candles, vendor notice);
//   - an exception for transport failures, so CachedAtrSource's circuit
//     breaker can count them.
//
// Thread model:
//   fetch_atr() may be called from several request threads at once.
// -----------------------------------------------------------------------------
class IAtrSource {
 public:
  virtual ~IAtrSource() = default;

  virtual std::optional<double> fetch_atr(const std::string& symbol,
                                          domain::AssetClass asset_class) = 0;
};

}  // namespace tradegate
