#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace tradegate {

struct Candle {
  std::int64_t timestamp_ms{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
};

inline constexpr int kDefaultAtrPeriod = 14;

// -----------------------------------------------------------------------------
// computeAtrFromCandles
// -----------------------------------------------------------------------------
// @brief  Wilder ATR over OHLC candles.
//
// @details
// Candles are sorted by timestamp first (the input is not modified). True
// range for candle i is max(high - low, |high - prev close|,
// |low - prev close|). The first ATR is the simple mean of the first
// `period` true ranges; each later range is folded in with Wilder smoothing
// atr = (atr * (period - 1) + tr) / period.
//
// @return std::nullopt with fewer than period + 1 candles, a non-positive
//         period, or a non-finite / non-positive result.
// -----------------------------------------------------------------------------
std::optional<double> computeAtrFromCandles(std::vector<Candle> candles,
                                            int period = kDefaultAtrPeriod);

}  // namespace tradegate
