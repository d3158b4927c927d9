#include "tradegate/market/atr.hpp"

#include <algorithm>
#include <cmath>

namespace tradegate {

std::optional<double> computeAtrFromCandles(std::vector<Candle> candles,
                                            int period) {
  if (period <= 0) return std::nullopt;
  if (candles.size() < static_cast<std::size_t>(period) + 1) {
    return std::nullopt;
  }

  std::sort(candles.begin(), candles.end(),
            [](const Candle& a, const Candle& b) {
              return a.timestamp_ms < b.timestamp_ms;
            });

  std::vector<double> tr;
  tr.reserve(candles.size() - 1);
  for (std::size_t i = 1; i < candles.size(); ++i) {
    const double prev_close = candles[i - 1].close;
    const Candle& c = candles[i];
    tr.push_back(std::max({c.high - c.low, std::abs(c.high - prev_close),
                           std::abs(c.low - prev_close)}));
  }

  const auto p = static_cast<std::size_t>(period);
  double atr = 0.0;
  for (std::size_t i = 0; i < p; ++i) atr += tr[i];
  atr /= period;
  for (std::size_t i = p; i < tr.size(); ++i) {
    atr = (atr * (period - 1) + tr[i]) / period;
  }

  if (!std::isfinite(atr) || atr <= 0.0) return std::nullopt;
  return atr;
}

}  // namespace tradegate
