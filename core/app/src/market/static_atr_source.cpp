#include "tradegate/market/static_atr_source.hpp"

#include <mutex>
#include <utility>

namespace tradegate {

void StaticAtrSource::set_atr(const std::string& symbol, double atr) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  atr_[symbol] = atr;
}

bool StaticAtrSource::set_candles(const std::string& symbol,
                                  std::vector<Candle> candles, int period) {
  const std::optional<double> atr =
      computeAtrFromCandles(std::move(candles), period);
  if (!atr) {
    return false;
  }
  set_atr(symbol, *atr);
  return true;
}

void StaticAtrSource::erase(const std::string& symbol) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  atr_.erase(symbol);
}

std::optional<double> StaticAtrSource::fetch_atr(
    const std::string& symbol, domain::AssetClass /*asset_class*/) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = atr_.find(symbol);
  if (it == atr_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace tradegate
