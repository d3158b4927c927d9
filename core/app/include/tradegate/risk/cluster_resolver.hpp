#pragma once

#include "tradegate/domain/flow_types.hpp"

#include <string>
#include <string_view>

namespace tradegate {

// -----------------------------------------------------------------------------
// IClusterResolver — symbol to correlation-cluster mapping
// -----------------------------------------------------------------------------
//
// @brief  Maps a symbol to the named sector/theme bucket used by the
//         correlation checks of both governors.
//
// @details
// Two positions are "correlated" when they resolve to the same cluster id
// and point the same way. The governors only compare ids; they never
// interpret them, so a resolver backed by real reference data (sector
// classification, factor model) can replace the default without touching
// the governors.
//
// Ownership:
//   Governors hold a non-owning const reference. The caller keeps the
//   resolver alive for the governor's lifetime.
//
// Thread model:
//   resolve() must be safe to call concurrently.
// -----------------------------------------------------------------------------
class IClusterResolver {
 public:
  virtual ~IClusterResolver() = default;

  // @brief  Returns the cluster id for `symbol` (case-insensitive).
  // @return Never empty. Unknown symbols fall into a per-market catch-all.
  virtual std::string resolve(domain::Market market,
                              std::string_view symbol) const = 0;
};

// -----------------------------------------------------------------------------
// StaticClusterResolver — hard-coded ticker lists
// -----------------------------------------------------------------------------
//
// Crypto: CRYPTO_BETA, CRYPTO_AI_NARRATIVE, CRYPTO_L1, fallback CRYPTO_CORE.
// Equities: AI_TECH, RISK_ON_GROWTH, ENERGY, FINANCIALS, fallback GENERAL.
// Lists are checked in that order; the first hit wins, so a ticker listed in
// two buckets (SOL, FET, ...) always resolves to the earlier one.
//
// Stateless; one shared instance is enough for the process.
// -----------------------------------------------------------------------------
class StaticClusterResolver : public IClusterResolver {
 public:
  std::string resolve(domain::Market market,
                      std::string_view symbol) const override;

  // Process-wide default instance.
  static const StaticClusterResolver& instance();
};

}  // namespace tradegate
