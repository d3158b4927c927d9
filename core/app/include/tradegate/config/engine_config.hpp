#pragma once

#include "tradegate/domain/execution_limits.hpp"
#include "tradegate/market/cached_atr_source.hpp"
#include "tradegate/resilience/circuit_breaker.hpp"
#include "tradegate/risk/institutional_risk_governor.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace tradegate {

// Thrown for unreadable files, malformed JSON, wrong value types and values
// outside their valid range.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// EngineConfig — everything the host needs to wire a DecisionEngine
// -----------------------------------------------------------------------------
//
// @brief  Aggregate of the per-component limit structs plus transport
//         settings. Every field has a usable default, so an empty JSON
//         object yields a working engine.
//
// @details
// File layout (all keys optional):
//
//   {
//     "execution":     { "max_daily_loss_pct": 0.02, ... },
//     "institutional": { "max_risk_per_trade_pct": 1.0, ... },
//     "breakers": {
//       "market_data": { "failure_threshold": 5, "reset_timeout_ms": 60000 },
//       "crypto_data": { "failure_threshold": 5, "reset_timeout_ms": 45000 }
//     },
//     "atr_cache_ttl_ms": 300000,
//     "atr_seeds":     { "SPY": 4.8, "BTC-USD": 1850.0 },
//     "ipc": { "cmd_endpoint": "tcp://127.0.0.1:5556",
//              "pub_endpoint": "tcp://127.0.0.1:5557" }
//   }
//
// Thread model:
//   Plain value type. Loaded once on the main thread and copied into the
//   engine.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::ExecutionLimits execution;
  InstitutionalLimits institutional;

  CircuitBreakerOptions market_data_breaker{marketDataBreakerOptions()};
  CircuitBreakerOptions crypto_data_breaker{cryptoDataBreakerOptions()};

  std::int64_t atr_cache_ttl_ms{kAtrCacheTtlMs};

  // Symbol -> ATR loaded into the host's StaticAtrSource at startup.
  std::map<std::string, double> atr_seeds;

  // Empty endpoints disable the IPC server.
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

EngineConfig parseEngineConfig(const nlohmann::json& j);

EngineConfig loadEngineConfig(const std::string& path);

}  // namespace tradegate
