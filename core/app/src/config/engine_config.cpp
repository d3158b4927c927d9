#include "tradegate/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>

namespace tradegate {

namespace {

using nlohmann::json;

// Reads obj[key] into out when present. Wrong JSON types become ConfigError
// naming the full key path.
template <typename T>
void readOptional(const json& obj, const std::string& section,
                  const char* key, T& out) {
  const auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return;
  try {
    out = it->template get<T>();
  } catch (const json::exception& e) {
    throw ConfigError("config: " + section + "." + key + ": " + e.what());
  }
}

const json* section(const json& root, const char* key) {
  const auto it = root.find(key);
  if (it == root.end() || it->is_null()) return nullptr;
  if (!it->is_object()) {
    throw ConfigError(std::string("config: ") + key + " must be an object");
  }
  return &*it;
}

void requirePositive(double v, const std::string& key) {
  if (!(v > 0.0)) {
    throw ConfigError("config: " + key + " must be > 0");
  }
}

// ---- section parsers ----

void parseExecution(const json& s, domain::ExecutionLimits& out) {
  const std::string name = "execution";
  readOptional(s, name, "max_daily_loss_pct", out.max_daily_loss_pct);
  readOptional(s, name, "max_portfolio_heat_pct", out.max_portfolio_heat_pct);
  readOptional(s, name, "min_required_rr", out.min_required_rr);
  readOptional(s, name, "max_open_trades", out.max_open_trades);
  readOptional(s, name, "max_single_trade_risk_pct",
               out.max_single_trade_risk_pct);
  readOptional(s, name, "default_account_equity", out.default_account_equity);
  readOptional(s, name, "default_risk_pct", out.default_risk_pct);
  readOptional(s, name, "max_notional_pct", out.max_notional_pct);
  readOptional(s, name, "min_crypto_quantity", out.min_crypto_quantity);

  requirePositive(out.max_daily_loss_pct, "execution.max_daily_loss_pct");
  requirePositive(out.max_portfolio_heat_pct,
                  "execution.max_portfolio_heat_pct");
  requirePositive(out.max_single_trade_risk_pct,
                  "execution.max_single_trade_risk_pct");
  requirePositive(out.default_account_equity,
                  "execution.default_account_equity");
  requirePositive(out.default_risk_pct, "execution.default_risk_pct");
  requirePositive(out.max_notional_pct, "execution.max_notional_pct");
  requirePositive(out.min_crypto_quantity, "execution.min_crypto_quantity");
  if (out.max_open_trades < 1) {
    throw ConfigError("config: execution.max_open_trades must be >= 1");
  }
}

void parseInstitutional(const json& s, InstitutionalLimits& out) {
  const std::string name = "institutional";
  readOptional(s, name, "max_risk_per_trade_pct", out.max_risk_per_trade_pct);
  readOptional(s, name, "max_daily_risk_pct", out.max_daily_risk_pct);
  readOptional(s, name, "max_open_risk_pct", out.max_open_risk_pct);
  readOptional(s, name, "max_correlated", out.max_correlated);

  requirePositive(out.max_risk_per_trade_pct,
                  "institutional.max_risk_per_trade_pct");
  requirePositive(out.max_daily_risk_pct, "institutional.max_daily_risk_pct");
  requirePositive(out.max_open_risk_pct, "institutional.max_open_risk_pct");
  if (out.max_correlated < 1) {
    throw ConfigError("config: institutional.max_correlated must be >= 1");
  }
}

void parseBreaker(const json& s, const std::string& name,
                  CircuitBreakerOptions& out) {
  readOptional(s, name, "failure_threshold", out.failure_threshold);
  readOptional(s, name, "reset_timeout_ms", out.reset_timeout_ms);
  if (out.failure_threshold < 1) {
    throw ConfigError("config: " + name + ".failure_threshold must be >= 1");
  }
  if (out.reset_timeout_ms < 0) {
    throw ConfigError("config: " + name + ".reset_timeout_ms must be >= 0");
  }
}

}  // namespace

// ---- parseEngineConfig ----
EngineConfig parseEngineConfig(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw ConfigError("config: top level must be a JSON object");
  }

  EngineConfig cfg;

  if (const json* s = section(j, "execution")) {
    parseExecution(*s, cfg.execution);
  }
  if (const json* s = section(j, "institutional")) {
    parseInstitutional(*s, cfg.institutional);
  }
  if (const json* breakers = section(j, "breakers")) {
    if (const json* s = section(*breakers, "market_data")) {
      parseBreaker(*s, "breakers.market_data", cfg.market_data_breaker);
    }
    if (const json* s = section(*breakers, "crypto_data")) {
      parseBreaker(*s, "breakers.crypto_data", cfg.crypto_data_breaker);
    }
  }

  readOptional(j, "root", "atr_cache_ttl_ms", cfg.atr_cache_ttl_ms);
  if (cfg.atr_cache_ttl_ms < 0) {
    throw ConfigError("config: atr_cache_ttl_ms must be >= 0");
  }

  if (const json* seeds = section(j, "atr_seeds")) {
    for (auto it = seeds->begin(); it != seeds->end(); ++it) {
      if (!it.value().is_number()) {
        throw ConfigError("config: atr_seeds." + it.key() +
                          " must be a number");
      }
      const double atr = it.value().get<double>();
      requirePositive(atr, "atr_seeds." + it.key());
      cfg.atr_seeds[it.key()] = atr;
    }
  }

  if (const json* s = section(j, "ipc")) {
    readOptional(*s, "ipc", "cmd_endpoint", cfg.ipc_cmd_endpoint);
    readOptional(*s, "ipc", "pub_endpoint", cfg.ipc_pub_endpoint);
  }

  return cfg;
}

// ---- loadEngineConfig ----
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("config: cannot open " + path);
  }

  json j;
  try {
    j = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError("config: " + path + ": " + e.what());
  }
  return parseEngineConfig(j);
}

}  // namespace tradegate
