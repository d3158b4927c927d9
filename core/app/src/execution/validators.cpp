#include "tradegate/execution/validators.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace tradegate {

using domain::Direction;
using domain::ValidationError;

namespace {

bool isPositive(double v) { return std::isfinite(v) && v > 0.0; }

bool isBlank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string joined(const std::vector<std::string>& codes) {
  std::string out;
  for (const auto& c : codes) {
    if (!out.empty()) out += ", ";
    out += c;
  }
  return out;
}

}  // namespace

// ---- validateIntent ----
std::vector<ValidationError> validateIntent(const domain::TradeIntent& intent) {
  std::vector<ValidationError> errors;

  if (isBlank(intent.symbol)) {
    errors.push_back({"symbol", "REQUIRED", "Symbol is required."});
  }
  if (!std::isfinite(intent.confidence) || intent.confidence < 0.0 ||
      intent.confidence > 100.0) {
    errors.push_back({"confidence", "RANGE", "Confidence must be 0-100."});
  }
  if (!isPositive(intent.entry_price)) {
    errors.push_back({"entry_price", "POSITIVE", "Entry price must be > 0."});
  }
  if (!isPositive(intent.atr)) {
    errors.push_back({"atr", "POSITIVE", "ATR must be > 0."});
  }

  if (intent.stop_price) {
    const double stop = *intent.stop_price;
    if (!isPositive(stop)) {
      errors.push_back({"stop_price", "POSITIVE", "Stop price must be > 0."});
    } else if (intent.direction == Direction::Long &&
               stop >= intent.entry_price) {
      errors.push_back(
          {"stop_price", "STOP_DIRECTION", "LONG stop must be below entry."});
    } else if (intent.direction == Direction::Short &&
               stop <= intent.entry_price) {
      errors.push_back(
          {"stop_price", "STOP_DIRECTION", "SHORT stop must be above entry."});
    }
  }

  if (intent.risk_pct) {
    const double r = *intent.risk_pct;
    if (!std::isfinite(r) || r <= 0.0 || r > 0.10) {
      errors.push_back(
          {"risk_pct", "RANGE", "Risk pct must be between 0 and 10%."});
    }
  }

  if (intent.leverage) {
    const double l = *intent.leverage;
    if (!std::isfinite(l) || l < 1.0 || l > 100.0) {
      errors.push_back({"leverage", "RANGE", "Leverage must be 1-100."});
    }
  }
  return errors;
}

// ---- validateProposal ----
std::vector<ValidationError> validateProposal(
    const domain::TradeProposal& p) {
  std::vector<ValidationError> errors;

  if (!p.governor.allowed) {
    errors.push_back({"governor", "GOVERNOR_BLOCKED",
                      "Governor blocked: " + joined(p.governor.reason_codes) +
                          "."});
  }

  if (!(p.sizing.quantity > 0.0)) {
    errors.push_back({"sizing.quantity", "ZERO_SIZE",
                      "Position size resolved to 0; check stop distance and "
                      "account equity."});
  }

  const double entry = p.intent.entry_price;
  if (p.intent.direction == Direction::Long) {
    if (p.exits.stop_price >= entry) {
      errors.push_back({"exits.stop_price", "STOP_ABOVE_ENTRY",
                        "Stop is above entry for a LONG trade."});
    }
    if (p.exits.take_profit_1 <= entry) {
      errors.push_back({"exits.take_profit_1", "TP_BELOW_ENTRY",
                        "TP1 is below entry for a LONG trade."});
    }
  } else {
    if (p.exits.stop_price <= entry) {
      errors.push_back({"exits.stop_price", "STOP_BELOW_ENTRY",
                        "Stop is below entry for a SHORT trade."});
    }
    if (p.exits.take_profit_1 >= entry) {
      errors.push_back({"exits.take_profit_1", "TP_ABOVE_ENTRY",
                        "TP1 is above entry for a SHORT trade."});
    }
  }

  const bool tp2_ok = !p.exits.take_profit_2 || isPositive(*p.exits.take_profit_2);
  if (!isPositive(p.exits.stop_price) || !isPositive(p.exits.take_profit_1) ||
      !tp2_ok) {
    errors.push_back({"exits", kBadExits,
                      "Exit prices must be finite and > 0."});
  }
  if (!std::isfinite(p.exits.rr_at_tp1) || p.exits.rr_at_tp1 < 1.0) {
    std::ostringstream msg;
    msg << "R:R at TP1 is " << std::fixed << std::setprecision(2)
        << p.exits.rr_at_tp1 << "; at least 1.00 required.";
    errors.push_back({"exits.rr_at_tp1", "LOW_RR", msg.str()});
  }

  if (p.sizing.notional_usd > p.sizing.account_equity * 0.5) {
    std::ostringstream msg;
    msg << "Notional $" << std::fixed << std::setprecision(0)
        << p.sizing.notional_usd << " exceeds 50% of equity.";
    errors.push_back({"sizing.notional_usd", kHighNotional, msg.str()});
  }
  return errors;
}

bool isBlocking(const ValidationError& error) {
  return error.code != kHighNotional;
}

}  // namespace tradegate
