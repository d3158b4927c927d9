#include "tradegate/risk/institutional_risk_governor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace tradegate {

namespace {

double clamp01(double v) { return std::max(0.0, std::min(1.0, v)); }

double round2(double v) { return std::round(v * 100.0) / 100.0; }

std::string upper(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

const char* directionWord(domain::Direction d) {
  return d == domain::Direction::Long ? "long" : "short";
}

}  // namespace

// ---- string conversions ----

const char* toString(GovernorMode m) {
  switch (m) {
    case GovernorMode::FullOffense: return "FULL_OFFENSE";
    case GovernorMode::Normal:      return "NORMAL";
    case GovernorMode::Defensive:   return "DEFENSIVE";
    case GovernorMode::Lockdown:    return "LOCKDOWN";
  }
  return "LOCKDOWN";
}

const char* toString(VolatilityRegime v) {
  switch (v) {
    case VolatilityRegime::Low:     return "LOW";
    case VolatilityRegime::Normal:  return "NORMAL";
    case VolatilityRegime::High:    return "HIGH";
    case VolatilityRegime::Extreme: return "EXTREME";
  }
  return "NORMAL";
}

const char* toString(ExpansionAcceleration a) {
  switch (a) {
    case ExpansionAcceleration::Rising:  return "rising";
    case ExpansionAcceleration::Falling: return "falling";
    case ExpansionAcceleration::Flat:    return "flat";
  }
  return "flat";
}

const char* toString(Severity s) {
  switch (s) {
    case Severity::Low:    return "LOW";
    case Severity::Medium: return "MEDIUM";
    case Severity::High:   return "HIGH";
  }
  return "LOW";
}

std::optional<VolatilityRegime> parseVolatilityRegime(std::string_view s) {
  const auto u = upper(s);
  if (u == "LOW") return VolatilityRegime::Low;
  if (u == "NORMAL") return VolatilityRegime::Normal;
  if (u == "HIGH") return VolatilityRegime::High;
  if (u == "EXTREME") return VolatilityRegime::Extreme;
  return std::nullopt;
}

std::optional<ExpansionAcceleration> parseExpansionAcceleration(
    std::string_view s) {
  const auto u = upper(s);
  if (u == "RISING") return ExpansionAcceleration::Rising;
  if (u == "FALLING") return ExpansionAcceleration::Falling;
  if (u == "FLAT") return ExpansionAcceleration::Flat;
  return std::nullopt;
}

// ---- free helpers ----

VolatilityRegime classifyVolatilityRegime(double atr_percent,
                                          double expansion_probability,
                                          ExpansionAcceleration acceleration) {
  if (atr_percent >= 3.5 ||
      (expansion_probability >= 74.0 &&
       acceleration == ExpansionAcceleration::Rising)) {
    return VolatilityRegime::Extreme;
  }
  if (atr_percent >= 2.2 || expansion_probability >= 62.0) {
    return VolatilityRegime::High;
  }
  if (atr_percent <= 0.9 && expansion_probability <= 40.0) {
    return VolatilityRegime::Low;
  }
  return VolatilityRegime::Normal;
}

GovernorMode governorModeFromIrs(double irs) {
  if (irs >= 0.85) return GovernorMode::FullOffense;
  if (irs >= 0.70) return GovernorMode::Normal;
  if (irs >= 0.50) return GovernorMode::Defensive;
  return GovernorMode::Lockdown;
}

double governorModeMultiplier(GovernorMode mode) {
  switch (mode) {
    case GovernorMode::FullOffense: return 1.0;
    case GovernorMode::Normal:      return 0.85;
    case GovernorMode::Defensive:   return 0.6;
    case GovernorMode::Lockdown:    return 0.0;
  }
  return 0.0;
}

DrawdownScore drawdownProfile(double daily_r, double conviction, double tps) {
  DrawdownScore d;
  d.daily_r = round2(daily_r);

  if (daily_r <= -5.0) {
    d.score = 0.05;
    d.size_multiplier = 0.0;
    d.lockout = true;
    d.action = "AUTO LOCKOUT: daily drawdown <= -5R";
  } else if (daily_r <= -4.0) {
    const bool a_plus = conviction >= 82.0 && tps >= 78.0;
    d.score = a_plus ? 0.35 : 0.2;
    d.size_multiplier = a_plus ? 0.35 : 0.0;
    d.a_plus_only = true;
    d.lockout = !a_plus;
    d.action = a_plus ? "ONLY A+ setups"
                      : "A+ ONLY mode active; setup not qualified";
  } else if (daily_r <= -3.0) {
    d.score = 0.48;
    d.size_multiplier = 0.5;
    d.action = "Size reduced to 50% (drawdown <= -3R)";
  } else if (daily_r <= -2.0) {
    d.score = 0.7;
    d.size_multiplier = 0.75;
    d.action = "Size reduced to 75% (drawdown <= -2R)";
  } else {
    d.score = 0.95;
    d.size_multiplier = 1.0;
    d.action = "Normal drawdown profile";
  }
  return d;
}

// ---- InstitutionalRiskGovernor ----

InstitutionalRiskGovernor::InstitutionalRiskGovernor(
    InstitutionalLimits limits, const IClusterResolver& clusters)
    : limits_(limits), clusters_(clusters) {}

CapitalScore InstitutionalRiskGovernor::scoreCapital(
    const InstitutionalRiskInput& input) const {
  const double open = std::max(0.0, input.account.open_risk_pct);
  const double daily = std::max(0.0, input.account.daily_risk_pct);
  const double proposed = std::max(0.0, input.account.proposed_risk_pct);
  const double open_if_accepted = open + proposed;
  const double daily_if_accepted = daily + proposed;

  CapitalScore c;
  c.reason = "Within allocation";
  if (proposed > limits_.max_risk_per_trade_pct) {
    c.blocked = true;
    std::ostringstream os;
    os << "Per-trade risk exceeds " << limits_.max_risk_per_trade_pct << "%";
    c.reason = os.str();
  } else if (daily_if_accepted > limits_.max_daily_risk_pct) {
    c.blocked = true;
    c.reason = "Daily risk limit exceeded";
  } else if (open_if_accepted > limits_.max_open_risk_pct) {
    c.blocked = true;
    c.reason = "Open risk exceeds allocation";
  }

  const double utilization =
      std::max({open_if_accepted / limits_.max_open_risk_pct,
                daily_if_accepted / limits_.max_daily_risk_pct,
                proposed / limits_.max_risk_per_trade_pct});

  c.used_pct = round2(clamp01(open_if_accepted / limits_.max_open_risk_pct));
  c.open_risk_pct = round2(open);
  c.proposed_risk_pct = round2(proposed);
  c.daily_risk_pct = round2(daily);
  c.score = clamp01(1.0 - utilization * 0.9);
  return c;
}

CorrelationScore InstitutionalRiskGovernor::scoreCorrelation(
    const InstitutionalRiskInput& input) const {
  const auto& proposed = input.exposure.proposed;
  const std::string cluster =
      proposed && proposed->cluster
          ? *proposed->cluster
          : clusters_.resolve(input.market, input.symbol);
  const domain::Direction direction =
      proposed ? proposed->direction : domain::Direction::Long;

  CorrelationScore c;
  c.cluster = cluster;
  c.max_correlated = limits_.max_correlated;
  c.correlated_count = static_cast<int>(std::count_if(
      input.exposure.open_positions.begin(),
      input.exposure.open_positions.end(),
      [&](const CorrelationPosition& p) {
        const std::string pc =
            p.cluster ? *p.cluster : clusters_.resolve(input.market, p.symbol);
        return pc == cluster && p.direction == direction;
      }));

  c.blocked = c.correlated_count >= limits_.max_correlated;
  c.severity = c.correlated_count >= 2   ? Severity::High
               : c.correlated_count == 1 ? Severity::Medium
                                         : Severity::Low;
  c.score = clamp01(1.0 - static_cast<double>(c.correlated_count) /
                              (limits_.max_correlated + 1));
  c.reason = c.blocked
                 ? "Max correlated exposure reached in " + cluster
                 : "Correlated exposure " + std::to_string(c.correlated_count) +
                       "/" + std::to_string(limits_.max_correlated) + " in " +
                       cluster;
  return c;
}

InstitutionalRiskOutput InstitutionalRiskGovernor::evaluate(
    const InstitutionalRiskInput& input) const {
  InstitutionalRiskOutput out;
  auto& reasons = out.hard_block_reasons;

  // Capital
  out.capital = scoreCapital(input);
  if (out.capital.blocked) {
    reasons.push_back("CAPITAL: " + out.capital.reason);
  }

  // Drawdown
  out.drawdown = drawdownProfile(input.account.daily_r, input.conviction,
                                 input.tps);
  if (out.drawdown.lockout) {
    reasons.push_back("DRAWDOWN: " + out.drawdown.action);
  }

  // Correlation
  out.correlation = scoreCorrelation(input);
  if (out.correlation.blocked) {
    reasons.push_back("CORRELATION: " + out.correlation.reason);
  }

  // Volatility
  auto& vol = out.volatility;
  vol.regime = input.volatility_override.value_or(classifyVolatilityRegime(
      input.atr_percent, input.expansion_probability, input.acceleration));
  vol.breakout_blocked = vol.regime == VolatilityRegime::Extreme &&
                         domain::isBreakout(input.archetype);
  switch (vol.regime) {
    case VolatilityRegime::Extreme:
      vol.size_multiplier = 0.5;
      vol.score = 0.4;
      break;
    case VolatilityRegime::High:
      vol.size_multiplier = 0.8;
      vol.score = 0.72;
      break;
    case VolatilityRegime::Low:
      vol.size_multiplier = 0.85;
      vol.score = 0.66;
      break;
    case VolatilityRegime::Normal:
      vol.size_multiplier = 1.0;
      vol.score = 0.95;
      break;
  }
  if (vol.breakout_blocked) {
    reasons.push_back("VOLATILITY: EXTREME regime blocks breakout entries");
  }

  // Behavior
  const auto& b = input.behavior;
  auto& beh = out.behavior;
  beh.cooldown_active =
      b.consecutive_losses >= 3 && b.losses_window_minutes <= 20.0;
  beh.cooldown_minutes = beh.cooldown_active ? 30 : 0;
  beh.overtrading_blocked = b.trades_this_session > 6 && b.expectancy_r < 0.0;
  beh.violations_blocked = b.rule_violations >= 2;
  beh.reason = beh.cooldown_active
                   ? "COOLDOWN MODE: 30 minutes after rapid loss cluster"
               : beh.overtrading_blocked
                   ? "Overtrading detected with negative expectancy"
               : beh.violations_blocked ? "Repeated rule violations detected"
                                        : "Behavior stable";
  beh.score = clamp01(
      1.0 - ((beh.cooldown_active ? 0.55 : 0.0) +
             (beh.overtrading_blocked ? 0.35 : 0.0) +
             std::min(0.25, std::max(0, b.rule_violations) * 0.08)));
  if (beh.cooldown_active || beh.overtrading_blocked ||
      beh.violations_blocked) {
    reasons.push_back("BEHAVIOR: " + beh.reason);
  }

  // Composite
  const double irs = clamp01(out.capital.score * 0.30 +
                             out.drawdown.score * 0.25 +
                             out.correlation.score * 0.20 + vol.score * 0.15 +
                             beh.score * 0.10);
  out.mode = governorModeFromIrs(irs);
  if (out.mode == GovernorMode::Lockdown) {
    reasons.push_back("IRS: Lockdown mode (< 0.50)");
  }

  out.hard_blocked = !reasons.empty();
  out.execution_allowed = !out.hard_blocked;

  auto& sizing = out.sizing;
  sizing.risk_governor_multiplier = governorModeMultiplier(out.mode);
  sizing.personal_performance_multiplier =
      round2(b.expectancy_r < 0.0 ? clamp01(0.85 + b.expectancy_r * 0.2) : 1.0);
  sizing.final_size = round2(
      sizing.base_size * sizing.flow_state_multiplier *
      (out.execution_allowed ? sizing.risk_governor_multiplier : 0.0) *
      out.drawdown.size_multiplier * vol.size_multiplier *
      sizing.personal_performance_multiplier);

  // Operator-facing guidance.
  out.allowed.push_back(out.drawdown.a_plus_only
                            ? "A+ setups only while drawdown control active"
                            : "Standard setups allowed within flow permissions");
  if (out.mode == GovernorMode::Defensive) {
    out.allowed.push_back("Defensive sizing enforced");
  }
  if (out.mode == GovernorMode::FullOffense) {
    out.allowed.push_back("Full offense available under strong IRS");
  }

  if (out.correlation.blocked) {
    out.blocked.push_back("New " + out.correlation.cluster + " " +
                          directionWord(input.exposure.proposed
                                            ? input.exposure.proposed->direction
                                            : domain::Direction::Long) +
                          " positions");
  }
  if (vol.breakout_blocked) {
    out.blocked.push_back("Breakout entries in EXTREME volatility");
  }
  if (beh.cooldown_active) {
    out.blocked.push_back("All new trades during 30-minute cooldown");
  }
  if (beh.overtrading_blocked) {
    out.blocked.push_back("New trades: overtrading + negative expectancy");
  }
  if (beh.violations_blocked) {
    out.blocked.push_back("New trades after repeated rule violations");
  }
  if (out.drawdown.lockout) {
    out.blocked.push_back("All trading lockout (drawdown governor)");
  }
  if (out.capital.blocked) {
    out.blocked.push_back("New risk allocation (capital limits exceeded)");
  }
  if (out.mode == GovernorMode::Lockdown) {
    out.blocked.push_back("All new trades (IRS lockdown mode)");
  }

  out.irs = round2(irs);
  out.capital.score = round2(out.capital.score);
  out.correlation.score = round2(out.correlation.score);
  beh.score = round2(beh.score);
  return out;
}

}  // namespace tradegate
