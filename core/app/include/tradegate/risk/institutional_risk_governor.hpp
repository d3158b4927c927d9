#pragma once

#include "tradegate/domain/flow_types.hpp"
#include "tradegate/domain/market_types.hpp"
#include "tradegate/risk/cluster_resolver.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// InstitutionalLimits — capital allocation caps of the institutional governor
// -----------------------------------------------------------------------------
//
// @details
// Percentages are whole percent of equity (1.0 == 1%), matching the units of
// InstitutionalRiskInput::account. Loaded from the "institutional" object of
// the engine config; copied by value into the governor.
// -----------------------------------------------------------------------------
struct InstitutionalLimits {
  double max_risk_per_trade_pct{1.0};
  double max_daily_risk_pct{3.0};
  double max_open_risk_pct{4.0};
  int max_correlated{2};
};

enum class GovernorMode {
  FullOffense,
  Normal,
  Defensive,
  Lockdown,
};

enum class VolatilityRegime {
  Low,
  Normal,
  High,
  Extreme,
};

enum class ExpansionAcceleration {
  Rising,
  Falling,
  Flat,
};

enum class Severity {
  Low,
  Medium,
  High,
};

const char* toString(GovernorMode m);
const char* toString(VolatilityRegime v);
const char* toString(ExpansionAcceleration a);
const char* toString(Severity s);

std::optional<VolatilityRegime> parseVolatilityRegime(std::string_view s);
std::optional<ExpansionAcceleration> parseExpansionAcceleration(
    std::string_view s);

struct CorrelationPosition {
  std::string symbol;
  domain::Direction direction{domain::Direction::Long};
  std::optional<std::string> cluster;  // resolved when absent
};

struct InstitutionalRiskInput {
  domain::Market market{domain::Market::Equities};
  std::string symbol;
  domain::FlowState flow_state{domain::FlowState::Neutral};
  domain::TradeArchetype archetype{domain::TradeArchetype::PullbackEntry};
  double conviction{0.0};  // 0-100
  double tps{0.0};         // 0-100
  double atr_percent{0.0};
  double expansion_probability{0.0};  // 0-100
  ExpansionAcceleration acceleration{ExpansionAcceleration::Flat};

  struct Account {
    double open_risk_pct{0.0};
    double proposed_risk_pct{0.0};
    double daily_risk_pct{0.0};
    double daily_r{0.0};  // session P&L in R-multiples
  } account;

  struct Exposure {
    std::vector<CorrelationPosition> open_positions;
    std::optional<CorrelationPosition> proposed;
  } exposure;

  struct Behavior {
    int consecutive_losses{0};
    double losses_window_minutes{0.0};
    int trades_this_session{0};
    double expectancy_r{0.0};
    int rule_violations{0};
  } behavior;

  std::optional<VolatilityRegime> volatility_override;
};

struct CapitalScore {
  double used_pct{0.0};  // open-if-accepted / max open, 0-1
  double open_risk_pct{0.0};
  double proposed_risk_pct{0.0};
  double daily_risk_pct{0.0};
  bool blocked{false};
  std::string reason;
  double score{0.0};
};

struct DrawdownScore {
  double daily_r{0.0};
  double size_multiplier{1.0};
  bool a_plus_only{false};
  bool lockout{false};
  double score{0.0};
  std::string action;
};

struct CorrelationScore {
  std::string cluster;
  int correlated_count{0};
  int max_correlated{0};
  bool blocked{false};
  Severity severity{Severity::Low};
  double score{0.0};
  std::string reason;
};

struct VolatilityScore {
  VolatilityRegime regime{VolatilityRegime::Normal};
  bool breakout_blocked{false};
  double size_multiplier{1.0};
  double score{0.0};
};

struct BehaviorScore {
  bool cooldown_active{false};
  int cooldown_minutes{0};
  bool overtrading_blocked{false};
  bool violations_blocked{false};
  double score{0.0};
  std::string reason;
};

struct SizingBreakdown {
  double base_size{1.0};
  double flow_state_multiplier{1.0};
  double risk_governor_multiplier{1.0};
  double personal_performance_multiplier{1.0};
  double final_size{0.0};
};

// -----------------------------------------------------------------------------
// InstitutionalRiskOutput
// -----------------------------------------------------------------------------
//
// @details
// Invariant: hard_blocked == !hard_block_reasons.empty() and
// execution_allowed == !hard_blocked. The composite index (irs) only selects
// the mode and therefore the sizing multiplier; it never clears a hard block.
// Scores and multipliers are rounded to two decimals.
// -----------------------------------------------------------------------------
struct InstitutionalRiskOutput {
  bool execution_allowed{false};
  bool hard_blocked{true};
  std::vector<std::string> hard_block_reasons;
  double irs{0.0};
  GovernorMode mode{GovernorMode::Lockdown};
  CapitalScore capital;
  DrawdownScore drawdown;
  CorrelationScore correlation;
  VolatilityScore volatility;
  BehaviorScore behavior;
  SizingBreakdown sizing;
  std::vector<std::string> allowed;
  std::vector<std::string> blocked;
};

// -----------------------------------------------------------------------------
// InstitutionalRiskGovernor
// -----------------------------------------------------------------------------
//
// @brief  Computes five independent sub-scores and folds them into the
//         Institutional Risk Score (IRS).
//
// @details
// Sub-scores and their IRS weights:
//   capital      30%  (open + proposed) vs per-trade / daily / open caps
//   drawdown     25%  step function of session R
//   correlation  20%  same-cluster same-direction open positions
//   volatility   15%  LOW / NORMAL / HIGH / EXTREME classification
//   behavior     10%  cooldown, overtrading, rule violations
//
// Mode from IRS: >= 0.85 FULL_OFFENSE, >= 0.70 NORMAL, >= 0.50 DEFENSIVE,
// otherwise LOCKDOWN (which is itself a hard block).
//
// Every hard-block condition is evaluated independently and listed in
// hard_block_reasons with its category prefix ("CAPITAL: ", "DRAWDOWN: ",
// "CORRELATION: ", "VOLATILITY: ", "BEHAVIOR: ", "IRS: ").
//
// Ownership:
//   Holds its limits by value and the cluster resolver by reference.
//
// Thread model:
//   evaluate() is const and touches no shared state.
// -----------------------------------------------------------------------------
class InstitutionalRiskGovernor {
 public:
  explicit InstitutionalRiskGovernor(
      InstitutionalLimits limits = {},
      const IClusterResolver& clusters = StaticClusterResolver::instance());

  InstitutionalRiskGovernor(const InstitutionalRiskGovernor&) = delete;
  InstitutionalRiskGovernor& operator=(const InstitutionalRiskGovernor&) =
      delete;

  InstitutionalRiskOutput evaluate(const InstitutionalRiskInput& input) const;

  const InstitutionalLimits& limits() const { return limits_; }

 private:
  CapitalScore scoreCapital(const InstitutionalRiskInput& input) const;
  CorrelationScore scoreCorrelation(const InstitutionalRiskInput& input) const;

  InstitutionalLimits limits_;
  const IClusterResolver& clusters_;
};

// Free helpers, exposed for direct testing.
VolatilityRegime classifyVolatilityRegime(double atr_percent,
                                          double expansion_probability,
                                          ExpansionAcceleration acceleration);
GovernorMode governorModeFromIrs(double irs);
double governorModeMultiplier(GovernorMode mode);
DrawdownScore drawdownProfile(double daily_r, double conviction, double tps);

}  // namespace tradegate
