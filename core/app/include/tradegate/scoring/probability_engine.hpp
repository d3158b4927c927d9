#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// Probability engine — signal evidence to bounded win probability
// -----------------------------------------------------------------------------
//
// @brief  Combines up to eight optional trading signals in log-odds space
//         and derives a guard-railed quarter-Kelly position size.
//
// @details
// Starting from a 0.5 prior (log-odds 0), every triggered signal adds
//
//   delta = sign * logit(base_win_rate) * confidence * dampening
//
// clamped to +/- kMaxSignalLogOdds. sign is +1 when the signal agrees with
// the reference direction, -1 when it opposes it and 0 when it carries no
// direction. Signals in the same correlation cluster (trend, momentum,
// volume) that point the same way are dampened 1st/2nd/3rd+ so correlated
// evidence is not counted at full strength twice.
//
// After all signals a confluence boost of kConfluenceBoost times the
// aligned-weight fraction is added, the log-odds are mapped back through
// the logistic function and the result is clamped to
// [kMinWinProbability, kMaxWinProbability].
//
// Kelly sizing is zero unless all three gates pass:
//   aligned signals >= 3
//   win probability >= 0.55
//   win probability >  break-even (1 / (1 + R)) + 0.05
// The size is quarter-Kelly, capped at 10% for options and 25% otherwise.
//
// Pure and deterministic. Safe to call concurrently.
// -----------------------------------------------------------------------------

enum class SignalDirection {
  Bullish,
  Bearish,
  Neutral,
};

enum class SignalCluster {
  Trend,
  Momentum,
  Volume,
  Standalone,
};

enum class SignalId : std::size_t {
  UnusualActivity = 0,
  PutCallRatio,
  MaxPain,
  TimeConfluence,
  IvRank,
  TrendAlignment,
  RsiMomentum,
  VolumeConfirmation,
};

inline constexpr std::size_t kSignalCount = 8;
inline constexpr double kPriorWinProbability = 0.5;
inline constexpr double kMaxSignalLogOdds = 0.6;
inline constexpr double kConfluenceBoost = 0.2;
inline constexpr double kMinWinProbability = 0.35;
inline constexpr double kMaxWinProbability = 0.80;
inline constexpr int kMinAlignedForKelly = 3;
inline constexpr double kMinKellyProbability = 0.55;
inline constexpr double kKellyEdgeBuffer = 0.05;
inline constexpr double kOptionsKellyCap = 0.10;
inline constexpr double kDefaultKellyCap = 0.25;

// Static per-signal calibration.
struct SignalCalibration {
  SignalId id{SignalId::UnusualActivity};
  const char* name{""};
  double base_win_rate{0.5};
  double weight{0.0};
  SignalCluster cluster{SignalCluster::Standalone};
};

const SignalCalibration& signalCalibration(SignalId id);

// Common fields of every signal. confidence is clamped to [0, 1].
struct SignalInput {
  bool triggered{false};
  double confidence{0.0};
};

struct UnusualActivitySignal : SignalInput {
  double call_premium{0.0};
  double put_premium{0.0};
  std::string alert_level;  // "high", "moderate", "low", "none"
};

struct PutCallRatioSignal : SignalInput {
  std::optional<double> ratio;
};

struct MaxPainSignal : SignalInput {
  std::optional<double> max_pain;
  std::optional<double> current_price;
};

struct TimeConfluenceSignal : SignalInput {
  int stack{0};  // signed count of aligned timeframes
  std::vector<std::string> decompressing;
};

enum class IvBias {
  BuyPremium,
  SellPremium,
  Neutral,
};

struct IvRankSignal : SignalInput {
  std::optional<double> rank;
  IvBias bias{IvBias::Neutral};
};

enum class EmaPosition {
  Above,
  Below,
  Near,
};

struct TrendAlignmentSignal : SignalInput {
  EmaPosition ema200{EmaPosition::Near};
};

struct RsiMomentumSignal : SignalInput {
  std::optional<double> rsi;
};

struct VolumeConfirmationSignal : SignalInput {};

struct ProbabilitySignals {
  std::optional<UnusualActivitySignal> unusual_activity;
  std::optional<PutCallRatioSignal> put_call_ratio;
  std::optional<MaxPainSignal> max_pain;
  std::optional<TimeConfluenceSignal> time_confluence;
  std::optional<IvRankSignal> iv_rank;
  std::optional<TrendAlignmentSignal> trend_alignment;
  std::optional<RsiMomentumSignal> rsi_momentum;
  std::optional<VolumeConfirmationSignal> volume_confirmation;
};

struct ProbabilityRequest {
  ProbabilitySignals signals;
  SignalDirection direction{SignalDirection::Neutral};  // requested trade
  double reward_risk{2.0};
  bool options_trade{true};
};

struct SignalComponent {
  SignalId id{SignalId::UnusualActivity};
  std::string name;
  SignalDirection direction{SignalDirection::Neutral};
  bool triggered{false};
  double confidence{0.0};
  double dampening{1.0};
  double contribution{0.0};  // log-odds delta actually applied
  std::string reason;
};

struct ProbabilityResult {
  double win_probability{kPriorWinProbability};  // fraction, clamped
  int win_probability_pct{50};
  double log_odds{0.0};
  std::string confidence_label;
  int aligned_count{0};
  int total_signals{static_cast<int>(kSignalCount)};
  int confluence_score{0};  // aligned / total * 100
  SignalDirection dominant_direction{SignalDirection::Neutral};
  SignalDirection reference_direction{SignalDirection::Neutral};
  double kelly_size_pct{0.0};  // percent of capital, one decimal
  double r_multiple{2.0};
  std::vector<SignalComponent> components;  // always kSignalCount entries
};

const char* toString(SignalDirection d);
const char* toString(SignalCluster c);

// Dampening factor for the n-th (0-based) same-direction signal in a cluster.
double clusterDampening(SignalCluster cluster, int prior_same_direction);

// -------------------------------------------------------------------------
// quarterKelly(p, b, cap)
// -------------------------------------------------------------------------
// @brief  Quarter of the full Kelly fraction (p*b - q)/b, floored at 0 and
//         capped at `cap`. Returns 0 for a non-positive reward:risk.
// -------------------------------------------------------------------------
double quarterKelly(double win_probability, double reward_risk, double cap);

// Label for a rounded win probability in percent.
std::string confidenceLabelFor(int win_probability_pct,
                               SignalDirection dominant);

// -------------------------------------------------------------------------
// calculateWinProbability(request)
// -------------------------------------------------------------------------
// @brief  Runs the log-odds update over the eight signals.
//
// @details
// When the requested direction is Neutral the dominant signal direction is
// used as the reference. With no reference at all every sign is zero and the
// result is the prior.
// -------------------------------------------------------------------------
ProbabilityResult calculateWinProbability(const ProbabilityRequest& request);

}  // namespace tradegate
