#include "tradegate/scoring/probability_engine.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace tradegate {

namespace {

// Indexed by SignalId.
const std::array<SignalCalibration, kSignalCount> kCalibration = {{
    {SignalId::UnusualActivity, "Unusual Activity", 0.65, 0.25,
     SignalCluster::Volume},
    {SignalId::PutCallRatio, "Put/Call Ratio", 0.58, 0.15,
     SignalCluster::Volume},
    {SignalId::MaxPain, "Max Pain Gravity", 0.55, 0.10,
     SignalCluster::Momentum},
    {SignalId::TimeConfluence, "Time Confluence", 0.62, 0.20,
     SignalCluster::Trend},
    {SignalId::IvRank, "IV Environment", 0.60, 0.10,
     SignalCluster::Standalone},
    {SignalId::TrendAlignment, "Trend Alignment", 0.58, 0.10,
     SignalCluster::Trend},
    {SignalId::RsiMomentum, "RSI Momentum", 0.55, 0.05,
     SignalCluster::Momentum},
    {SignalId::VolumeConfirmation, "Volume Confirmation", 0.54, 0.05,
     SignalCluster::Volume},
}};

double logit(double p) { return std::log(p / (1.0 - p)); }

double logistic(double x) { return 1.0 / (1.0 + std::exp(-x)); }

// One signal after direction classification, before weighting.
struct Observation {
  SignalId id{SignalId::UnusualActivity};
  bool present{false};
  bool triggered{false};
  double confidence{0.0};
  SignalDirection direction{SignalDirection::Neutral};
  std::string reason;
};

std::string fixed(double v, int precision) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(precision) << v;
  return os.str();
}

template <typename Signal>
Observation observe(SignalId id, const std::optional<Signal>& signal) {
  Observation o;
  o.id = id;
  if (signal) {
    o.present = true;
    o.triggered = signal->triggered;
    o.confidence = std::isfinite(signal->confidence)
                       ? std::clamp(signal->confidence, 0.0, 1.0)
                       : 0.0;
  }
  return o;
}

// ---- per-signal direction rules ----

Observation observeUnusualActivity(
    const std::optional<UnusualActivitySignal>& s) {
  auto o = observe(SignalId::UnusualActivity, s);
  if (!s) return o;
  const bool call_bias = s->call_premium > s->put_premium;
  o.direction = call_bias               ? SignalDirection::Bullish
                : s->put_premium > 0.0  ? SignalDirection::Bearish
                                        : SignalDirection::Neutral;
  const double flow = std::max(s->call_premium, s->put_premium);
  if (flow > 0.0) {
    o.reason = "$" + fixed(flow, 0) + (call_bias ? " call" : " put") +
               " premium (" +
               (s->alert_level.empty() ? std::string("none") : s->alert_level) +
               " alert)";
  } else {
    o.reason = "Smart money detected";
  }
  return o;
}

Observation observePutCallRatio(const std::optional<PutCallRatioSignal>& s) {
  auto o = observe(SignalId::PutCallRatio, s);
  if (!s) return o;
  const double ratio = s->ratio.value_or(1.0);
  o.direction = ratio < 0.7   ? SignalDirection::Bullish
                : ratio > 1.0 ? SignalDirection::Bearish
                              : SignalDirection::Neutral;
  const char* tilt = o.direction == SignalDirection::Bullish   ? "Call-heavy"
                     : o.direction == SignalDirection::Bearish ? "Put-heavy"
                                                               : "Balanced";
  o.reason = "P/C " + fixed(ratio, 2) + " - " + tilt;
  return o;
}

Observation observeMaxPain(const std::optional<MaxPainSignal>& s) {
  auto o = observe(SignalId::MaxPain, s);
  if (!s) return o;
  // Price is pulled toward max pain into expiry.
  const double gap = s->current_price.value_or(0.0) - s->max_pain.value_or(0.0);
  o.direction = gap > 0.0   ? SignalDirection::Bearish
                : gap < 0.0 ? SignalDirection::Bullish
                            : SignalDirection::Neutral;
  if (s->max_pain) {
    o.reason = "Price $" + fixed(std::abs(gap), 2) +
               (gap > 0.0 ? " above" : " below") + " Max Pain $" +
               fixed(*s->max_pain, 2);
  } else {
    o.reason = "Max pain level detected";
  }
  return o;
}

Observation observeTimeConfluence(
    const std::optional<TimeConfluenceSignal>& s) {
  auto o = observe(SignalId::TimeConfluence, s);
  if (!s) return o;
  o.direction = s->stack > 0   ? SignalDirection::Bullish
                : s->stack < 0 ? SignalDirection::Bearish
                               : SignalDirection::Neutral;
  std::string windows;
  for (const auto& w : s->decompressing) {
    if (!windows.empty()) windows += ", ";
    windows += w;
  }
  o.reason = "Stack: " + std::to_string(s->stack) + " | " +
             (windows.empty() ? std::string("No decompression") : windows);
  return o;
}

Observation observeIvRank(const std::optional<IvRankSignal>& s) {
  auto o = observe(SignalId::IvRank, s);
  if (!s) return o;
  // IV shapes structure choice, not direction.
  o.direction = SignalDirection::Neutral;
  const char* bias = s->bias == IvBias::SellPremium  ? "Sell premium"
                     : s->bias == IvBias::BuyPremium ? "Buy premium"
                                                     : "Either works";
  o.reason = "IV Rank " + fixed(s->rank.value_or(50.0), 0) + "% - " + bias;
  return o;
}

Observation observeTrendAlignment(
    const std::optional<TrendAlignmentSignal>& s) {
  auto o = observe(SignalId::TrendAlignment, s);
  if (!s) return o;
  switch (s->ema200) {
    case EmaPosition::Above:
      o.direction = SignalDirection::Bullish;
      o.reason = "Price above EMA200";
      break;
    case EmaPosition::Below:
      o.direction = SignalDirection::Bearish;
      o.reason = "Price below EMA200";
      break;
    case EmaPosition::Near:
      o.direction = SignalDirection::Neutral;
      o.reason = "Price near EMA200";
      break;
  }
  return o;
}

Observation observeRsiMomentum(const std::optional<RsiMomentumSignal>& s) {
  auto o = observe(SignalId::RsiMomentum, s);
  if (!s) return o;
  const double rsi = s->rsi.value_or(50.0);
  if (rsi >= 55.0 && rsi <= 70.0) {
    o.direction = SignalDirection::Bullish;
  } else if (rsi > 70.0 || (rsi <= 45.0 && rsi >= 30.0)) {
    o.direction = SignalDirection::Bearish;
  } else if (rsi < 30.0) {
    o.direction = SignalDirection::Bullish;  // oversold bounce
  }
  const char* tone = o.direction == SignalDirection::Bullish
                         ? "Bullish momentum"
                     : o.direction == SignalDirection::Bearish
                         ? "Bearish/Overbought"
                         : "Neutral";
  o.reason = "RSI " + fixed(rsi, 0) + " - " + tone;
  return o;
}

Observation observeVolume(const std::optional<VolumeConfirmationSignal>& s,
                          SignalDirection requested) {
  auto o = observe(SignalId::VolumeConfirmation, s);
  if (!s) return o;
  // Volume confirms whatever direction the trade takes.
  o.direction = requested;
  o.reason = s->triggered ? "Above-average volume" : "Normal volume";
  return o;
}

int signOf(SignalDirection signal, SignalDirection reference) {
  if (signal == SignalDirection::Neutral ||
      reference == SignalDirection::Neutral) {
    return 0;
  }
  return signal == reference ? 1 : -1;
}

std::size_t clusterIndex(SignalCluster c) { return static_cast<std::size_t>(c); }

}  // namespace

// ---- lookups ----

const SignalCalibration& signalCalibration(SignalId id) {
  return kCalibration[static_cast<std::size_t>(id)];
}

const char* toString(SignalDirection d) {
  switch (d) {
    case SignalDirection::Bullish: return "bullish";
    case SignalDirection::Bearish: return "bearish";
    case SignalDirection::Neutral: return "neutral";
  }
  return "neutral";
}

const char* toString(SignalCluster c) {
  switch (c) {
    case SignalCluster::Trend:      return "trend";
    case SignalCluster::Momentum:   return "momentum";
    case SignalCluster::Volume:     return "volume";
    case SignalCluster::Standalone: return "standalone";
  }
  return "standalone";
}

double clusterDampening(SignalCluster cluster, int prior_same_direction) {
  const int n = std::max(0, prior_same_direction);
  switch (cluster) {
    case SignalCluster::Trend:
      return n == 0 ? 1.0 : n == 1 ? 0.75 : 0.6;
    case SignalCluster::Momentum:
    case SignalCluster::Volume:
      return n == 0 ? 1.0 : n == 1 ? 0.9 : 0.8;
    case SignalCluster::Standalone:
      return 1.0;
  }
  return 1.0;
}

// ---- quarterKelly ----

double quarterKelly(double win_probability, double reward_risk, double cap) {
  if (!(reward_risk > 0.0)) {
    return 0.0;
  }
  const double p = win_probability;
  const double q = 1.0 - p;
  const double full = (p * reward_risk - q) / reward_risk;
  return std::min(std::max(0.0, full * 0.25), cap);
}

// ---- confidenceLabelFor ----

std::string confidenceLabelFor(int pct, SignalDirection dominant) {
  if (dominant == SignalDirection::Neutral) return "No Clear Signal";
  if (pct >= 72) return "High Conviction";
  if (pct >= 65) return "Strong";
  if (pct >= 55) return "Moderate";
  if (pct >= 45) return "Weak";
  return "Bearish Lean";
}

// ---- calculateWinProbability ----

ProbabilityResult calculateWinProbability(const ProbabilityRequest& request) {
  const auto& sig = request.signals;

  const std::array<Observation, kSignalCount> observations = {
      observeUnusualActivity(sig.unusual_activity),
      observePutCallRatio(sig.put_call_ratio),
      observeMaxPain(sig.max_pain),
      observeTimeConfluence(sig.time_confluence),
      observeIvRank(sig.iv_rank),
      observeTrendAlignment(sig.trend_alignment),
      observeRsiMomentum(sig.rsi_momentum),
      observeVolume(sig.volume_confirmation, request.direction),
  };

  int bullish = 0;
  int bearish = 0;
  for (const auto& o : observations) {
    if (!o.triggered) continue;
    if (o.direction == SignalDirection::Bullish) ++bullish;
    if (o.direction == SignalDirection::Bearish) ++bearish;
  }

  ProbabilityResult result;
  result.r_multiple = request.reward_risk;
  result.dominant_direction = bullish > bearish   ? SignalDirection::Bullish
                              : bearish > bullish ? SignalDirection::Bearish
                                                  : SignalDirection::Neutral;
  result.reference_direction = request.direction != SignalDirection::Neutral
                                   ? request.direction
                                   : result.dominant_direction;

  // [cluster][0 = aligned, 1 = opposed] signals already counted.
  int seen[4][2] = {{0, 0}, {0, 0}, {0, 0}, {0, 0}};
  double log_odds = logit(kPriorWinProbability);
  double aligned_weight = 0.0;
  double total_weight = 0.0;

  for (const auto& o : observations) {
    const SignalCalibration& cal = signalCalibration(o.id);
    total_weight += cal.weight;

    SignalComponent component;
    component.id = o.id;
    component.name = cal.name;
    component.triggered = o.triggered;

    if (!o.triggered) {
      component.reason = "Not triggered";
      result.components.push_back(std::move(component));
      continue;
    }

    component.direction = o.direction;
    component.confidence = o.confidence;
    component.reason = o.reason;

    const int sign = signOf(o.direction, result.reference_direction);
    if (sign != 0) {
      int& count = seen[clusterIndex(cal.cluster)][sign > 0 ? 0 : 1];
      component.dampening = clusterDampening(cal.cluster, count);
      ++count;

      const double delta = sign * logit(cal.base_win_rate) * o.confidence *
                           component.dampening;
      component.contribution =
          std::clamp(delta, -kMaxSignalLogOdds, kMaxSignalLogOdds);
      log_odds += component.contribution;

      if (sign > 0) {
        ++result.aligned_count;
        aligned_weight += cal.weight;
      }
    }
    result.components.push_back(std::move(component));
  }

  if (total_weight > 0.0) {
    log_odds += kConfluenceBoost * (aligned_weight / total_weight);
  }

  result.log_odds = log_odds;
  result.win_probability = std::clamp(logistic(log_odds), kMinWinProbability,
                                      kMaxWinProbability);
  result.win_probability_pct =
      static_cast<int>(std::lround(result.win_probability * 100.0));
  result.confluence_score = static_cast<int>(std::lround(
      100.0 * result.aligned_count / static_cast<double>(kSignalCount)));
  result.confidence_label = confidenceLabelFor(result.win_probability_pct,
                                               result.dominant_direction);

  const double break_even =
      request.reward_risk > 0.0 ? 1.0 / (1.0 + request.reward_risk) : 1.0;
  const bool kelly_gate_open =
      result.aligned_count >= kMinAlignedForKelly &&
      result.win_probability >= kMinKellyProbability &&
      result.win_probability > break_even + kKellyEdgeBuffer;
  if (kelly_gate_open) {
    const double cap =
        request.options_trade ? kOptionsKellyCap : kDefaultKellyCap;
    const double kelly =
        quarterKelly(result.win_probability, request.reward_risk, cap);
    result.kelly_size_pct = std::round(kelly * 1000.0) / 10.0;
  }

  return result;
}

}  // namespace tradegate
