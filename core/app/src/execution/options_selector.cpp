#include "tradegate/execution/options_selector.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace tradegate {

using domain::Direction;
using domain::OptionsStructure;
using domain::Regime;

namespace {

constexpr double kContractMultiplier = 100.0;

double round2(double v) { return std::round(v * 100.0) / 100.0; }

bool isHighVol(Regime r) {
  return r == Regime::VolExpansion || r == Regime::RiskOffStress;
}

std::string buildNotes(OptionsStructure s, int dte, double delta, Regime r,
                       double confidence) {
  std::ostringstream os;
  os << "Structure: " << domain::toString(s) << " | DTE: " << dte << "d"
     << " | Delta target: " << std::lround(delta * 100.0)
     << " | Regime: " << domain::toString(r) << " | Confidence: " << confidence;
  switch (s) {
    case OptionsStructure::IronCondor:
      os << " | Non-directional, range-bound play.";
      break;
    case OptionsStructure::Straddle:
      os << " | Expecting vol expansion / breakout.";
      break;
    case OptionsStructure::CallDebitSpread:
    case OptionsStructure::PutDebitSpread:
      os << " | Defined risk, max loss = debit paid.";
      break;
    default:
      break;
  }
  return os.str();
}

}  // namespace

OptionsStructure pickOptionsStructure(Regime regime, Direction direction,
                                      double confidence) {
  if (isHighVol(regime)) {
    return direction == Direction::Long ? OptionsStructure::CallDebitSpread
                                        : OptionsStructure::PutDebitSpread;
  }
  if (regime == Regime::RangeNeutral && confidence < 65.0) {
    return OptionsStructure::IronCondor;
  }
  if (regime == Regime::VolContraction && confidence >= 70.0) {
    return OptionsStructure::Straddle;
  }
  return direction == Direction::Long ? OptionsStructure::LongCall
                                      : OptionsStructure::LongPut;
}

int defaultDte(Regime regime) {
  switch (regime) {
    case Regime::TrendUp:
    case Regime::TrendDown:
      return 30;
    case Regime::RangeNeutral: return 14;
    case Regime::VolExpansion: return 21;
    case Regime::VolContraction: return 45;
    case Regime::RiskOffStress: return 7;
  }
  return 21;
}

double baseDelta(double confidence) {
  if (confidence >= 80.0) return 0.70;
  if (confidence >= 65.0) return 0.55;
  if (confidence >= 50.0) return 0.45;
  return 0.30;
}

// ---- selectOptions ----
domain::OptionsSelection selectOptions(const OptionsRequest& req) {
  domain::OptionsSelection sel;
  sel.structure = req.force_structure.value_or(
      pickOptionsStructure(req.regime, req.direction, req.confidence));
  sel.dte = req.force_dte.value_or(defaultDte(req.regime));
  sel.delta = req.force_delta.value_or(baseDelta(req.confidence));
  sel.strike = req.entry_price;

  const double iv_proxy = isHighVol(req.regime) ? 0.45 : 0.25;
  const double premium = req.entry_price * sel.delta *
                         std::sqrt(std::max(0, sel.dte) / 365.0) * iv_proxy;

  std::optional<double> max_loss;
  switch (sel.structure) {
    case OptionsStructure::CallDebitSpread:
    case OptionsStructure::PutDebitSpread:
    case OptionsStructure::IronCondor:
    case OptionsStructure::LongCall:
    case OptionsStructure::LongPut:
      max_loss = premium * kContractMultiplier;
      break;
    case OptionsStructure::Straddle:
    case OptionsStructure::Strangle:
      max_loss = premium * 2.0 * kContractMultiplier;
      break;
    case OptionsStructure::None:
      break;
  }
  if (max_loss && *max_loss > req.risk_budget_usd) {
    max_loss = req.risk_budget_usd;
  }

  sel.premium_est = round2(premium);
  if (max_loss) sel.max_loss_usd = round2(*max_loss);
  sel.notes = buildNotes(sel.structure, sel.dte, sel.delta, req.regime,
                         req.confidence);
  return sel;
}

}  // namespace tradegate
