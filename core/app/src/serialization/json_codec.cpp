#include "tradegate/serialization/json_codec.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace tradegate {

using nlohmann::json;

namespace {

// ---- field access helpers ----

template <typename T>
T field(const json& j, const char* key, T def) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return def;
  try {
    return it->template get<T>();
  } catch (const json::exception& e) {
    throw CodecError(std::string(key) + ": " + e.what());
  }
}

template <typename T>
std::optional<T> optionalField(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  try {
    return it->template get<T>();
  } catch (const json::exception& e) {
    throw CodecError(std::string(key) + ": " + e.what());
  }
}

template <typename T>
T required(const json& j, const char* key) {
  std::optional<T> v = optionalField<T>(j, key);
  if (!v) throw CodecError(std::string(key) + " is required");
  return *v;
}

template <typename E, typename Parse>
std::optional<E> optionalEnum(const json& j, const char* key, Parse parse) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  if (!it->is_string()) {
    throw CodecError(std::string(key) + ": expected a string");
  }
  const std::string label = it->template get<std::string>();
  std::optional<E> v = parse(label);
  if (!v) {
    throw CodecError(std::string(key) + ": unknown value '" + label + "'");
  }
  return v;
}

template <typename E, typename Parse>
E enumField(const json& j, const char* key, E def, Parse parse) {
  return optionalEnum<E>(j, key, parse).value_or(def);
}

// Null when absent. Throws when present but not an object.
const json* child(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  if (!it->is_object()) {
    throw CodecError(std::string(key) + ": expected an object");
  }
  return &*it;
}

const json* childArray(const json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  if (!it->is_array()) {
    throw CodecError(std::string(key) + ": expected an array");
  }
  return &*it;
}

void requireObject(const json& j, const char* what) {
  if (!j.is_object()) {
    throw CodecError(std::string(what) + ": expected an object");
  }
}

template <typename T>
json nullable(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

// ---- labels without a parseX() in the core ----

std::optional<SignalDirection> parseSignalDirection(std::string_view s) {
  const std::string v = lower(s);
  if (v == "bullish" || v == "long") return SignalDirection::Bullish;
  if (v == "bearish" || v == "short") return SignalDirection::Bearish;
  if (v == "neutral") return SignalDirection::Neutral;
  return std::nullopt;
}

std::optional<IvBias> parseIvBias(std::string_view s) {
  const std::string v = lower(s);
  if (v == "buy_premium") return IvBias::BuyPremium;
  if (v == "sell_premium") return IvBias::SellPremium;
  if (v == "neutral") return IvBias::Neutral;
  return std::nullopt;
}

std::optional<EmaPosition> parseEmaPosition(std::string_view s) {
  const std::string v = lower(s);
  if (v == "above") return EmaPosition::Above;
  if (v == "below") return EmaPosition::Below;
  if (v == "near") return EmaPosition::Near;
  return std::nullopt;
}

template <typename Signal>
Signal decodeSignalBase(const json& j) {
  Signal s;
  s.triggered = field<bool>(j, "triggered", false);
  s.confidence = field<double>(j, "confidence", 0.0);
  return s;
}

domain::OpenPosition decodeOpenPosition(const json& j) {
  requireObject(j, "open_positions[]");
  domain::OpenPosition p;
  p.symbol = required<std::string>(j, "symbol");
  p.direction = enumField(j, "direction", domain::Direction::Long,
                          domain::parseDirection);
  p.asset_class = enumField(j, "asset_class", domain::AssetClass::Equity,
                            domain::parseAssetClass);
  return p;
}

CorrelationPosition decodeCorrelationPosition(const json& j) {
  requireObject(j, "position");
  CorrelationPosition p;
  p.symbol = required<std::string>(j, "symbol");
  p.direction = enumField(j, "direction", domain::Direction::Long,
                          domain::parseDirection);
  p.cluster = optionalField<std::string>(j, "cluster");
  return p;
}

json encodeComponents(const ComponentVector& v) {
  json out = json::object();
  for (std::size_t i = 0; i < kComponentCount; ++i) {
    out[toString(static_cast<Component>(i))] = v[i];
  }
  return out;
}

json encodeVerdict(const domain::PermissionVerdict& v) {
  json j;
  j["permission"] = toString(v.permission);
  j["risk_mode"] = toString(v.risk_mode);
  j["risk_per_trade"] = v.risk_per_trade;
  j["max_position_size"] = v.max_position_size;
  j["required_stop_min_distance"] = v.required_stop_min_distance;
  j["constraints"] = {
      {"max_gross_exposure", v.constraints.max_gross_exposure},
      {"max_net_exposure", v.constraints.max_net_exposure},
      {"max_open_risk_r", v.constraints.max_open_risk_r},
      {"no_add_ons", v.constraints.no_add_ons},
      {"trigger_only", v.constraints.trigger_only},
  };
  j["required_actions"] = v.required_actions;
  j["reason_codes"] = v.reason_codes;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Decoding
// -----------------------------------------------------------------------------

domain::TradeIntent decodeTradeIntent(const json& j) {
  requireObject(j, "intent");
  domain::TradeIntent t;
  t.symbol = required<std::string>(j, "symbol");
  t.asset_class = enumField(j, "asset_class", domain::AssetClass::Equity,
                            domain::parseAssetClass);
  t.direction =
      enumField(j, "direction", domain::Direction::Long, domain::parseDirection);
  t.strategy_tag = enumField(j, "strategy_tag", domain::StrategyTag::TrendPullback,
                             domain::parseStrategyTag);
  t.confidence = field<double>(j, "confidence", t.confidence);
  t.regime =
      enumField(j, "regime", domain::Regime::RangeNeutral, domain::parseRegime);
  t.entry_price = required<double>(j, "entry_price");
  t.atr = field<double>(j, "atr", 0.0);
  t.stop_price = optionalField<double>(j, "stop_price");
  t.event_severity = enumField(j, "event_severity", domain::EventSeverity::None,
                               domain::parseEventSeverity);
  t.options_dte = optionalField<int>(j, "options_dte");
  t.options_delta = optionalField<double>(j, "options_delta");
  t.options_structure = optionalEnum<domain::OptionsStructure>(
      j, "options_structure", domain::parseOptionsStructure);
  t.account_equity = optionalField<double>(j, "account_equity");
  t.risk_pct = optionalField<double>(j, "risk_pct");
  t.leverage = optionalField<double>(j, "leverage");
  if (const json* arr = childArray(j, "open_positions")) {
    for (const auto& p : *arr) {
      t.open_positions.push_back(decodeOpenPosition(p));
    }
  }
  return t;
}

SnapshotInput decodeSnapshotInput(const json& j, SnapshotInput d) {
  requireObject(j, "session");
  d.guard_enabled = field<bool>(j, "guard_enabled", d.guard_enabled);
  d.regime = enumField(j, "regime", d.regime, domain::parseRegime);
  d.data_status =
      enumField(j, "data_status", d.data_status, domain::parseDataStatus);
  d.data_age_seconds = field<double>(j, "data_age_seconds", d.data_age_seconds);
  d.event_severity = enumField(j, "event_severity", d.event_severity,
                               domain::parseEventSeverity);
  d.realized_daily_r = field<double>(j, "realized_daily_r", d.realized_daily_r);
  d.open_risk_r = field<double>(j, "open_risk_r", d.open_risk_r);
  d.consecutive_losses =
      field<int>(j, "consecutive_losses", d.consecutive_losses);
  d.r_budget_halved = field<bool>(j, "r_budget_halved", d.r_budget_halved);
  d.trades_today = field<int>(j, "trades_today", d.trades_today);
  d.market = enumField(j, "market", d.market, domain::parseMarket);
  return d;
}

ExposureState decodeExposure(const json& j, const domain::TradeIntent& intent) {
  requireObject(j, "exposure");
  ExposureState e;
  e.daily_loss_pct = field<double>(j, "daily_loss_pct", 0.0);
  e.portfolio_heat_pct = field<double>(j, "portfolio_heat_pct", 0.0);
  e.open_trade_count = field<int>(j, "open_trade_count", 0);
  if (const json* s = child(j, "session")) {
    SnapshotInput d;
    d.regime = intent.regime;
    d.event_severity = intent.event_severity;
    d.market = domain::marketFor(intent.asset_class);
    e.snapshot = buildPermissionSnapshot(decodeSnapshotInput(*s, d));
  }
  return e;
}

PipelineInput decodePipelineInput(const json& j) {
  requireObject(j, "request");
  PipelineInput in;
  in.account_id = field<std::string>(j, "account_id", "");
  in.symbol = required<std::string>(j, "symbol");
  in.side = enumField(j, "side", domain::Direction::Long, domain::parseDirection);
  in.entry_price = required<double>(j, "entry_price");
  in.asset_class = field<std::string>(j, "asset_class", in.asset_class);
  in.confidence = field<double>(j, "confidence", in.confidence);
  in.regime = field<std::string>(j, "regime", in.regime);
  in.strategy_tag = field<std::string>(j, "strategy_tag", in.strategy_tag);
  in.atr = optionalField<double>(j, "atr");
  in.guard_enabled = field<bool>(j, "guard_enabled", true);
  if (const json* s = child(j, "session")) {
    in.session = decodeSnapshotInput(*s);
  }
  return in;
}

ConfluenceComponents decodeConfluenceComponents(const json& j) {
  requireObject(j, "components");
  ConfluenceComponents c;
  c.signal_quality = field<double>(j, "SQ", c.signal_quality);
  c.technical_alignment = field<double>(j, "TA", c.technical_alignment);
  c.volume_activity = field<double>(j, "VA", c.volume_activity);
  c.liquidity_level = field<double>(j, "LL", c.liquidity_level);
  c.mtf_agreement = field<double>(j, "MTF", c.mtf_agreement);
  c.fundamental_derivatives = field<double>(j, "FD", c.fundamental_derivatives);
  return c;
}

ProbabilityRequest decodeProbabilityRequest(const json& j) {
  requireObject(j, "request");
  ProbabilityRequest r;
  r.direction = enumField(j, "direction", SignalDirection::Neutral,
                          parseSignalDirection);
  r.reward_risk = field<double>(j, "reward_risk", r.reward_risk);
  r.options_trade = field<bool>(j, "options_trade", r.options_trade);

  const json* sig = child(j, "signals");
  if (sig == nullptr) return r;
  ProbabilitySignals& s = r.signals;

  if (const json* x = child(*sig, "unusual_activity")) {
    auto v = decodeSignalBase<UnusualActivitySignal>(*x);
    v.call_premium = field<double>(*x, "call_premium", 0.0);
    v.put_premium = field<double>(*x, "put_premium", 0.0);
    v.alert_level = field<std::string>(*x, "alert_level", "");
    s.unusual_activity = std::move(v);
  }
  if (const json* x = child(*sig, "put_call_ratio")) {
    auto v = decodeSignalBase<PutCallRatioSignal>(*x);
    v.ratio = optionalField<double>(*x, "ratio");
    s.put_call_ratio = v;
  }
  if (const json* x = child(*sig, "max_pain")) {
    auto v = decodeSignalBase<MaxPainSignal>(*x);
    v.max_pain = optionalField<double>(*x, "max_pain");
    v.current_price = optionalField<double>(*x, "current_price");
    s.max_pain = v;
  }
  if (const json* x = child(*sig, "time_confluence")) {
    auto v = decodeSignalBase<TimeConfluenceSignal>(*x);
    v.stack = field<int>(*x, "stack", 0);
    v.decompressing =
        field<std::vector<std::string>>(*x, "decompressing", {});
    s.time_confluence = std::move(v);
  }
  if (const json* x = child(*sig, "iv_rank")) {
    auto v = decodeSignalBase<IvRankSignal>(*x);
    v.rank = optionalField<double>(*x, "rank");
    v.bias = enumField(*x, "bias", IvBias::Neutral, parseIvBias);
    s.iv_rank = v;
  }
  if (const json* x = child(*sig, "trend_alignment")) {
    auto v = decodeSignalBase<TrendAlignmentSignal>(*x);
    v.ema200 = enumField(*x, "ema200", EmaPosition::Near, parseEmaPosition);
    s.trend_alignment = v;
  }
  if (const json* x = child(*sig, "rsi_momentum")) {
    auto v = decodeSignalBase<RsiMomentumSignal>(*x);
    v.rsi = optionalField<double>(*x, "rsi");
    s.rsi_momentum = v;
  }
  if (const json* x = child(*sig, "volume_confirmation")) {
    s.volume_confirmation = decodeSignalBase<VolumeConfirmationSignal>(*x);
  }
  return r;
}

FlowPermissionInput decodeFlowPermissionInput(const json& j) {
  requireObject(j, "request");
  FlowPermissionInput in;
  in.state =
      enumField(j, "state", domain::FlowState::Neutral, domain::parseFlowState);
  in.state_confidence = field<double>(j, "state_confidence", 0.0);
  in.institutional_probability =
      field<double>(j, "institutional_probability", 0.0);
  in.p_trend = field<double>(j, "p_trend", 0.0);
  in.p_pin = field<double>(j, "p_pin", 0.0);
  in.p_expansion = field<double>(j, "p_expansion", 0.0);
  in.data_health_score = field<double>(j, "data_health_score", 0.0);
  in.liquidity_clarity = field<double>(j, "liquidity_clarity", 0.0);
  in.volatility_compression = field<double>(j, "volatility_compression", 0.0);
  in.atr_expansion_rate = field<double>(j, "atr_expansion_rate", 0.0);
  in.preferred_archetype =
      enumField(j, "preferred_archetype", in.preferred_archetype,
                domain::parseTradeArchetype);

  const std::optional<SessionPhase> phase =
      optionalEnum<SessionPhase>(j, "session_phase", parseSessionPhase);
  if (phase) {
    const domain::Market market = enumField(
        j, "market", domain::Market::Equities, domain::parseMarket);
    in.session_overlay = sessionOverlayForPhase(*phase, market);
  }
  return in;
}

InstitutionalRiskInput decodeInstitutionalRiskInput(const json& j) {
  requireObject(j, "request");
  InstitutionalRiskInput in;
  in.market = enumField(j, "market", domain::Market::Equities, domain::parseMarket);
  in.symbol = required<std::string>(j, "symbol");
  in.flow_state = enumField(j, "flow_state", domain::FlowState::Neutral,
                            domain::parseFlowState);
  in.archetype = enumField(j, "archetype", in.archetype,
                           domain::parseTradeArchetype);
  in.conviction = field<double>(j, "conviction", 0.0);
  in.tps = field<double>(j, "tps", 0.0);
  in.atr_percent = field<double>(j, "atr_percent", 0.0);
  in.expansion_probability = field<double>(j, "expansion_probability", 0.0);
  in.acceleration = enumField(j, "acceleration", ExpansionAcceleration::Flat,
                              parseExpansionAcceleration);
  in.volatility_override = optionalEnum<VolatilityRegime>(
      j, "volatility_override", parseVolatilityRegime);

  if (const json* a = child(j, "account")) {
    in.account.open_risk_pct = field<double>(*a, "open_risk_pct", 0.0);
    in.account.proposed_risk_pct = field<double>(*a, "proposed_risk_pct", 0.0);
    in.account.daily_risk_pct = field<double>(*a, "daily_risk_pct", 0.0);
    in.account.daily_r = field<double>(*a, "daily_r", 0.0);
  }
  if (const json* x = child(j, "exposure")) {
    if (const json* arr = childArray(*x, "open_positions")) {
      for (const auto& p : *arr) {
        in.exposure.open_positions.push_back(decodeCorrelationPosition(p));
      }
    }
    if (const json* p = child(*x, "proposed")) {
      in.exposure.proposed = decodeCorrelationPosition(*p);
    }
  }
  if (const json* b = child(j, "behavior")) {
    in.behavior.consecutive_losses = field<int>(*b, "consecutive_losses", 0);
    in.behavior.losses_window_minutes =
        field<double>(*b, "losses_window_minutes", 0.0);
    in.behavior.trades_this_session = field<int>(*b, "trades_this_session", 0);
    in.behavior.expectancy_r = field<double>(*b, "expectancy_r", 0.0);
    in.behavior.rule_violations = field<int>(*b, "rule_violations", 0);
  }
  return in;
}

// -----------------------------------------------------------------------------
// Encoding: execution types
// -----------------------------------------------------------------------------

json toJson(const domain::TradeIntent& t) {
  json j;
  j["symbol"] = t.symbol;
  j["asset_class"] = toString(t.asset_class);
  j["direction"] = toString(t.direction);
  j["strategy_tag"] = toString(t.strategy_tag);
  j["confidence"] = t.confidence;
  j["regime"] = toString(t.regime);
  j["entry_price"] = t.entry_price;
  j["atr"] = t.atr;
  j["stop_price"] = nullable(t.stop_price);
  j["event_severity"] = toString(t.event_severity);
  j["options_dte"] = nullable(t.options_dte);
  j["options_delta"] = nullable(t.options_delta);
  j["options_structure"] =
      t.options_structure ? json(toString(*t.options_structure)) : json(nullptr);
  j["account_equity"] = nullable(t.account_equity);
  j["risk_pct"] = nullable(t.risk_pct);
  j["leverage"] = nullable(t.leverage);

  json positions = json::array();
  for (const auto& p : t.open_positions) {
    positions.push_back({{"symbol", p.symbol},
                         {"direction", toString(p.direction)},
                         {"asset_class", toString(p.asset_class)}});
  }
  j["open_positions"] = std::move(positions);
  return j;
}

json toJson(const domain::ExitPlan& e) {
  json j;
  j["stop_price"] = e.stop_price;
  j["take_profit_1"] = e.take_profit_1;
  j["take_profit_2"] = nullable(e.take_profit_2);
  j["trail_rule"] = toString(e.trail_rule);
  j["time_stop_minutes"] = e.time_stop_minutes;
  j["rr_at_tp1"] = e.rr_at_tp1;
  j["rr_at_tp2"] = nullable(e.rr_at_tp2);
  return j;
}

json toJson(const domain::PositionSizingResult& s) {
  json j;
  j["quantity"] = s.quantity;
  j["raw_quantity"] = s.raw_quantity;
  j["risk_per_unit"] = s.risk_per_unit;
  j["total_risk_usd"] = s.total_risk_usd;
  j["account_equity"] = s.account_equity;
  j["risk_pct"] = s.risk_pct;
  j["notional_usd"] = s.notional_usd;
  j["leverage"] = s.leverage;
  return j;
}

json toJson(const domain::LeverageResult& l) {
  json j;
  j["max_leverage"] = l.max_leverage;
  j["recommended_leverage"] = l.recommended_leverage;
  j["capped"] = l.capped;
  j["cap_reason"] = nullable(l.cap_reason);
  return j;
}

json toJson(const domain::OptionsSelection& o) {
  json j;
  j["structure"] = toString(o.structure);
  j["dte"] = o.dte;
  j["delta"] = o.delta;
  j["strike"] = o.strike;
  j["premium_est"] = o.premium_est;
  j["max_loss_usd"] = nullable(o.max_loss_usd);
  j["notes"] = o.notes;
  return j;
}

json toJson(const domain::GovernorDecision& d) {
  json j;
  j["allowed"] = d.allowed;
  j["permission"] = toString(d.permission);
  j["risk_mode"] = toString(d.risk_mode);
  j["risk_per_trade"] = d.risk_per_trade;
  j["max_position_size"] = d.max_position_size;
  j["reason_codes"] = d.reason_codes;
  j["required_actions"] = d.required_actions;
  j["raw"] = encodeVerdict(d.raw);
  return j;
}

json toJson(const domain::OrderInstruction& o) {
  json j;
  j["symbol"] = o.symbol;
  j["side"] = toString(o.side);
  j["order_type"] = toString(o.order_type);
  j["time_in_force"] = toString(o.time_in_force);
  j["quantity"] = o.quantity;
  j["limit_price"] = nullable(o.limit_price);
  j["stop_price"] = nullable(o.stop_price);
  j["bracket_stop"] = nullable(o.bracket_stop);
  j["bracket_tp1"] = nullable(o.bracket_tp1);
  j["bracket_tp2"] = nullable(o.bracket_tp2);
  j["leverage"] = nullable(o.leverage);
  j["asset_class"] = toString(o.asset_class);
  j["option_type"] = o.option_type ? json(toString(*o.option_type)) : json(nullptr);
  j["strike"] = nullable(o.strike);
  j["option_dte"] = nullable(o.option_dte);
  j["client_order_id"] = o.client_order_id;
  j["proposal_id"] = o.proposal_id;
  return j;
}

json toJson(const domain::ValidationError& e) {
  return {{"field", e.field}, {"code", e.code}, {"message", e.message}};
}

json toJson(const std::vector<domain::ValidationError>& errors) {
  json arr = json::array();
  for (const auto& e : errors) arr.push_back(toJson(e));
  return arr;
}

json toJson(const domain::TradeProposal& p) {
  json j;
  j["proposal_id"] = p.proposal_id;
  j["created_ms"] = p.created_ms;
  j["intent"] = toJson(p.intent);
  j["governor"] = toJson(p.governor);
  j["sizing"] = toJson(p.sizing);
  j["exits"] = toJson(p.exits);
  j["leverage"] = toJson(p.leverage);
  j["options"] = p.options ? toJson(*p.options) : json(nullptr);
  j["order"] = toJson(p.order);
  j["validation_errors"] = toJson(p.validation_errors);
  j["executable"] = p.executable;
  j["summary"] = p.summary;
  return j;
}

json toJson(const PipelineResult& r) {
  json j;
  j["ok"] = true;
  j["exits"] = toJson(r.exits);
  j["sizing"] = toJson(r.sizing);
  j["leverage"] = toJson(r.leverage);
  j["governor"] = toJson(r.governor);
  j["atr"] = r.atr;
  j["entry_risk"] = {
      {"normalized_r", r.entry_risk.normalized_r},
      {"dynamic_r", r.entry_risk.dynamic_r},
      {"risk_per_trade_at_entry", r.entry_risk.risk_per_trade_at_entry},
      {"equity_at_entry", r.entry_risk.equity_at_entry},
  };
  j["trade_type"] = r.trade_type;
  j["account_equity"] = r.account_equity;
  j["intent"] = toJson(r.intent);
  j["engine_regime"] = toString(r.engine_regime);
  j["engine_strategy"] = toString(r.engine_strategy);
  return j;
}

json toJson(const PipelineFailure& f) {
  json j;
  j["ok"] = false;
  j["code"] = toString(f.code);
  j["reason"] = f.reason;
  j["reason_codes"] = f.reason_codes;
  j["required_actions"] = f.required_actions;
  return j;
}

json toJson(const PipelineOutcome& outcome) {
  return std::visit([](const auto& v) { return toJson(v); }, outcome);
}

// -----------------------------------------------------------------------------
// Encoding: scoring and permission
// -----------------------------------------------------------------------------

json toJson(const ConfluenceResult& r) {
  json j;
  j["regime"] = toString(r.regime);
  j["components"] = encodeComponents(r.components);
  j["weights"] = encodeComponents(r.weights);
  j["breakdown"] = encodeComponents(r.breakdown);
  j["raw_score"] = r.raw_score;
  j["weighted_score"] = r.weighted_score;
  j["gated"] = r.gated;
  j["gate_violations"] = r.gate_violations;
  j["bias"] = toString(r.bias);
  return j;
}

json toJson(const ProbabilityResult& r) {
  json j;
  j["win_probability"] = r.win_probability;
  j["win_probability_pct"] = r.win_probability_pct;
  j["log_odds"] = r.log_odds;
  j["confidence_label"] = r.confidence_label;
  j["aligned_count"] = r.aligned_count;
  j["total_signals"] = r.total_signals;
  j["confluence_score"] = r.confluence_score;
  j["dominant_direction"] = toString(r.dominant_direction);
  j["reference_direction"] = toString(r.reference_direction);
  j["kelly_size_pct"] = r.kelly_size_pct;
  j["r_multiple"] = r.r_multiple;

  json comps = json::array();
  for (const auto& c : r.components) {
    json cj;
    cj["name"] = c.name;
    cj["direction"] = toString(c.direction);
    cj["triggered"] = c.triggered;
    cj["confidence"] = c.confidence;
    cj["dampening"] = c.dampening;
    cj["contribution"] = c.contribution;
    cj["reason"] = c.reason;
    comps.push_back(std::move(cj));
  }
  j["components"] = std::move(comps);
  return j;
}

json toJson(const FlowPermission& p) {
  json j;
  j["state"] = toString(p.state);
  j["tps"] = p.tps;
  j["blocked"] = p.blocked;
  j["no_trade_mode"] = {{"active", p.no_trade_mode.active},
                        {"reason", p.no_trade_mode.reason}};
  j["risk_mode"] = toString(p.risk_mode);
  j["size_multiplier"] = p.size_multiplier;
  j["stop_style"] = toString(p.stop_style);
  j["allowed"] = p.allowed;
  j["blocked_trades"] = p.blocked_trades;

  json alignment = json::object();
  for (std::size_t i = 0; i < domain::kArchetypeCount; ++i) {
    alignment[toString(static_cast<domain::TradeArchetype>(i))] =
        p.alignment_by_archetype[i];
  }
  j["alignment_by_archetype"] = std::move(alignment);
  j["selected_archetype"] = toString(p.selected_archetype);

  if (p.session_adjustment) {
    const SessionAdjustment& s = *p.session_adjustment;
    j["session_adjustment"] = {{"phase", toString(s.phase)},
                               {"tps_adjustment", s.tps_adjustment},
                               {"size_cap_applied", s.size_cap_applied},
                               {"restrictive", s.restrictive},
                               {"reason", s.reason}};
  } else {
    j["session_adjustment"] = nullptr;
  }
  return j;
}

json toJson(const InstitutionalRiskOutput& o) {
  json j;
  j["execution_allowed"] = o.execution_allowed;
  j["hard_blocked"] = o.hard_blocked;
  j["hard_block_reasons"] = o.hard_block_reasons;
  j["irs"] = o.irs;
  j["mode"] = toString(o.mode);
  j["capital"] = {{"used_pct", o.capital.used_pct},
                  {"open_risk_pct", o.capital.open_risk_pct},
                  {"proposed_risk_pct", o.capital.proposed_risk_pct},
                  {"daily_risk_pct", o.capital.daily_risk_pct},
                  {"blocked", o.capital.blocked},
                  {"reason", o.capital.reason},
                  {"score", o.capital.score}};
  j["drawdown"] = {{"daily_r", o.drawdown.daily_r},
                   {"size_multiplier", o.drawdown.size_multiplier},
                   {"a_plus_only", o.drawdown.a_plus_only},
                   {"lockout", o.drawdown.lockout},
                   {"score", o.drawdown.score},
                   {"action", o.drawdown.action}};
  j["correlation"] = {{"cluster", o.correlation.cluster},
                      {"correlated_count", o.correlation.correlated_count},
                      {"max_correlated", o.correlation.max_correlated},
                      {"blocked", o.correlation.blocked},
                      {"severity", toString(o.correlation.severity)},
                      {"score", o.correlation.score},
                      {"reason", o.correlation.reason}};
  j["volatility"] = {{"regime", toString(o.volatility.regime)},
                     {"breakout_blocked", o.volatility.breakout_blocked},
                     {"size_multiplier", o.volatility.size_multiplier},
                     {"score", o.volatility.score}};
  j["behavior"] = {{"cooldown_active", o.behavior.cooldown_active},
                   {"cooldown_minutes", o.behavior.cooldown_minutes},
                   {"overtrading_blocked", o.behavior.overtrading_blocked},
                   {"violations_blocked", o.behavior.violations_blocked},
                   {"score", o.behavior.score},
                   {"reason", o.behavior.reason}};
  j["sizing"] = {
      {"base_size", o.sizing.base_size},
      {"flow_state_multiplier", o.sizing.flow_state_multiplier},
      {"risk_governor_multiplier", o.sizing.risk_governor_multiplier},
      {"personal_performance_multiplier",
       o.sizing.personal_performance_multiplier},
      {"final_size", o.sizing.final_size}};
  j["allowed"] = o.allowed;
  j["blocked"] = o.blocked;
  return j;
}

// -----------------------------------------------------------------------------
// Encoding: telemetry
// -----------------------------------------------------------------------------

json toJson(const CircuitSnapshot& s) {
  json j;
  j["name"] = s.name;
  j["state"] = toString(s.state);
  j["failure_count"] = s.failure_count;
  j["last_failure_ms"] = s.last_failure_ms;
  j["failure_threshold"] = s.failure_threshold;
  j["reset_timeout_ms"] = s.reset_timeout_ms;
  return j;
}

json toJson(const DecisionEvent& event) {
  json j;
  if (const auto* e = std::get_if<ProposalEvent>(&event)) {
    j["type"] = "proposal";
    j["proposal_id"] = e->proposal_id;
    j["symbol"] = e->symbol;
    j["executable"] = e->executable;
    j["summary"] = e->summary;
    j["reason_codes"] = e->reason_codes;
    j["timestamp_ms"] = e->timestamp_ms;
  } else if (const auto* e = std::get_if<PipelineBlockedEvent>(&event)) {
    j["type"] = "pipeline_blocked";
    j["symbol"] = e->symbol;
    j["code"] = e->code;
    j["reason"] = e->reason;
    j["reason_codes"] = e->reason_codes;
    j["timestamp_ms"] = e->timestamp_ms;
  } else if (const auto* e = std::get_if<CircuitStateEvent>(&event)) {
    j["type"] = "circuit_state";
    j["circuit"] = e->circuit;
    j["from"] = toString(e->from);
    j["to"] = toString(e->to);
    j["timestamp_ms"] = e->timestamp_ms;
  }
  return j;
}

}  // namespace tradegate
