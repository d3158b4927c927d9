// =============================================================================
// proposal_builder_test.cpp
// =============================================================================
// Unit tests for ProposalBuilder and the pieces it assembles: OrderBuilder,
// intent / proposal validation and the id generators.
//
// Validates:
//   - a clean equity pullback produces an executable, fully populated proposal
//   - a governor block still returns the full proposal, marked not executable
//   - malformed intents come back as validation errors, no id consumed
//   - options intents carry a structure and an option order
//   - validateProposal codes and the advisory HIGH_NOTIONAL
//   - exits that land at or below zero never reach an executable order
// =============================================================================

#include "tradegate/concurrent/id_generator.hpp"
#include "tradegate/execution/order_builder.hpp"
#include "tradegate/execution/proposal_builder.hpp"
#include "tradegate/execution/validators.hpp"
#include "tradegate/risk/execution_governor.hpp"
#include "tradegate/risk/permission_matrix.hpp"
#include "tradegate/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using tradegate::domain::AssetClass;
using tradegate::domain::Direction;
using tradegate::domain::Regime;
using tradegate::domain::StrategyTag;
using tradegate::domain::TradeIntent;
using tradegate::domain::TradeProposal;
using tradegate::domain::ValidationError;

namespace {

constexpr std::int64_t kStartMs = 1700000000000LL;

std::vector<std::string> codesOf(const std::vector<ValidationError>& errors) {
  std::vector<std::string> codes;
  for (const auto& e : errors) codes.push_back(e.code);
  return codes;
}

}  // namespace

class ProposalBuilderTest : public ::testing::Test {
 protected:
  ProposalBuilderTest()
      : clock(kStartMs),
        governor(tradegate::domain::ExecutionLimits{}, matrix),
        order_ids("tg"),
        proposal_ids("prop"),
        orders(order_ids),
        builder(governor, orders, proposal_ids, clock) {
    intent.symbol = "SPY";
    intent.asset_class = AssetClass::Equity;
    intent.direction = Direction::Long;
    intent.strategy_tag = StrategyTag::TrendPullback;
    intent.regime = Regime::TrendUp;
    intent.confidence = 80.0;
    intent.entry_price = 100.0;
    intent.atr = 2.0;
  }

  TradeProposal buildOk(const tradegate::ExposureState& exposure = {}) {
    auto outcome = builder.build(intent, exposure);
    EXPECT_TRUE(std::holds_alternative<TradeProposal>(outcome));
    return std::get<TradeProposal>(std::move(outcome));
  }

  tradegate::SimulationTimeProvider clock;
  tradegate::PermissionMatrix matrix;
  tradegate::ExecutionGovernor governor;
  tradegate::IdGenerator order_ids;
  tradegate::IdGenerator proposal_ids;
  tradegate::OrderBuilder orders;
  tradegate::ProposalBuilder builder;
  TradeIntent intent;
};

// -----------------------------------------------------------------------------
// 1. Clean equity pullback in an uptrend.
// -----------------------------------------------------------------------------
TEST_F(ProposalBuilderTest, ExecutableEquityProposal) {
  const TradeProposal p = buildOk();

  EXPECT_EQ(p.proposal_id, "prop-1");
  EXPECT_EQ(p.created_ms, kStartMs);
  ASSERT_TRUE(p.intent.account_equity.has_value());
  EXPECT_DOUBLE_EQ(*p.intent.account_equity, 100000.0);

  EXPECT_TRUE(p.governor.allowed);
  EXPECT_DOUBLE_EQ(p.governor.risk_per_trade, 0.0075);
  EXPECT_DOUBLE_EQ(p.governor.max_position_size, 250.0);

  EXPECT_NEAR(p.exits.stop_price, 97.0, 1e-9);
  EXPECT_NEAR(p.exits.take_profit_1, 107.2, 1e-9);
  EXPECT_DOUBLE_EQ(p.leverage.recommended_leverage, 2.25);
  EXPECT_DOUBLE_EQ(p.sizing.quantity, 250.0);
  EXPECT_DOUBLE_EQ(p.sizing.total_risk_usd, 750.0);
  EXPECT_FALSE(p.options.has_value());

  EXPECT_EQ(p.order.side, tradegate::domain::OrderSide::Buy);
  EXPECT_EQ(p.order.time_in_force, tradegate::domain::TimeInForce::Day);
  EXPECT_EQ(p.order.order_type, tradegate::domain::OrderType::Limit);
  EXPECT_DOUBLE_EQ(p.order.quantity, 250.0);
  ASSERT_TRUE(p.order.leverage.has_value());
  EXPECT_DOUBLE_EQ(*p.order.leverage, 2.25);
  EXPECT_EQ(p.order.client_order_id, "tg-1");
  EXPECT_EQ(p.order.proposal_id, "prop-1");

  EXPECT_TRUE(p.validation_errors.empty());
  EXPECT_TRUE(p.executable);
  EXPECT_EQ(p.summary,
            "LONG SPY x 250 @ 100 | Stop 97 -> TP1 107.2 | Risk $750.00 "
            "(0.75%) | R:R 2.4:1 | Leverage 2.25x | EXECUTABLE");
}

// -----------------------------------------------------------------------------
// 2. Ids advance per proposal.
// -----------------------------------------------------------------------------
TEST_F(ProposalBuilderTest, IdsAdvance) {
  buildOk();
  const TradeProposal second = buildOk();
  EXPECT_EQ(second.proposal_id, "prop-2");
  EXPECT_EQ(second.order.client_order_id, "tg-2");
}

// -----------------------------------------------------------------------------
// 3. Daily loss cap: populated but blocked.
// -----------------------------------------------------------------------------
TEST_F(ProposalBuilderTest, GovernorBlockStillPopulated) {
  tradegate::ExposureState exposure;
  exposure.daily_loss_pct = 0.025;
  const TradeProposal p = buildOk(exposure);

  EXPECT_FALSE(p.governor.allowed);
  EXPECT_FALSE(p.executable);
  EXPECT_DOUBLE_EQ(p.sizing.quantity, 250.0);
  const auto codes = codesOf(p.validation_errors);
  EXPECT_NE(std::find(codes.begin(), codes.end(), "GOVERNOR_BLOCKED"),
            codes.end());
  EXPECT_NE(p.summary.find("BLOCKED: POLICY_CLEAR, EXEC_DAILY_LOSS_CAP"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 4. Malformed intent returns every error and consumes no id.
// -----------------------------------------------------------------------------
TEST_F(ProposalBuilderTest, InvalidIntentReturnsErrors) {
  intent.symbol = "  ";
  intent.entry_price = 0.0;
  intent.confidence = 120.0;

  const auto outcome = builder.build(intent, {});
  ASSERT_TRUE(std::holds_alternative<std::vector<ValidationError>>(outcome));
  const auto& errors = std::get<std::vector<ValidationError>>(outcome);
  const std::vector<std::string> expected = {"REQUIRED", "RANGE", "POSITIVE"};
  EXPECT_EQ(codesOf(errors), expected);
  EXPECT_EQ(errors[2].field, "entry_price");

  intent.symbol = "SPY";
  intent.entry_price = 100.0;
  intent.confidence = 80.0;
  EXPECT_EQ(buildOk().proposal_id, "prop-1");
}

// -----------------------------------------------------------------------------
// 5. Options intent: structure chosen and the order becomes an option order.
// -----------------------------------------------------------------------------
TEST_F(ProposalBuilderTest, OptionsProposal) {
  intent.asset_class = AssetClass::Options;
  const TradeProposal p = buildOk();

  ASSERT_TRUE(p.options.has_value());
  EXPECT_EQ(p.options->structure, tradegate::domain::OptionsStructure::LongCall);
  EXPECT_EQ(p.options->dte, 30);
  EXPECT_DOUBLE_EQ(p.leverage.recommended_leverage, 1.0);
  EXPECT_FALSE(p.order.leverage.has_value());
  ASSERT_TRUE(p.order.option_type.has_value());
  EXPECT_EQ(*p.order.option_type, tradegate::domain::OptionRight::Call);
  ASSERT_TRUE(p.order.option_dte.has_value());
  EXPECT_EQ(*p.order.option_dte, 30);
  ASSERT_TRUE(p.order.limit_price.has_value());
  EXPECT_DOUBLE_EQ(*p.order.limit_price, p.options->premium_est);
  ASSERT_TRUE(p.options->max_loss_usd.has_value());
  EXPECT_LE(*p.options->max_loss_usd, p.sizing.total_risk_usd);
  EXPECT_NE(p.summary.find("Options: LONG_CALL 30DTE 70d"), std::string::npos);
}

// -----------------------------------------------------------------------------
// 6. validateIntent: stop direction, risk and leverage ranges.
// -----------------------------------------------------------------------------
TEST(ValidatorsTest, IntentRanges) {
  TradeIntent in;
  in.symbol = "QQQ";
  in.confidence = 70.0;
  in.entry_price = 100.0;
  in.atr = 1.0;
  in.stop_price = 101.0;
  in.risk_pct = 0.2;
  in.leverage = 0.5;

  const auto errors = tradegate::validateIntent(in);
  const std::vector<std::string> expected = {"STOP_DIRECTION", "RANGE", "RANGE"};
  EXPECT_EQ(codesOf(errors), expected);
  EXPECT_EQ(errors[1].field, "risk_pct");
  EXPECT_EQ(errors[2].field, "leverage");

  in.direction = Direction::Short;
  in.risk_pct = 0.01;
  in.leverage = 2.0;
  EXPECT_TRUE(tradegate::validateIntent(in).empty());
}

// -----------------------------------------------------------------------------
// 7. validateProposal: blocking codes and advisory HIGH_NOTIONAL.
// -----------------------------------------------------------------------------
TEST(ValidatorsTest, ProposalChecks) {
  TradeProposal p;
  p.governor.allowed = true;
  p.intent.direction = Direction::Long;
  p.intent.entry_price = 100.0;
  p.exits.stop_price = 101.0;
  p.exits.take_profit_1 = 99.0;
  p.sizing.quantity = 0.0;

  const std::vector<std::string> expected = {"ZERO_SIZE", "STOP_ABOVE_ENTRY",
                                             "TP_BELOW_ENTRY", "LOW_RR"};
  EXPECT_EQ(codesOf(tradegate::validateProposal(p)), expected);

  p.exits.stop_price = 97.0;
  p.exits.take_profit_1 = 105.0;
  p.exits.rr_at_tp1 = 5.0 / 3.0;
  p.sizing.quantity = 600.0;
  p.sizing.notional_usd = 60000.0;
  p.sizing.account_equity = 100000.0;
  const auto advisory = tradegate::validateProposal(p);
  ASSERT_EQ(advisory.size(), 1u);
  EXPECT_EQ(advisory[0].code, tradegate::kHighNotional);
  EXPECT_EQ(advisory[0].message, "Notional $60000 exceeds 50% of equity.");
  EXPECT_FALSE(tradegate::isBlocking(advisory[0]));
}

// -----------------------------------------------------------------------------
// 8. Wide-ATR short on a cheap symbol: TP1 falls below zero, so the
//    proposal is returned but cannot execute.
// -----------------------------------------------------------------------------
TEST_F(ProposalBuilderTest, NegativeTargetBlocksExecution) {
  intent.symbol = "XYZ";
  intent.direction = Direction::Short;
  intent.regime = Regime::TrendDown;
  intent.entry_price = 10.0;
  intent.atr = 5.0;

  const TradeProposal p = buildOk();
  EXPECT_GT(p.exits.stop_price, 10.0);
  EXPECT_LE(p.exits.take_profit_1, 0.0);
  EXPECT_FALSE(p.executable);
  const auto codes = codesOf(p.validation_errors);
  EXPECT_NE(std::find(codes.begin(), codes.end(), tradegate::kBadExits),
            codes.end());
}

// -----------------------------------------------------------------------------
// 9. validateProposal: non-finite or non-positive exits, thin R:R.
// -----------------------------------------------------------------------------
TEST(ValidatorsTest, ExitSanity) {
  TradeProposal p;
  p.governor.allowed = true;
  p.intent.direction = Direction::Short;
  p.intent.entry_price = 10.0;
  p.sizing.quantity = 100.0;
  p.sizing.account_equity = 100000.0;
  p.exits.stop_price = 12.0;
  p.exits.take_profit_1 = 6.0;
  p.exits.take_profit_2 = -1.0;
  p.exits.rr_at_tp1 = 2.0;

  std::vector<std::string> expected = {"BAD_EXITS"};
  EXPECT_EQ(codesOf(tradegate::validateProposal(p)), expected);

  p.exits.take_profit_2.reset();
  p.exits.take_profit_1 = 9.5;
  p.exits.rr_at_tp1 = 0.25;
  const auto thin = tradegate::validateProposal(p);
  expected = {"LOW_RR"};
  EXPECT_EQ(codesOf(thin), expected);
  EXPECT_EQ(thin[0].message, "R:R at TP1 is 0.25; at least 1.00 required.");
  EXPECT_TRUE(tradegate::isBlocking(thin[0]));

  p.exits.rr_at_tp1 = 2.0;
  EXPECT_TRUE(tradegate::validateProposal(p).empty());
}

// -----------------------------------------------------------------------------
// 10. Id generator: prefixed sequence starting at 1.
// -----------------------------------------------------------------------------
TEST(IdGeneratorTest, PrefixedSequence) {
  tradegate::IdGenerator ids("x");
  EXPECT_EQ(ids.next(), "x-1");
  EXPECT_EQ(ids.next(), "x-2");
  EXPECT_EQ(ids.next_value(), 3u);
  EXPECT_EQ(ids.prefix(), "x");
}
