#pragma once

#include "tradegate/domain/trade_intent.hpp"
#include "tradegate/domain/trade_proposal.hpp"

#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// Intent and proposal validation
// -----------------------------------------------------------------------------
//
// Both return every problem found, in a fixed order; empty means valid.
// Enumerated fields cannot hold invalid values, so only the numeric and
// free-text fields are checked.
//
// validateIntent codes:
//   symbol      REQUIRED
//   confidence  RANGE          outside 0..100
//   entry_price POSITIVE
//   atr         POSITIVE
//   stop_price  POSITIVE / STOP_DIRECTION
//   risk_pct    RANGE          outside (0, 0.10]
//   leverage    RANGE          outside [1, 100]
//
// validateProposal codes:
//   GOVERNOR_BLOCKED, ZERO_SIZE,
//   STOP_ABOVE_ENTRY / TP_BELOW_ENTRY   (LONG)
//   STOP_BELOW_ENTRY / TP_ABOVE_ENTRY   (SHORT)
//   BAD_EXITS                           stop / TP1 / TP2 not finite and > 0
//   LOW_RR                              rr_at_tp1 < 1
//   HIGH_NOTIONAL                       notional > 50% of equity, advisory
// -----------------------------------------------------------------------------

inline constexpr const char* kHighNotional = "HIGH_NOTIONAL";
inline constexpr const char* kBadExits = "BAD_EXITS";

std::vector<domain::ValidationError> validateIntent(
    const domain::TradeIntent& intent);

std::vector<domain::ValidationError> validateProposal(
    const domain::TradeProposal& proposal);

// Everything except HIGH_NOTIONAL blocks execution.
bool isBlocking(const domain::ValidationError& error);

}  // namespace tradegate
