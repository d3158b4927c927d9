#pragma once

#include "tradegate/domain/market_types.hpp"

#include <optional>
#include <string>

namespace tradegate {
namespace domain {

// Options structure chosen for an intent. premium_est is per share (one
// contract covers 100 shares); max_loss_usd is already capped to the risk
// budget.
struct OptionsSelection {
  OptionsStructure structure{OptionsStructure::None};
  int dte{0};
  double delta{0.0};
  double strike{0.0};
  double premium_est{0.0};
  std::optional<double> max_loss_usd;
  std::string notes;
};

}  // namespace domain
}  // namespace tradegate
