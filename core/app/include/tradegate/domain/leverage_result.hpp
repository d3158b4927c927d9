#pragma once

#include <optional>
#include <string>

namespace tradegate {
namespace domain {

// Leverage recommendation. capped is set whenever an override was clipped
// to the asset-class cap or flagged as well above the recommendation.
struct LeverageResult {
  double max_leverage{1.0};
  double recommended_leverage{1.0};
  bool capped{false};
  std::optional<std::string> cap_reason;
};

}  // namespace domain
}  // namespace tradegate
