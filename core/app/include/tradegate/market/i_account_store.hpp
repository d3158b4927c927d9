#pragma once

#include "tradegate/domain/trade_intent.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradegate {

// -----------------------------------------------------------------------------
// IAccountStore — account state collaborator
// -----------------------------------------------------------------------------
//
// @brief  Read-only view of the account figures the governor needs. The
//         core owns no persistence; the host plugs in whatever backs it.
//
// @details
//   latest_equity       std::nullopt when unknown; callers fall back to
//                       ExecutionLimits::default_account_equity
//   open_positions      symbol / direction / asset class, for correlation
//   daily_realized_pnl  signed P&L of trades closed today
//   open_risk_total     dollar risk currently at stake in open trades
//
// Thread model:
//   All methods may be called concurrently.
// -----------------------------------------------------------------------------
class IAccountStore {
 public:
  virtual ~IAccountStore() = default;

  virtual std::optional<double> latest_equity(
      const std::string& account_id) const = 0;
  virtual std::vector<domain::OpenPosition> open_positions(
      const std::string& account_id) const = 0;
  virtual double daily_realized_pnl(const std::string& account_id) const = 0;
  virtual double open_risk_total(const std::string& account_id) const = 0;
};

// -----------------------------------------------------------------------------
// InMemoryAccountStore
// -----------------------------------------------------------------------------
// Map-backed store used by the host service and the tests. Readers take a
// shared lock, the setters an exclusive one. Unknown accounts read as no
// equity, no positions and zero P&L / risk.
// -----------------------------------------------------------------------------
class InMemoryAccountStore final : public IAccountStore {
 public:
  struct Account {
    std::optional<double> equity;
    std::vector<domain::OpenPosition> positions;
    double daily_realized_pnl{0.0};
    double open_risk_total{0.0};
  };

  void put(const std::string& account_id, Account account);
  void set_equity(const std::string& account_id, double equity);
  void add_position(const std::string& account_id, domain::OpenPosition pos);
  void set_daily_realized_pnl(const std::string& account_id, double pnl);
  void set_open_risk_total(const std::string& account_id, double risk);

  std::optional<double> latest_equity(
      const std::string& account_id) const override;
  std::vector<domain::OpenPosition> open_positions(
      const std::string& account_id) const override;
  double daily_realized_pnl(const std::string& account_id) const override;
  double open_risk_total(const std::string& account_id) const override;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Account> accounts_;
};

}  // namespace tradegate
