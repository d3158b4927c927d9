#include "tradegate/market/i_account_store.hpp"

#include <mutex>
#include <utility>

namespace tradegate {

void InMemoryAccountStore::put(const std::string& account_id,
                               Account account) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  accounts_[account_id] = std::move(account);
}

void InMemoryAccountStore::set_equity(const std::string& account_id,
                                      double equity) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  accounts_[account_id].equity = equity;
}

void InMemoryAccountStore::add_position(const std::string& account_id,
                                        domain::OpenPosition pos) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  accounts_[account_id].positions.push_back(std::move(pos));
}

void InMemoryAccountStore::set_daily_realized_pnl(
    const std::string& account_id, double pnl) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  accounts_[account_id].daily_realized_pnl = pnl;
}

void InMemoryAccountStore::set_open_risk_total(const std::string& account_id,
                                               double risk) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  accounts_[account_id].open_risk_total = risk;
}

std::optional<double> InMemoryAccountStore::latest_equity(
    const std::string& account_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = accounts_.find(account_id);
  if (it == accounts_.end()) return std::nullopt;
  return it->second.equity;
}

std::vector<domain::OpenPosition> InMemoryAccountStore::open_positions(
    const std::string& account_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = accounts_.find(account_id);
  if (it == accounts_.end()) return {};
  return it->second.positions;
}

double InMemoryAccountStore::daily_realized_pnl(
    const std::string& account_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = accounts_.find(account_id);
  return it == accounts_.end() ? 0.0 : it->second.daily_realized_pnl;
}

double InMemoryAccountStore::open_risk_total(
    const std::string& account_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = accounts_.find(account_id);
  return it == accounts_.end() ? 0.0 : it->second.open_risk_total;
}

}  // namespace tradegate
