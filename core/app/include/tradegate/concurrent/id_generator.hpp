#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace tradegate {

// -----------------------------------------------------------------------------
// IdGenerator — prefixed, monotonically increasing identifiers
// -----------------------------------------------------------------------------
//
// @brief  Issues "<prefix>-<n>" strings, n starting at 1, from an atomic
//         counter.
//
// @details
// DecisionEngine owns two instances: "prop" for proposal ids and "tg" for
// client order ids. They are injected by reference into ProposalBuilder and
// OrderBuilder, so two builders sharing one generator never hand out the
// same id.
//
// Thread model:
//   next() and next_value() are safe to call concurrently. Relaxed ordering
//   is enough: uniqueness is the only guarantee.
//
// Ownership:
//   Owned by value by DecisionEngine (or a test fixture); outlives the
//   builders that reference it.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_value() {
    return next_.fetch_add(1, std::memory_order_relaxed);
  }

  std::string next() { return prefix_ + "-" + std::to_string(next_value()); }

  const std::string& prefix() const { return prefix_; }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace tradegate
