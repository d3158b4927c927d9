#include "tradegate/resilience/circuit_breaker.hpp"

#include <iostream>

namespace tradegate {

namespace {

std::string openMessage(const std::string& name, std::int64_t retry_after_ms) {
  return "Circuit breaker '" + name + "' is OPEN, requests blocked for " +
         std::to_string((retry_after_ms + 500) / 1000) + "s";
}

}  // namespace

const char* toString(CircuitState s) {
  switch (s) {
    case CircuitState::Closed: return "CLOSED";
    case CircuitState::Open: return "OPEN";
    case CircuitState::HalfOpen: return "HALF_OPEN";
  }
  return "UNKNOWN";
}

CircuitOpenError::CircuitOpenError(std::string name,
                                   std::int64_t retry_after_ms)
    : std::runtime_error(openMessage(name, retry_after_ms)),
      name_(std::move(name)),
      retry_after_ms_(retry_after_ms) {}

CircuitBreaker::CircuitBreaker(std::string name, const ITimeProvider& clock,
                               CircuitBreakerOptions options)
    : name_(std::move(name)), clock_(clock), options_(std::move(options)) {}

// ---- acquire: admission check before the wrapped call ----
CircuitBreaker::Admission CircuitBreaker::acquire() {
  std::vector<Transition> fired;
  Admission admission = Admission::Closed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::Open) {
      const std::int64_t elapsed = clock_.now_ms() - last_failure_ms_;
      if (elapsed < options_.reset_timeout_ms) {
        throw CircuitOpenError(name_, options_.reset_timeout_ms - elapsed);
      }
      transition_locked(CircuitState::HalfOpen, fired);
      probe_in_flight_ = true;
      admission = Admission::Probe;
    } else if (state_ == CircuitState::HalfOpen) {
      if (probe_in_flight_) throw CircuitOpenError(name_, 0);
      probe_in_flight_ = true;
      admission = Admission::Probe;
    }
  }
  notify(fired);
  return admission;
}

// ---- record_success ----
void CircuitBreaker::record_success(Admission admission) {
  std::vector<Transition> fired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (admission == Admission::Probe) {
      probe_in_flight_ = false;
      transition_locked(CircuitState::Closed, fired);
      failure_count_ = 0;
    } else if (state_ == CircuitState::Closed) {
      failure_count_ = 0;
    }
  }
  notify(fired);
}

// ---- record_failure ----
void CircuitBreaker::record_failure(Admission admission) {
  std::vector<Transition> fired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (admission == Admission::Probe) {
      probe_in_flight_ = false;
      ++failure_count_;
      last_failure_ms_ = clock_.now_ms();
      transition_locked(CircuitState::Open, fired);
    } else if (state_ == CircuitState::Closed) {
      ++failure_count_;
      last_failure_ms_ = clock_.now_ms();
      if (failure_count_ >= options_.failure_threshold) {
        transition_locked(CircuitState::Open, fired);
      }
    }
  }
  notify(fired);
}

void CircuitBreaker::transition_locked(CircuitState to,
                                       std::vector<Transition>& fired) {
  if (state_ == to) return;
  const CircuitState from = state_;
  state_ = to;
  if (to == CircuitState::Closed) failure_count_ = 0;
  std::cerr << "[CircuitBreaker] " << name_ << ": " << toString(from) << " -> "
            << toString(to) << "\n";
  fired.push_back({from, to});
}

void CircuitBreaker::notify(const std::vector<Transition>& fired) const {
  if (!options_.on_state_change) return;
  for (const auto& t : fired) options_.on_state_change(name_, t.from, t.to);
}

CircuitState CircuitBreaker::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

CircuitSnapshot CircuitBreaker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  CircuitSnapshot s;
  s.name = name_;
  s.state = state_;
  s.failure_count = failure_count_;
  s.last_failure_ms = last_failure_ms_;
  s.failure_threshold = options_.failure_threshold;
  s.reset_timeout_ms = options_.reset_timeout_ms;
  return s;
}

}  // namespace tradegate
