#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace tradeguard {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing string ID source
// -----------------------------------------------------------------------------
//
// @brief  Produces "<prefix>-<n>" identifiers with n starting at 1. Each call
//         to next_id() returns a value different from every other call on
//         the same instance, regardless of which thread invokes it.
//
// @details
// The counter is a std::atomic<uint64_t> advanced with fetch_add(relaxed);
// uniqueness is the only requirement, there is no cross-variable ordering.
//
// OrderService uses one instance with prefix "ord" for order ids; RiskService
// uses one with prefix "risk" for RiskEvent ids.
//
// Thread model:
//   next_id() is safe to call concurrently from any number of threads.
//
// Ownership:
//   Owned as a value member by its user (PretradeEngine, RiskService) or by
//   the test. Non-copyable so two copies can never hand out the same id.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  explicit IdGenerator(std::string prefix) : prefix_(std::move(prefix)) {}

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @brief  Returns the next unique identifier, e.g. "ord-1", "ord-2".
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  Atomically increments the internal counter.
  // -------------------------------------------------------------------------
  std::string next_id() {
    std::uint64_t n = next_.fetch_add(1, std::memory_order_relaxed);
    return prefix_ + "-" + std::to_string(n);
  }

  const std::string& prefix() const { return prefix_; }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace tradeguard
