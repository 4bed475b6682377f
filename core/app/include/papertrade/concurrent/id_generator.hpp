#pragma once

#include <atomic>
#include <cstdint>

namespace papertrade {

// -----------------------------------------------------------------------------
// IdGenerator — monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique, increasing 64-bit ids from an atomic counter.
//
// @details
// One instance per id space (orders, trades, signals). Ids start at 1; 0 is
// the "unset" sentinel. Order ids double as the deterministic processing
// order of the OrderExecutionEngine, so they must increase in submission
// order, which fetch_add guarantees.
//
// advance_past() is used when a ledger snapshot is restored so that new ids
// never collide with ids already on disk.
//
// Thread model:
//   next_id() and advance_past() are safe to call concurrently. Relaxed
//   ordering is enough: only uniqueness and monotonicity of the counter
//   itself matter.
//
// Ownership:
//   Owned by the Ledger as value members and borrowed by reference.
// -----------------------------------------------------------------------------
class IdGenerator {
 public:
  IdGenerator() = default;

  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Value the next call to next_id() would return.
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

  // Ensures every future id is greater than used_id.
  void advance_past(std::uint64_t used_id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= used_id &&
           !next_id_.compare_exchange_weak(current, used_id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace papertrade
