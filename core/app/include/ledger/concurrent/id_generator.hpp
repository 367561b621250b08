#pragma once

#include <atomic>
#include <cstdint>

namespace ledger {

// -----------------------------------------------------------------------------
// IdGenerator: thread-safe, monotonically increasing row id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids for one table (batches, adjustments,
//         allocations or audit entries).
//
// @details
// Starts at 1; id 0 is the "unset" sentinel in every domain struct. The
// engine owns one generator per table as a value member and passes it by
// reference where rows are created.
//
// advance_past(id) is used during hydration: after rows with existing ids
// are loaded, the generator is moved beyond the largest one so newly issued
// ids never collide with them. It only ever moves the counter forward.
//
// Thread model:
//   next_id() and advance_past() are safe to call concurrently from any
//   thread. Uniqueness is all that is required, so relaxed ordering is used.
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

  // Ensures every id returned from now on is greater than `id`.
  void advance_past(std::uint64_t id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

  // Next id that would be issued. Diagnostic only.
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace ledger
