#pragma once

#include <atomic>
#include <cstdint>

namespace ordersim {

// -----------------------------------------------------------------------------
// OrderIdGenerator — per-run order id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique, increasing order ids. One instance per Backtester;
//         every OrderBook of that run draws from it.
//
// @details
// Starts at 1 (0 is the "no id" sentinel of rejected orders). There is no
// process-wide counter: two Backtesters running on different threads each
// own a generator, so their id sequences are independent and a run's ids do
// not depend on what else the process is doing.
//
// advance_past() is used after restoring a checkpoint so freshly issued ids
// never collide with restored ones.
//
// Thread model:
//   next_id() and advance_past() are lock-free and safe from any thread.
//
// Ownership:
//   Value member of Backtester. OrderBooks hold a reference to it.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  // Returns the next id. Values start at 1 and increase by 1.
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // -------------------------------------------------------------------------
  // advance_past(id)
  // -------------------------------------------------------------------------
  // @brief  Guarantees every later next_id() returns a value > id.
  //
  // @details
  // Never moves the counter backwards. CAS loop so a concurrent next_id()
  // is not lost.
  // -------------------------------------------------------------------------
  void advance_past(std::uint64_t id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

  // The id the next call to next_id() would return.
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace ordersim
