/**
 * @file waker.cpp
 * @brief AtomicWaker state machine
 */

#include "fwcore/waker.hpp"

#include "DEBUG_PRINT.hpp"

#include <utility>

namespace fwcore
{

void AtomicWaker::register_waker(Waker const& new_waker)
{
   std::uint8_t expected = WAITING;
   if (state.compare_exchange_strong(expected, REGISTERING, std::memory_order_acquire)) {
      if (!waker.will_wake(new_waker)) {
         waker = new_waker;
      }

      expected = REGISTERING;
      if (!state.compare_exchange_strong(expected, WAITING, std::memory_order_acq_rel)) {
         // A producer raised WAKING while we held the cell: it could not take
         // the waker, so the wake is ours to deliver.
         Waker pending = std::exchange(waker, Waker{});
         state.store(WAITING, std::memory_order_release);
         LOG_SYNC("AtomicWaker: wake raced registration");
         pending.wake();
      }
      return;
   }

   if (expected == WAKING) {
      // A producer is mid-wake: it may have taken an older waker
      new_waker.wake();
   }
   // REGISTERING | WAKING: concurrent registration, which a single consumer
   // cannot cause. Nothing to do.
}

void AtomicWaker::wake()
{
   Waker taken = take();
   taken.wake();
}

Waker AtomicWaker::take()
{
   std::uint8_t const previous = state.fetch_or(WAKING, std::memory_order_acq_rel);
   if (previous == WAITING) {
      Waker taken = std::exchange(waker, Waker{});
      state.fetch_and(static_cast<std::uint8_t>(~WAKING), std::memory_order_release);
      return taken;
   }
   return Waker{};
}

}  // namespace fwcore
