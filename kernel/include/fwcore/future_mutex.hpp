/**
 * @file future_mutex.hpp
 * @brief Mutex whose contention path parks the calling task
 */

#ifndef FWCORE_FUTURE_MUTEX_HPP
#define FWCORE_FUTURE_MUTEX_HPP

#include "fwcore/mpsc_queue.hpp"
#include "fwcore/poll.hpp"
#include "fwcore/spinlock.hpp"
#include "fwcore/waker.hpp"

#include "DEBUG_PRINT.hpp"

#include <cassert>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace fwcore
{

/**
 * @brief Non-blocking mutex for sharing a peripheral between tasks
 *
 * The payload sits behind a Spinlock that is only ever try-locked by tasks
 * and held for the duration of one closure call. A task that finds it taken
 * pushes its waker onto the waiter queue and yields. Every release wakes all
 * parked waiters in the order they parked; a task polled in between may
 * still win the lock first, so strict FIFO is not guaranteed.
 *
 * Example:
 *   FutureMutex<I2cBus> bus{I2cBus{}};
 *   auto read = bus.with([](I2cBus& i2c) { return i2c.read(0x38); });
 *   // poll `read` from a task until Ready
 */
template<typename T>
class FutureMutex
{
public:
   explicit FutureMutex(T value) : data(std::move(value)) {}

   FutureMutex(FutureMutex const&)            = delete;
   FutureMutex& operator=(FutureMutex const&) = delete;

   /**
    * @brief Future running `f(payload)` under the lock
    *
    * Output is f's result, or Unit if f returns void. `f` runs at most once.
    */
   template<typename F>
   class WithFuture
   {
      using Result = std::invoke_result_t<F&, T&>;

   public:
      using Output = std::conditional_t<std::is_void_v<Result>, Unit, Result>;

      WithFuture(FutureMutex& mutex, F f) : mutex(&mutex), f(std::move(f)) {}

      Poll<Output> poll(Waker const& waker)
      {
         assert(f.has_value() && "WithFuture polled after completion");

         if (!mutex->lock.try_lock()) {
            mutex->waiters.push(waker);
            // Release may have drained the waiters before our push landed
            if (!mutex->lock.try_lock()) {
               LOG_SYNC("FutureMutex: contended, task parked");
               return Pending;
            }
         }

         Release release{*mutex};
         F fn = std::move(*f);
         f.reset();
         if constexpr (std::is_void_v<Result>) {
            std::invoke(fn, mutex->data);
            return Unit{};
         } else {
            return std::invoke(fn, mutex->data);
         }
      }

   private:
      FutureMutex*     mutex;
      std::optional<F> f;
   };

   template<typename F>
   WithFuture<std::decay_t<F>> with(F&& f)
   {
      return WithFuture<std::decay_t<F>>(*this, std::forward<F>(f));
   }

   /**
    * @brief Acquire the lock, spinning if necessary
    *
    * For fault handlers that must reach the payload regardless of tasks.
    */
   T& force_lock()
   {
      lock.lock();
      return data;
   }

   /**
    * @brief Release the lock regardless of who holds it and wake all waiters
    */
   void force_unlock()
   {
      wake_waiters();
      lock.unlock();
   }

   [[nodiscard]] bool is_locked() const { return lock.is_locked(); }

private:
   struct Release
   {
      FutureMutex& mutex;
      ~Release()
      {
         mutex.wake_waiters();
         mutex.lock.unlock();
      }
   };

   void wake_waiters()
   {
      for (;;) {
         auto result = waiters.pop();
         if (!result.is_data()) {
            // Inconsistent: a task is mid-park. It re-tries the lock once its
            // push lands, and whoever holds the lock then drains the rest.
            return;
         }
         result.value->wake();
      }
   }

   Spinlock          lock;
   T                 data;
   MpscQueue<Waker>  waiters;
};

}  // namespace fwcore

#endif // FWCORE_FUTURE_MUTEX_HPP
