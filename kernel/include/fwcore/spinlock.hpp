/**
 * @file spinlock.hpp
 * @brief Test-and-set lock guarding a FutureMutex payload
 */

#ifndef FWCORE_SPINLOCK_HPP
#define FWCORE_SPINLOCK_HPP

#include <atomic>

namespace fwcore
{

/**
 * @brief Single-flag lock
 *
 * Tasks only ever try_lock() it and park on failure. lock() spins and is
 * reserved for FutureMutex::force_lock(), where the holder is known to
 * release within a few instructions.
 */
class Spinlock
{
public:
   constexpr Spinlock() = default;

   Spinlock(Spinlock const&)            = delete;
   Spinlock& operator=(Spinlock const&) = delete;

   void lock();
   void unlock();

   /**
    * @return true if this call took the lock
    */
   bool try_lock() { return !flag.test_and_set(std::memory_order_acquire); }

   // Racy; for assertions and tests
   [[nodiscard]] bool is_locked() const { return flag.test(std::memory_order_relaxed); }

private:
   std::atomic_flag flag{};
};

}  // namespace fwcore

#endif // FWCORE_SPINLOCK_HPP
