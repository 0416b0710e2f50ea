/**
 * @file waker.hpp
 * @brief Wake-up tokens for suspended tasks
 */

#ifndef FWCORE_WAKER_HPP
#define FWCORE_WAKER_HPP

#include <atomic>
#include <cstdint>
#include <memory>

namespace fwcore
{

/**
 * @brief Handle that marks a suspended task as runnable
 *
 * Copying and invoking a Waker never allocates, so both are allowed from
 * ISR context. A default constructed Waker is a no-op.
 */
class Waker
{
public:
   /**
    * @brief What a waker wakes
    *
    * wake() may run in ISR context and concurrently with the owner's poll.
    */
   struct Target
   {
      virtual ~Target() = default;
      virtual void wake() noexcept = 0;
   };

   Waker() = default;
   explicit Waker(std::shared_ptr<Target> target) : target(std::move(target)) {}

   static Waker noop() { return Waker{}; }

   void wake() const noexcept
   {
      if (target) target->wake();
   }

   /**
    * @brief True if both wakers wake the same task
    */
   [[nodiscard]] bool will_wake(Waker const& other) const noexcept
   {
      return target == other.target;
   }

   [[nodiscard]] bool is_noop() const noexcept { return target == nullptr; }

private:
   std::shared_ptr<Target> target;
};

/**
 * @brief Single waker cell shared between a consumer task and producers
 *
 * The consumer registers its waker before checking for data; producers
 * publish data and then call wake(). A wake racing a registration is never
 * lost: whichever side observes the other's state performs the wake.
 *
 * State machine (bit flags):
 *   WAITING     - idle, cell may hold a waker
 *   REGISTERING - consumer is replacing the stored waker
 *   WAKING      - a producer is taking the stored waker
 */
class AtomicWaker
{
public:
   AtomicWaker() = default;

   AtomicWaker(AtomicWaker const&)            = delete;
   AtomicWaker& operator=(AtomicWaker const&) = delete;

   /**
    * @brief Store `waker` to be woken by the next wake()
    *
    * Single consumer only. If a wake() is in progress, `waker` is woken
    * immediately instead.
    */
   void register_waker(Waker const& waker);

   /**
    * @brief Wake the registered waker, if any
    */
   void wake();

   /**
    * @brief Remove and return the registered waker
    */
   Waker take();

private:
   static constexpr std::uint8_t WAITING     = 0;
   static constexpr std::uint8_t REGISTERING = 1;
   static constexpr std::uint8_t WAKING      = 2;

   std::atomic<std::uint8_t> state{WAITING};
   Waker waker;
};

}  // namespace fwcore

#endif // FWCORE_WAKER_HPP
