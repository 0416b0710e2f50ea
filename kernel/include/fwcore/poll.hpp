/**
 * @file poll.hpp
 * @brief Readiness of a cooperative computation
 *
 * Tasks are explicit state machines: each call to poll() advances the
 * machine as far as it can and reports either Ready(value) or Pending. A
 * Pending result promises that the waker handed to poll() has been stored
 * somewhere that will invoke it once progress is possible.
 */

#ifndef FWCORE_POLL_HPP
#define FWCORE_POLL_HPP

#include "fwcore/waker.hpp"

#include <cassert>
#include <concepts>
#include <optional>
#include <type_traits>
#include <utility>

namespace fwcore
{

/**
 * @brief Value of a computation that produces nothing
 */
struct Unit
{
   constexpr bool operator==(Unit const&) const = default;
};

struct PendingTag
{
   explicit constexpr PendingTag() = default;
};

inline constexpr PendingTag Pending{};

template<typename T>
class Poll
{
public:
   using value_type = T;

   constexpr Poll(PendingTag) noexcept {}
   constexpr Poll(T v) : value(std::move(v)) {}

   [[nodiscard]] constexpr bool is_ready() const noexcept { return value.has_value(); }
   [[nodiscard]] constexpr bool is_pending() const noexcept { return !value.has_value(); }

   constexpr T& get() &
   {
      assert(is_ready());
      return *value;
   }

   constexpr T&& get() &&
   {
      assert(is_ready());
      return std::move(*value);
   }

private:
   std::optional<T> value;
};

/**
 * @brief Anything that can be polled with a waker
 */
template<typename F>
concept Future = requires(F& f, Waker const& waker) {
   typename decltype(f.poll(waker))::value_type;
   { f.poll(waker).is_ready() } -> std::convertible_to<bool>;
};

template<Future F>
using FutureOutput = typename decltype(std::declval<F&>().poll(std::declval<Waker const&>()))::value_type;

/**
 * @brief Adapts a callable `Poll<T>(Waker const&)` into a Future
 *
 * The callable holds the state machine in its captures (mutable lambda).
 */
template<typename Fn>
class PollFn
{
public:
   explicit PollFn(Fn fn) : fn(std::move(fn)) {}

   auto poll(Waker const& waker)
   {
      return fn(waker);
   }

private:
   Fn fn;
};

template<typename Fn>
PollFn<std::decay_t<Fn>> poll_fn(Fn&& fn)
{
   return PollFn<std::decay_t<Fn>>(std::forward<Fn>(fn));
}

}  // namespace fwcore

#endif // FWCORE_POLL_HPP
