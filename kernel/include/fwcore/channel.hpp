/**
 * @file channel.hpp
 * @brief Unbounded MPSC channel between ISRs and tasks
 *
 * The canonical hand-off: an ISR owns an UnboundedSender and pushes a token
 * (often Unit) for every event; a task awaits the UnboundedReceiver. send()
 * never blocks and never fails while the receiver is alive, so it is safe in
 * ISR context.
 */

#ifndef FWCORE_CHANNEL_HPP
#define FWCORE_CHANNEL_HPP

#include "fwcore/mpsc_queue.hpp"
#include "fwcore/poll.hpp"
#include "fwcore/waker.hpp"

#include "DEBUG_PRINT.hpp"

#include <atomic>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <utility>

namespace fwcore
{

enum class ChannelError
{
   Closed,  // Receiver dropped or closed the channel
};

constexpr const char* to_string(ChannelError error)
{
   switch (error) {
      case ChannelError::Closed: return "channel closed";
   }
   return "unknown channel error";
}

template<typename T> class UnboundedSender;
template<typename T> class UnboundedReceiver;

template<typename T>
std::pair<UnboundedSender<T>, UnboundedReceiver<T>> unbounded();

namespace detail
{
   template<typename T>
   struct ChannelState
   {
      MpscQueue<T>             queue;
      AtomicWaker              receiver_waker;
      std::atomic<std::size_t> senders{1};
      std::atomic<bool>        open{true};
   };
}  // namespace detail

template<typename T>
class UnboundedSender
{
public:
   UnboundedSender(UnboundedSender const& other) : state(other.state)
   {
      if (state) state->senders.fetch_add(1, std::memory_order_relaxed);
   }

   UnboundedSender(UnboundedSender&& other) noexcept = default;

   UnboundedSender& operator=(UnboundedSender other) noexcept
   {
      std::swap(state, other.state);
      return *this;
   }

   ~UnboundedSender()
   {
      if (state && state->senders.fetch_sub(1, std::memory_order_acq_rel) == 1) {
         // Last sender gone: the receiver must observe end-of-stream
         state->receiver_waker.wake();
      }
   }

   /**
    * @brief Queue a value and wake the receiver
    *
    * ISR safe. Fails only once the receiver has closed the channel.
    */
   std::expected<void, ChannelError> send(T value) const
   {
      if (!state || !state->open.load(std::memory_order_acquire)) {
         return std::unexpected(ChannelError::Closed);
      }
      state->queue.push(std::move(value));
      state->receiver_waker.wake();
      return {};
   }

   [[nodiscard]] bool is_closed() const
   {
      return !state || !state->open.load(std::memory_order_acquire);
   }

private:
   friend std::pair<UnboundedSender<T>, UnboundedReceiver<T>> unbounded<T>();

   explicit UnboundedSender(std::shared_ptr<detail::ChannelState<T>> state) : state(std::move(state)) {}

   std::shared_ptr<detail::ChannelState<T>> state;
};

template<typename T>
class UnboundedReceiver
{
public:
   /**
    * @brief Future resolving to the next value, or std::nullopt at end-of-stream
    */
   class Next
   {
   public:
      explicit Next(UnboundedReceiver& receiver) : receiver(&receiver) {}

      Poll<std::optional<T>> poll(Waker const& waker)
      {
         return receiver->poll_next(waker);
      }

   private:
      UnboundedReceiver* receiver;
   };

   UnboundedReceiver(UnboundedReceiver&&) noexcept            = default;
   UnboundedReceiver& operator=(UnboundedReceiver&&) noexcept = default;

   ~UnboundedReceiver()
   {
      if (state) close();
   }

   /**
    * @brief Poll for the next value
    *
    * Ready(value) when one is queued, Ready(std::nullopt) once every sender
    * is gone (or the channel is closed) and the queue is drained, Pending
    * otherwise with `waker` registered for the next send.
    */
   Poll<std::optional<T>> poll_next(Waker const& waker)
   {
      if (auto ready = try_receive(waker)) return std::move(*ready);

      state->receiver_waker.register_waker(waker);

      // A send between the first attempt and the registration woke nobody
      if (auto ready = try_receive(waker)) return std::move(*ready);
      return Pending;
   }

   Next next() { return Next(*this); }

   /**
    * @brief Refuse further sends; already queued values can still be received
    */
   void close()
   {
      state->open.store(false, std::memory_order_release);
   }

private:
   using Item = std::optional<T>;

   friend std::pair<UnboundedSender<T>, UnboundedReceiver<T>> unbounded<T>();

   explicit UnboundedReceiver(std::shared_ptr<detail::ChannelState<T>> state) : state(std::move(state)) {}

   std::optional<Poll<Item>> try_receive(Waker const& waker)
   {
      // Sample senders before popping: a last send always precedes the drop
      std::size_t const senders = state->senders.load(std::memory_order_acquire);
      bool const open           = state->open.load(std::memory_order_acquire);

      auto result = state->queue.pop();
      switch (result.kind) {
         case PopResult<T>::Kind::Data:
            return Poll<Item>(Item(std::move(*result.value)));

         case PopResult<T>::Kind::Inconsistent:
            // A producer was interrupted mid-push; come back next turn
            LOG_SYNC("channel: queue inconsistent, retrying");
            waker.wake();
            return Poll<Item>(Pending);

         case PopResult<T>::Kind::Empty:
            if (senders == 0 || !open) return Poll<Item>(Item{});
            return std::nullopt;
      }
      return std::nullopt;
   }

   std::shared_ptr<detail::ChannelState<T>> state;
};

/**
 * @brief Create an unbounded channel
 */
template<typename T>
std::pair<UnboundedSender<T>, UnboundedReceiver<T>> unbounded()
{
   auto state = std::make_shared<detail::ChannelState<T>>();
   return {UnboundedSender<T>(state), UnboundedReceiver<T>(state)};
}

}  // namespace fwcore

#endif // FWCORE_CHANNEL_HPP
