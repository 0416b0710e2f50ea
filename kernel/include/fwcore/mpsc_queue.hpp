/**
 * @file mpsc_queue.hpp
 * @brief Intrusive-node Multi-Producer Single-Consumer (MPSC) queue
 *
 * Unbounded linked queue used for every wake path in fwcore: the executor's
 * runnable queue, the future-mutex waiter list and channel buffers.
 *
 * Key properties:
 * - push() is wait-free and safe from ISR context (one exchange, one store)
 * - pop() is single-consumer and never blocks
 * - FIFO per producer; across producers, ordered by the exchange on head
 *
 * Algorithm:
 * Dmitry Vyukov's non-intrusive MPSC node queue. A stub node separates the
 * empty queue from a queue with a producer in flight. A producer first
 * swings `head` to its node and only then links the previous node to it.
 * A consumer that runs between those two writes finds the next link still
 * null while `head` has already moved: pop() reports Inconsistent and the
 * consumer retries later instead of waiting for the producer, which may be
 * the foreground code the consumer's ISR interrupted.
 */

#ifndef FWCORE_MPSC_QUEUE_HPP
#define FWCORE_MPSC_QUEUE_HPP

#include <atomic>
#include <optional>
#include <utility>

namespace fwcore
{

template<typename T>
struct PopResult
{
   enum class Kind
   {
      Data,
      Empty,
      Inconsistent,
   };

   Kind kind;
   std::optional<T> value;

   [[nodiscard]] bool is_data() const noexcept { return kind == Kind::Data; }
   [[nodiscard]] bool is_empty() const noexcept { return kind == Kind::Empty; }
   [[nodiscard]] bool is_inconsistent() const noexcept { return kind == Kind::Inconsistent; }
};

/**
 * @brief Lock-free Multi-Producer Single-Consumer linked queue
 *
 * @tparam T Element type
 *
 * Thread safety:
 * - push(): Safe from any context, including ISRs and other threads
 * - pop(): Must ONLY be called from the single consumer
 */
template<typename T>
class MpscQueue
{
   struct Node
   {
      std::atomic<Node*> next{nullptr};
      std::optional<T>   value;
   };

public:
   using Result = PopResult<T>;
   using Kind   = typename Result::Kind;

   MpscQueue() : head(&stub), tail(&stub) {}

   ~MpscQueue()
   {
      // Consumer side is gone, so any completed push can be reclaimed
      while (pop().is_data()) {}

      Node* node = tail;
      while (node) {
         Node* next = node->next.load(std::memory_order_acquire);
         if (node != &stub) delete node;
         node = next;
      }
   }

   MpscQueue(MpscQueue const&)            = delete;
   MpscQueue& operator=(MpscQueue const&) = delete;

   void push(T item)
   {
      Node* node = new Node;
      node->value.emplace(std::move(item));
      link(node);
   }

   /**
    * @brief Dequeue the oldest fully-published item
    */
   Result pop()
   {
      Node* first = tail;
      Node* next  = first->next.load(std::memory_order_acquire);

      if (first == &stub) {
         if (next == nullptr) return empty_or_inconsistent();
         // Skip over the stub
         tail  = next;
         first = next;
         next  = first->next.load(std::memory_order_acquire);
      }

      if (next != nullptr) {
         tail = next;
         return take(first);
      }

      if (first != head.load(std::memory_order_acquire)) {
         // A producer swung head but has not linked its node yet
         return {Kind::Inconsistent, std::nullopt};
      }

      // `first` is the last node: put the stub back behind it so it can leave
      stub.next.store(nullptr, std::memory_order_relaxed);
      link(&stub);

      next = first->next.load(std::memory_order_acquire);
      if (next != nullptr) {
         tail = next;
         return take(first);
      }
      return {Kind::Inconsistent, std::nullopt};
   }

   /**
    * @brief Consumer-side emptiness check
    *
    * Racy with respect to producers; a concurrent push may be missed.
    */
   [[nodiscard]] bool empty() const
   {
      Node* first = tail;
      if (first == &stub) {
         return first->next.load(std::memory_order_acquire) == nullptr &&
                head.load(std::memory_order_acquire) == &stub;
      }
      return false;
   }

private:
   void link(Node* node)
   {
      Node* prev = head.exchange(node, std::memory_order_acq_rel);
      // An ISR interrupting here leaves the queue Inconsistent until we resume
      prev->next.store(node, std::memory_order_release);
   }

   Result take(Node* node)
   {
      Result result{Kind::Data, std::move(node->value)};
      delete node;
      return result;
   }

   Result empty_or_inconsistent() const
   {
      if (head.load(std::memory_order_acquire) == tail) return {Kind::Empty, std::nullopt};
      return {Kind::Inconsistent, std::nullopt};
   }

   std::atomic<Node*> head;  // Producers: most recently pushed node
   Node*              tail;  // Consumer: next node to inspect
   Node               stub;
};

}  // namespace fwcore

#endif // FWCORE_MPSC_QUEUE_HPP
