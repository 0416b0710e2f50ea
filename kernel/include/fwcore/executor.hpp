/**
 * @file executor.hpp
 * @brief Single-threaded cooperative task runtime
 *
 * Tasks are Futures (see poll.hpp): explicit state machines whose poll()
 * either finishes or parks the task's Waker wherever the awaited event will
 * be signalled (a channel, a FutureMutex, an AtomicWaker). Waking pushes the
 * task id onto the executor's runnable queue, which ISRs may do at any time.
 *
 * Typical main loop:
 *   Executor executor;
 *   executor.spawn(button_task(...));
 *   executor.set_idle_task(IdleWakerTask(std::move(idle_receiver)));
 *   for (;;) executor.run();
 */

#ifndef FWCORE_EXECUTOR_HPP
#define FWCORE_EXECUTOR_HPP

#include "fwcore/channel.hpp"
#include "fwcore/mpsc_queue.hpp"
#include "fwcore/poll.hpp"
#include "fwcore/waker.hpp"

#include <atomic>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <utility>

namespace fwcore
{

struct TaskId
{
   std::uint64_t value;

   constexpr auto operator<=>(TaskId const&) const = default;
};

class Executor
{
public:
   /**
    * @brief What one call to run() did
    */
   enum class Turn
   {
      Polled,        // A task was polled and is still pending
      Completed,     // A task was polled to completion and removed
      Stale,         // Popped the id of a task that already completed
      Idle,          // Runnable queue empty; idle task polled once
      Empty,         // Runnable queue empty and no idle task
      Inconsistent,  // A wake was mid-push; try again
   };

   Executor();
   ~Executor();

   Executor(Executor const&)            = delete;
   Executor& operator=(Executor const&) = delete;

   /**
    * @brief Admit a task; it is polled for the first time on a later turn
    *
    * The task's output, if any, is discarded.
    */
   template<Future F>
   TaskId spawn(F future)
   {
      return insert(std::make_unique<TaskImpl<F>>(std::move(future)));
   }

   /**
    * @brief Install the task polled whenever no task is runnable
    *
    * It is polled with a no-op waker, so it must not rely on being woken.
    * Replaces any previous idle task.
    */
   template<Future F>
   void set_idle_task(F future)
   {
      idle_task = std::make_unique<TaskImpl<F>>(std::move(future));
   }

   /**
    * @brief Execute one turn
    *
    * Pops at most one runnable task id and polls that task once. Only when
    * the queue is empty is the idle task polled.
    */
   Turn run();

   /**
    * @brief Run turns until no task is runnable
    * @return number of tasks polled
    *
    * Does not poll the idle task. Never returns if a task wakes itself on
    * every poll.
    */
   std::size_t run_until_idle();

   [[nodiscard]] std::size_t task_count() const { return tasks.size(); }
   [[nodiscard]] bool has_idle_task() const { return idle_task != nullptr; }
   [[nodiscard]] bool contains(TaskId id) const { return tasks.contains(id); }

private:
   struct TaskBase
   {
      virtual ~TaskBase() = default;
      // Returns true once the task has completed
      virtual bool poll(Waker const& waker) = 0;
   };

   template<typename F>
   struct TaskImpl final : TaskBase
   {
      explicit TaskImpl(F future) : future(std::move(future)) {}

      bool poll(Waker const& waker) override
      {
         return future.poll(waker).is_ready();
      }

      F future;
   };

   /**
    * @brief Waker target: re-queues one task id
    *
    * `queued` is true while the id sits in the runnable queue, so any number
    * of wakes before the next poll queue the task once. It stays true after
    * completion, turning late wakes into no-ops.
    */
   struct TaskWaker final : Waker::Target
   {
      TaskWaker(TaskId id, std::shared_ptr<MpscQueue<TaskId>> run_queue)
         : id(id), run_queue(std::move(run_queue)) {}

      void wake() noexcept override;

      TaskId const id;
      std::shared_ptr<MpscQueue<TaskId>> const run_queue;
      std::atomic<bool> queued{true};
   };

   struct Task
   {
      std::shared_ptr<TaskWaker> target;
      Waker                      waker;
      std::unique_ptr<TaskBase>  body;
   };

   TaskId insert(std::unique_ptr<TaskBase> body);
   Turn run_task();

   std::map<TaskId, Task>             tasks;
   std::shared_ptr<MpscQueue<TaskId>> run_queue;
   std::uint64_t                      next_id{0};
   std::unique_ptr<TaskBase>          idle_task;
};

/**
 * @brief Stream for tasks that want to run when the CPU is otherwise idle
 *
 * poll_next() alternates between Pending and Ready, starting with Pending.
 * On Pending the task's waker is sent to the idle channel; the executor's
 * idle task (IdleWakerTask) wakes everything it receives, so the awaiting
 * task resumes once the runnable queue has drained.
 */
class IdleStream
{
public:
   explicit IdleStream(UnboundedSender<Waker> idle_waker_sink)
      : idle_waker_sink(std::move(idle_waker_sink)) {}

   Poll<std::optional<Unit>> poll_next(Waker const& waker);

   /**
    * @brief Future resolving on the next Ready of the stream
    */
   class Next
   {
   public:
      explicit Next(IdleStream& stream) : stream(&stream) {}

      Poll<std::optional<Unit>> poll(Waker const& waker) { return stream->poll_next(waker); }

   private:
      IdleStream* stream;
   };

   Next next() { return Next(*this); }

private:
   bool idle{false};
   UnboundedSender<Waker> idle_waker_sink;
};

/**
 * @brief Idle task that wakes every waker parked by an IdleStream
 *
 * Completes only if every IdleStream sender is gone.
 */
class IdleWakerTask
{
public:
   explicit IdleWakerTask(UnboundedReceiver<Waker> wakers) : wakers(std::move(wakers)) {}

   Poll<Unit> poll(Waker const& waker);

private:
   UnboundedReceiver<Waker> wakers;
};

}  // namespace fwcore

#endif // FWCORE_EXECUTOR_HPP
