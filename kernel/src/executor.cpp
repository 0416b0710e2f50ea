/**
 * @file executor.cpp
 * @brief Cooperative task runtime
 */

#include "fwcore/executor.hpp"
#include "fwcore/panic.hpp"

#include "DEBUG_PRINT.hpp"

namespace fwcore
{

void Executor::TaskWaker::wake() noexcept
{
   if (!queued.exchange(true, std::memory_order_acq_rel)) {
      run_queue->push(id);
   }
}

Executor::Executor() : run_queue(std::make_shared<MpscQueue<TaskId>>()) {}

Executor::~Executor()
{
   // Outstanding wakers (held by channels, mutexes, ISRs) outlive us
   for (auto& [id, task] : tasks) {
      task.target->queued.store(true, std::memory_order_release);
   }
}

TaskId Executor::insert(std::unique_ptr<TaskBase> body)
{
   TaskId const id{next_id++};

   auto target = std::make_shared<TaskWaker>(id, run_queue);
   Waker waker(target);
   tasks.emplace(id, Task{std::move(target), std::move(waker), std::move(body)});

   run_queue->push(id);
   LOG_EXEC("spawn: task=%llu tasks=%zu", static_cast<unsigned long long>(id.value), tasks.size());
   return id;
}

Executor::Turn Executor::run()
{
   Turn const turn = run_task();
   if (turn != Turn::Empty || !idle_task) return turn;

   if (idle_task->poll(Waker::noop())) {
      LOG_EXEC("run: idle task completed, dropping it");
      idle_task.reset();
   }
   return Turn::Idle;
}

std::size_t Executor::run_until_idle()
{
   std::size_t polled = 0;
   for (;;) {
      switch (run_task()) {
         case Turn::Empty:
            return polled;
         case Turn::Polled:
         case Turn::Completed:
            ++polled;
            break;
         case Turn::Stale:
         case Turn::Inconsistent:
         case Turn::Idle:
            break;
      }
   }
}

Executor::Turn Executor::run_task()
{
   auto result = run_queue->pop();

   if (result.is_empty()) return Turn::Empty;
   if (result.is_inconsistent()) {
      LOG_EXEC("run: runnable queue inconsistent");
      return Turn::Inconsistent;
   }

   TaskId const id = *result.value;
   auto it = tasks.find(id);
   if (it == tasks.end()) {
      LOG_EXEC("run: task=%llu already completed", static_cast<unsigned long long>(id.value));
      return Turn::Stale;
   }

   // Wakes from here on, including from within poll(), queue the task again
   Task& task = it->second;
   task.target->queued.store(false, std::memory_order_release);

   bool const done = task.body->poll(task.waker);
   LOG_EXEC("run: task=%llu -> %s", static_cast<unsigned long long>(id.value), POLL_TO_STR(done));

   if (done) {
      task.target->queued.store(true, std::memory_order_release);
      tasks.erase(it);
      return Turn::Completed;
   }
   return Turn::Polled;
}

/* ============================================================================
 * Idle support
 * ========================================================================= */

Poll<std::optional<Unit>> IdleStream::poll_next(Waker const& waker)
{
   bool const was_idle = idle;
   idle = !idle;

   if (was_idle) return std::optional<Unit>(Unit{});

   if (!idle_waker_sink.send(waker)) {
      panic("sending on idle channel failed");
   }
   return Pending;
}

Poll<Unit> IdleWakerTask::poll(Waker const& waker)
{
   for (;;) {
      auto next = wakers.poll_next(waker);
      if (next.is_pending()) return Pending;

      auto& parked = next.get();
      if (!parked) return Unit{};
      parked->wake();
   }
}

}  // namespace fwcore
