/**
 * @file port_linux_boost.cpp
 * @brief Linux simulation port using Boost.Context
 *
 * Simulates the parts of a Cortex-M7 (STM32F7) the interrupt core talks to:
 * - PRIMASK style interrupt masking
 * - An NVIC with enable, pending and priority state per line
 * - Exception entry on a dedicated interrupt stack, executed as a
 *   Boost.Context fiber over a preallocated stack (the main stack of the
 *   real chip)
 * - A basic timer peripheral raising update events from simulated time
 *
 * There is a single simulated core. Interrupts are delivered at simulated
 * instruction boundaries: whenever a line is pended or enabled, whenever
 * interrupts become unmasked, and when the foreground idles.
 */

#include "fwcore/port.h"

#include "DEBUG_PRINT.hpp"

#include <boost/context/fiber.hpp>
#include <boost/context/preallocated.hpp>
#include <boost/context/stack_context.hpp>

#include <array>
#include <atomic>
#include <cassert>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

static_assert((FWCORE_STACK_ALIGN & (FWCORE_STACK_ALIGN - 1)) == 0,
              "FWCORE_STACK_ALIGN must be a power of two");
static_assert(FWCORE_PORT_PRIORITY_BITS > 0 && FWCORE_PORT_PRIORITY_BITS <= 8,
              "FWCORE_PORT_PRIORITY_BITS must be in [1, 8]");

/* ============================================================================
 * Simulated Core State
 * ========================================================================= */

namespace
{

struct NvicLine
{
   std::atomic<bool>    enabled{false};
   std::atomic<bool>    pending{false};
   std::atomic<uint8_t> priority{0};
};

constexpr uint8_t PRIORITY_MASK = static_cast<uint8_t>(0xFFu << (8 - FWCORE_PORT_PRIORITY_BITS));

constinit std::array<NvicLine, FWCORE_PORT_IRQ_COUNT> nvic{};

// PRIMASK: true while interrupts are masked
constinit std::atomic<bool> primask{false};
constinit std::atomic<bool> in_exception{false};
constinit std::atomic<fwcore_port_exception_handler_t> exception_handler{nullptr};

alignas(FWCORE_STACK_ALIGN) std::array<std::byte, FWCORE_PORT_ISR_STACK_SIZE> isr_stack;

struct BasicTimer
{
   bool     running{false};
   uint32_t irq{0};
   uint64_t period_us{0};
   uint64_t next_update{0};
   std::atomic<bool> update_flag{false};
};

constinit std::atomic<uint64_t> time_now_us{0};
constinit BasicTimer timer{};

// No-op stack allocator for preallocated memory
struct preallocated_stack_noop
{
   using traits_type = boost::context::stack_traits;
   boost::context::stack_context allocate(std::size_t) { std::abort(); }
   void deallocate(boost::context::stack_context&) noexcept {}
};

[[noreturn]] void fatal(const char* text)
{
   fwcore_port_disable_interrupts();
   fwcore_port_diagnostic_write(text);
   fwcore_port_halt();
}

// NVIC registers only exist for implemented lines, in release builds too
void check_line(uint32_t irq, const char* op)
{
   if (irq < FWCORE_PORT_IRQ_COUNT) return;

   static char message[96];
   std::snprintf(message, sizeof(message), "PANIC: %s: IRQ %u out of range (IRQ_COUNT=%u)\n", op,
                 static_cast<unsigned>(irq), static_cast<unsigned>(FWCORE_PORT_IRQ_COUNT));
   fatal(message);
}

void enter_exception(uint32_t irq)
{
   auto handler = exception_handler.load(std::memory_order_acquire);
   if (handler == nullptr) {
      fatal("PANIC: interrupt taken without a default exception handler\n");
   }

   uint32_t const exception_number = irq + FWCORE_PORT_IRQ_EXCEPTION_BASE;
   LOG_PORT("exception entry: irq=%u exception=%u", irq, exception_number);

   boost::context::stack_context boost_stack_context =
   {
      .size = isr_stack.size(),
      .sp   = isr_stack.data() + isr_stack.size(),
   };

   boost::context::preallocated boost_prealloc(
      boost_stack_context.sp,
      boost_stack_context.size,
      boost_stack_context
   );

   boost::context::fiber isr(
      std::allocator_arg,
      boost_prealloc,
      preallocated_stack_noop{},
      [handler, exception_number](boost::context::fiber&& thread) -> boost::context::fiber
      {
         handler(exception_number);
         return std::move(thread);
      }
   );

   in_exception.store(true, std::memory_order_release);
   isr = std::move(isr).resume();
   in_exception.store(false, std::memory_order_release);

   assert(!isr && "Exception fiber must run to completion");
   LOG_PORT("exception return: irq=%u", irq);
}

// Highest urgency first: lowest priority value, ties broken by lowest IRQ number
int next_deliverable_irq()
{
   int best = -1;
   uint8_t best_priority = 0xFF;

   for (uint32_t irq = 0; irq < nvic.size(); ++irq) {
      auto const& line = nvic[irq];
      if (!line.enabled.load(std::memory_order_acquire)) continue;
      if (!line.pending.load(std::memory_order_acquire)) continue;

      uint8_t priority = line.priority.load(std::memory_order_relaxed);
      if (best < 0 || priority < best_priority) {
         best = static_cast<int>(irq);
         best_priority = priority;
      }
   }
   return best;
}

}  // namespace

/* ============================================================================
 * Critical Sections
 * ========================================================================= */

extern "C" uint32_t fwcore_port_irq_save(void)
{
   bool const was_masked = primask.exchange(true, std::memory_order_acq_rel);
   return was_masked ? 0u : 1u;
}

extern "C" void fwcore_port_irq_restore(uint32_t state)
{
   if (state != 0) {
      fwcore_port_enable_interrupts();
   }
}

extern "C" void fwcore_port_disable_interrupts(void)
{
   primask.store(true, std::memory_order_release);
}

extern "C" void fwcore_port_enable_interrupts(void)
{
   primask.store(false, std::memory_order_release);
   fwcore_port_service_interrupts();
}

extern "C" bool fwcore_port_interrupts_enabled(void)
{
   return !primask.load(std::memory_order_acquire);
}

extern "C" bool fwcore_port_in_isr(void)
{
   return in_exception.load(std::memory_order_acquire);
}

extern "C" void fwcore_port_cpu_relax(void)
{
   // CPU yield hint for busy-wait loops
#if defined(__x86_64__) || defined(__i386__)
   __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
   __asm__ __volatile__("yield");
#endif
}

/* ============================================================================
 * NVIC
 * ========================================================================= */

extern "C" void fwcore_port_nvic_enable(uint32_t irq)
{
   check_line(irq, "nvic_enable");
   nvic[irq].enabled.store(true, std::memory_order_release);
   fwcore_port_service_interrupts();
}

extern "C" void fwcore_port_nvic_disable(uint32_t irq)
{
   check_line(irq, "nvic_disable");
   nvic[irq].enabled.store(false, std::memory_order_release);
}

extern "C" bool fwcore_port_nvic_is_enabled(uint32_t irq)
{
   check_line(irq, "nvic_is_enabled");
   return nvic[irq].enabled.load(std::memory_order_acquire);
}

extern "C" void fwcore_port_nvic_pend(uint32_t irq)
{
   check_line(irq, "nvic_pend");
   nvic[irq].pending.store(true, std::memory_order_release);
   fwcore_port_service_interrupts();
}

extern "C" void fwcore_port_nvic_unpend(uint32_t irq)
{
   check_line(irq, "nvic_unpend");
   nvic[irq].pending.store(false, std::memory_order_release);
}

extern "C" bool fwcore_port_nvic_is_pending(uint32_t irq)
{
   check_line(irq, "nvic_is_pending");
   return nvic[irq].pending.load(std::memory_order_acquire);
}

extern "C" void fwcore_port_nvic_set_priority(uint32_t irq, uint8_t priority)
{
   check_line(irq, "nvic_set_priority");
   nvic[irq].priority.store(priority & PRIORITY_MASK, std::memory_order_release);
}

extern "C" uint8_t fwcore_port_nvic_get_priority(uint32_t irq)
{
   check_line(irq, "nvic_get_priority");
   return nvic[irq].priority.load(std::memory_order_acquire);
}

extern "C" void fwcore_port_nvic_trigger(uint32_t irq)
{
   LOG_PORT("STIR write: irq=%u", irq);
   fwcore_port_nvic_pend(irq);
}

extern "C" void fwcore_port_nvic_reset(void)
{
   for (auto& line : nvic) {
      line.enabled.store(false, std::memory_order_relaxed);
      line.pending.store(false, std::memory_order_relaxed);
      line.priority.store(0, std::memory_order_relaxed);
   }
   primask.store(false, std::memory_order_release);
}

/* ============================================================================
 * Exception Entry
 * ========================================================================= */

extern "C" void fwcore_port_register_exception_handler(fwcore_port_exception_handler_t handler)
{
   exception_handler.store(handler, std::memory_order_release);
}

extern "C" void fwcore_port_service_interrupts(void)
{
   // No nesting: lines pended from an ISR are tail-chained once it returns
   while (!primask.load(std::memory_order_acquire) && !in_exception.load(std::memory_order_acquire)) {
      int const irq = next_deliverable_irq();
      if (irq < 0) return;

      // Hardware clears the pending bit on exception entry
      nvic[irq].pending.store(false, std::memory_order_release);
      enter_exception(static_cast<uint32_t>(irq));
   }
}

extern "C" void fwcore_port_idle(void)
{
   fwcore_port_service_interrupts();
   fwcore_port_cpu_relax();
}

/* ============================================================================
 * Time and Basic Timer
 * ========================================================================= */

extern "C" uint64_t fwcore_port_time_now(void)
{
   return time_now_us.load(std::memory_order_acquire);
}

extern "C" void fwcore_port_time_reset(uint64_t time)
{
   time_now_us.store(time, std::memory_order_release);
   timer.running = false;
   timer.update_flag.store(false, std::memory_order_release);
}

extern "C" void fwcore_port_time_advance(uint64_t delta_us)
{
   uint64_t const target = time_now_us.load(std::memory_order_acquire) + delta_us;

   while (timer.running && timer.next_update <= target) {
      time_now_us.store(timer.next_update, std::memory_order_release);
      timer.next_update += timer.period_us;

      timer.update_flag.store(true, std::memory_order_release);
      fwcore_port_nvic_pend(timer.irq);
   }

   time_now_us.store(target, std::memory_order_release);
}

extern "C" void fwcore_port_timer_setup(uint32_t irq, uint32_t hz)
{
   check_line(irq, "timer_setup");
   if (hz == 0 || hz > 1'000'000) {
      fatal("PANIC: timer_setup: frequency out of range\n");
   }

   timer.irq         = irq;
   timer.period_us   = 1'000'000ull / hz;
   timer.next_update = fwcore_port_time_now() + timer.period_us;
   timer.update_flag.store(false, std::memory_order_release);
   timer.running     = true;

   LOG_PORT("timer: irq=%u period=%lluus", irq, static_cast<unsigned long long>(timer.period_us));
}

extern "C" void fwcore_port_timer_stop(void)
{
   timer.running = false;
}

extern "C" bool fwcore_port_timer_update_flag(void)
{
   return timer.update_flag.load(std::memory_order_acquire);
}

extern "C" void fwcore_port_timer_clear_update_flag(void)
{
   timer.update_flag.store(false, std::memory_order_release);
}

/* ============================================================================
 * Debug / Diagnostics
 * ========================================================================= */

extern "C" void fwcore_port_diagnostic_write(const char* text)
{
   std::fputs(text, stderr);
   std::fflush(stderr);
}

extern "C" void fwcore_port_halt(void)
{
   std::abort();
}

extern "C" void fwcore_port_breakpoint(void)
{
#if defined(__x86_64__) || defined(__i386__)
   __asm__ __volatile__("int3");
#elif defined(__aarch64__) || defined(__arm__)
   __builtin_trap();
#else
   raise(SIGTRAP);
#endif
}
