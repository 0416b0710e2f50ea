/**
 * @file firmware_demo.cpp
 * @brief Simulated STM32F7 firmware built on the fwcore runtime
 *
 * - TIM6 raises a 10 Hz update interrupt; its ISR feeds a tick channel
 * - The EXTI line 10..15 ISR stands in for a touch panel interrupt; the
 *   foreground "presses" it in software every 700 ms
 * - The touch task reads the controller over an I2C bus shared through a
 *   FutureMutex with the sensor task
 * - A background task runs whenever the executor has nothing else to do
 *
 * Build with -DFWCORE_DEBUG_PRINT=ON to trace every step.
 */

#include "fwcore/channel.hpp"
#include "fwcore/executor.hpp"
#include "fwcore/future_mutex.hpp"
#include "fwcore/interrupt_table.hpp"
#include "fwcore/nvic_controller.hpp"
#include "fwcore/port.h"
#include "fwcore/primask_mutex.hpp"

#include "DEBUG_PRINT.hpp"

#include <cstdint>
#include <cstdio>
#include <optional>
#include <utility>

using namespace fwcore;

namespace
{

constexpr std::uint64_t RUN_TIME_US    = 3'000'000;
constexpr std::uint32_t TICK_HZ        = 10;
constexpr std::uint32_t PRESS_EVERY    = 7;   // ticks
constexpr std::uint8_t  TOUCH_ADDRESS  = 0x38;
constexpr std::uint8_t  SENSOR_ADDRESS = 0x76;

struct I2cBus
{
   std::uint32_t transfers{0};

   std::uint8_t read(std::uint8_t address)
   {
      ++transfers;
      return static_cast<std::uint8_t>(address ^ transfers);
   }
};

struct ReadRegister
{
   std::uint8_t address;

   std::uint8_t operator()(I2cBus& bus) const { return bus.read(address); }
};

using BusRead = FutureMutex<I2cBus>::WithFuture<ReadRegister>;

/**
 * @brief Counts timer ticks and samples the sensor every second
 */
class SensorTask
{
public:
   SensorTask(UnboundedReceiver<Unit> ticks, FutureMutex<I2cBus>& bus, std::uint32_t& tick_count)
      : ticks(std::move(ticks)), bus(&bus), tick_count(&tick_count) {}

   Poll<Unit> poll(Waker const& waker)
   {
      for (;;) {
         if (read) {
            auto sample = read->poll(waker);
            if (sample.is_pending()) return Pending;
            LOG_TEST("sensor: sample 0x%02x", sample.get());
            read.reset();
         }

         auto tick = ticks.poll_next(waker);
         if (tick.is_pending()) return Pending;
         if (!tick.get()) return Unit{};

         ++*tick_count;
         if (*tick_count % TICK_HZ == 0) read.emplace(bus->with(ReadRegister{SENSOR_ADDRESS}));
      }
   }

private:
   UnboundedReceiver<Unit> ticks;
   FutureMutex<I2cBus>*    bus;
   std::uint32_t*          tick_count;
   std::optional<BusRead>  read;
};

/**
 * @brief Reads the touch controller after every touch interrupt
 */
class TouchTask
{
public:
   TouchTask(UnboundedReceiver<Unit> presses, FutureMutex<I2cBus>& bus,
             PrimaskMutex<std::uint64_t>& last_press, std::uint32_t& touches)
      : presses(std::move(presses)), bus(&bus), last_press(&last_press), touches(&touches) {}

   Poll<Unit> poll(Waker const& waker)
   {
      for (;;) {
         if (!read) {
            auto press = presses.poll_next(waker);
            if (press.is_pending()) return Pending;
            if (!press.get()) return Unit{};
            read.emplace(bus->with(ReadRegister{TOUCH_ADDRESS}));
         }

         auto reply = read->poll(waker);
         if (reply.is_pending()) return Pending;
         read.reset();
         ++*touches;

         [[maybe_unused]] std::uint64_t const pressed_at = last_press->lock([](std::uint64_t& t) { return t; });
         LOG_TEST("touch: controller replied 0x%02x, %llu us after the interrupt", reply.get(),
                  static_cast<unsigned long long>(fwcore_port_time_now() - pressed_at));
      }
   }

private:
   UnboundedReceiver<Unit>      presses;
   FutureMutex<I2cBus>*         bus;
   PrimaskMutex<std::uint64_t>* last_press;
   std::uint32_t*               touches;
   std::optional<BusRead>       read;
};

/**
 * @brief Work that only runs when nothing else is runnable
 */
class BackgroundTask
{
public:
   BackgroundTask(IdleStream idle, std::uint32_t& cycles) : idle(std::move(idle)), cycles(&cycles) {}

   Poll<Unit> poll(Waker const& waker)
   {
      for (;;) {
         if (idle.poll_next(waker).is_pending()) return Pending;
         ++*cycles;
      }
   }

private:
   IdleStream     idle;
   std::uint32_t* cycles;
};

}  // namespace

int main()
{
   fwcore_port_nvic_reset();
   fwcore_port_time_reset(0);

   Executor executor;
   FutureMutex<I2cBus> bus{I2cBus{}};
   PrimaskMutex<std::uint64_t> last_press{0};

   std::uint32_t ticks = 0;
   std::uint32_t touches = 0;
   std::uint32_t idle_cycles = 0;

   auto [tick_tx, tick_rx]   = unbounded<Unit>();
   auto [press_tx, press_rx] = unbounded<Unit>();
   auto [idle_tx, idle_rx]   = unbounded<Waker>();

   executor.spawn(SensorTask(std::move(tick_rx), bus, ticks));
   executor.spawn(TouchTask(std::move(press_rx), bus, last_press, touches));
   executor.spawn(BackgroundTask(IdleStream(std::move(idle_tx)), idle_cycles));
   executor.set_idle_task(IdleWakerTask(std::move(idle_rx)));

   auto default_handler = []([[maybe_unused]] std::uint8_t irq) { LOG_IRQ("spurious interrupt on line %u", irq); };

   auto result = scope(NvicController{}, default_handler, [&](auto& table) -> std::optional<InterruptError> {
      auto tim6 = table.register_isr(InterruptRequest::Tim6Dac, Priority::P1, [tx = std::move(tick_tx)] {
         if (!fwcore_port_timer_update_flag()) return;
         fwcore_port_timer_clear_update_flag();
         (void)tx.send(Unit{});
      });
      auto touch = table.register_isr(InterruptRequest::Exti10to15, Priority::P3,
                                      [tx = std::move(press_tx), &last_press] {
         last_press.lock([](std::uint64_t& t) { t = fwcore_port_time_now(); });
         (void)tx.send(Unit{});
      });
      if (!tim6) return tim6.error();
      if (!touch) return touch.error();

      fwcore_port_timer_setup(std::to_underlying(InterruptRequest::Tim6Dac), TICK_HZ);

      std::uint32_t pressed_on_tick = 0;
      while (fwcore_port_time_now() < RUN_TIME_US) {
         Executor::Turn const turn = executor.run();
         if (turn == Executor::Turn::Idle || turn == Executor::Turn::Empty) {
            // WFI: let the next millisecond of simulated time pass
            fwcore_port_time_advance(1000);
         }

         if (ticks != 0 && ticks % PRESS_EVERY == 0 && ticks != pressed_on_tick) {
            pressed_on_tick = ticks;
            table.trigger(InterruptRequest::Exti10to15);
         }
      }

      fwcore_port_timer_stop();
      return std::nullopt;
   });

   if (!result) {
      std::fprintf(stderr, "interrupt scope failed: %s\n", to_string(result.error().kind));
      return 1;
   }
   if (auto const& error = *result) {
      std::fprintf(stderr, "ISR registration failed on line %u: %s\n",
                   static_cast<unsigned>(error->irq.value), to_string(error->kind));
      return 1;
   }

   // Scope exit dropped both ISRs and with them the last senders
   executor.run_until_idle();

   std::printf("ticks=%u touches=%u bus_transfers=%u idle_cycles=%u tasks_left=%zu\n",
               ticks, touches, bus.force_lock().transfers, idle_cycles, executor.task_count());
   bus.force_unlock();
   return 0;
}
