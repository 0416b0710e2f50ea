/**
 * @file isr_table.cpp
 * @brief Process-wide ISR dispatch table
 */

#include "fwcore/isr_table.hpp"
#include "fwcore/panic.hpp"
#include "fwcore/port.h"
#include "fwcore/primask_mutex.hpp"

#include "DEBUG_PRINT.hpp"

#include <array>
#include <atomic>
#include <cassert>
#include <utility>

namespace fwcore
{

namespace
{
   struct Slot
   {
      IsrTable::Isr     isr;
      std::atomic<bool> installed{false};
   };

   constinit std::array<Slot, config::IRQ_COUNT> slots{};

   constinit IsrTable::DefaultHandler default_handler{};
   constinit std::atomic<bool> default_installed{false};

   Slot& slot_for(IrqNumber irq)
   {
      if (irq.value >= config::IRQ_COUNT) {
         panic("IRQ %u out of range (IRQ_COUNT=%zu)", static_cast<unsigned>(irq.value), config::IRQ_COUNT);
      }
      return slots[irq.value];
   }
}

void IsrTable::handle(IrqNumber irq)
{
   Slot& slot = slot_for(irq);

   if (slot.installed.load(std::memory_order_acquire)) {
      LOG_IRQ("dispatch: irq=%u", static_cast<unsigned>(irq.value));
      slot.isr();
      return;
   }

   if (default_installed.load(std::memory_order_acquire)) {
      LOG_IRQ("dispatch: irq=%u -> default handler", static_cast<unsigned>(irq.value));
      default_handler(irq.value);
      return;
   }

   panic("unhandled interrupt %u", static_cast<unsigned>(irq.value));
}

void IsrTable::exception_entry(std::uint32_t exception_number)
{
   if (exception_number < FWCORE_PORT_IRQ_EXCEPTION_BASE ||
       exception_number - FWCORE_PORT_IRQ_EXCEPTION_BASE >= config::IRQ_COUNT) {
      panic("exception %u is not a peripheral IRQ", static_cast<unsigned>(exception_number));
   }
   handle(static_cast<std::uint8_t>(exception_number - FWCORE_PORT_IRQ_EXCEPTION_BASE));
}

bool IsrTable::occupied(IrqNumber irq)
{
   return slot_for(irq).installed.load(std::memory_order_acquire);
}

std::size_t IsrTable::occupied_count()
{
   std::size_t count = 0;
   for (auto const& slot : slots) {
      if (slot.installed.load(std::memory_order_acquire)) ++count;
   }
   return count;
}

bool IsrTable::in_scope()
{
   return default_installed.load(std::memory_order_acquire);
}

bool IsrTable::install(IrqNumber irq, Isr isr)
{
   assert(isr && "Installing an empty ISR");
   Slot& slot = slot_for(irq);

   CriticalSection cs;
   if (slot.installed.load(std::memory_order_relaxed)) return false;

   slot.isr = std::move(isr);
   slot.installed.store(true, std::memory_order_release);
   LOG_IRQ("install: irq=%u", static_cast<unsigned>(irq.value));
   return true;
}

void IsrTable::remove(IrqNumber irq)
{
   Slot& slot = slot_for(irq);
   Isr removed;
   {
      CriticalSection cs;
      slot.installed.store(false, std::memory_order_release);
      removed = std::move(slot.isr);
   }
   LOG_IRQ("remove: irq=%u", static_cast<unsigned>(irq.value));
   // `removed` (and anything it owns) is destroyed with interrupts enabled
}

bool IsrTable::install_default(DefaultHandler handler)
{
   {
      CriticalSection cs;
      if (default_installed.load(std::memory_order_relaxed)) return false;

      default_handler = std::move(handler);
      default_installed.store(true, std::memory_order_release);
   }
   fwcore_port_register_exception_handler(&IsrTable::exception_entry);
   LOG_IRQ("scope: default handler installed");
   return true;
}

void IsrTable::clear_default()
{
   fwcore_port_register_exception_handler(nullptr);

   DefaultHandler removed;
   {
      CriticalSection cs;
      default_installed.store(false, std::memory_order_release);
      removed = std::move(default_handler);
   }
   LOG_IRQ("scope: default handler cleared");
}

}  // namespace fwcore
