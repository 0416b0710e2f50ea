/**
 * @file isr_table.hpp
 * @brief Process-wide ISR dispatch table
 *
 * One slot per IRQ line plus a default-handler slot. The platform's default
 * exception vector lands in IsrTable::exception_entry(), which translates the
 * exception number and dispatches. Slots are only mutated by InterruptTable,
 * so their lifecycle is: empty -> populated inside a scope -> drained on
 * scope exit.
 */

#ifndef FWCORE_ISR_TABLE_HPP
#define FWCORE_ISR_TABLE_HPP

#include "fwcore/config.hpp"
#include "fwcore/function.hpp"
#include "fwcore/interrupt_controller.hpp"

#include <cstddef>
#include <cstdint>

namespace fwcore
{

template<typename Controller>
class InterruptTable;

class IsrTable
{
public:
   /**
    * @brief Stored ISR
    *
    * Closures larger than the inline buffer are moved to the heap when they
    * are installed; invoking never allocates.
    */
   using Isr            = Function<void(), config::ISR_INLINE_SIZE, HeapPolicy::CanUseHeap>;
   using DefaultHandler = Function<void(std::uint8_t), config::DEFAULT_HANDLER_INLINE_SIZE, HeapPolicy::CanUseHeap>;

   IsrTable() = delete;

   /**
    * @brief Dispatch one interrupt
    *
    * Runs the installed ISR for `irq`, else the default handler with the IRQ
    * number. Panics with "unhandled interrupt" if neither exists, and on an
    * out-of-range IRQ. Lock-free, allocation-free, O(1).
    */
   static void handle(IrqNumber irq);

   /**
    * @brief Default exception vector
    *
    * Registered with the port while a scope is live.
    */
   static void exception_entry(std::uint32_t exception_number);

   [[nodiscard]] static bool occupied(IrqNumber irq);
   [[nodiscard]] static std::size_t occupied_count();

   /**
    * @brief True while a default handler is installed (a scope is live)
    */
   [[nodiscard]] static bool in_scope();

private:
   template<typename Controller>
   friend class InterruptTable;

   // Returns false if the slot is occupied
   static bool install(IrqNumber irq, Isr isr);
   static void remove(IrqNumber irq);

   // Returns false if a default handler is already installed
   static bool install_default(DefaultHandler handler);
   static void clear_default();
};

}  // namespace fwcore

#endif // FWCORE_ISR_TABLE_HPP
