/**
 * @file interrupt_controller.hpp
 * @brief Interrupt controller capability surface
 *
 * The scoped interrupt table drives the hardware through this interface
 * only: on Cortex-M it is the NVIC (NvicController), in unit tests a mock.
 */

#ifndef FWCORE_INTERRUPT_CONTROLLER_HPP
#define FWCORE_INTERRUPT_CONTROLLER_HPP

#include "fwcore/config.hpp"
#include "fwcore/interrupt_request.hpp"
#include "fwcore/panic.hpp"

#include <concepts>
#include <cstdint>
#include <utility>

namespace fwcore
{

/**
 * @brief IRQ line identifier
 *
 * Valid lines are [0, config::IRQ_COUNT). Implicitly constructible from a
 * raw number or an InterruptRequest so either can be passed to the table.
 * A raw number outside that range panics instead of wrapping to 8 bits.
 */
struct IrqNumber
{
   std::uint8_t value{0};

   constexpr IrqNumber() = default;

   template<std::integral I>
   constexpr IrqNumber(I v)
   {
      if (std::cmp_less(v, 0) || std::cmp_greater_equal(v, config::IRQ_COUNT)) {
         panic("IRQ %lld out of range (IRQ_COUNT=%zu)", static_cast<long long>(v), config::IRQ_COUNT);
      }
      value = static_cast<std::uint8_t>(v);
   }

   constexpr IrqNumber(InterruptRequest request) : value(std::to_underlying(request)) {}

   constexpr bool operator==(IrqNumber const&) const = default;
};

/**
 * @brief Interrupt priority; lower value means more urgent
 */
enum class Priority : std::uint8_t
{
   P0, P1, P2,  P3,  P4,  P5,  P6,  P7,
   P8, P9, P10, P11, P12, P13, P14, P15,
};

/**
 * @brief Abstract interrupt controller
 *
 * All operations are O(1) and cannot fail. Implementations are owned by
 * value by the InterruptTable, so they must be movable.
 */
class IInterruptController
{
public:
   IInterruptController() = default;
   virtual ~IInterruptController() = default;

   IInterruptController(IInterruptController const&)            = delete;
   IInterruptController& operator=(IInterruptController const&) = delete;
   IInterruptController(IInterruptController&&)                 = default;
   IInterruptController& operator=(IInterruptController&&)      = default;

   /**
    * @brief Software-assert the line
    *
    * The ISR runs as soon as the line is enabled and its priority allows.
    */
   virtual void trigger(IrqNumber irq) = 0;

   [[nodiscard]] virtual bool is_pending(IrqNumber irq) const = 0;
   virtual void pend(IrqNumber irq)   = 0;
   virtual void unpend(IrqNumber irq) = 0;

   [[nodiscard]] virtual Priority get_priority(IrqNumber irq) const = 0;
   virtual void set_priority(IrqNumber irq, Priority priority) = 0;

   virtual void enable(IrqNumber irq)  = 0;
   virtual void disable(IrqNumber irq) = 0;
};

/**
 * @brief Recoverable interrupt table errors
 */
struct InterruptError
{
   enum class Kind : std::uint8_t
   {
      AlreadyInUse,    // Line already has an ISR installed
      AlreadyInScope,  // Another interrupt scope is live
   };

   Kind      kind;
   IrqNumber irq{};  // Line concerned, for AlreadyInUse

   constexpr bool operator==(InterruptError const&) const = default;
};

constexpr const char* to_string(InterruptError::Kind kind)
{
   switch (kind) {
      case InterruptError::Kind::AlreadyInUse:   return "interrupt already in use";
      case InterruptError::Kind::AlreadyInScope: return "interrupt scope already active";
   }
   return "unknown interrupt error";
}

}  // namespace fwcore

#endif // FWCORE_INTERRUPT_CONTROLLER_HPP
