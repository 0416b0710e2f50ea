/**
 * @file nvic_controller.hpp
 * @brief Cortex-M NVIC implementation of IInterruptController
 */

#ifndef FWCORE_NVIC_CONTROLLER_HPP
#define FWCORE_NVIC_CONTROLLER_HPP

#include "fwcore/interrupt_controller.hpp"

#include <cstdint>

namespace fwcore
{

/**
 * @brief Forwards every operation to the port's NVIC
 *
 * Priorities occupy the upper config::PRIORITY_BITS bits of the 8-bit
 * priority register; P0 is the most urgent.
 */
class NvicController final : public IInterruptController
{
public:
   NvicController() = default;

   void trigger(IrqNumber irq) override;

   [[nodiscard]] bool is_pending(IrqNumber irq) const override;
   void pend(IrqNumber irq) override;
   void unpend(IrqNumber irq) override;

   [[nodiscard]] Priority get_priority(IrqNumber irq) const override;
   void set_priority(IrqNumber irq, Priority priority) override;

   void enable(IrqNumber irq) override;
   void disable(IrqNumber irq) override;

   [[nodiscard]] bool is_enabled(IrqNumber irq) const;

   static std::uint8_t encode(Priority priority);
   static Priority     decode(std::uint8_t raw);
};

}  // namespace fwcore

#endif // FWCORE_NVIC_CONTROLLER_HPP
