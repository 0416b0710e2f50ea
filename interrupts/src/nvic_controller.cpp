/**
 * @file nvic_controller.cpp
 * @brief NVIC controller
 */

#include "fwcore/nvic_controller.hpp"
#include "fwcore/config.hpp"
#include "fwcore/port.h"

#include <utility>

namespace fwcore
{

namespace
{
   constexpr std::uint32_t PRIORITY_SHIFT = 8 - config::PRIORITY_BITS;

   static_assert(config::PRIORITY_LEVELS >= 16, "Priority P0..P15 needs 4 implemented priority bits");
}

void NvicController::trigger(IrqNumber irq)
{
   fwcore_port_nvic_trigger(irq.value);
}

bool NvicController::is_pending(IrqNumber irq) const
{
   return fwcore_port_nvic_is_pending(irq.value);
}

void NvicController::pend(IrqNumber irq)
{
   fwcore_port_nvic_pend(irq.value);
}

void NvicController::unpend(IrqNumber irq)
{
   fwcore_port_nvic_unpend(irq.value);
}

Priority NvicController::get_priority(IrqNumber irq) const
{
   return decode(fwcore_port_nvic_get_priority(irq.value));
}

void NvicController::set_priority(IrqNumber irq, Priority priority)
{
   fwcore_port_nvic_set_priority(irq.value, encode(priority));
}

void NvicController::enable(IrqNumber irq)
{
   fwcore_port_nvic_enable(irq.value);
}

void NvicController::disable(IrqNumber irq)
{
   fwcore_port_nvic_disable(irq.value);
}

bool NvicController::is_enabled(IrqNumber irq) const
{
   return fwcore_port_nvic_is_enabled(irq.value);
}

std::uint8_t NvicController::encode(Priority priority)
{
   return static_cast<std::uint8_t>(std::to_underlying(priority) << PRIORITY_SHIFT);
}

Priority NvicController::decode(std::uint8_t raw)
{
   return static_cast<Priority>((raw >> PRIORITY_SHIFT) & 0x0F);
}

}  // namespace fwcore
