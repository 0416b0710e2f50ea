/**
 * @file config.hpp
 * @brief fwcore compile-time configuration
 */

#ifndef FWCORE_CONFIG_HPP
#define FWCORE_CONFIG_HPP

#include "fwcore/port_traits.h"

#include <cstddef>
#include <cstdint>

namespace fwcore::config
{
   /**
    * @brief Number of ISR dispatch slots
    *
    * IRQ numbers are valid in [0, IRQ_COUNT).
    */
   static constexpr std::size_t IRQ_COUNT = 98;
   static_assert(0 < IRQ_COUNT && IRQ_COUNT <= FWCORE_PORT_IRQ_COUNT, "Port does not implement that many IRQ lines.");
   static_assert(IRQ_COUNT <= 256, "IRQ numbers are 8 bit.");

   /**
    * @brief Priority levels implemented by the interrupt controller
    */
   static constexpr std::uint32_t PRIORITY_BITS   = FWCORE_PORT_PRIORITY_BITS;
   static constexpr std::uint32_t PRIORITY_LEVELS = 1u << PRIORITY_BITS;

   /**
    * @brief Inline storage of an installed ISR closure
    *
    * Larger closures are moved to the heap at registration time. Dispatch
    * never allocates.
    */
   static constexpr std::size_t ISR_INLINE_SIZE = 48;

   static constexpr std::size_t DEFAULT_HANDLER_INLINE_SIZE = 32;

   static constexpr std::size_t PANIC_MESSAGE_SIZE = 256;
}  // namespace fwcore::config

#endif // FWCORE_CONFIG_HPP
