/**
 * @file primask_mutex.hpp
 * @brief Interrupt-masking critical sections
 *
 * Data shared between an ISR and foreground code is accessed with
 * interrupts masked (PRIMASK on Cortex-M). The previous mask state is
 * restored on exit, so critical sections nest.
 */

#ifndef FWCORE_PRIMASK_MUTEX_HPP
#define FWCORE_PRIMASK_MUTEX_HPP

#include "fwcore/port.h"

#include <cstdint>
#include <functional>
#include <utility>

namespace fwcore
{

/**
 * @brief RAII interrupt mask
 */
class CriticalSection
{
public:
   CriticalSection() : state(fwcore_port_irq_save()) {}
   ~CriticalSection() { fwcore_port_irq_restore(state); }

   CriticalSection(CriticalSection const&)            = delete;
   CriticalSection& operator=(CriticalSection const&) = delete;

private:
   std::uint32_t state;
};

/**
 * @brief Data only reachable with interrupts masked
 *
 * Example:
 *   PrimaskMutex<std::uint32_t> ticks{0};
 *   // ISR
 *   ticks.lock([](std::uint32_t& t) { ++t; });
 *   // Foreground
 *   auto now = ticks.lock([](std::uint32_t& t) { return t; });
 */
template<typename T>
class PrimaskMutex
{
public:
   explicit PrimaskMutex(T data) : data(std::move(data)) {}

   PrimaskMutex(PrimaskMutex const&)            = delete;
   PrimaskMutex& operator=(PrimaskMutex const&) = delete;

   /**
    * @brief Run `critical_section(data)` with interrupts masked
    *
    * Interrupts are unmasked afterwards only if they were unmasked before.
    */
   template<typename F>
   auto lock(F&& critical_section)
   {
      CriticalSection cs;
      return std::invoke(std::forward<F>(critical_section), data);
   }

private:
   T data;
};

}  // namespace fwcore

#endif // FWCORE_PRIMASK_MUTEX_HPP
