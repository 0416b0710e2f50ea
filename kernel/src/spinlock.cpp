/**
 * @file spinlock.cpp
 * @brief Spinlock slow path
 */

#include "fwcore/spinlock.hpp"
#include "fwcore/port.h"

namespace fwcore
{

void Spinlock::lock()
{
   while (!try_lock()) {
      // Only the foreground or one ISR can hold it; wait for the release
      while (is_locked()) fwcore_port_cpu_relax();
   }
}

void Spinlock::unlock()
{
   flag.clear(std::memory_order_release);
}

}  // namespace fwcore
