/**
 * @file panic.cpp
 * @brief Fatal error path
 */

#include "fwcore/panic.hpp"
#include "fwcore/config.hpp"
#include "fwcore/port.h"

#include <array>
#include <cstdarg>
#include <cstdio>

namespace fwcore
{

namespace
{
   // Static so a panic from a small ISR stack does not overflow it
   constinit std::array<char, config::PANIC_MESSAGE_SIZE> message{};
}

void panic(const char* fmt, ...)
{
   fwcore_port_disable_interrupts();

   int const prefix = std::snprintf(message.data(), message.size(), "PANIC: ");
   std::size_t offset = prefix > 0 ? static_cast<std::size_t>(prefix) : 0;

   va_list args;
   va_start(args, fmt);
   int const written = std::vsnprintf(message.data() + offset, message.size() - offset, fmt, args);
   va_end(args);

   if (written > 0) offset += static_cast<std::size_t>(written);
   if (offset > message.size() - 2) offset = message.size() - 2;
   message[offset]     = '\n';
   message[offset + 1] = '\0';

   fwcore_port_diagnostic_write(message.data());
   fwcore_port_halt();
}

}  // namespace fwcore
