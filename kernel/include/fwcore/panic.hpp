/**
 * @file panic.hpp
 * @brief Fatal error path
 */

#ifndef FWCORE_PANIC_HPP
#define FWCORE_PANIC_HPP

namespace fwcore
{

/**
 * @brief Stop the system with a diagnostic message
 *
 * Masks interrupts, formats the message (printf style) into a fixed buffer,
 * writes "PANIC: <message>" to the port diagnostic sink and halts. Safe to
 * call from ISR context; never allocates.
 */
[[noreturn]] void panic(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace fwcore

#endif // FWCORE_PANIC_HPP
