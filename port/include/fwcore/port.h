/**
 * @file port.h
 * @brief fwcore Port Layer API (C ABI)
 *
 * This is the hardware abstraction layer between the fwcore interrupt and
 * task runtime and the platform. All functions use C linkage so a port can
 * be written in assembly or C.
 *
 * Port implementations must provide all functions declared here.
 */

#ifndef FWCORE_PORT_H
#define FWCORE_PORT_H

#include "fwcore/port_traits.h"

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Port Configuration
 * ========================================================================= */
#ifndef FWCORE_PORT_SIMULATION
# define FWCORE_PORT_SIMULATION 0
#endif

/**
 * @brief Default exception handler signature
 *
 * Receives the architectural exception number of the IRQ being serviced
 * (IRQ number + FWCORE_PORT_IRQ_EXCEPTION_BASE).
 */
typedef void (*fwcore_port_exception_handler_t)(uint32_t exception_number);

/* ============================================================================
 * Critical Sections (Interrupt Masking)
 * ========================================================================= */

/**
 * @brief Mask interrupts and return the previous mask state
 * @return 1 if interrupts were enabled before the call, 0 otherwise
 */
uint32_t fwcore_port_irq_save(void);

/**
 * @brief Restore a mask state returned by fwcore_port_irq_save()
 *
 * Pending interrupts are taken as soon as interrupts become unmasked.
 */
void fwcore_port_irq_restore(uint32_t state);

void fwcore_port_disable_interrupts(void);
void fwcore_port_enable_interrupts(void);

/**
 * @brief Check if interrupts are currently unmasked
 */
bool fwcore_port_interrupts_enabled(void);

/**
 * @brief Check if the caller executes in exception (ISR) context
 */
bool fwcore_port_in_isr(void);

void fwcore_port_cpu_relax(void);

/* ============================================================================
 * Nested Vectored Interrupt Controller
 * ========================================================================= */

void fwcore_port_nvic_enable(uint32_t irq);
void fwcore_port_nvic_disable(uint32_t irq);
bool fwcore_port_nvic_is_enabled(uint32_t irq);

void fwcore_port_nvic_pend(uint32_t irq);
void fwcore_port_nvic_unpend(uint32_t irq);
bool fwcore_port_nvic_is_pending(uint32_t irq);

/**
 * @brief Write/read the raw 8-bit priority register of a line
 *
 * Only the upper FWCORE_PORT_PRIORITY_BITS bits are implemented; the others
 * read as zero.
 */
void    fwcore_port_nvic_set_priority(uint32_t irq, uint8_t priority);
uint8_t fwcore_port_nvic_get_priority(uint32_t irq);

/**
 * @brief Software trigger (STIR register write)
 *
 * Pends the line. If the line is enabled and interrupts are unmasked the
 * exception is taken before this function returns.
 */
void fwcore_port_nvic_trigger(uint32_t irq);

/**
 * @brief Disable, unpend and zero the priority of every line
 *
 * Simulation only; on hardware this is a system reset.
 */
void fwcore_port_nvic_reset(void);

/* ============================================================================
 * Exception Entry
 * ========================================================================= */

/**
 * @brief Install the handler the default exception vector jumps to
 *
 * If no handler is installed when an IRQ is delivered, the port writes a
 * diagnostic and halts.
 */
void fwcore_port_register_exception_handler(fwcore_port_exception_handler_t handler);

/**
 * @brief Deliver any pending, enabled interrupts
 *
 * On hardware this is implicit. The simulation calls it at every point an
 * interrupt could be taken, and the foreground can call it explicitly.
 */
void fwcore_port_service_interrupts(void);

/**
 * @brief Platform-specific idle behaviour (WFI)
 */
void fwcore_port_idle(void);

/* ============================================================================
 * Time and Basic Timer Peripheral
 * ========================================================================= */

/**
 * @brief Monotonic time in microseconds
 */
uint64_t fwcore_port_time_now(void);

/**
 * @brief Reset time, stop the timer and clear its update flag
 *
 * Intended for simulation and unit testing.
 */
void fwcore_port_time_reset(uint64_t time);

/**
 * @brief Advance simulated time (simulation only)
 *
 * Every timer period boundary crossed raises an update event: the update
 * flag is set and the timer's IRQ line is pended, in time order.
 */
void fwcore_port_time_advance(uint64_t delta_us);

/**
 * @brief Configure the basic timer to raise an update event at hz
 * @param irq IRQ line the update event is routed to
 * @param hz Update frequency, must be > 0
 */
void fwcore_port_timer_setup(uint32_t irq, uint32_t hz);
void fwcore_port_timer_stop(void);

bool fwcore_port_timer_update_flag(void);
void fwcore_port_timer_clear_update_flag(void);

/* ============================================================================
 * Debug / Diagnostics
 * ========================================================================= */

/**
 * @brief Write text to the diagnostic sink
 *
 * Must be usable with interrupts masked.
 */
void fwcore_port_diagnostic_write(const char* text);

/**
 * @brief Stop the system
 */
void fwcore_port_halt(void) __attribute__((noreturn));

void fwcore_port_breakpoint(void);

#ifdef __cplusplus
}
#endif

#endif /* FWCORE_PORT_H */
