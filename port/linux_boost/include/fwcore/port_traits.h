/**
 * @file port_traits.h
 * @brief Port-specific compile-time constants
 *
 * Each port must provide this header defining:
 * - FWCORE_PORT_IRQ_COUNT: Number of IRQ lines implemented by the interrupt controller
 * - FWCORE_PORT_PRIORITY_BITS: Implemented priority bits (upper bits of the 8-bit register)
 * - FWCORE_PORT_IRQ_EXCEPTION_BASE: Exception number of IRQ 0
 * - FWCORE_PORT_ISR_STACK_SIZE: Size of the stack exceptions execute on
 * - FWCORE_STACK_ALIGN: Stack alignment requirement
 */

#ifndef FWCORE_PORT_TRAITS_H
#define FWCORE_PORT_TRAITS_H

/* ============================================================================
 * Boost.Context Port (Linux Simulation of an STM32F7 / Cortex-M7)
 * ========================================================================= */

/**
 * @brief Number of external interrupt lines (NVIC inputs)
 *
 * The STM32F74x/75x implements 98 of them.
 */
#define FWCORE_PORT_IRQ_COUNT 98

/**
 * @brief Implemented priority bits
 *
 * Cortex-M7 on STM32F7 implements 4 bits, giving 16 priority levels.
 */
#define FWCORE_PORT_PRIORITY_BITS 4

/**
 * @brief Exception number of IRQ 0
 *
 * The first 16 exception numbers are reserved for the system exceptions
 * (Reset, NMI, HardFault, ..., SysTick).
 */
#define FWCORE_PORT_IRQ_EXCEPTION_BASE 16

/**
 * @brief Stack the simulated exception entry runs on (main stack on real hardware)
 */
#define FWCORE_PORT_ISR_STACK_SIZE (64 * 1024)

/**
 * @brief Stack alignment requirement in bytes
 *
 * Must be a power of two.
 */
#define FWCORE_STACK_ALIGN 16

#define FWCORE_PORT_SIMULATION 1

#endif // FWCORE_PORT_TRAITS_H
