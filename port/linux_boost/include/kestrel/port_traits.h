/**
 * @file port_traits.h
 * @brief Port-specific compile-time constants
 *
 * Each port provides this header defining:
 * - KESTREL_PORT_CONTEXT_SIZE: Size of kestrel_port_context_t in bytes
 * - KESTREL_PORT_CONTEXT_ALIGN: Alignment requirement for kestrel_port_context_t
 * - KESTREL_STACK_ALIGN: Stack alignment requirement
 * - KESTREL_PORT_CACHE_LINE: Destructive interference size
 * - KESTREL_PORT_CORE_COUNT: Most CPUs the port can drive
 *
 * The port implementation static_asserts that the real sizes match.
 */

#ifndef KESTREL_PORT_TRAITS_H
#define KESTREL_PORT_TRAITS_H

/* ============================================================================
 * Boost.Context Port (Linux Simulation)
 * ========================================================================= */

/**
 * @brief Size of kestrel_port_context_t in bytes
 *
 * Two fibers, stack bounds, entry, argument and completion flag.
 */
#define KESTREL_PORT_CONTEXT_SIZE  56

#define KESTREL_PORT_CONTEXT_ALIGN 8

/**
 * @brief Stack alignment in bytes (power of two)
 */
#define KESTREL_STACK_ALIGN 16

#define KESTREL_PORT_CACHE_LINE 64

/**
 * @brief Simulated CPUs are host threads or round-robin slots
 */
#define KESTREL_PORT_CORE_COUNT 8

#define KESTREL_PORT_SIMULATION 1

#endif // KESTREL_PORT_TRAITS_H
