/**
 * @file port.h
 * @brief Kestrel Port Layer API (C ABI)
 *
 * This is the hardware abstraction layer between the Kestrel kernel core and
 * platform-specific code. All functions use C linkage so a port can be
 * written in assembly or C.
 *
 * Port implementations must provide all functions declared here.
 */

#ifndef KESTREL_PORT_H
#define KESTREL_PORT_H

#include "kestrel/port_traits.h"

#include <stddef.h>
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

#ifndef KESTREL_PORT_SIMULATION
# define KESTREL_PORT_SIMULATION 0
#endif

/**
 * @brief Opaque context structure (platform-specific size/alignment)
 *
 * Each port defines the actual structure. The kernel only reserves
 * KESTREL_PORT_CONTEXT_SIZE bytes for it.
 */
typedef struct kestrel_port_context kestrel_port_context_t;

/**
 * @brief Task entry point signature
 */
typedef void (*kestrel_port_entry_t)(void* arg);

/**
 * @brief ISR signature
 */
typedef void (*kestrel_port_isr_handler_t)(void* arg);

/* ============================================================================
 * CPU Identification
 * ========================================================================= */

/**
 * @brief Linear index of the CPU executing the caller (0-indexed)
 */
uint32_t kestrel_port_get_core_id(void);

/**
 * @brief Bind the calling execution stream to a linear CPU index
 *
 * Real targets read the id from hardware and ignore this. The simulation
 * port stores it per host thread, so one host thread can pump several
 * simulated CPUs in turn.
 */
void kestrel_port_set_core_id(uint32_t core_id);

/* ============================================================================
 * Context Switching
 * ========================================================================= */

/**
 * @brief Initialise a task context
 * @param context Pointer to context storage (pre-allocated by the kernel)
 * @param stack_base Base (lowest address) of the stack
 * @param stack_size Size of the stack in bytes
 * @param entry Task entry point
 * @param arg Argument passed to entry
 *
 * The first kestrel_port_switch() to this context starts entry(arg).
 */
void kestrel_port_context_init(kestrel_port_context_t* context,
                               void* stack_base,
                               size_t stack_size,
                               kestrel_port_entry_t entry,
                               void* arg);

/**
 * @brief Destroy a task context
 *
 * A context that never finished is unwound first, so objects living on its
 * stack are destroyed.
 */
void kestrel_port_context_destroy(kestrel_port_context_t* context);

/**
 * @brief True once the entry function of the context has returned
 */
bool kestrel_port_context_finished(kestrel_port_context_t const* context);

/**
 * @brief Switch from the dispatcher to a task context
 * @param from Context to save (may be NULL, the dispatcher is implicit)
 * @param to Context to resume
 *
 * Returns when the task yields, exits or finishes.
 */
void kestrel_port_switch(kestrel_port_context_t* from, kestrel_port_context_t* to);

/**
 * @brief Start executing the first task on this CPU
 */
void kestrel_port_start_first(kestrel_port_context_t* first);

/**
 * @brief Give the CPU back to the dispatcher
 *
 * No-op outside a task context.
 */
void kestrel_port_yield(void);

/**
 * @brief Terminate the calling task. Never returns.
 */
void kestrel_port_thread_exit(void) __attribute__((noreturn));

/* ============================================================================
 * Critical Sections (Interrupt Control)
 * ========================================================================= */

/**
 * @brief Mask interrupts, returning the previous mask state for irq_restore()
 */
uint32_t kestrel_port_irq_save(void);

void kestrel_port_irq_restore(uint32_t state);

/**
 * @brief Busy-wait hint (pause/yield instruction)
 */
void kestrel_port_cpu_relax(void);

/* ============================================================================
 * Platform Initialisation / Idle
 * ========================================================================= */

/**
 * @brief Initialise the port layer
 *
 * Called by kernel::initialise() before any task is created.
 */
void kestrel_port_init(void);

/**
 * @brief Called by a CPU that has nothing to run
 */
void kestrel_port_idle(void);

/* ============================================================================
 * Time Port
 * ========================================================================= */

/**
 * @brief Monotonic 64-bit time in port ticks
 */
uint64_t kestrel_port_time_now(void);

/**
 * @brief Arm a one-shot interrupt for an absolute deadline
 *
 * The earliest armed deadline wins until disarm().
 */
void kestrel_port_time_arm(uint64_t deadline);

void kestrel_port_time_disarm(void);

void kestrel_port_time_irq_enable(void);
void kestrel_port_time_irq_disable(void);

void kestrel_port_time_register_isr_handler(kestrel_port_isr_handler_t handler, void* arg);

#if KESTREL_PORT_SIMULATION
/**
 * @brief Simulation only: move port time forward (never backwards)
 */
void kestrel_port_time_advance_to(uint64_t time);

/**
 * @brief Simulation only: reset port time and disarm the one-shot
 */
void kestrel_port_time_reset(uint64_t time);
#endif

#ifdef __cplusplus
}
#endif

#endif /* KESTREL_PORT_H */
