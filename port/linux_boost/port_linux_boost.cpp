/**
 * @file port_linux_boost.cpp
 * @brief Linux simulation port using Boost.Context
 *
 * Tasks run on Boost.Context fibers bound to caller-provided stacks, which
 * mimics embedded stack switching while running on Linux for development
 * and testing.
 *
 * SMP: a simulated CPU is whatever host thread last called
 * kestrel_port_set_core_id(). The simulated scheduler either gives each CPU
 * its own host thread or pumps all CPUs round-robin on one.
 */

#include "kestrel/port.h"

#include <boost/context/fiber.hpp>
#include <boost/context/preallocated.hpp>
#include <boost/context/stack_context.hpp>

#include <atomic>
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <new>
#include <time.h>

/* ============================================================================
 * Port Context Structure
 * ========================================================================= */

struct kestrel_port_context
{
   boost::context::fiber thread;  // Task fiber (held by the dispatcher while the task is switched out)
   boost::context::fiber sched;   // Dispatcher continuation (held by the task while it runs)
   void*                 stack_top;
   size_t                stack_size;
   kestrel_port_entry_t  entry;
   void*                 arg;
   bool                  finished;
};

static_assert(sizeof(kestrel_port_context) == KESTREL_PORT_CONTEXT_SIZE,
              "KESTREL_PORT_CONTEXT_SIZE mismatch - adjust in port_traits.h");
static_assert(alignof(kestrel_port_context) == KESTREL_PORT_CONTEXT_ALIGN,
              "KESTREL_PORT_CONTEXT_ALIGN mismatch - adjust in port_traits.h");
static_assert((KESTREL_STACK_ALIGN & (KESTREL_STACK_ALIGN - 1)) == 0,
              "KESTREL_STACK_ALIGN must be a power of two");

/* ============================================================================
 * Thread-Local State
 * ========================================================================= */

// Context currently executing on this host thread (used by kestrel_port_yield)
static thread_local kestrel_port_context* tls_current_context = nullptr;

static thread_local uint32_t tls_core_id = 0;

/* ============================================================================
 * CPU Identification
 * ========================================================================= */

extern "C" uint32_t kestrel_port_get_core_id(void)
{
   return tls_core_id;
}

extern "C" void kestrel_port_set_core_id(uint32_t core_id)
{
   assert(core_id < KESTREL_PORT_CORE_COUNT);
   tls_core_id = core_id;
}

/* ============================================================================
 * Context Switching
 * ========================================================================= */

// The stack belongs to the caller, nothing to allocate or release
struct preallocated_stack_noop
{
   using traits_type = boost::context::stack_traits;
   boost::context::stack_context allocate(size_t) { std::abort(); }
   void deallocate(boost::context::stack_context&) noexcept {}
};

extern "C" void kestrel_port_context_init(kestrel_port_context_t* context,
                                          void* stack_base,
                                          size_t stack_size,
                                          kestrel_port_entry_t entry,
                                          void* arg)
{
   ::new (context) kestrel_port_context
   {
      .thread     = {},
      .sched      = {},
      .stack_top  = static_cast<uint8_t*>(stack_base) + stack_size,
      .stack_size = stack_size,
      .entry      = entry,
      .arg        = arg,
      .finished   = false,
   };

   boost::context::stack_context boost_stack_context =
   {
      .size = context->stack_size,
      .sp   = context->stack_top,
   };

   boost::context::preallocated boost_prealloc(
      boost_stack_context.sp,
      boost_stack_context.size,
      boost_stack_context
   );

   context->thread = boost::context::fiber(
      std::allocator_arg,
      boost_prealloc,
      preallocated_stack_noop{},
      [context](boost::context::fiber&& sched_in) mutable -> boost::context::fiber
      {
         // Keep the dispatcher continuation so kestrel_port_yield() can jump back
         context->sched = std::move(sched_in);

         try {
            tls_current_context = context;
            context->entry(context->arg);
            tls_current_context = nullptr;
         } catch (boost::context::detail::forced_unwind const&) {
            // Context destroyed while suspended
            tls_current_context = nullptr;
            throw;
         }

         context->finished = true;
         return std::move(context->sched);
      }
   );
}

extern "C" void kestrel_port_context_destroy(kestrel_port_context_t* context)
{
   // Dropping a suspended fiber unwinds its stack via forced_unwind
   context->thread = boost::context::fiber{};
   context->sched  = boost::context::fiber{};
   context->~kestrel_port_context();
}

extern "C" bool kestrel_port_context_finished(kestrel_port_context_t const* context)
{
   return context->finished;
}

extern "C" void kestrel_port_switch(kestrel_port_context_t* /*from*/, kestrel_port_context_t* to)
{
   assert(to->thread && "No context to switch to");

   auto* previous = tls_current_context;
   tls_current_context = to;
   to->thread = std::move(to->thread).resume();
   tls_current_context = previous;
}

extern "C" void kestrel_port_start_first(kestrel_port_context_t* first)
{
   kestrel_port_switch(nullptr, first);
}

extern "C" void kestrel_port_yield(void)
{
   if (!tls_current_context) return;

   auto* current = tls_current_context;
   tls_current_context = nullptr;

   assert(current->sched && "No dispatcher context to switch to");
   current->sched = std::move(current->sched).resume();
   tls_current_context = current;
}

extern "C" void kestrel_port_thread_exit(void)
{
   // The dispatcher destroys the context, which unwinds this stack
   while (true) {
      kestrel_port_yield();
   }
}

/* ============================================================================
 * Critical Sections (Simulated)
 * ========================================================================= */

static thread_local uint32_t interrupt_disable_depth = 0;

extern "C" uint32_t kestrel_port_irq_save(void)
{
   uint32_t const previous_depth = interrupt_disable_depth;
   interrupt_disable_depth++;
   return previous_depth;
}

extern "C" void kestrel_port_irq_restore(uint32_t state)
{
   interrupt_disable_depth = state;
}

extern "C" void kestrel_port_cpu_relax(void)
{
#if defined(__x86_64__) || defined(__i386__)
   __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
   __asm__ __volatile__("yield");
#endif
}

/* ============================================================================
 * Platform Initialisation / Idle
 * ========================================================================= */

extern "C" void kestrel_port_init(void)
{
   interrupt_disable_depth = 0;
}

extern "C" void kestrel_port_idle(void)
{
   struct timespec req = {.tv_sec = 0, .tv_nsec = 100'000};
   nanosleep(&req, nullptr);
}

/* ============================================================================
 * Time Port (Linux Boost)
 *
 * Port time is a virtual counter that only moves on
 * kestrel_port_time_advance_to(), which also delivers the timer interrupt
 * once the armed one-shot is due. The virtual SimulationTimeDriver owns it;
 * the real-time driver reads the host clock instead.
 * ========================================================================= */

static std::atomic<uint64_t> g_port_now{0};

static std::atomic<bool> g_time_irq_enabled{false};
static std::atomic<uint64_t> g_armed_deadline{UINT64_MAX};
static std::atomic<kestrel_port_isr_handler_t> g_isr{nullptr};
static std::atomic<void*> g_isr_arg{nullptr};

extern "C" uint64_t kestrel_port_time_now(void)
{
   return g_port_now.load(std::memory_order_acquire);
}

extern "C" void kestrel_port_time_reset(uint64_t t)
{
   g_port_now.store(t, std::memory_order_release);
   g_armed_deadline.store(UINT64_MAX, std::memory_order_release);
}

extern "C" void kestrel_port_time_register_isr_handler(kestrel_port_isr_handler_t h, void* arg)
{
   g_isr_arg.store(arg, std::memory_order_relaxed);
   g_isr.store(h, std::memory_order_release);
}

extern "C" void kestrel_port_time_irq_enable(void)  { g_time_irq_enabled.store(true,  std::memory_order_release); }
extern "C" void kestrel_port_time_irq_disable(void) { g_time_irq_enabled.store(false, std::memory_order_release); }

extern "C" void kestrel_port_time_arm(uint64_t deadline)
{
   // Keep earliest
   uint64_t cur = g_armed_deadline.load(std::memory_order_relaxed);
   while (deadline < cur &&
          !g_armed_deadline.compare_exchange_weak(cur, deadline,
                                                  std::memory_order_release,
                                                  std::memory_order_relaxed))
   {}
}

extern "C" void kestrel_port_time_disarm(void)
{
   g_armed_deadline.store(UINT64_MAX, std::memory_order_release);
}

// Simulated timer interrupt: fires once the armed one-shot is due
static void deliver_due_timer_irq()
{
   if (!g_time_irq_enabled.load(std::memory_order_acquire)) return;

   uint64_t const now = g_port_now.load(std::memory_order_acquire);
   uint64_t armed = g_armed_deadline.load(std::memory_order_acquire);
   if (armed > now) return;
   if (!g_armed_deadline.compare_exchange_strong(armed, UINT64_MAX, std::memory_order_acq_rel)) return;

   auto* handler = g_isr.load(std::memory_order_acquire);
   if (handler) handler(g_isr_arg.load(std::memory_order_relaxed));
}

extern "C" void kestrel_port_time_advance_to(uint64_t t)
{
   uint64_t cur = g_port_now.load(std::memory_order_relaxed);
   while (t > cur &&
          !g_port_now.compare_exchange_weak(cur, t,
                                            std::memory_order_release,
                                            std::memory_order_relaxed))
   {}

   deliver_due_timer_irq();
}
