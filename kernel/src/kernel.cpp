/**
 * @file kernel.cpp
 * @brief Process-wide kernel registry
 */

#define DEBUG_PRINT_ENABLE 0

#include "kestrel/kernel.hpp"
#include "kestrel/cpu.hpp"
#include "kestrel/debug_print.hpp"
#include "kestrel/scheduler_hook.hpp"
#include "kestrel/signal.hpp"
#include "kestrel/task.hpp"

#include <cassert>

namespace kestrel
{

struct Kernel
{
   std::atomic<bool> initialised{false};
   ISchedulerHook* scheduler{nullptr};
   ITimeDriver*    time{nullptr};
   CpuTable        cpus;
   SignalAdapter   signals;

   std::atomic<TaskId> task_id_generator{1};
};
static Kernel k;

namespace kernel
{
   void initialise(std::uint32_t cpu_count, ISchedulerHook& scheduler, ITimeDriver& time)
   {
      assert(cpu_count >= 1 && cpu_count <= config::MAX_CPUS);

      kestrel_port_init();
      k.cpus.initialise(cpu_count);
      k.scheduler = &scheduler;
      k.time      = &time;
      k.signals.reset_counters();
      ITimeDriver::set_instance(&time);
      k.initialised.store(true, std::memory_order_release);

      LOG_SCHED("kernel initialised with %u cpus", cpu_count);
   }

   bool initialised() noexcept
   {
      return k.initialised.load(std::memory_order_acquire);
   }

   ISchedulerHook& scheduler() noexcept
   {
      assert(k.scheduler && "kernel::initialise() must be called first");
      return *k.scheduler;
   }

   ITimeDriver& time() noexcept
   {
      assert(k.time && "kernel::initialise() must be called first");
      return *k.time;
   }

   CpuTable& cpus() noexcept
   {
      return k.cpus;
   }

   SignalAdapter& signals() noexcept
   {
      return k.signals;
   }

   TimePoint now() noexcept
   {
      return time().now();
   }

   Task* current_task() noexcept
   {
      if (!k.scheduler) return nullptr;
      return k.scheduler->current();
   }

   void report_misuse(Task* task, Status status, char const* operation, void const* object)
   {
      LOG_FAULT("%s: %s by task %u on cpu%u (object %p)",
                to_string(status).data(),
                operation,
                task ? task->id() : KERNEL_TASK_ID,
                task ? task->cpu() : kestrel_port_get_core_id(),
                object);

      // Fatal to the offending task only
      if (task && k.scheduler) {
         k.scheduler->terminate(*task);
      }
   }

   TaskId next_task_id() noexcept
   {
      return k.task_id_generator.fetch_add(1, std::memory_order_relaxed);
   }
}  // namespace kernel

}  // namespace kestrel
