/**
 * @file simulation.cpp
 * @brief Embedded-style threads and run loops for the simulated scheduler
 */

#define DEBUG_PRINT_ENABLE 0

#include "kestrel/simulation.hpp"
#include "kestrel/debug_print.hpp"

#include <cassert>
#include <cstdint>
#include <new>
#include <utility>

namespace kestrel::sim
{

static constexpr std::size_t align_down(std::size_t size, std::size_t align) { return size & ~(align - 1); }

// Carves a user-provided buffer region into:
// +----------------------+ <-- buffer's end (high address)
// +         Task         + (Fixed size)
// +----------------------+
// +     Task's stack     +
// +----------------------+ <-- buffer's base (low address)
struct StackLayout
{
   void* task_storage;
   std::span<std::byte> user_stack;

   explicit StackLayout(std::span<std::byte> const buffer)
   {
      auto const base = reinterpret_cast<std::uintptr_t>(buffer.data());
      auto const end  = base + buffer.size();

      auto const task_start = align_down(end - sizeof(Task), alignof(Task));
      assert(task_start >= base && "Buffer too small for the Task");
      task_storage = reinterpret_cast<void*>(task_start);

      // Stack top must satisfy the port's alignment
      auto const stack_top = align_down(task_start, KESTREL_STACK_ALIGN);
      auto const stack_len = static_cast<std::size_t>(stack_top - base);
      assert(stack_len > 1024 && "Buffer too small after carving the Task");

      user_stack = buffer.subspan(0, stack_len);
   }
};

Thread::Thread(SimScheduler& scheduler,
               Task::EntryFn&& entry,
               std::span<std::byte> buffer,
               Task::Priority priority,
               CoreAffinity affinity,
               Mailbox::Options mailbox_options)
   : scheduler(scheduler)
{
   StackLayout layout(buffer);
   tcb = ::new (layout.task_storage) Task(std::move(entry), layout.user_stack, priority, mailbox_options);

   spawn_status = scheduler.spawn(*tcb, affinity);
   if (spawn_status != Status::Ok) {
      LOG_FAULT("thread %u not spawned: %s", tcb->id(), to_string(spawn_status).data());
   }
}

Thread::~Thread()
{
   scheduler.retire(*tcb);
   tcb->~Task();
}

std::size_t run_until_idle(SimScheduler& scheduler,
                           SimulationTimeDriver<TimeMode::Virtual>& driver,
                           std::size_t max_rounds)
{
   for (std::size_t round = 0; round < max_rounds; ++round) {
      if (scheduler.live_tasks() == 0) break;
      if (scheduler.step()) continue;

      // Nothing runnable: jump to the next deadline, if any
      auto const next = driver.next_event();
      if (!next) break;
      driver.advance_to(*next);
   }
   return scheduler.live_tasks();
}

} // namespace kestrel::sim
