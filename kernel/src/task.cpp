/**
 * @file task.cpp
 * @brief Task and Process bookkeeping
 */

#define DEBUG_PRINT_ENABLE 0

#include "kestrel/task.hpp"
#include "kestrel/cpu.hpp"
#include "kestrel/debug_print.hpp"
#include "kestrel/wait_queue.hpp"

#include <utility>

namespace kestrel
{

Task::Task(Priority priority) noexcept
   : Task(priority, Mailbox::Options{})
{
}

Task::Task(Priority priority, Mailbox::Options mailbox_options) noexcept
   : task_id(kernel::next_task_id())
   , task_priority(priority)
   , inbox(*this, mailbox_options)
{
}

Task::Task(EntryFn&& entry, std::span<std::byte> stack, Priority priority) noexcept
   : Task(std::move(entry), stack, priority, Mailbox::Options{})
{
}

Task::Task(EntryFn&& entry, std::span<std::byte> stack, Priority priority, Mailbox::Options mailbox_options) noexcept
   : task_id(kernel::next_task_id())
   , task_priority(priority)
   , entry_fn(std::move(entry))
   , stack_region(stack)
   , inbox(*this, mailbox_options)
{
}

Task::~Task()
{
   if (waiting_on()) {
      LOG_FAULT("task %u destroyed while blocked", task_id);
      cancel_wait();
   }
   if (owning_process) owning_process->remove_thread(*this);
   kernel::cpus().unpin(*this);
}

bool Task::mark_runnable() noexcept
{
   State expected = State::Blocked;
   return current_state.compare_exchange_strong(expected, State::Ready, std::memory_order_acq_rel);
}

void Task::cancel_wait() noexcept
{
   if (WaitQueue* queue = waiting_on()) {
      queue->cancel(*this);
   }
}

/* ============================================================================
 * Process
 * ========================================================================= */

Process::~Process()
{
   SpinlockGuard lock(guard);
   for (std::size_t i = 0; i < count; ++i) {
      threads[i]->owning_process = nullptr;
   }
   count = 0;
}

Status Process::add_thread(Task& task) noexcept
{
   SpinlockGuard lock(guard);
   if (task.owning_process) return Status::InvalidArgument;
   if (count == threads.size()) return Status::ResourceExhausted;

   threads[count++] = &task;
   task.owning_process = this;
   return Status::Ok;
}

void Process::remove_thread(Task& task) noexcept
{
   SpinlockGuard lock(guard);
   for (std::size_t i = 0; i < count; ++i) {
      if (threads[i] != &task) continue;

      for (std::size_t j = i + 1; j < count; ++j) {
         threads[j - 1] = threads[j];
      }
      threads[--count] = nullptr;
      task.owning_process = nullptr;
      return;
   }
}

std::size_t Process::thread_count() const noexcept
{
   SpinlockGuard lock(guard);
   return count;
}

Task* Process::thread(std::size_t index) const noexcept
{
   SpinlockGuard lock(guard);
   return index < count ? threads[index] : nullptr;
}

Task* Process::select_thread() const noexcept
{
   SpinlockGuard lock(guard);

   Task* best = nullptr;
   for (std::size_t i = 0; i < count; ++i) {
      Task* candidate = threads[i];
      if (candidate->state() == Task::State::Terminated) continue;
      if (!best) {
         best = candidate;
         continue;
      }

      auto const candidate_load = candidate->mailbox().size();
      auto const best_load      = best->mailbox().size();
      if (candidate_load != best_load) {
         if (candidate_load < best_load) best = candidate;
      } else if (candidate->priority() != best->priority()) {
         if (candidate->priority() > best->priority()) best = candidate;
      } else if (candidate->id() < best->id()) {
         best = candidate;
      }
   }
   return best;
}

} // namespace kestrel
