/**
 * @file wait_queue.cpp
 * @brief FIFO wait queue over a fixed node pool
 */

#define DEBUG_PRINT_ENABLE 0

#include "kestrel/wait_queue.hpp"
#include "kestrel/debug_print.hpp"
#include "kestrel/task.hpp"

#include <cassert>

namespace kestrel
{

WaitQueue::~WaitQueue()
{
   if (count != 0) {
      LOG_FAULT("wait queue %p destroyed with %zu waiters", static_cast<void*>(this), count);
   }
}

WaitQueue::Slot WaitQueue::enqueue(Task& task, void* payload) noexcept
{
   assert(guard.is_locked());
   assert(task.waiting_on() == nullptr && "Task is already waiting elsewhere");

   WaitNode* node = alloc(task);
   if (!node) {
      LOG_SYNC("wait queue %p: node pool exhausted (task %u)", static_cast<void*>(this), task.id());
      return NO_SLOT;
   }

   node->payload = payload;
   link_tail(*node);

   task.wait_slot = node->slot;
   task.blocked_on.store(this, std::memory_order_release);
   task.set_state(Task::State::Blocked);

   LOG_SYNC("wait queue %p: task %u enqueued at slot %u (%zu waiting)",
            static_cast<void*>(this), task.id(), node->slot, count);
   return node->slot;
}

Task* WaitQueue::claim_head() noexcept
{
   assert(guard.is_locked());

   // Every linked node is unclaimed: claims always unlink under the guard
   if (head_slot == NO_SLOT) return nullptr;

   WaitNode& node = nodes[head_slot];
   [[maybe_unused]] bool const won = claim(node, Outcome::Granted);
   assert(won && "Linked node was already claimed");
   unlink(node);
   return node.task;
}

void WaitQueue::wake(Task& task)
{
   // A granted waiter already holds what it waited for: Blocked -> Ready, never Spinning
   if (task.mark_runnable()) {
      kernel::scheduler().resume(task);
   }
}

WaitQueue::Outcome WaitQueue::wait(CriticalSection& cs, Slot slot, SuspendReason reason, TimePoint deadline)
{
   assert(cs.owns_lock());
   assert(slot < N && nodes[slot].active);

   WaitNode& node = nodes[slot];
   Task& task = *node.task;

   // cancel() frees the node under a task that is later resumed instead of unwound
   auto const still_ours = [&] { return node.active && node.task == &task; };

   while (true) {
      if (!still_ours() || node.claimed.load(std::memory_order_acquire)) break;

      if (deadline != TimePoint::max() && kernel::now() >= deadline) {
         if (claim(node, Outcome::TimedOut)) unlink(node);
         break;
      }

      task.set_state(Task::State::Blocked);
      cs.unlock();
      kernel::scheduler().suspend_current(reason, deadline);
      cs.lock();
   }

   Outcome outcome = node.outcome;
   if (still_ours()) {
      free(node);
   } else if (node.active) {
      // Slot already reused; whatever cancel() kept is gone
      outcome = Outcome::Cancelled;
   }
   task.set_state(Task::State::Running);

   LOG_SYNC("wait queue %p: task %u left with outcome %u",
            static_cast<void*>(this), task.id(), static_cast<unsigned>(outcome));
   return outcome;
}

void WaitQueue::cancel(Task& task) noexcept
{
   CriticalSection cs(guard);

   if (task.blocked_on.load(std::memory_order_acquire) != this) return;

   Slot const slot = task.wait_slot;
   if (slot >= N) return;

   WaitNode& node = nodes[slot];
   if (!node.active || node.task != &task) return;

   if (claim(node, Outcome::Cancelled)) unlink(node);
   free(node);

   LOG_SYNC("wait queue %p: task %u cancelled", static_cast<void*>(this), task.id());
}

Task* WaitQueue::front() const noexcept
{
   if (head_slot == NO_SLOT) return nullptr;
   return nodes[head_slot].task;
}

void* WaitQueue::front_payload() const noexcept
{
   if (head_slot == NO_SLOT) return nullptr;
   return nodes[head_slot].payload;
}

WaitQueue::WaitNode* WaitQueue::alloc(Task& task) noexcept
{
   if (free_mask == 0) return nullptr;

   auto const slot = static_cast<Slot>(std::countr_zero(free_mask));
   free_mask &= ~(1u << slot);

   WaitNode& node = nodes[slot];
   node.slot        = slot;
   node.active      = true;
   node.linked      = false;
   node.next        = NO_SLOT;
   node.prev        = NO_SLOT;
   node.claimed.store(false, std::memory_order_relaxed);
   node.outcome     = Outcome::Pending;
   node.task        = &task;
   node.payload     = nullptr;
   node.enqueued_at = kernel::initialised() ? kernel::now() : TimePoint{};
   return &node;
}

void WaitQueue::free(WaitNode& node) noexcept
{
   assert(node.active && !node.linked);

   if (node.task) {
      node.task->blocked_on.store(nullptr, std::memory_order_release);
      node.task->wait_slot = NO_SLOT;
   }

   node.active  = false;
   node.task    = nullptr;
   node.payload = nullptr;
   free_mask |= (1u << node.slot);
}

void WaitQueue::link_tail(WaitNode& node) noexcept
{
   assert(!node.linked);

   node.prev = tail_slot;
   node.next = NO_SLOT;
   if (tail_slot == NO_SLOT) {
      head_slot = node.slot;
   } else {
      nodes[tail_slot].next = node.slot;
   }
   tail_slot = node.slot;

   node.linked = true;
   ++count;
}

void WaitQueue::unlink(WaitNode& node) noexcept
{
   assert(node.linked && count > 0);

   if (node.prev == NO_SLOT) {
      head_slot = node.next;
   } else {
      nodes[node.prev].next = node.next;
   }

   if (node.next == NO_SLOT) {
      tail_slot = node.prev;
   } else {
      nodes[node.next].prev = node.prev;
   }

   node.next   = NO_SLOT;
   node.prev   = NO_SLOT;
   node.linked = false;
   --count;
}

bool WaitQueue::claim(WaitNode& node, Outcome outcome) noexcept
{
   bool expected = false;
   if (!node.claimed.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) return false;
   node.outcome = outcome;
   return true;
}

} // namespace kestrel
