/**
 * @file lock.cpp
 * @brief Spin-then-queue lock
 */

#define DEBUG_PRINT_ENABLE 0

#include "kestrel/lock.hpp"
#include "kestrel/debug_print.hpp"
#include "kestrel/task.hpp"

#include <cassert>

namespace kestrel
{

namespace
{

// Holds the lock's single spinner slot; also released when a killed task is unwound
class SpinnerSlot
{
public:
   SpinnerSlot(std::atomic<Task*>& spinner, Task& self) noexcept : spinner(spinner), self(self) {}

   ~SpinnerSlot()
   {
      Task* expected = &self;
      spinner.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel);
   }

   SpinnerSlot(SpinnerSlot const&)            = delete;
   SpinnerSlot& operator=(SpinnerSlot const&) = delete;

private:
   std::atomic<Task*>& spinner;
   Task& self;
};

} // namespace

Lock::~Lock()
{
   if (Task* holder_task = holder()) {
      LOG_FAULT("lock %p destroyed while held by task %u", static_cast<void*>(this), holder_task->id());
   }
}

std::size_t Lock::waiter_count() const noexcept
{
   CriticalSection cs(guard);
   return waiters.size();
}

Status Lock::acquire()
{
   return acquire_until(TimePoint::max());
}

Status Lock::acquire_timeout(TimePoint deadline)
{
   return acquire_until(deadline);
}

Status Lock::try_acquire()
{
   Task* self = kernel::current_task();
   if (!self) return Status::InvalidArgument;

   if (holder() == self) {
      if (options.reentrant) {
         ++nesting;
         return Status::Ok;
      }
      kernel::report_misuse(self, Status::DeadlockError, "Lock::try_acquire", this);
      return Status::DeadlockError;
   }

   return try_take(*self) ? Status::Ok : Status::WouldBlock;
}

Status Lock::release()
{
   Task* self = kernel::current_task();
   if (!self || holder() != self) {
      kernel::report_misuse(self, Status::OwnershipError, "Lock::release", this);
      return Status::OwnershipError;
   }

   if (options.reentrant && nesting > 1) {
      --nesting;
      return Status::Ok;
   }

   CriticalSection cs(guard);
   nesting = 0;

   if (Task* next = waiters.claim_head()) {
      // Direct hand-off: the lock never becomes free, so nobody can barge in.
      // The grantee goes Blocked -> Ready and returns from acquire() as owner.
      owner.store(next, std::memory_order_release);
      waiters.wake(*next);
      LOG_SYNC("lock %p: task %u -> task %u", static_cast<void*>(this), self->id(), next->id());
   } else {
      owner.store(nullptr, std::memory_order_release);
      LOG_SYNC("lock %p: released by task %u", static_cast<void*>(this), self->id());
   }
   return Status::Ok;
}

Status Lock::acquire_until(TimePoint deadline)
{
   Task* self = kernel::current_task();
   if (!self) return Status::InvalidArgument;

   if (holder() == self) {
      if (options.reentrant) {
         ++nesting;
         return Status::Ok;
      }
      kernel::report_misuse(self, Status::DeadlockError, "Lock::acquire", this);
      return Status::DeadlockError;
   }

   if (try_take(*self)) return Status::Ok;

   {
      CriticalSection cs(guard);
      if (try_take(*self)) return Status::Ok;

      Task* expected = nullptr;
      bool const can_spin = options.spin_budget > 0
                         && waiters.empty()
                         && spinner.compare_exchange_strong(expected, self, std::memory_order_acq_rel);
      if (!can_spin) {
         return queue_and_wait(cs, *self, deadline);
      }
   }

   // Sole spinner: busy-wait for the holder to let go
   bool taken = false;
   bool expired = false;
   {
      SpinnerSlot const slot(spinner, *self);
      LOG_SYNC("lock %p: task %u spinning", static_cast<void*>(this), self->id());
      self->set_state(Task::State::Spinning);

      for (std::uint32_t step = 0; step < options.spin_budget; ++step) {
         if (try_take(*self)) {
            taken = true;
            break;
         }
         if (deadline != TimePoint::max() && kernel::now() >= deadline) {
            expired = true;
            break;
         }
         kernel::scheduler().relax();
      }
   }
   self->set_state(Task::State::Running);

   if (taken) return Status::Ok;
   if (expired) return Status::TimedOut;

   // Spin budget spent: downgrade to a queued wait
   CriticalSection cs(guard);
   if (try_take(*self)) return Status::Ok;
   if (deadline != TimePoint::max() && kernel::now() >= deadline) return Status::TimedOut;
   return queue_and_wait(cs, *self, deadline);
}

Status Lock::queue_and_wait(CriticalSection& cs, Task& self, TimePoint deadline)
{
   assert(cs.owns_lock());

   WaitQueue::Slot const slot = waiters.enqueue(self);
   if (slot == WaitQueue::NO_SLOT) {
      LOG_SYNC("lock %p: task %u cannot queue, pool exhausted", static_cast<void*>(this), self.id());
      return Status::ResourceExhausted;
   }

   LOG_SYNC("lock %p: task %u queued behind task %u", static_cast<void*>(this), self.id(),
            holder() ? holder()->id() : KERNEL_TASK_ID);

   WaitQueue::Outcome const outcome = waiters.wait(cs, slot, SuspendReason::LockWait, deadline);
   if (outcome == WaitQueue::Outcome::Granted) {
      // release() already made us the owner
      assert(holder() == &self);
      nesting = 1;
      return Status::Ok;
   }

   if (outcome == WaitQueue::Outcome::Cancelled) {
      LOG_SYNC("lock %p: task %u wait cancelled", static_cast<void*>(this), self.id());
   } else {
      LOG_SYNC("lock %p: task %u timed out", static_cast<void*>(this), self.id());
   }
   return Status::TimedOut;
}

bool Lock::try_take(Task& self) noexcept
{
   Task* expected = nullptr;
   if (!owner.compare_exchange_strong(expected, &self, std::memory_order_acq_rel, std::memory_order_acquire)) {
      return false;
   }
   nesting = 1;
   return true;
}

} // namespace kestrel
