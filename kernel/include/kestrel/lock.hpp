/**
 * @file lock.hpp
 * @brief Spin-then-queue mutual exclusion with FIFO hand-off
 *
 * - Free lock: taken with one compare-and-set.
 * - Held, nobody spinning, nobody queued: the caller becomes the single
 *   spinner for up to spin_budget relax steps, then queues.
 * - Otherwise the caller queues FIFO and blocks immediately.
 * - release() hands ownership straight to the queue head, so queued waiters
 *   are served strictly in arrival order regardless of task priority.
 *
 * Queue links are protected by the lock's own interrupt-masked critical
 * section, never by the Lock itself.
 */

#ifndef KESTREL_LOCK_HPP
#define KESTREL_LOCK_HPP

#include "kestrel/kernel.hpp"
#include "kestrel/wait_queue.hpp"

#include <atomic>
#include <cstdint>

namespace kestrel
{

class Lock
{
public:
   struct Options
   {
      std::uint32_t spin_budget{config::DEFAULT_SPIN_BUDGET};
      bool reentrant{false};
   };

   Lock() noexcept : Lock(Options{}) {}
   explicit Lock(Options options) noexcept : options(options) {}

   /**
    * @brief A held lock must not be destroyed (reported on the fault channel)
    */
   ~Lock();

   Lock(Lock const&)            = delete;
   Lock& operator=(Lock const&) = delete;

   /**
    * @brief Block until ownership is granted
    * @return Ok, ResourceExhausted, DeadlockError, InvalidArgument (no task)
    */
   [[nodiscard]] Status acquire();

   /**
    * @brief acquire() that gives up once deadline has passed
    * @return Ok, TimedOut, ResourceExhausted, DeadlockError, InvalidArgument
    */
   [[nodiscard]] Status acquire_timeout(TimePoint deadline);

   /**
    * @brief Never spins, never blocks
    * @return Ok or WouldBlock (DeadlockError when re-taken by a non-reentrant holder)
    */
   [[nodiscard]] Status try_acquire();

   /**
    * @brief Give up ownership, handing it to the oldest waiter if any
    * @return Ok, or OwnershipError if the caller is not the holder
    *
    * OwnershipError leaves the lock untouched and is fatal to the caller.
    */
   Status release();

   [[nodiscard]] Task* holder() const noexcept { return owner.load(std::memory_order_acquire); }
   [[nodiscard]] bool is_locked() const noexcept { return holder() != nullptr; }
   [[nodiscard]] bool has_spinner() const noexcept { return spinner.load(std::memory_order_acquire) != nullptr; }
   [[nodiscard]] std::size_t waiter_count() const noexcept;
   [[nodiscard]] std::uint32_t depth() const noexcept { return nesting; }
   [[nodiscard]] Options const& settings() const noexcept { return options; }

private:
   Status acquire_until(TimePoint deadline);
   Status queue_and_wait(CriticalSection& cs, Task& self, TimePoint deadline);
   bool try_take(Task& self) noexcept;

   Options options;
   std::atomic<Task*> owner{nullptr};
   std::atomic<Task*> spinner{nullptr};
   std::uint32_t nesting{0};  // holder only

   mutable Spinlock guard;
   WaitQueue waiters{guard};
};

/**
 * @brief RAII acquire/release
 *
 * Check owns_lock() (or status()) before touching the guarded state.
 */
class LockGuard
{
public:
   explicit LockGuard(Lock& lock) : lock(lock), result(lock.acquire()) {}

   ~LockGuard()
   {
      if (result == Status::Ok) (void)lock.release();
   }

   LockGuard(LockGuard const&)            = delete;
   LockGuard& operator=(LockGuard const&) = delete;

   [[nodiscard]] Status status() const noexcept { return result; }
   [[nodiscard]] bool owns_lock() const noexcept { return result == Status::Ok; }

private:
   Lock& lock;
   Status result;
};

} // namespace kestrel

#endif // KESTREL_LOCK_HPP
