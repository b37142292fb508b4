/**
 * @file kernel.hpp
 * @brief Kestrel kernel core API
 *
 * Configuration, status codes, the low-level critical-section primitives and
 * the process-wide kernel registry. The synchronisation and IPC objects live
 * in their own headers (lock.hpp, mailbox.hpp, signal.hpp).
 */

#ifndef KESTREL_KERNEL_HPP
#define KESTREL_KERNEL_HPP

#include "kestrel/function.hpp"
#include "kestrel/port.h"
#include "kestrel/time_driver.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

namespace kestrel
{

namespace config
{
   /**
    * @brief Capacity of the CPU descriptor table
    */
   static constexpr std::size_t MAX_CPUS = 8;
   static_assert(1 <= MAX_CPUS && MAX_CPUS <= KESTREL_PORT_CORE_COUNT, "Port does not support configured amount of CPUs.");
   static_assert(MAX_CPUS <= std::numeric_limits<uint32_t>::digits, "CoreAffinity mask cannot hold that many CPUs.");

   /**
    * @brief Wait-node slots reserved per Lock/Mailbox wait queue
    */
   static constexpr std::size_t MAX_WAITERS_PER_OBJECT = 16;
   static_assert(MAX_WAITERS_PER_OBJECT > 0 && MAX_WAITERS_PER_OBJECT <= 32, "Wait node pool uses a 32-bit free mask.");

   static constexpr std::size_t MAILBOX_CAPACITY = 32;
   static constexpr std::size_t SIGNAL_RESERVE   = 8;
   static_assert(MAILBOX_CAPACITY > 0, "Mailbox needs at least one slot.");
   static_assert(MAILBOX_CAPACITY + SIGNAL_RESERVE <= 64, "Message pool uses a 64-bit free mask.");

   static constexpr std::uint8_t MAX_MESSAGE_PRIORITY = 31;
   static_assert(MAX_MESSAGE_PRIORITY < std::numeric_limits<uint32_t>::digits, "Message priorities are tracked in a 32-bit bitmap.");

   static constexpr std::uint32_t DEFAULT_SPIN_BUDGET = 64;

   static constexpr std::size_t CPU_INBOX_CAPACITY = 64;
   static_assert((CPU_INBOX_CAPACITY & (CPU_INBOX_CAPACITY - 1)) == 0, "CPU inbox capacity must be a power of two.");

   static constexpr std::size_t MAX_THREADS_PER_PROCESS = 16;
}  // namespace config

/**
 * @brief Result of every fallible kernel operation
 *
 * OwnershipError and DeadlockError are misuse: they are also reported through
 * kernel::report_misuse() and are fatal to the offending task.
 * Everything else is an ordinary result the caller must handle.
 */
enum class Status : std::uint8_t
{
   Ok,
   WouldBlock,        // try_acquire() on a held lock
   TimedOut,
   Empty,             // non-blocking receive on an empty mailbox
   MailboxFull,       // Block policy, sender cannot wait
   MessageDropped,    // Drop policy, message discarded
   ResourceExhausted, // wait-node or message slots exhausted
   OwnershipError,
   DeadlockError,
   InvalidArgument,
   NoSuchTask,
};

[[nodiscard]] constexpr std::string_view to_string(Status status) noexcept
{
   switch (status) {
      case Status::Ok:                return "Ok";
      case Status::WouldBlock:        return "WouldBlock";
      case Status::TimedOut:          return "TimedOut";
      case Status::Empty:             return "Empty";
      case Status::MailboxFull:       return "MailboxFull";
      case Status::MessageDropped:    return "MessageDropped";
      case Status::ResourceExhausted: return "ResourceExhausted";
      case Status::OwnershipError:    return "OwnershipError";
      case Status::DeadlockError:     return "DeadlockError";
      case Status::InvalidArgument:   return "InvalidArgument";
      case Status::NoSuchTask:        return "NoSuchTask";
   }
   return "Unknown";
}

[[nodiscard]] constexpr bool is_misuse(Status status) noexcept
{
   return status == Status::OwnershipError || status == Status::DeadlockError;
}

using TaskId = std::uint32_t;
static constexpr TaskId KERNEL_TASK_ID = 0; // Sender id of messages raised outside task context

/**
 * @brief CPU affinity mask
 *
 * Bit flags indicating which CPUs a task may be pinned to.
 * Use bitwise OR to combine: Cpu0 | Cpu1
 */
struct CoreAffinity
{
   std::uint32_t mask;
   constexpr explicit CoreAffinity(std::uint32_t m) : mask(m) {}
   constexpr CoreAffinity operator|(CoreAffinity rhs) const { return CoreAffinity{mask | rhs.mask}; }
   constexpr CoreAffinity operator&(CoreAffinity rhs) const { return CoreAffinity{mask & rhs.mask}; }
   [[nodiscard]] constexpr bool allows(std::uint32_t cpu) const noexcept { return cpu < 32 && (mask & (1u << cpu)) != 0; }
   [[nodiscard]] constexpr static CoreAffinity from_id(std::uint32_t cpu) { return CoreAffinity{1u << cpu}; }
};
static constexpr CoreAffinity Cpu0 = CoreAffinity{0x01};
static constexpr CoreAffinity Cpu1 = CoreAffinity{0x02};
static constexpr CoreAffinity Cpu2 = CoreAffinity{0x04};
static constexpr CoreAffinity Cpu3 = CoreAffinity{0x08};
static constexpr CoreAffinity AnyCpu = CoreAffinity{0xFFFFFFFF};

/* ============================================================================
 * Spinlock
 * ========================================================================= */

/**
 * @brief Non-blocking spinlock for very short critical sections
 *
 * Never suspends the caller, so it is usable from interrupt context and
 * inside the Lock implementation itself. Holders must not suspend.
 *
 * Usage:
 *   Spinlock lock;
 *   {
 *       SpinlockGuard guard(lock);
 *       // ... critical section ...
 *   } // Automatically unlocked
 */
class Spinlock
{
public:
   constexpr Spinlock() : flag(ATOMIC_FLAG_INIT) {}

   Spinlock(Spinlock const&)            = delete;
   Spinlock& operator=(Spinlock const&) = delete;
   Spinlock(Spinlock&&)                 = delete;
   Spinlock& operator=(Spinlock&&)      = delete;

   void lock() noexcept
   {
      while (flag.test_and_set(std::memory_order_acquire)) {
         while (flag.test(std::memory_order_relaxed)) {
            kestrel_port_cpu_relax();
         }
      }
   }

   void unlock() noexcept
   {
      flag.clear(std::memory_order_release);
   }

   bool try_lock() noexcept
   {
      return !flag.test_and_set(std::memory_order_acquire);
   }

   /**
    * @brief Racy, for assertions only
    */
   [[nodiscard]] bool is_locked() const noexcept
   {
      return flag.test(std::memory_order_relaxed);
   }

private:
   std::atomic_flag flag;
};

class SpinlockGuard
{
public:
   explicit SpinlockGuard(Spinlock& lock) noexcept : lock(lock)
   {
      lock.lock();
   }

   ~SpinlockGuard()
   {
      lock.unlock();
   }

   SpinlockGuard(SpinlockGuard const&)            = delete;
   SpinlockGuard& operator=(SpinlockGuard const&) = delete;

private:
   Spinlock& lock;
};

/**
 * @brief Interrupt-masked critical section over an object's spinlock
 *
 * Masks interrupts on this CPU, then takes the spinlock. Both are restored on
 * every exit path, including early returns and unlock() before a suspension.
 * unlock()/lock() may be repeated, e.g. around a wait.
 */
class CriticalSection
{
public:
   explicit CriticalSection(Spinlock& guard) noexcept : guard(guard)
   {
      lock();
   }

   ~CriticalSection()
   {
      if (held) unlock();
   }

   CriticalSection(CriticalSection const&)            = delete;
   CriticalSection& operator=(CriticalSection const&) = delete;

   void lock() noexcept
   {
      irq_state = kestrel_port_irq_save();
      guard.lock();
      held = true;
   }

   void unlock() noexcept
   {
      held = false;
      guard.unlock();
      kestrel_port_irq_restore(irq_state);
   }

   [[nodiscard]] bool owns_lock() const noexcept { return held; }

private:
   Spinlock& guard;
   std::uint32_t irq_state{0};
   bool held{false};
};

class Task;
class CpuTable;
class ISchedulerHook;
class SignalAdapter;

/**
 * @brief Process-wide kernel registry
 *
 * Initialised once at boot, in order: port, CPU table, scheduler hook, time
 * source. There is no teardown; the registry lives as long as the kernel.
 */
namespace kernel
{
   /**
    * @brief Initialise the registry
    * @param cpu_count Number of online CPUs, 1..config::MAX_CPUS
    * @param scheduler Externally owned scheduler, must outlive the kernel
    * @param time Monotonic time source, must outlive the kernel
    *
    * Calling it again re-initialises the registry (simulation and tests).
    */
   void initialise(std::uint32_t cpu_count, ISchedulerHook& scheduler, ITimeDriver& time);

   [[nodiscard]] bool initialised() noexcept;

   [[nodiscard]] ISchedulerHook& scheduler() noexcept;
   [[nodiscard]] ITimeDriver&    time() noexcept;
   [[nodiscard]] CpuTable&       cpus() noexcept;
   [[nodiscard]] SignalAdapter&  signals() noexcept;

   [[nodiscard]] TimePoint now() noexcept;

   /**
    * @brief Task running on the calling CPU, nullptr in non-task context
    */
   [[nodiscard]] Task* current_task() noexcept;

   /**
    * @brief Report a misuse error (OwnershipError, DeadlockError)
    *
    * Logs the fault with task, CPU, object and operation, then terminates the
    * offending task through the scheduler hook. Never call it while holding a
    * critical section: terminating the calling task does not return.
    */
   void report_misuse(Task* task, Status status, char const* operation, void const* object);

   [[nodiscard]] TaskId next_task_id() noexcept;
}  // namespace kernel

} // namespace kestrel

#endif // KESTREL_KERNEL_HPP
