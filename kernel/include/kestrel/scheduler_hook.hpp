/**
 * @file scheduler_hook.hpp
 * @brief The suspend/resume contract the kernel core needs from a scheduler
 *
 * The kernel core never picks what runs next. Locks and mailboxes only ask
 * the installed scheduler to park the calling task and to make a task
 * runnable again; run-queue selection and load balancing stay outside.
 */

#ifndef KESTREL_SCHEDULER_HOOK_HPP
#define KESTREL_SCHEDULER_HOOK_HPP

#include "kestrel/kernel.hpp"

#include <cstdint>
#include <string_view>

namespace kestrel
{

enum class SuspendReason : std::uint8_t
{
   LockWait,
   MailboxReceive,
   MailboxSend,
};

[[nodiscard]] constexpr std::string_view to_string(SuspendReason reason) noexcept
{
   switch (reason) {
      case SuspendReason::LockWait:       return "LockWait";
      case SuspendReason::MailboxReceive: return "MailboxReceive";
      case SuspendReason::MailboxSend:    return "MailboxSend";
   }
   return "Unknown";
}

class ISchedulerHook
{
public:
   ISchedulerHook() = default;
   virtual ~ISchedulerHook() = default;
   ISchedulerHook(ISchedulerHook const&)            = delete;
   ISchedulerHook& operator=(ISchedulerHook const&) = delete;

   /**
    * @brief Task running on the calling CPU, nullptr outside task context
    */
   [[nodiscard]] virtual Task* current() noexcept = 0;

   /**
    * @brief Park the calling task
    * @param reason What the task waits for (diagnostics only)
    * @param wake_at Resume no later than this, TimePoint::max() for never
    *
    * The caller has already marked itself Blocked under the object's critical
    * section and released it. Returns once resume() was called or wake_at
    * passed. Callers re-check their wait condition, so an early return is
    * harmless.
    */
   virtual void suspend_current(SuspendReason reason, TimePoint wake_at) = 0;

   /**
    * @brief Make a task eligible to run again, on whatever CPU owns it
    *
    * Called with interrupts masked and under object critical sections: it
    * must not block and must not allocate.
    */
   virtual void resume(Task& task) = 0;

   /**
    * @brief Terminate one task
    *
    * Terminating the calling task does not return.
    */
   virtual void terminate(Task& task) = 0;

   /**
    * @brief One busy-wait step of a spinning task
    */
   virtual void relax() = 0;
};

} // namespace kestrel

#endif // KESTREL_SCHEDULER_HOOK_HPP
