/**
 * @file signal.cpp
 * @brief Signal adapter: handler delivery or default action
 */

#define DEBUG_PRINT_ENABLE 0

#include "kestrel/signal.hpp"
#include "kestrel/debug_print.hpp"
#include "kestrel/scheduler_hook.hpp"
#include "kestrel/task.hpp"

namespace kestrel
{

static std::size_t index_of(SignalCode code) noexcept
{
   return static_cast<std::size_t>(code);
}

/* ============================================================================
 * SignalTable
 * ========================================================================= */

Status SignalTable::set(SignalCode code, HandlerTarget target) noexcept
{
   if (!is_catchable(code) || !target.task) return Status::InvalidArgument;

   CriticalSection cs(guard);
   entries[index_of(code)] = target;
   return Status::Ok;
}

void SignalTable::clear(SignalCode code) noexcept
{
   CriticalSection cs(guard);
   entries[index_of(code)] = NoHandler{};
}

SignalDisposition SignalTable::lookup(SignalCode code) const noexcept
{
   CriticalSection cs(guard);
   return entries[index_of(code)];
}

/* ============================================================================
 * SignalAdapter
 * ========================================================================= */

Status SignalAdapter::register_handler(Task& task, SignalCode code, HandlerTarget target)
{
   Status const status = task.signal_table().set(code, target);
   if (status == Status::Ok) {
      LOG_SIGNAL("task %u: %s -> task %u slot %u", task.id(), to_string(code).data(), target.task->id(), target.slot);
   }
   return status;
}

Status SignalAdapter::unregister_handler(Task& task, SignalCode code)
{
   if (!is_catchable(code)) return Status::InvalidArgument;
   task.signal_table().clear(code);
   LOG_SIGNAL("task %u: %s back to default", task.id(), to_string(code).data());
   return Status::Ok;
}

SignalOutcome SignalAdapter::raise(Task& task, SignalCode code, FaultContext const& context)
{
   SignalDisposition const disposition = task.signal_table().lookup(code);

   if (auto const* target = std::get_if<HandlerTarget>(&disposition)) {
      Message message;
      message.sender  = task.id();
      message.kind    = MessageKind::Signal;
      message.code    = code;
      message.tag     = target->slot;
      message.payload = {context.address, context.instruction_pointer, context.error_code};

      Status const status = (target->task->state() == Task::State::Terminated)
                          ? Status::NoSuchTask
                          : target->task->mailbox().try_send(message, config::MAX_MESSAGE_PRIORITY);
      if (status == Status::Ok) {
         delivered.fetch_add(1, std::memory_order_relaxed);
         LOG_SIGNAL("%s on task %u delivered to task %u", to_string(code).data(), task.id(), target->task->id());
         return SignalOutcome::Delivered;
      }

      LOG_FAULT("%s on task %u: delivery to task %u failed (%s), applying default action",
                to_string(code).data(), task.id(), target->task->id(), to_string(status).data());
   }

   return apply_default(task, code, context);
}

void SignalAdapter::reset_counters() noexcept
{
   delivered.store(0, std::memory_order_relaxed);
   defaulted.store(0, std::memory_order_relaxed);
}

SignalOutcome SignalAdapter::apply_default(Task& task, SignalCode code, FaultContext const& context)
{
   defaulted.fetch_add(1, std::memory_order_relaxed);

   switch (default_action(code)) {
      case DefaultAction::Ignore:
         LOG_SIGNAL("%s on task %u ignored", to_string(code).data(), task.id());
         return SignalOutcome::DefaultIgnored;

      case DefaultAction::LogAndTerminate:
         LOG_FAULT("task %u: unhandled %s (addr=0x%llx ip=0x%llx err=0x%llx)",
                   task.id(), to_string(code).data(),
                   static_cast<unsigned long long>(context.address),
                   static_cast<unsigned long long>(context.instruction_pointer),
                   static_cast<unsigned long long>(context.error_code));
         [[fallthrough]];

      case DefaultAction::Terminate:
         LOG_SIGNAL("%s terminates task %u", to_string(code).data(), task.id());
         kernel::scheduler().terminate(task);
         return SignalOutcome::DefaultTerminated;
   }
   return SignalOutcome::DefaultTerminated;
}

Status register_handler(Task& task, SignalCode code, HandlerTarget target)
{
   return kernel::signals().register_handler(task, code, target);
}

Status unregister_handler(Task& task, SignalCode code)
{
   return kernel::signals().unregister_handler(task, code);
}

} // namespace kestrel
