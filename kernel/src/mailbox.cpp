/**
 * @file mailbox.cpp
 * @brief Priority mailbox with Block/Drop backpressure
 */

#define DEBUG_PRINT_ENABLE 0

#include "kestrel/mailbox.hpp"
#include "kestrel/debug_print.hpp"
#include "kestrel/task.hpp"

#include <algorithm>
#include <bit>
#include <cassert>

namespace kestrel
{

/* ============================================================================
 * MessageQueue
 * ========================================================================= */

MessageQueue::MessageQueue() noexcept
{
   heads.fill(NONE);
   tails.fill(NONE);
}

bool MessageQueue::push(Message const& message) noexcept
{
   if (free_mask == 0) return false;
   assert(message.priority < PRIORITY_LEVELS);

   auto const index = static_cast<Index>(std::countr_zero(free_mask));
   free_mask &= ~(std::uint64_t{1} << index);

   Slot& slot = slots[index];
   slot.message = message;
   slot.next    = NONE;

   auto const level = message.priority;
   if (tails[level] == NONE) {
      heads[level] = index;
   } else {
      slots[tails[level]].next = index;
   }
   tails[level] = index;
   ready_bitmap |= (1u << level);

   if (message.kind == MessageKind::Signal) ++signals;
   else                                     ++normal;
   return true;
}

bool MessageQueue::pop(Message& out) noexcept
{
   if (ready_bitmap == 0) return false;

   // Highest non-empty level
   auto const level = static_cast<std::size_t>(31 - std::countl_zero(ready_bitmap));
   Index const index = heads[level];
   assert(index != NONE);

   Slot& slot = slots[index];
   out = slot.message;

   heads[level] = slot.next;
   if (heads[level] == NONE) {
      tails[level] = NONE;
      ready_bitmap &= ~(1u << level);
   }
   slot.next = NONE;
   free_mask |= (std::uint64_t{1} << index);

   if (out.kind == MessageKind::Signal) --signals;
   else                                 --normal;
   return true;
}

void MessageQueue::clear() noexcept
{
   heads.fill(NONE);
   tails.fill(NONE);
   free_mask    = ALL_SLOTS_FREE;
   ready_bitmap = 0;
   normal       = 0;
   signals      = 0;
}

/* ============================================================================
 * Mailbox
 * ========================================================================= */

Mailbox::Mailbox(Task& owner) noexcept : Mailbox(owner, Options{}) {}

Mailbox::Mailbox(Task& owner, Options options) noexcept
   : owner_task(owner)
   , options(options)
{
   this->options.high_water_mark = std::min(options.high_water_mark, config::MAILBOX_CAPACITY);
}

Mailbox::~Mailbox()
{
   CriticalSection cs(guard);
   if (!queue.empty()) {
      LOG_MBOX("mailbox of task %u: discarding %zu pending messages", owner_task.id(), queue.size());
   }
   queue.clear();
   queued.store(0, std::memory_order_release);
}

std::size_t Mailbox::blocked_senders() const noexcept
{
   CriticalSection cs(guard);
   return senders.size();
}

Status Mailbox::send(Message message, std::uint8_t priority, TimePoint deadline)
{
   return deliver(message, priority, deadline, true);
}

Status Mailbox::try_send(Message message, std::uint8_t priority)
{
   return deliver(message, priority, TimePoint::max(), false);
}

Status Mailbox::deliver(Message& message, std::uint8_t priority, TimePoint deadline, bool may_block)
{
   if (priority > config::MAX_MESSAGE_PRIORITY) return Status::InvalidArgument;
   if (message.kind == MessageKind::Signal && !message.code) return Status::InvalidArgument;

   message.priority = priority;

   Task* self = kernel::current_task();
   if (message.sender == KERNEL_TASK_ID && self) message.sender = self->id();

   bool const can_wait = may_block && self && self != &owner_task;

   CriticalSection cs(guard);

   if (message.kind == MessageKind::Signal) {
      if (!queue.push(message)) {
         LOG_MBOX("task %u: signal reserve exhausted", owner_task.id());
         return Status::ResourceExhausted;
      }
      published(message);
      return Status::Ok;
   }

   // Blocked senders keep their place: nobody overtakes them into a freed slot
   if (senders.empty() && queue.normal_count() < options.high_water_mark && queue.push(message)) {
      published(message);
      return Status::Ok;
   }

   if (options.policy == BackpressurePolicy::Drop) {
      dropped.fetch_add(1, std::memory_order_relaxed);
      LOG_MBOX("task %u: full, message from task %u dropped", owner_task.id(), message.sender);
      return Status::MessageDropped;
   }

   if (!can_wait) return Status::MailboxFull;
   if (deadline != TimePoint::max() && kernel::now() >= deadline) return Status::TimedOut;

   WaitQueue::Slot const slot = senders.enqueue(*self, &message);
   if (slot == WaitQueue::NO_SLOT) return Status::ResourceExhausted;

   // Granted means the receiver already queued our message for us
   WaitQueue::Outcome const outcome = senders.wait(cs, slot, SuspendReason::MailboxSend, deadline);
   if (outcome == WaitQueue::Outcome::Granted) return Status::Ok;

   LOG_MBOX("task %u: send from task %u gave up waiting", owner_task.id(), message.sender);
   return Status::TimedOut;
}

void Mailbox::published(Message const& message)
{
   queued.store(queue.size(), std::memory_order_release);
   if (Task* receiver = receivers.claim_head()) receivers.wake(*receiver);

   LOG_MBOX("task %u -> task %u: prio %u queued (%zu pending)",
            message.sender, owner_task.id(), message.priority, queue.size());
}

void Mailbox::admit_blocked_senders()
{
   while (queue.normal_count() < options.high_water_mark) {
      auto* pending = static_cast<Message*>(senders.front_payload());
      if (!pending || !queue.push(*pending)) break;

      // The message is in; only now does the sender learn it was granted
      Task* sender = senders.claim_head();
      LOG_MBOX("task %u: admitted blocked send from task %u", owner_task.id(), sender->id());
      senders.wake(*sender);
   }
   queued.store(queue.size(), std::memory_order_release);
}

ReceiveResult Mailbox::receive(ReceiveMode mode)
{
   Task* self = kernel::current_task();
   if (self != &owner_task) {
      kernel::report_misuse(self, Status::OwnershipError, "Mailbox::receive", this);
      return {Status::OwnershipError, {}};
   }

   TimePoint const deadline = (mode.kind == ReceiveMode::Kind::Until) ? mode.deadline : TimePoint::max();

   CriticalSection cs(guard);
   while (true) {
      ReceiveResult result{Status::Ok, {}};
      if (queue.pop(result.message)) {
         admit_blocked_senders();
         return result;
      }

      if (mode.kind == ReceiveMode::Kind::NonBlocking) return {Status::Empty, {}};
      if (deadline != TimePoint::max() && kernel::now() >= deadline) return {Status::TimedOut, {}};

      WaitQueue::Slot const slot = receivers.enqueue(*self);
      if (slot == WaitQueue::NO_SLOT) return {Status::ResourceExhausted, {}};

      // A message that raced the timeout is still picked up above
      (void)receivers.wait(cs, slot, SuspendReason::MailboxReceive, deadline);
   }
}

/* ============================================================================
 * Free functions
 * ========================================================================= */

Status send_message(Task& destination, Message message, std::uint8_t priority)
{
   if (destination.state() == Task::State::Terminated) return Status::NoSuchTask;
   return destination.mailbox().send(message, priority);
}

Status send_message(Process& destination, Message message, std::uint8_t priority)
{
   Task* thread = destination.select_thread();
   if (!thread) return Status::NoSuchTask;

   LOG_MBOX("process %u: delivering to thread %u", destination.id(), thread->id());
   return send_message(*thread, message, priority);
}

ReceiveResult receive_message(ReceiveMode mode)
{
   Task* self = kernel::current_task();
   if (!self) return {Status::InvalidArgument, {}};
   return self->mailbox().receive(mode);
}

} // namespace kestrel
