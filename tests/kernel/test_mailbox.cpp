/**
 * @file test_mailbox.cpp
 * @brief Unit tests for mailbox ordering, backpressure and thread selection
 */

#include "kestrel/mailbox.hpp"
#include "mock/mock_scheduler_hook.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace kestrel;
using kestrel::test::KernelTest;

namespace
{
Message tagged(std::uint32_t tag)
{
   Message message;
   message.tag = tag;
   return message;
}

Message signal_message(SignalCode code)
{
   Message message;
   message.kind = MessageKind::Signal;
   message.code = code;
   return message;
}

// Thrown from a scripted suspension to abandon a wait, as a kill would
struct AbandonWait {};
} // namespace

class MailboxTest : public KernelTest
{
protected:
   std::vector<std::uint32_t> drain_tags(Task& owner)
   {
      std::vector<std::uint32_t> tags;
      hook.as(owner, [&] {
         while (true) {
            auto result = owner.mailbox().receive(ReceiveMode::non_blocking());
            if (!result.ok()) break;
            tags.push_back(result.message.tag);
         }
      });
      return tags;
   }

   Task owner{1};
   Task sender{2};
};

/* ============================================================================
 * Ordering
 * ========================================================================= */

TEST_F(MailboxTest, HighestPriorityFirst)
{
   auto& box = owner.mailbox();
   hook.as(sender, [&] {
      ASSERT_EQ(box.send(tagged(1), 1), Status::Ok);
      ASSERT_EQ(box.send(tagged(5), 5), Status::Ok);
      ASSERT_EQ(box.send(tagged(3), 3), Status::Ok);
   });

   EXPECT_EQ(box.size(), 3u);
   EXPECT_EQ(drain_tags(owner), (std::vector<std::uint32_t>{5, 3, 1}));
   EXPECT_EQ(box.size(), 0u);
}

TEST_F(MailboxTest, FifoWithinPriority)
{
   auto& box = owner.mailbox();
   hook.as(sender, [&] {
      ASSERT_EQ(box.send(tagged(10), 4), Status::Ok);
      ASSERT_EQ(box.send(tagged(20), 7), Status::Ok);
      ASSERT_EQ(box.send(tagged(11), 4), Status::Ok);
      ASSERT_EQ(box.send(tagged(21), 7), Status::Ok);
      ASSERT_EQ(box.send(tagged(12), 4), Status::Ok);
   });

   EXPECT_EQ(drain_tags(owner), (std::vector<std::uint32_t>{20, 21, 10, 11, 12}));
}

TEST_F(MailboxTest, SenderIdIsStamped)
{
   hook.as(sender, [&] { ASSERT_EQ(owner.mailbox().send(tagged(1), 0), Status::Ok); });

   // Outside task context the kernel is the sender
   ASSERT_EQ(owner.mailbox().try_send(tagged(2), 0), Status::Ok);

   hook.as(owner, [&] {
      auto first = receive_message(ReceiveMode::non_blocking());
      ASSERT_TRUE(first.ok());
      EXPECT_EQ(first.message.sender, sender.id());
      EXPECT_EQ(first.message.priority, 0u);

      auto second = receive_message(ReceiveMode::non_blocking());
      ASSERT_TRUE(second.ok());
      EXPECT_EQ(second.message.sender, KERNEL_TASK_ID);
   });
}

TEST_F(MailboxTest, InvalidPriorityIsRejected)
{
   auto& box = owner.mailbox();
   EXPECT_EQ(box.try_send(tagged(1), config::MAX_MESSAGE_PRIORITY + 1), Status::InvalidArgument);
   EXPECT_EQ(box.try_send(tagged(1), config::MAX_MESSAGE_PRIORITY), Status::Ok);
   EXPECT_EQ(box.size(), 1u);
}

TEST_F(MailboxTest, SignalWithoutCodeIsRejected)
{
   Message message;
   message.kind = MessageKind::Signal;
   EXPECT_EQ(owner.mailbox().try_send(message, 31), Status::InvalidArgument);
   EXPECT_EQ(owner.mailbox().size(), 0u);
}

/* ============================================================================
 * Receive
 * ========================================================================= */

TEST_F(MailboxTest, NonBlockingReceiveOnEmptyMailbox)
{
   hook.as(owner, [&] {
      EXPECT_EQ(owner.mailbox().receive(ReceiveMode::non_blocking()).status, Status::Empty);
   });
   EXPECT_EQ(hook.suspend_calls, 0);
}

TEST_F(MailboxTest, ReceiveUntilTimesOut)
{
   TimePoint const deadline = after(25);
   hook.as(owner, [&] {
      EXPECT_EQ(owner.mailbox().receive(ReceiveMode::until(deadline)).status, Status::TimedOut);
   });
   EXPECT_GE(now().value, deadline.value);
   EXPECT_EQ(hook.last_reason, SuspendReason::MailboxReceive);
   EXPECT_EQ(owner.waiting_on(), nullptr);
}

TEST_F(MailboxTest, BlockingReceiveWokenBySend)
{
   hook.on_suspend = [&](Task& self) {
      EXPECT_EQ(&self, &owner);
      hook.as(sender, [&] { EXPECT_EQ(send_message(owner, tagged(42), 3), Status::Ok); });
   };

   hook.as(owner, [&] {
      auto result = owner.mailbox().receive(ReceiveMode::blocking());
      ASSERT_TRUE(result.ok());
      EXPECT_EQ(result.message.tag, 42u);
      EXPECT_EQ(result.message.sender, sender.id());
   });
   EXPECT_EQ(hook.resumed, (std::vector<Task*>{&owner}));
}

TEST_F(MailboxTest, ReceiveByNonOwnerIsOwnershipError)
{
   ASSERT_EQ(owner.mailbox().try_send(tagged(1), 0), Status::Ok);

   hook.as(sender, [&] {
      EXPECT_EQ(owner.mailbox().receive(ReceiveMode::non_blocking()).status, Status::OwnershipError);
   });

   EXPECT_EQ(owner.mailbox().size(), 1u);
   EXPECT_EQ(hook.terminated, (std::vector<Task*>{&sender}));
}

TEST_F(MailboxTest, ReceiveOutsideTaskContext)
{
   EXPECT_EQ(receive_message(ReceiveMode::non_blocking()).status, Status::InvalidArgument);
}

/* ============================================================================
 * Backpressure
 * ========================================================================= */

TEST_F(MailboxTest, DropPolicyDiscardsAndCounts)
{
   Task dropper(1, Mailbox::Options{.high_water_mark = 2, .policy = BackpressurePolicy::Drop});
   auto& box = dropper.mailbox();

   hook.as(sender, [&] {
      EXPECT_EQ(box.send(tagged(1), 0), Status::Ok);
      EXPECT_EQ(box.send(tagged(2), 9), Status::Ok);
      EXPECT_EQ(box.send(tagged(3), 31), Status::MessageDropped);
   });

   EXPECT_EQ(box.dropped_count(), 1u);
   EXPECT_EQ(box.size(), 2u);
   EXPECT_EQ(hook.suspend_calls, 0);
   EXPECT_EQ(drain_tags(dropper), (std::vector<std::uint32_t>{2, 1}));

   // Room again
   EXPECT_EQ(box.try_send(tagged(4), 0), Status::Ok);
   EXPECT_EQ(box.dropped_count(), 1u);
}

TEST_F(MailboxTest, BlockPolicyTrySendOnFullMailbox)
{
   Task small(1, Mailbox::Options{.high_water_mark = 1, .policy = BackpressurePolicy::Block});
   auto& box = small.mailbox();

   ASSERT_EQ(box.try_send(tagged(1), 0), Status::Ok);
   EXPECT_EQ(box.try_send(tagged(2), 0), Status::MailboxFull);

   // The owner sending to itself never waits
   hook.as(small, [&] { EXPECT_EQ(box.send(tagged(3), 0), Status::MailboxFull); });

   EXPECT_EQ(box.size(), 1u);
   EXPECT_EQ(box.dropped_count(), 0u);
   EXPECT_EQ(hook.suspend_calls, 0);
}

TEST_F(MailboxTest, BlockedSenderTimesOut)
{
   Task small(1, Mailbox::Options{.high_water_mark = 1, .policy = BackpressurePolicy::Block});
   ASSERT_EQ(small.mailbox().try_send(tagged(1), 0), Status::Ok);

   TimePoint const deadline = after(40);
   hook.as(sender, [&] { EXPECT_EQ(small.mailbox().send(tagged(2), 0, deadline), Status::TimedOut); });

   EXPECT_GE(now().value, deadline.value);
   EXPECT_EQ(hook.last_reason, SuspendReason::MailboxSend);
   EXPECT_EQ(small.mailbox().blocked_senders(), 0u);
   EXPECT_EQ(small.mailbox().size(), 1u);
}

TEST_F(MailboxTest, BlockedSenderResumesWhenOwnerMakesRoom)
{
   Task small(1, Mailbox::Options{.high_water_mark = 1, .policy = BackpressurePolicy::Block});
   ASSERT_EQ(small.mailbox().try_send(tagged(1), 0), Status::Ok);

   std::uint32_t received = 0;
   hook.on_suspend = [&](Task& self) {
      EXPECT_EQ(&self, &sender);
      EXPECT_EQ(small.mailbox().blocked_senders(), 1u);
      hook.as(small, [&] {
         auto result = small.mailbox().receive(ReceiveMode::non_blocking());
         ASSERT_TRUE(result.ok());
         received = result.message.tag;
      });
   };

   hook.as(sender, [&] { EXPECT_EQ(small.mailbox().send(tagged(2), 0), Status::Ok); });

   EXPECT_EQ(received, 1u);
   EXPECT_EQ(hook.resumed, (std::vector<Task*>{&sender}));
   EXPECT_EQ(drain_tags(small), (std::vector<std::uint32_t>{2}));
}

TEST_F(MailboxTest, BlockedSendersAreAdmittedInArrivalOrder)
{
   Task small(1, Mailbox::Options{.high_water_mark = 1, .policy = BackpressurePolicy::Block});
   Task late(3);
   auto& box = small.mailbox();
   ASSERT_EQ(box.try_send(tagged(0), 0), Status::Ok);

   std::vector<std::uint32_t> tags;
   hook.on_suspend = [&](Task& self) {
      if (&self == &sender) {
         hook.as(late, [&] { EXPECT_EQ(box.send(tagged(2), 0), Status::Ok); });
         return;
      }

      // Both senders parked, sender first
      EXPECT_EQ(box.blocked_senders(), 2u);
      hook.as(small, [&] {
         Message signal = signal_message(SignalCode::TerminateRequest);
         signal.tag = 99;
         ASSERT_EQ(box.try_send(signal, config::MAX_MESSAGE_PRIORITY), Status::Ok);

         // Taking the signal frees no normal slot, so nobody is admitted yet
         auto first = box.receive(ReceiveMode::non_blocking());
         ASSERT_TRUE(first.ok());
         tags.push_back(first.message.tag);
         EXPECT_EQ(box.blocked_senders(), 2u);

         while (true) {
            auto result = box.receive(ReceiveMode::non_blocking());
            if (!result.ok()) break;
            tags.push_back(result.message.tag);
         }
      });
   };

   hook.as(sender, [&] { EXPECT_EQ(box.send(tagged(1), 0), Status::Ok); });

   EXPECT_EQ(tags, (std::vector<std::uint32_t>{99, 0, 1, 2}));
   EXPECT_EQ(hook.resumed, (std::vector<Task*>{&sender, &late}));
   EXPECT_EQ(box.blocked_senders(), 0u);
   EXPECT_EQ(box.size(), 0u);
}

TEST_F(MailboxTest, KilledSenderKeepsAlreadyAdmittedMessage)
{
   Task small(1, Mailbox::Options{.high_water_mark = 1, .policy = BackpressurePolicy::Block});
   auto& box = small.mailbox();
   ASSERT_EQ(box.try_send(tagged(1), 0), Status::Ok);

   // The owner makes room, admitting the blocked message, then the sender dies
   hook.on_suspend = [&](Task&) {
      hook.as(small, [&] { ASSERT_TRUE(box.receive(ReceiveMode::non_blocking()).ok()); });
      sender.cancel_wait();
      throw AbandonWait{};
   };

   EXPECT_THROW(hook.as(sender, [&] { (void)box.send(tagged(2), 0); }), AbandonWait);
   hook.on_suspend = nullptr;

   EXPECT_EQ(sender.waiting_on(), nullptr);
   EXPECT_EQ(box.blocked_senders(), 0u);
   EXPECT_EQ(box.size(), 1u);
   EXPECT_EQ(box.try_send(tagged(3), 0), Status::MailboxFull);
   EXPECT_EQ(drain_tags(small), (std::vector<std::uint32_t>{2}));
   EXPECT_EQ(box.try_send(tagged(4), 0), Status::Ok);
}

TEST_F(MailboxTest, HighWaterMarkIsClamped)
{
   Task big(1, Mailbox::Options{.high_water_mark = 1000, .policy = BackpressurePolicy::Drop});
   EXPECT_EQ(big.mailbox().high_water_mark(), config::MAILBOX_CAPACITY);
   EXPECT_EQ(big.mailbox().policy(), BackpressurePolicy::Drop);
}

/* ============================================================================
 * Signals
 * ========================================================================= */

TEST_F(MailboxTest, SignalsBypassHighWaterMark)
{
   Task dropper(1, Mailbox::Options{.high_water_mark = 1, .policy = BackpressurePolicy::Drop});
   auto& box = dropper.mailbox();

   ASSERT_EQ(box.try_send(tagged(1), 31), Status::Ok);
   ASSERT_EQ(box.try_send(tagged(2), 0), Status::MessageDropped);

   EXPECT_EQ(box.try_send(signal_message(SignalCode::PageFault), 31), Status::Ok);
   EXPECT_EQ(box.size(), 2u);
   EXPECT_EQ(box.dropped_count(), 1u);

   hook.as(dropper, [&] {
      // Same priority: arrival order
      auto first = box.receive(ReceiveMode::non_blocking());
      EXPECT_EQ(first.message.kind, MessageKind::Normal);

      auto second = box.receive(ReceiveMode::non_blocking());
      EXPECT_EQ(second.message.kind, MessageKind::Signal);
      ASSERT_TRUE(second.message.code.has_value());
      EXPECT_EQ(*second.message.code, SignalCode::PageFault);
   });
}

TEST_F(MailboxTest, SignalReserveCanRunOut)
{
   auto& box = owner.mailbox();
   for (std::size_t i = 0; i < config::MAILBOX_CAPACITY; ++i) {
      ASSERT_EQ(box.try_send(tagged(static_cast<std::uint32_t>(i)), 0), Status::Ok);
   }
   for (std::size_t i = 0; i < config::SIGNAL_RESERVE; ++i) {
      ASSERT_EQ(box.try_send(signal_message(SignalCode::Breakpoint), 31), Status::Ok);
   }

   EXPECT_EQ(box.try_send(signal_message(SignalCode::Breakpoint), 31), Status::ResourceExhausted);
   EXPECT_EQ(box.try_send(tagged(99), 0), Status::MailboxFull);
   EXPECT_EQ(box.size(), config::MAILBOX_CAPACITY + config::SIGNAL_RESERVE);
}

/* ============================================================================
 * Destinations
 * ========================================================================= */

TEST_F(MailboxTest, TerminatedDestinationIsNoSuchTask)
{
   owner.set_state(Task::State::Terminated);
   EXPECT_EQ(send_message(owner, tagged(1), 0), Status::NoSuchTask);
   EXPECT_EQ(owner.mailbox().size(), 0u);
}

TEST_F(MailboxTest, ProcessDeliveryPicksLeastLoadedThread)
{
   Task low(1);
   Task high_a(5);
   Task high_b(5);

   Process process(7);
   ASSERT_EQ(process.add_thread(low), Status::Ok);
   ASSERT_EQ(process.add_thread(high_b), Status::Ok);
   ASSERT_EQ(process.add_thread(high_a), Status::Ok);
   EXPECT_EQ(process.thread_count(), 3u);

   // Equal load: highest priority, then lowest id
   EXPECT_EQ(process.select_thread(), &high_a);

   for (std::uint32_t i = 0; i < 4; ++i) {
      ASSERT_EQ(send_message(process, tagged(i), 0), Status::Ok);
   }

   EXPECT_EQ(high_a.mailbox().size(), 2u);
   EXPECT_EQ(high_b.mailbox().size(), 1u);
   EXPECT_EQ(low.mailbox().size(), 1u);
   EXPECT_EQ(drain_tags(high_a), (std::vector<std::uint32_t>{0, 3}));
   EXPECT_EQ(drain_tags(high_b), (std::vector<std::uint32_t>{1}));
   EXPECT_EQ(drain_tags(low), (std::vector<std::uint32_t>{2}));
}

TEST_F(MailboxTest, ProcessDeliverySkipsTerminatedThreads)
{
   Task first(9);
   Task second(1);

   Process process(1);
   ASSERT_EQ(process.add_thread(first), Status::Ok);
   ASSERT_EQ(process.add_thread(second), Status::Ok);

   first.set_state(Task::State::Terminated);
   EXPECT_EQ(process.select_thread(), &second);

   second.set_state(Task::State::Terminated);
   EXPECT_EQ(process.select_thread(), nullptr);
   EXPECT_EQ(send_message(process, tagged(1), 0), Status::NoSuchTask);
}

TEST_F(MailboxTest, ThreadBelongsToOneProcess)
{
   Task thread(1);
   Process first(1);
   Process second(2);

   ASSERT_EQ(first.add_thread(thread), Status::Ok);
   EXPECT_EQ(second.add_thread(thread), Status::InvalidArgument);
   EXPECT_EQ(thread.process(), &first);

   first.remove_thread(thread);
   EXPECT_EQ(thread.process(), nullptr);
   EXPECT_EQ(first.thread_count(), 0u);
   EXPECT_EQ(second.add_thread(thread), Status::Ok);
}
