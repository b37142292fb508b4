/**
 * @file test_lock.cpp
 * @brief Unit tests for Lock against a scripted scheduler hook
 *
 * Contention across real execution contexts is covered by the simulation
 * tests; here every suspension is scripted.
 */

#include "kestrel/lock.hpp"
#include "mock/mock_scheduler_hook.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace kestrel;
using kestrel::test::KernelTest;

// Thrown from a scripted suspension to abandon a wait, as a kill would
struct AbandonWait {};

class LockTest : public KernelTest
{
protected:
   Task a{1};
   Task b{2};
   Task c{3};
};

/* ============================================================================
 * Ownership
 * ========================================================================= */

TEST_F(LockTest, FreeLockIsTakenImmediately)
{
   Lock lock;
   hook.set_current(&a);

   EXPECT_EQ(lock.acquire(), Status::Ok);
   EXPECT_EQ(lock.holder(), &a);
   EXPECT_EQ(lock.depth(), 1u);
   EXPECT_EQ(hook.suspend_calls, 0);
   EXPECT_EQ(hook.relax_calls, 0);

   EXPECT_EQ(lock.release(), Status::Ok);
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(LockTest, ReleaseWithNoWaitersLeavesItFree)
{
   Lock lock;

   hook.as(a, [&] {
      ASSERT_EQ(lock.acquire(), Status::Ok);
      ASSERT_EQ(lock.release(), Status::Ok);
   });

   // Next comer gets it on the fast path
   hook.as(b, [&] { EXPECT_EQ(lock.acquire(), Status::Ok); });
   EXPECT_EQ(lock.holder(), &b);
   EXPECT_EQ(hook.relax_calls, 0);
   EXPECT_TRUE(hook.resumed.empty());

   hook.as(b, [&] { (void)lock.release(); });
}

TEST_F(LockTest, NoTaskContextIsRejected)
{
   Lock lock;
   EXPECT_EQ(lock.acquire(), Status::InvalidArgument);
   EXPECT_EQ(lock.try_acquire(), Status::InvalidArgument);
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(LockTest, TryAcquireNeverWaits)
{
   Lock lock;
   hook.as(a, [&] { ASSERT_EQ(lock.try_acquire(), Status::Ok); });

   hook.as(b, [&] { EXPECT_EQ(lock.try_acquire(), Status::WouldBlock); });
   EXPECT_EQ(lock.holder(), &a);
   EXPECT_EQ(lock.waiter_count(), 0u);
   EXPECT_EQ(hook.suspend_calls, 0);
   EXPECT_EQ(hook.relax_calls, 0);

   hook.as(a, [&] { (void)lock.release(); });
}

/* ============================================================================
 * Misuse
 * ========================================================================= */

TEST_F(LockTest, ReleaseByNonHolderIsOwnershipError)
{
   Lock lock;
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   hook.as(b, [&] { EXPECT_EQ(lock.release(), Status::OwnershipError); });

   // Lock untouched, offender terminated
   EXPECT_EQ(lock.holder(), &a);
   EXPECT_EQ(lock.depth(), 1u);
   EXPECT_EQ(hook.terminated, (std::vector<Task*>{&b}));

   hook.as(a, [&] { EXPECT_EQ(lock.release(), Status::Ok); });
}

TEST_F(LockTest, ReleaseOfFreeLockIsOwnershipError)
{
   Lock lock;
   hook.as(a, [&] { EXPECT_EQ(lock.release(), Status::OwnershipError); });
   EXPECT_FALSE(lock.is_locked());
   EXPECT_EQ(hook.terminated, (std::vector<Task*>{&a}));
}

TEST_F(LockTest, NonReentrantSelfAcquireIsDeadlockError)
{
   Lock lock;
   hook.set_current(&a);
   ASSERT_EQ(lock.acquire(), Status::Ok);

   EXPECT_EQ(lock.acquire(), Status::DeadlockError);
   EXPECT_EQ(lock.try_acquire(), Status::DeadlockError);

   EXPECT_EQ(lock.holder(), &a);
   EXPECT_EQ(lock.depth(), 1u);
   EXPECT_EQ(hook.terminated, (std::vector<Task*>{&a, &a}));
   EXPECT_EQ(hook.suspend_calls, 0);

   EXPECT_EQ(lock.release(), Status::Ok);
}

TEST_F(LockTest, ReentrantLockCountsNesting)
{
   Lock lock(Lock::Options{.spin_budget = 0, .reentrant = true});
   hook.set_current(&a);

   ASSERT_EQ(lock.acquire(), Status::Ok);
   ASSERT_EQ(lock.acquire(), Status::Ok);
   ASSERT_EQ(lock.try_acquire(), Status::Ok);
   EXPECT_EQ(lock.depth(), 3u);

   EXPECT_EQ(lock.release(), Status::Ok);
   EXPECT_EQ(lock.release(), Status::Ok);
   EXPECT_EQ(lock.holder(), &a);

   EXPECT_EQ(lock.release(), Status::Ok);
   EXPECT_FALSE(lock.is_locked());
   EXPECT_TRUE(hook.terminated.empty());
}

/* ============================================================================
 * Contention
 * ========================================================================= */

TEST_F(LockTest, SpinnerTakesLockReleasedDuringSpin)
{
   Lock lock;
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   hook.on_relax = [&] {
      EXPECT_TRUE(lock.has_spinner());
      if (hook.relax_calls == 3) hook.as(a, [&] { (void)lock.release(); });
   };

   hook.as(b, [&] { EXPECT_EQ(lock.acquire(), Status::Ok); });

   EXPECT_EQ(lock.holder(), &b);
   EXPECT_EQ(hook.relax_calls, 3);
   EXPECT_EQ(hook.suspend_calls, 0);
   EXPECT_FALSE(lock.has_spinner());
   EXPECT_EQ(b.state(), Task::State::Running);

   hook.as(b, [&] { (void)lock.release(); });
}

TEST_F(LockTest, ExhaustedSpinBudgetQueues)
{
   Lock lock(Lock::Options{.spin_budget = 5, .reentrant = false});
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   hook.on_suspend = [&](Task& self) {
      EXPECT_EQ(&self, &b);
      EXPECT_EQ(lock.waiter_count(), 1u);
      EXPECT_FALSE(lock.has_spinner());
      hook.as(a, [&] { EXPECT_EQ(lock.release(), Status::Ok); });
   };

   hook.as(b, [&] { EXPECT_EQ(lock.acquire(), Status::Ok); });

   EXPECT_EQ(hook.relax_calls, 5);
   EXPECT_EQ(hook.suspend_calls, 1);
   EXPECT_EQ(hook.last_reason, SuspendReason::LockWait);
   EXPECT_EQ(lock.holder(), &b);
   EXPECT_EQ(hook.resumed, (std::vector<Task*>{&b}));

   hook.as(b, [&] { (void)lock.release(); });
}

TEST_F(LockTest, ReleaseHandsOffToQueueHead)
{
   Lock lock(Lock::Options{.spin_budget = 0, .reentrant = false});
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   Task* owner_seen_at_release = nullptr;
   hook.on_suspend = [&](Task&) {
      hook.as(a, [&] { (void)lock.release(); });
      owner_seen_at_release = lock.holder();

      // A newcomer cannot barge in between hand-off and the waiter running
      hook.as(c, [&] { EXPECT_EQ(lock.try_acquire(), Status::WouldBlock); });
   };

   hook.as(b, [&] { EXPECT_EQ(lock.acquire(), Status::Ok); });

   EXPECT_EQ(owner_seen_at_release, &b);
   EXPECT_EQ(hook.relax_calls, 0);
   hook.as(b, [&] { (void)lock.release(); });
}

TEST_F(LockTest, QueuedWaitersAreServedInArrivalOrder)
{
   Lock lock(Lock::Options{.spin_budget = 0, .reentrant = false});
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   // While b sleeps, c queues behind it and is then abandoned in its wait
   hook.on_suspend = [&](Task& self) {
      if (&self == &c) throw AbandonWait{};

      EXPECT_THROW(hook.as(c, [&] { (void)lock.acquire(); }), AbandonWait);
      EXPECT_EQ(lock.waiter_count(), 2u);

      hook.as(a, [&] { (void)lock.release(); });
      EXPECT_EQ(lock.holder(), &b);
   };

   hook.as(b, [&] { EXPECT_EQ(lock.acquire(), Status::Ok); });
   EXPECT_EQ(lock.holder(), &b);

   // c arrived second, so it is next even though it never ran again
   hook.as(b, [&] { (void)lock.release(); });
   EXPECT_EQ(lock.holder(), &c);
   EXPECT_EQ(hook.resumed, (std::vector<Task*>{&b, &c}));
   EXPECT_EQ(hook.relax_calls, 0);

   c.cancel_wait();
   hook.as(c, [&] { EXPECT_EQ(lock.release(), Status::Ok); });
   EXPECT_FALSE(lock.is_locked());
}

/* ============================================================================
 * Timeouts
 * ========================================================================= */

TEST_F(LockTest, TimeoutReturnsNoEarlierThanDeadline)
{
   Lock lock(Lock::Options{.spin_budget = 0, .reentrant = false});
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   TimePoint const deadline = after(50);
   hook.as(b, [&] { EXPECT_EQ(lock.acquire_timeout(deadline), Status::TimedOut); });

   EXPECT_GE(now().value, deadline.value);
   EXPECT_EQ(lock.waiter_count(), 0u);
   EXPECT_EQ(b.waiting_on(), nullptr);
   EXPECT_EQ(b.state(), Task::State::Running);

   // A later release must not wake the timed-out waiter
   hook.as(a, [&] { EXPECT_EQ(lock.release(), Status::Ok); });
   EXPECT_FALSE(lock.is_locked());
   EXPECT_TRUE(hook.resumed.empty());
}

TEST_F(LockTest, TimeoutWhileSpinning)
{
   Lock lock;
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   // Each spin step burns 10 ticks
   hook.on_relax = [&] { driver.advance_by(Duration{10}); };

   TimePoint const deadline = after(35);
   hook.as(b, [&] { EXPECT_EQ(lock.acquire_timeout(deadline), Status::TimedOut); });

   EXPECT_EQ(hook.relax_calls, 4);
   EXPECT_EQ(hook.suspend_calls, 0);
   EXPECT_FALSE(lock.has_spinner());
   EXPECT_EQ(lock.holder(), &a);

   hook.as(a, [&] { (void)lock.release(); });
}

TEST_F(LockTest, ExpiredDeadlineStillTakesFreeLock)
{
   Lock lock;
   driver.advance_to(TimePoint{100});

   hook.as(a, [&] { EXPECT_EQ(lock.acquire_timeout(TimePoint{10}), Status::Ok); });
   hook.as(a, [&] { (void)lock.release(); });
}

TEST_F(LockTest, GrantRacingTheDeadlineIsKept)
{
   Lock lock(Lock::Options{.spin_budget = 0, .reentrant = false});
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   hook.on_suspend = [&](Task&) {
      hook.as(a, [&] { (void)lock.release(); });
      driver.advance_by(Duration{1000});
   };

   hook.as(b, [&] { EXPECT_EQ(lock.acquire_timeout(after(20)), Status::Ok); });
   EXPECT_EQ(lock.holder(), &b);

   hook.as(b, [&] { (void)lock.release(); });
}

TEST_F(LockTest, CancelledWaiterResumesWithoutTheLock)
{
   Lock lock(Lock::Options{.spin_budget = 0, .reentrant = false});
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   hook.on_suspend = [&](Task& self) { self.cancel_wait(); };

   hook.as(b, [&] { EXPECT_EQ(lock.acquire(), Status::TimedOut); });
   hook.on_suspend = nullptr;

   EXPECT_EQ(b.waiting_on(), nullptr);
   EXPECT_EQ(lock.waiter_count(), 0u);
   EXPECT_EQ(lock.holder(), &a);

   // The freed slot is usable by the next waiter
   hook.on_suspend = [&](Task&) { hook.as(a, [&] { (void)lock.release(); }); };
   hook.as(c, [&] { EXPECT_EQ(lock.acquire(), Status::Ok); });
   EXPECT_EQ(lock.holder(), &c);
}

/* ============================================================================
 * Resource limits and RAII
 * ========================================================================= */

TEST_F(LockTest, FullWaitPoolIsResourceExhausted)
{
   Lock lock(Lock::Options{.spin_budget = 0, .reentrant = false});
   hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });

   std::vector<std::unique_ptr<Task>> waiters;
   for (std::size_t i = 0; i < WaitQueue::capacity(); ++i) {
      waiters.push_back(std::make_unique<Task>(1));
   }

   // Each waiter queues while the previous one sleeps; the last one sees a full pool
   std::size_t queued = 0;
   hook.on_suspend = [&](Task&) {
      ++queued;
      if (queued < waiters.size()) {
         hook.as(*waiters[queued], [&] { (void)lock.acquire(); });
         return;
      }

      hook.as(c, [&] { EXPECT_EQ(lock.acquire(), Status::ResourceExhausted); });
      EXPECT_EQ(c.waiting_on(), nullptr);
      EXPECT_EQ(lock.waiter_count(), WaitQueue::capacity());
      throw AbandonWait{};
   };

   EXPECT_THROW(hook.as(*waiters[0], [&] { (void)lock.acquire(); }), AbandonWait);
   EXPECT_EQ(queued, WaitQueue::capacity());
   EXPECT_EQ(lock.holder(), &a);

   for (auto& waiter : waiters) waiter->cancel_wait();
   EXPECT_EQ(lock.waiter_count(), 0u);

   hook.as(a, [&] { EXPECT_EQ(lock.release(), Status::Ok); });
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(LockTest, LockGuardReleasesOnScopeExit)
{
   Lock lock;
   hook.set_current(&a);
   {
      LockGuard guard(lock);
      EXPECT_TRUE(guard.owns_lock());
      EXPECT_EQ(lock.holder(), &a);
   }
   EXPECT_FALSE(lock.is_locked());
}

TEST_F(LockTest, DestroyingHeldLockIsReported)
{
   testing::internal::CaptureStderr();
   {
      Lock lock;
      hook.as(a, [&] { ASSERT_EQ(lock.acquire(), Status::Ok); });
   }
   std::string const output = testing::internal::GetCapturedStderr();
   EXPECT_NE(output.find("destroyed while held"), std::string::npos);
}
