/**
 * @file wait_queue.hpp
 * @brief FIFO of tasks blocked on one Lock or Mailbox
 *
 * Wait nodes live in a fixed pool owned by the queue and are linked by slot
 * index, so neither tasks nor nodes own each other. A node's atomic claimed
 * flag settles the race between grant, timeout and teardown: exactly one of
 * them wins and records the outcome.
 *
 * Every member except cancel() expects the caller to hold the owning
 * object's critical section (the Spinlock passed at construction).
 */

#ifndef KESTREL_WAIT_QUEUE_HPP
#define KESTREL_WAIT_QUEUE_HPP

#include "kestrel/kernel.hpp"
#include "kestrel/scheduler_hook.hpp"

#include <array>
#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace kestrel
{

class WaitQueue
{
public:
   using Slot = std::uint8_t;
   static constexpr Slot NO_SLOT = std::numeric_limits<Slot>::max();

   enum class Outcome : std::uint8_t
   {
      Pending,
      Granted,    // woken by release/send/receive
      TimedOut,   // deadline passed before anyone claimed the node
      Cancelled,  // task torn down while waiting
   };

   explicit WaitQueue(Spinlock& guard) noexcept : guard(guard) {}
   ~WaitQueue();

   WaitQueue(WaitQueue const&)            = delete;
   WaitQueue& operator=(WaitQueue const&) = delete;

   /**
    * @brief Append the task at the tail and mark it Blocked
    * @param payload Opaque per-waiter data for whoever claims the node
    * @return The node slot, or NO_SLOT when the pool is exhausted
    */
   [[nodiscard]] Slot enqueue(Task& task, void* payload = nullptr) noexcept;

   /**
    * @brief Claim and unlink the head waiter as Granted, without waking it
    * @return The granted task, nullptr if nobody waits
    *
    * The caller publishes whatever the waiter was granted, then calls wake().
    */
   [[nodiscard]] Task* claim_head() noexcept;

   /**
    * @brief Make a claimed waiter runnable through the scheduler hook
    */
   void wake(Task& task);

   /**
    * @brief Block the calling task on its node until claimed or deadline
    * @param cs The owning object's critical section, held on entry and exit
    *
    * The critical section is dropped around each suspension. The node is
    * back in the pool when this returns.
    */
   Outcome wait(CriticalSection& cs, Slot slot, SuspendReason reason, TimePoint deadline);

   /**
    * @brief Teardown: remove a task that will never run again
    *
    * Takes the critical section itself. A node already claimed keeps its
    * outcome (a granted lock stays with the dead task).
    */
   void cancel(Task& task) noexcept;

   [[nodiscard]] bool        empty()      const noexcept { return head_slot == NO_SLOT; }
   [[nodiscard]] std::size_t size()       const noexcept { return count; }
   [[nodiscard]] std::size_t free_slots() const noexcept { return std::popcount(free_mask); }
   [[nodiscard]] static constexpr std::size_t capacity() noexcept { return N; }

   /**
    * @brief Head waiter (oldest), nullptr if empty
    */
   [[nodiscard]] Task* front() const noexcept;

   /**
    * @brief Payload the head waiter enqueued with, nullptr if empty
    *
    * Only valid under the critical section, while the node is still linked.
    */
   [[nodiscard]] void* front_payload() const noexcept;

   /**
    * @brief Visit waiters in FIFO order
    */
   template<typename Fn>
   void for_each_waiter(Fn&& fn) const
   {
      for (Slot slot = head_slot; slot != NO_SLOT; slot = nodes[slot].next) {
         fn(*nodes[slot].task);
      }
   }

private:
   static constexpr std::size_t N = config::MAX_WAITERS_PER_OBJECT;
   static constexpr uint32_t ALL_NODES_FREE = (N == 32) ? std::numeric_limits<uint32_t>::max() : (1u << static_cast<uint32_t>(N)) - 1u;

   struct WaitNode
   {
      Slot slot{NO_SLOT};
      bool active{false};
      bool linked{false};

      // FIFO links, by slot
      Slot next{NO_SLOT};
      Slot prev{NO_SLOT};

      std::atomic<bool> claimed{false};
      Outcome outcome{Outcome::Pending};

      Task* task{nullptr};
      void* payload{nullptr};
      TimePoint enqueued_at{};
   };

   WaitNode* alloc(Task& task) noexcept;
   void free(WaitNode& node) noexcept;
   void link_tail(WaitNode& node) noexcept;
   void unlink(WaitNode& node) noexcept;
   bool claim(WaitNode& node, Outcome outcome) noexcept;

   Spinlock& guard;
   std::array<WaitNode, N> nodes{};
   uint32_t free_mask{ALL_NODES_FREE};
   Slot head_slot{NO_SLOT};
   Slot tail_slot{NO_SLOT};
   std::size_t count{0};
};

} // namespace kestrel

#endif // KESTREL_WAIT_QUEUE_HPP
