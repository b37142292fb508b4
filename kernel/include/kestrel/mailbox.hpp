/**
 * @file mailbox.hpp
 * @brief Per-task priority inbox with backpressure
 *
 * Messages dequeue by priority (highest first), FIFO within a priority.
 * Once a mailbox holds high_water_mark normal messages, the policy decides:
 * Block suspends the sender until the owner makes room, Drop discards the
 * message and counts it. Signal messages skip the high-water mark and use a
 * small reserve of extra slots, so they are never dropped.
 */

#ifndef KESTREL_MAILBOX_HPP
#define KESTREL_MAILBOX_HPP

#include "kestrel/kernel.hpp"
#include "kestrel/message.hpp"
#include "kestrel/wait_queue.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace kestrel
{

class Process;

enum class BackpressurePolicy : std::uint8_t
{
   Block,
   Drop,
};

/**
 * @brief Fixed-slot priority queue of messages (not synchronised)
 *
 * One FIFO per priority level, threaded through the slot array, and a bitmap
 * of non-empty levels for O(1) pop.
 */
class MessageQueue
{
public:
   static constexpr std::size_t CAPACITY = config::MAILBOX_CAPACITY + config::SIGNAL_RESERVE;
   static constexpr std::size_t PRIORITY_LEVELS = config::MAX_MESSAGE_PRIORITY + 1u;

   MessageQueue() noexcept;

   /**
    * @return false if every slot is in use
    */
   bool push(Message const& message) noexcept;
   bool pop(Message& out) noexcept;
   void clear() noexcept;

   [[nodiscard]] std::size_t size()         const noexcept { return normal + signals; }
   [[nodiscard]] std::size_t normal_count() const noexcept { return normal; }
   [[nodiscard]] std::size_t signal_count() const noexcept { return signals; }
   [[nodiscard]] bool        empty()        const noexcept { return size() == 0; }
   [[nodiscard]] bool        full()         const noexcept { return free_mask == 0; }

private:
   using Index = std::uint8_t;
   static constexpr Index NONE = 0xFF;
   static constexpr std::uint64_t ALL_SLOTS_FREE = (CAPACITY == 64) ? ~std::uint64_t{0} : (std::uint64_t{1} << CAPACITY) - 1u;

   struct Slot
   {
      Message message{};
      Index next{NONE};
   };

   std::array<Slot, CAPACITY> slots{};
   std::array<Index, PRIORITY_LEVELS> heads{};
   std::array<Index, PRIORITY_LEVELS> tails{};
   std::uint64_t free_mask{ALL_SLOTS_FREE};
   std::uint32_t ready_bitmap{0};
   std::size_t normal{0};
   std::size_t signals{0};
};

class Mailbox
{
public:
   struct Options
   {
      std::size_t high_water_mark{config::MAILBOX_CAPACITY};  // clamped to MAILBOX_CAPACITY
      BackpressurePolicy policy{BackpressurePolicy::Block};
   };

   explicit Mailbox(Task& owner) noexcept;
   Mailbox(Task& owner, Options options) noexcept;

   /**
    * @brief Pending messages are discarded
    */
   ~Mailbox();

   Mailbox(Mailbox const&)            = delete;
   Mailbox& operator=(Mailbox const&) = delete;

   /**
    * @brief Insert by (priority desc, arrival asc)
    * @param priority 0..config::MAX_MESSAGE_PRIORITY
    * @param deadline Give up waiting for room after this (Block policy)
    * @return Ok, MessageDropped, MailboxFull (caller cannot wait), TimedOut,
    *         ResourceExhausted, InvalidArgument
    *
    * A sender outside task context, or the owner sending to itself, never
    * waits: a full Block-policy mailbox returns MailboxFull. Blocked senders
    * are admitted in arrival order as the owner frees room, and a new normal
    * message never overtakes them.
    */
   [[nodiscard]] Status send(Message message, std::uint8_t priority, TimePoint deadline = TimePoint::max());

   /**
    * @brief send() that never suspends
    */
   [[nodiscard]] Status try_send(Message message, std::uint8_t priority);

   /**
    * @brief Dequeue the highest-priority, oldest message (owner only)
    * @return Ok with the message, Empty, TimedOut, OwnershipError
    */
   [[nodiscard]] ReceiveResult receive(ReceiveMode mode);

   [[nodiscard]] Task&              owner()           const noexcept { return owner_task; }
   [[nodiscard]] std::size_t        size()            const noexcept { return queued.load(std::memory_order_acquire); }
   [[nodiscard]] std::uint64_t      dropped_count()   const noexcept { return dropped.load(std::memory_order_relaxed); }
   [[nodiscard]] std::size_t        high_water_mark() const noexcept { return options.high_water_mark; }
   [[nodiscard]] BackpressurePolicy policy()          const noexcept { return options.policy; }
   [[nodiscard]] std::size_t        blocked_senders() const noexcept;

private:
   Status deliver(Message& message, std::uint8_t priority, TimePoint deadline, bool may_block);

   // Both run under the critical section
   void published(Message const& message);
   void admit_blocked_senders();

   Task& owner_task;
   Options options;

   mutable Spinlock guard;
   MessageQueue queue;
   WaitQueue receivers{guard};
   WaitQueue senders{guard};
   std::atomic<std::size_t> queued{0};
   std::atomic<std::uint64_t> dropped{0};
};

/**
 * @brief Send to a task's mailbox
 * @return NoSuchTask if the destination has terminated, else as Mailbox::send()
 */
[[nodiscard]] Status send_message(Task& destination, Message message, std::uint8_t priority);

/**
 * @brief Send to a multi-threaded target, placed by Process::select_thread()
 */
[[nodiscard]] Status send_message(Process& destination, Message message, std::uint8_t priority);

/**
 * @brief Receive on the calling task's own mailbox
 */
[[nodiscard]] ReceiveResult receive_message(ReceiveMode mode);

} // namespace kestrel

#endif // KESTREL_MAILBOX_HPP
