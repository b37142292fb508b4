/**
 * @file task.hpp
 * @brief Task (schedulable unit) and Process (multi-threaded target)
 *
 * Tasks are created by the scheduler and own their Mailbox and SignalTable.
 * The kernel core only drives the Blocked <-> Ready edge of the state machine;
 * everything else belongs to the scheduler.
 */

#ifndef KESTREL_TASK_HPP
#define KESTREL_TASK_HPP

#include "kestrel/kernel.hpp"
#include "kestrel/mailbox.hpp"
#include "kestrel/signal.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace kestrel
{

class WaitQueue;
class Process;

class Task
{
public:
   using Priority = std::uint8_t;  // higher is more urgent
   using EntryFn  = Function<void(), 48>;

   enum class State : std::uint8_t
   {
      Ready,
      Running,
      Blocked,
      Spinning,   // busy-waiting for a lock
      Terminated,
   };

   /**
    * @brief A task without an execution context (driven by a test or a host)
    */
   explicit Task(Priority priority) noexcept;
   Task(Priority priority, Mailbox::Options mailbox_options) noexcept;

   /**
    * @brief A task the scheduler runs on its own stack
    */
   Task(EntryFn&& entry, std::span<std::byte> stack, Priority priority) noexcept;
   Task(EntryFn&& entry, std::span<std::byte> stack, Priority priority, Mailbox::Options mailbox_options) noexcept;

   ~Task();

   Task(Task const&)            = delete;
   Task& operator=(Task const&) = delete;

   [[nodiscard]] TaskId   id()       const noexcept { return task_id; }
   [[nodiscard]] Priority priority() const noexcept { return task_priority; }
   [[nodiscard]] State    state()    const noexcept { return current_state.load(std::memory_order_acquire); }
   void set_state(State state) noexcept { current_state.store(state, std::memory_order_release); }

   /**
    * @brief The single Blocked -> Ready transition
    * @return false if the task was not blocked (already resumed)
    */
   bool mark_runnable() noexcept;

   /**
    * @brief Linear index of the CPU this task is pinned to
    */
   [[nodiscard]] std::uint32_t cpu() const noexcept { return owning_cpu.load(std::memory_order_acquire); }

   [[nodiscard]] Mailbox&       mailbox()       noexcept { return inbox; }
   [[nodiscard]] Mailbox const& mailbox() const noexcept { return inbox; }
   [[nodiscard]] SignalTable&   signal_table()  noexcept { return signal_dispositions; }
   [[nodiscard]] Process*       process() const noexcept { return owning_process; }

   /**
    * @brief Wait queue this task is blocked on, if any
    */
   [[nodiscard]] WaitQueue* waiting_on() const noexcept { return blocked_on.load(std::memory_order_acquire); }

   /**
    * @brief Teardown: leave whatever wait queue the task is blocked on
    */
   void cancel_wait() noexcept;

   [[nodiscard]] EntryFn& entry() noexcept { return entry_fn; }
   [[nodiscard]] std::span<std::byte> stack() const noexcept { return stack_region; }

   // Opaque, in-place port context storage
   [[nodiscard]] auto*       context()       noexcept { return reinterpret_cast<kestrel_port_context_t*      >(context_storage.data()); }
   [[nodiscard]] auto const* context() const noexcept { return reinterpret_cast<kestrel_port_context_t const*>(context_storage.data()); }

   /**
    * @brief Scratch space owned by the external scheduler
    */
   struct SchedulerLinks
   {
      Task* next{nullptr};
      Task* prev{nullptr};
      bool  queued{false};
      bool  context_live{false};
      bool  reaped{false};
      ITimeDriver::Handle deadline{};
      std::atomic<std::uint64_t> wake_at{TimePoint::max().value};
   } sched;

private:
   friend class WaitQueue;
   friend class CpuTable;
   friend class Process;

   TaskId task_id;
   Priority task_priority;
   std::atomic<State> current_state{State::Ready};
   std::atomic<std::uint32_t> owning_cpu{0};
   bool pinned{false};

   std::atomic<WaitQueue*> blocked_on{nullptr};
   std::uint8_t wait_slot{0xFF};

   Process* owning_process{nullptr};

   EntryFn entry_fn;
   std::span<std::byte> stack_region;

   Mailbox inbox;
   SignalTable signal_dispositions;

   alignas(KESTREL_PORT_CONTEXT_ALIGN) std::array<std::byte, KESTREL_PORT_CONTEXT_SIZE> context_storage{};
};

[[nodiscard]] constexpr std::string_view to_string(Task::State state) noexcept
{
   switch (state) {
      case Task::State::Ready:      return "Ready";
      case Task::State::Running:    return "Running";
      case Task::State::Blocked:    return "Blocked";
      case Task::State::Spinning:   return "Spinning";
      case Task::State::Terminated: return "Terminated";
   }
   return "???";
}

/**
 * @brief Thread group of one multi-threaded delivery target
 */
class Process
{
public:
   using Id = std::uint32_t;

   explicit Process(Id id) noexcept : process_id(id) {}
   ~Process();

   Process(Process const&)            = delete;
   Process& operator=(Process const&) = delete;

   [[nodiscard]] Id id() const noexcept { return process_id; }

   /**
    * @return ResourceExhausted when full, InvalidArgument if the task already
    *         belongs to a process
    */
   [[nodiscard]] Status add_thread(Task& task) noexcept;
   void remove_thread(Task& task) noexcept;

   [[nodiscard]] std::size_t thread_count() const noexcept;
   [[nodiscard]] Task* thread(std::size_t index) const noexcept;

   /**
    * @brief Deterministic delivery placement
    *
    * Live thread with the fewest queued messages; ties go to the highest
    * priority, then the lowest task id. nullptr if no thread is alive.
    */
   [[nodiscard]] Task* select_thread() const noexcept;

private:
   Id process_id;
   mutable Spinlock guard;
   std::array<Task*, config::MAX_THREADS_PER_PROCESS> threads{};
   std::size_t count{0};
};

} // namespace kestrel

#endif // KESTREL_TASK_HPP
