/**
 * @file sim_scheduler.hpp
 * @brief Simulated multi-CPU scheduler implementing the scheduler hook
 *
 * One FIFO ready queue per simulated CPU, fed through the CPU's request
 * inbox. Tasks are pinned at spawn time and run on port contexts.
 *
 * - Deterministic: step() pumps every CPU once, in index order, on the
 *   calling host thread. Virtual time only moves when the test moves it.
 * - Threaded: run_threaded() gives every CPU its own host thread.
 */

#ifndef KESTREL_SIM_SCHEDULER_HPP
#define KESTREL_SIM_SCHEDULER_HPP

#include "kestrel/cpu.hpp"
#include "kestrel/kernel.hpp"
#include "kestrel/scheduler_hook.hpp"
#include "kestrel/task.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace kestrel::sim
{

class SimScheduler final : public ISchedulerHook
{
public:
   enum class Mode : std::uint8_t
   {
      Deterministic,
      Threaded,
   };

   /**
    * @brief Installs itself, the CPU table and time into the kernel registry
    */
   SimScheduler(Mode mode, std::uint32_t cpu_count, ITimeDriver& time);
   ~SimScheduler() override;

   [[nodiscard]] Task* current() noexcept override;
   void suspend_current(SuspendReason reason, TimePoint wake_at) override;
   void resume(Task& task) override;
   void terminate(Task& task) override;
   void relax() override;

   /**
    * @brief Give the task a context and make it runnable
    * @return InvalidArgument without entry/stack or allowed CPU,
    *         ResourceExhausted if the CPU inbox is full
    */
   [[nodiscard]] Status spawn(Task& task, CoreAffinity affinity = AnyCpu);

   /**
    * @brief Tear a task down on the calling host thread (scheduler stopped)
    *
    * Unwinds the task's stack if it is still alive. Idempotent.
    */
   void retire(Task& task);

   /**
    * @brief Voluntarily give up the CPU, stays runnable
    */
   void yield();

   /**
    * @brief Kill every thread of a process, wherever it is pinned
    */
   void kill_process(Process& process);

   /**
    * @brief Deterministic mode: run one dispatch on every CPU
    * @return true if anything ran or any request was handled
    */
   bool step();

   /**
    * @brief Threaded mode: run every CPU on its own host thread
    * @return true if every task finished before the time limit
    */
   bool run_threaded(std::chrono::milliseconds limit);

   [[nodiscard]] std::size_t   live_tasks() const noexcept { return live.load(std::memory_order_acquire); }
   [[nodiscard]] std::uint32_t cpu_count()  const noexcept { return cpu_total; }
   [[nodiscard]] Mode          mode()       const noexcept { return run_mode; }

private:
   class RunQueue
   {
   public:
      [[nodiscard]] bool empty() const noexcept { return !head; }
      [[nodiscard]] std::size_t size() const noexcept;
      void push_back(Task* task) noexcept;
      Task* pop_front() noexcept;
      void remove(Task* task) noexcept;

   private:
      Task* head{nullptr};
      Task* tail{nullptr};
   };

   struct CpuRuntime
   {
      std::atomic<Task*> current{nullptr};
      RunQueue ready;
   };

   static void task_launcher(void* arg);
   static void deadline_expired(void* arg);

   bool dispatch_one(std::uint32_t cpu);
   void handle_request(std::uint32_t cpu, CpuRequest const& request);
   void make_ready(CpuRuntime& runtime, Task& task) noexcept;
   void reap(Task& task);

   Mode run_mode;
   std::uint32_t cpu_total;
   ITimeDriver& time;
   std::array<CpuRuntime, config::MAX_CPUS> runtimes{};
   std::atomic<std::size_t> live{0};
   std::atomic<bool> stop_requested{false};
};

} // namespace kestrel::sim

#endif // KESTREL_SIM_SCHEDULER_HPP
