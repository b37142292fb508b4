/**
 * @file simulation.hpp
 * @brief Embedded-style threads and run loops for the simulated scheduler
 */

#ifndef KESTREL_SIMULATION_HPP
#define KESTREL_SIMULATION_HPP

#include "kestrel/sim_scheduler.hpp"
#include "kestrel/task.hpp"
#include "kestrel/time_driver_simulation.hpp"

#include <cstddef>
#include <span>

namespace kestrel::sim
{

/**
 * @brief A task living inside its own stack buffer
 *
 * The Task is constructed in place at the top of the buffer and the rest
 * becomes its stack, the way an embedded kernel lays out a thread. The
 * thread is spawned on construction and retired on destruction.
 */
class Thread
{
public:
   Thread(SimScheduler& scheduler,
          Task::EntryFn&& entry,
          std::span<std::byte> buffer,
          Task::Priority priority,
          CoreAffinity affinity = AnyCpu,
          Mailbox::Options mailbox_options = {});
   ~Thread();

   Thread(Thread const&)            = delete;
   Thread& operator=(Thread const&) = delete;

   [[nodiscard]] Task&       task()       noexcept { return *tcb; }
   [[nodiscard]] Task const& task() const noexcept { return *tcb; }
   [[nodiscard]] TaskId      id()   const noexcept { return tcb->id(); }

   /**
    * @brief Result of spawning the thread
    */
   [[nodiscard]] Status status() const noexcept { return spawn_status; }

private:
   SimScheduler& scheduler;
   Task* tcb;
   Status spawn_status;
};

/**
 * @brief Deterministic run loop
 *
 * Steps every CPU until nothing is runnable, then jumps virtual time to the
 * next pending deadline. Stops once no task is alive, no deadline is left,
 * or max_rounds is reached.
 *
 * @return Tasks still alive (blocked forever, or out of rounds)
 */
std::size_t run_until_idle(SimScheduler& scheduler,
                           SimulationTimeDriver<TimeMode::Virtual>& driver,
                           std::size_t max_rounds = 1'000'000);

} // namespace kestrel::sim

#endif // KESTREL_SIMULATION_HPP
