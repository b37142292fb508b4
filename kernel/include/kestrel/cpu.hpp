/**
 * @file cpu.hpp
 * @brief CPU descriptor table
 *
 * Maps the stable linear CPU index (assigned by topology discovery at boot)
 * to per-CPU kernel state. Only the owning CPU mutates its own run state;
 * every other CPU talks to it through its request inbox.
 */

#ifndef KESTREL_CPU_HPP
#define KESTREL_CPU_HPP

#include "kestrel/kernel.hpp"
#include "kestrel/mpsc_ring_buffer.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <span>

namespace kestrel
{

class Process;

/**
 * @brief Physical identity of a CPU, as reported by topology discovery
 */
struct CpuTopologyId
{
   std::uint16_t core{0};
   std::uint16_t thread{0};  // hardware thread within the core

   constexpr bool operator==(CpuTopologyId const&) const = default;
};

/**
 * @brief Cross-CPU request, posted to the CPU that owns the task
 */
struct CpuRequest
{
   enum class Kind : std::uint8_t
   {
      ResumeTask,  // make a blocked task runnable on its CPU
      KillTask,    // terminate one task
      KillProcess, // terminate every thread of a process pinned to this CPU
   } kind{};
   Task*    task{nullptr};
   Process* process{nullptr};
};

class CpuDescriptor
{
public:
   using RequestFn = Function<void(CpuRequest const&), 32>;

   CpuDescriptor() = default;
   CpuDescriptor(CpuDescriptor const&)            = delete;
   CpuDescriptor& operator=(CpuDescriptor const&) = delete;

   [[nodiscard]] std::uint32_t index() const noexcept { return linear_index; }
   [[nodiscard]] CpuTopologyId topology() const noexcept { return topology_id; }
   [[nodiscard]] std::uint32_t pinned_tasks() const noexcept { return pinned.load(std::memory_order_relaxed); }

   /**
    * @brief Mark this CPU as executing kernel code
    * @return true if it already was (nested entry, a kernel bug)
    */
   [[nodiscard]] bool enter_kernel() noexcept { return in_kernel_flag.exchange(true, std::memory_order_acq_rel); }
   void leave_kernel() noexcept { in_kernel_flag.store(false, std::memory_order_release); }
   [[nodiscard]] bool in_kernel() const noexcept { return in_kernel_flag.load(std::memory_order_acquire); }

   /**
    * @brief Bring the CPU online
    * @return false if it was already started
    */
   bool start() noexcept;
   [[nodiscard]] bool started() const noexcept { return started_flag.load(std::memory_order_acquire); }

   /**
    * @brief Post a request from any CPU or interrupt context
    * @return false if the inbox is full
    */
   [[nodiscard]] bool post(CpuRequest request) noexcept;

   /**
    * @brief Hand every pending request to fn, owning CPU only
    * @return Number of requests drained
    */
   std::size_t drain(RequestFn&& fn);

   [[nodiscard]] std::size_t pending_requests() const noexcept { return inbox.approx_size(); }

private:
   friend class CpuTable;

   void reset(std::uint32_t index, CpuTopologyId id) noexcept;

   std::uint32_t linear_index{0};
   CpuTopologyId topology_id{};
   std::atomic<std::uint32_t> pinned{0};
   std::atomic<bool> in_kernel_flag{false};
   std::atomic<bool> started_flag{false};
   MpscRingBuffer<CpuRequest, config::CPU_INBOX_CAPACITY> inbox;
};

class CpuTable
{
public:
   CpuTable() = default;
   CpuTable(CpuTable const&)            = delete;
   CpuTable& operator=(CpuTable const&) = delete;

   /**
    * @brief Populate the table once topology discovery is done
    * @param cpu_count Online CPUs, 1..config::MAX_CPUS
    * @param topology Topology id per linear index, defaults to {index, 0}
    */
   void initialise(std::uint32_t cpu_count, std::span<CpuTopologyId const> topology = {}) noexcept;

   [[nodiscard]] std::uint32_t count() const noexcept { return cpu_count; }

   /**
    * @return nullptr for an index outside [0, count())
    */
   [[nodiscard]] CpuDescriptor*       at(std::uint32_t index) noexcept;
   [[nodiscard]] CpuDescriptor const* at(std::uint32_t index) const noexcept;

   [[nodiscard]] CpuDescriptor* find(CpuTopologyId id) noexcept;

   /**
    * @brief Descriptor of the CPU executing the caller
    */
   [[nodiscard]] CpuDescriptor& this_cpu() noexcept;

   /**
    * @brief Allowed CPU with the fewest pinned tasks, lowest index on ties
    */
   [[nodiscard]] std::optional<std::uint32_t> least_loaded(CoreAffinity affinity) const noexcept;

   /**
    * @brief Assign a task to a CPU (moves it off its previous one)
    */
   void pin(Task& task, std::uint32_t cpu) noexcept;
   void unpin(Task& task) noexcept;

private:
   std::array<CpuDescriptor, config::MAX_CPUS> cpus{};
   std::uint32_t cpu_count{0};
};

} // namespace kestrel

#endif // KESTREL_CPU_HPP
