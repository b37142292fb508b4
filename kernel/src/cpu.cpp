/**
 * @file cpu.cpp
 * @brief CPU descriptor table
 */

#define DEBUG_PRINT_ENABLE 0

#include "kestrel/cpu.hpp"
#include "kestrel/debug_print.hpp"
#include "kestrel/task.hpp"

#include <cassert>
#include <limits>

namespace kestrel
{

void CpuDescriptor::reset(std::uint32_t index, CpuTopologyId id) noexcept
{
   linear_index = index;
   topology_id  = id;
   pinned.store(0, std::memory_order_relaxed);
   in_kernel_flag.store(false, std::memory_order_relaxed);
   started_flag.store(false, std::memory_order_relaxed);

   // Stale requests from a previous boot
   CpuRequest discard;
   while (inbox.pop(discard)) {}
}

bool CpuDescriptor::start() noexcept
{
   bool expected = false;
   return started_flag.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

bool CpuDescriptor::post(CpuRequest request) noexcept
{
   if (!inbox.push(request)) {
      LOG_FAULT("cpu%u inbox full, request kind %u dropped", linear_index, static_cast<unsigned>(request.kind));
      return false;
   }
   return true;
}

std::size_t CpuDescriptor::drain(RequestFn&& fn)
{
   std::size_t drained = 0;
   CpuRequest request;
   while (inbox.pop(request)) {
      fn(request);
      ++drained;
   }
   return drained;
}

void CpuTable::initialise(std::uint32_t count, std::span<CpuTopologyId const> topology) noexcept
{
   assert(count >= 1 && count <= config::MAX_CPUS);
   assert(topology.empty() || topology.size() == count);

   cpu_count = count;
   for (std::uint32_t index = 0; index < cpus.size(); ++index) {
      CpuTopologyId id{static_cast<std::uint16_t>(index), 0};
      if (!topology.empty() && index < count) id = topology[index];
      cpus[index].reset(index, id);
   }
   LOG_SCHED("cpu table: %u cpus online", count);
}

CpuDescriptor* CpuTable::at(std::uint32_t index) noexcept
{
   if (index >= cpu_count) return nullptr;
   return &cpus[index];
}

CpuDescriptor const* CpuTable::at(std::uint32_t index) const noexcept
{
   if (index >= cpu_count) return nullptr;
   return &cpus[index];
}

CpuDescriptor* CpuTable::find(CpuTopologyId id) noexcept
{
   for (std::uint32_t index = 0; index < cpu_count; ++index) {
      if (cpus[index].topology() == id) return &cpus[index];
   }
   return nullptr;
}

CpuDescriptor& CpuTable::this_cpu() noexcept
{
   auto* cpu = at(kestrel_port_get_core_id());
   assert(cpu && "Running on a CPU that is not in the table");
   return *cpu;
}

std::optional<std::uint32_t> CpuTable::least_loaded(CoreAffinity affinity) const noexcept
{
   std::optional<std::uint32_t> best;
   std::uint32_t best_load = std::numeric_limits<std::uint32_t>::max();

   for (std::uint32_t index = 0; index < cpu_count; ++index) {
      if (!affinity.allows(index)) continue;

      std::uint32_t const load = cpus[index].pinned_tasks();
      if (load < best_load) {
         best_load = load;
         best = index;
      }
   }
   return best;
}

void CpuTable::pin(Task& task, std::uint32_t cpu) noexcept
{
   assert(cpu < cpu_count);
   unpin(task);
   task.owning_cpu.store(cpu, std::memory_order_release);
   cpus[cpu].pinned.fetch_add(1, std::memory_order_relaxed);
   task.pinned = true;
}

void CpuTable::unpin(Task& task) noexcept
{
   if (!task.pinned) return;
   cpus[task.cpu()].pinned.fetch_sub(1, std::memory_order_relaxed);
   task.pinned = false;
}

} // namespace kestrel
