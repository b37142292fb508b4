/**
 * @file time_driver_simulation.cpp
 * @brief Simulation TimeDriver implementation
 */

#include "kestrel/time_driver_simulation.hpp"
#include "kestrel/port.h"

#include <algorithm>

namespace kestrel
{

template<TimeMode Mode>
SimulationTimeDriver<Mode>::SimulationTimeDriver(uint32_t tick_frequency_hz) noexcept
   : tick_frequency_hz(tick_frequency_hz), rt_epoch(std::chrono::steady_clock::now())
{
   if constexpr (Mode == TimeMode::Virtual) {
      kestrel_port_time_reset(0);
   }
}

template<TimeMode Mode>
TimePoint SimulationTimeDriver<Mode>::now() const noexcept
{
   if constexpr (Mode == TimeMode::Virtual) {
      return TimePoint{kestrel_port_time_now()};
   } else {
      auto const elapsed = std::chrono::steady_clock::now() - rt_epoch;
      auto const us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
      return TimePoint{static_cast<uint64_t>(us) * tick_frequency_hz / 1'000'000};
   }
}

template<TimeMode Mode>
ITimeDriver::Handle SimulationTimeDriver<Mode>::schedule_at(TimePoint tp, Callback cb, void* arg) noexcept
{
   if (!cb) return {};

   uint32_t id = next_id.fetch_add(1, std::memory_order_relaxed);
   if (id == 0) id = next_id.fetch_add(1, std::memory_order_relaxed);

   std::lock_guard lk(m);
   events.push_back(Event{.id = id, .when = tp.value, .cb = cb, .arg = arg});

   if constexpr (Mode == TimeMode::Virtual) {
      kestrel_port_time_arm(tp.value);
   }
   return Handle{id};
}

template<TimeMode Mode>
bool SimulationTimeDriver<Mode>::cancel(Handle h) noexcept
{
   if (h.id == 0) return false;

   std::lock_guard lk(m);
   auto it = std::find_if(events.begin(), events.end(), [&](Event const& event) { return event.id == h.id; });
   if (it == events.end()) return false;
   events.erase(it);
   return true;
}

template<TimeMode Mode>
void SimulationTimeDriver<Mode>::start() noexcept
{
   bool expected = false;
   if (!running.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) return;

   if constexpr (Mode == TimeMode::Virtual) {
      kestrel_port_time_register_isr_handler(&isr_trampoline, this);
      kestrel_port_time_irq_enable();
      std::lock_guard lk(m);
      rearm_locked();
   } else {
      rt_thread = std::thread([this]{ realtime_thread_main(); });
   }
}

template<TimeMode Mode>
void SimulationTimeDriver<Mode>::stop() noexcept
{
   bool was = running.exchange(false, std::memory_order_acq_rel);
   if (!was) return;

   if constexpr (Mode == TimeMode::Virtual) {
      kestrel_port_time_irq_disable();
      kestrel_port_time_register_isr_handler(nullptr, nullptr);
   } else {
      if (rt_thread.joinable()) rt_thread.join();
   }
}

template<TimeMode Mode>
void SimulationTimeDriver<Mode>::rearm_locked() noexcept
{
   if constexpr (Mode == TimeMode::Virtual) {
      kestrel_port_time_disarm();
      for (auto const& event : events) {
         kestrel_port_time_arm(event.when);
      }
   }
}

template<TimeMode Mode>
void SimulationTimeDriver<Mode>::on_timer_isr() noexcept
{
   const uint64_t now_ticks = now().value;

   std::vector<Event> due;
   {
      std::lock_guard lk(m);
      auto split = std::stable_partition(events.begin(), events.end(),
                                         [&](Event const& event) { return event.when > now_ticks; });
      due.assign(split, events.end());
      events.erase(split, events.end());
   }

   // Deadline order, then scheduling order
   std::stable_sort(due.begin(), due.end(), [](Event const& a, Event const& b) { return a.when < b.when; });
   for (auto& event : due) {
      event.cb(event.arg);
   }

   std::lock_guard lk(m);
   rearm_locked();
}

template<TimeMode Mode>
std::optional<TimePoint> SimulationTimeDriver<Mode>::next_event() const
{
   std::lock_guard lk(m);
   if (events.empty()) return std::nullopt;
   auto it = std::min_element(events.begin(), events.end(),
                              [](Event const& a, Event const& b) { return a.when < b.when; });
   return TimePoint{it->when};
}

template<>
void SimulationTimeDriver<TimeMode::Virtual>::advance_to(TimePoint tp)
{
   // Crossing the armed deadline raises the simulated timer interrupt
   kestrel_port_time_advance_to(tp.value);
}

template<>
void SimulationTimeDriver<TimeMode::Virtual>::advance_by(Duration d)
{
   advance_to(now() + d);
}

template<>
void SimulationTimeDriver<TimeMode::RealTime>::realtime_thread_main()
{
   using namespace std::chrono_literals;

   while (running.load(std::memory_order_acquire)) {
      std::this_thread::sleep_for(1ms);
      on_timer_isr();
   }
}

// Explicit instantiations
template class SimulationTimeDriver<TimeMode::RealTime>;
template class SimulationTimeDriver<TimeMode::Virtual>;

} // namespace kestrel
