/**
 * @file time_driver_simulation.hpp
 * @brief Simulation TimeDriver for the Linux port
 *
 * - Virtual mode: time only advances when told to (deterministic tests)
 * - Real-time mode: time follows the host steady clock
 */

#ifndef KESTREL_TIME_DRIVER_SIMULATION_HPP
#define KESTREL_TIME_DRIVER_SIMULATION_HPP

#include "kestrel/time_driver.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace kestrel
{

enum class TimeMode
{
   RealTime,    // Host steady clock, callbacks fired by a background thread
   Virtual      // Moves only on advance_to/advance_by (deterministic)
};

/**
 * @brief Simulation time driver
 *
 * @tparam Mode TimeMode::RealTime or TimeMode::Virtual
 *
 * Virtual mode drives the port's virtual counter. Crossing an armed deadline
 * raises the simulated timer interrupt, which lands in on_timer_isr() on the
 * thread that advanced time.
 *
 * Real-time mode polls at 1ms from a background host thread.
 *
 * All methods are thread-safe.
 *
 * Example (Virtual):
 *   SimulationTimeDriver<TimeMode::Virtual> driver(1000); // 1kHz
 *   driver.start();
 *
 *   auto h = driver.schedule_at(TimePoint{100}, callback, &data);
 *   driver.advance_to(TimePoint{100}); // Fires callback
 */
template<TimeMode Mode>
class SimulationTimeDriver final : public ITimeDriver
{
public:
   /**
    * @param tick_frequency_hz Ticks per second, TimePoint{1} is one tick
    *
    * Virtual mode restarts the port's virtual clock at zero.
    */
   explicit SimulationTimeDriver(uint32_t tick_frequency_hz) noexcept;

   ~SimulationTimeDriver() override { stop(); }

   [[nodiscard]] TimePoint now() const noexcept override;

   [[nodiscard]] Handle schedule_at(TimePoint tp, Callback cb, void* arg) noexcept override;

   bool cancel(Handle h) noexcept override;

   [[nodiscard]] Duration from_milliseconds(uint32_t ms) const noexcept override
   {
      const uint64_t ticks = (static_cast<uint64_t>(ms) * tick_frequency_hz + 999) / 1000;
      return Duration{ticks};
   }

   [[nodiscard]] Duration from_microseconds(uint32_t us) const noexcept override
   {
      const uint64_t ticks = (static_cast<uint64_t>(us) * tick_frequency_hz + 999'999) / 1'000'000;
      return Duration{ticks};
   }

   /**
    * @brief Hook into the port timer interrupt and start time flowing
    *
    * Safe to call again after stop().
    */
   void start() noexcept override;

   void stop() noexcept override;

   /**
    * @brief Fires all callbacks where scheduled time <= now()
    */
   void on_timer_isr() noexcept override;

   /**
    * @brief Earliest pending callback time, if any
    *
    * Lets a deterministic simulation jump straight to the next deadline.
    */
   [[nodiscard]] std::optional<TimePoint> next_event() const;

   /**
    * @brief Advance virtual time (never backwards) and fire due callbacks
    */
   void advance_to(TimePoint tp) requires (Mode == TimeMode::Virtual);

   void advance_by(Duration d) requires (Mode == TimeMode::Virtual);

private:
   struct Event
   {
      uint32_t id{0};
      uint64_t when{0};
      Callback cb{nullptr};
      void* arg{nullptr};
   };

   static void isr_trampoline(void* arg) noexcept
   {
      static_cast<SimulationTimeDriver*>(arg)->on_timer_isr();
   }

   void rearm_locked() noexcept;

   void realtime_thread_main() requires (Mode == TimeMode::RealTime);

   uint32_t tick_frequency_hz{0};
   std::atomic<uint32_t> next_id{1};

   mutable std::mutex m;
   std::vector<Event> events;

   std::atomic<bool> running{false};
   std::thread rt_thread;

   std::chrono::steady_clock::time_point rt_epoch;
};

} // namespace kestrel

#endif // KESTREL_TIME_DRIVER_SIMULATION_HPP
