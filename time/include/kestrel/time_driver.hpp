/**
* @file time_driver.hpp
* @brief Kestrel TimeDriver Interface
*
* The TimeDriver sits between the kernel core and hardware timers. It provides:
* - Current time queries (monotonic, non-decreasing)
* - One-shot callbacks at absolute deadlines (lock and receive timeouts)
*
* The kernel core has no concept of ticks. Deadlines are absolute TimePoints
* of the installed driver, and the driver decides how to make them fire.
*
* Architecture:
*
*   Scheduler hook: schedule_at(deadline, wake_task, task)
*    -> TimeDriver: arms the port one-shot
*       -> Port timer interrupt fires
*          -> TimeDriver::on_timer_isr(): runs due callbacks
*             -> Scheduler hook resumes the timed-out task
*/

#ifndef KESTREL_TIME_DRIVER_HPP
#define KESTREL_TIME_DRIVER_HPP

#include <cstdint>
#include <limits>

namespace kestrel
{

/* ============================================================================
* Time Types
* ========================================================================= */

/**
* @brief Monotonic time point (in driver ticks)
*
* Time points compare with <, >, == and subtract into a Duration.
*/
struct TimePoint
{
   uint64_t value{0};

   constexpr TimePoint() = default;
   constexpr explicit TimePoint(uint64_t v) : value(v) {}

   constexpr bool operator==(TimePoint rhs) const { return value == rhs.value; }
   constexpr bool operator!=(TimePoint rhs) const { return value != rhs.value; }
   constexpr bool operator< (TimePoint rhs) const { return value <  rhs.value; }
   constexpr bool operator<=(TimePoint rhs) const { return value <= rhs.value; }
   constexpr bool operator> (TimePoint rhs) const { return value >  rhs.value; }
   constexpr bool operator>=(TimePoint rhs) const { return value >= rhs.value; }

   // "Never": the deadline of an untimed wait
   static constexpr TimePoint max()
   {
      return TimePoint{std::numeric_limits<uint64_t>::max()};
   }
};

/**
* @brief Duration (difference between two TimePoints)
*/
struct Duration
{
   uint64_t value{0};

   constexpr Duration() = default;
   constexpr explicit Duration(uint64_t v) : value(v) {}

   constexpr Duration operator+(Duration rhs) const
   {
      return Duration{value + rhs.value};
   }

   constexpr bool operator==(Duration rhs) const { return value == rhs.value; }
   constexpr bool operator< (Duration rhs) const { return value <  rhs.value; }
};

// Saturates at TimePoint::max()
constexpr TimePoint operator+(TimePoint tp, Duration d)
{
   if (d.value > TimePoint::max().value - tp.value) return TimePoint::max();
   return TimePoint{tp.value + d.value};
}

constexpr Duration operator-(TimePoint a, TimePoint b)
{
   return Duration{a.value - b.value};
}

/* ============================================================================
* TimeDriver Interface
* ========================================================================= */

/**
* @brief Abstract interface for time management
*
* Implementations provide different timing strategies, e.g. virtual time for
* deterministic tests or the host clock for realistic simulation.
*/
class ITimeDriver
{
public:
   using Callback = void (*)(void* arg);

   struct Handle
   {
      uint32_t id{0};  // 0 is never a valid handle
   };

   ITimeDriver() = default;
   virtual ~ITimeDriver() = default;
   ITimeDriver(ITimeDriver const&)            = delete;
   ITimeDriver& operator=(ITimeDriver const&) = delete;
   ITimeDriver(ITimeDriver&&)            = delete;
   ITimeDriver& operator=(ITimeDriver&&) = delete;

   /**
   * @brief Get the current time
   * @return Current monotonic time point
   */
   [[nodiscard]] virtual TimePoint now() const noexcept = 0;

   /**
   * @brief Run cb(arg) once now() >= tp
   * @return Handle for cancel(), {0} if cb is null
   *
   * Callbacks run in timer-interrupt context: they must not block.
   */
   [[nodiscard]] virtual Handle schedule_at(TimePoint tp, Callback cb, void* arg) noexcept = 0;

   /**
   * @brief Cancel a pending callback
   * @return true if cancelled, false if it already fired or h is unknown
   */
   virtual bool cancel(Handle h) noexcept = 0;

   /**
   * @brief Convert to native units (rounded up)
   */
   [[nodiscard]] virtual Duration from_milliseconds(uint32_t ms) const noexcept = 0;
   [[nodiscard]] virtual Duration from_microseconds(uint32_t us) const noexcept = 0;

   virtual void start() noexcept = 0;
   virtual void stop() noexcept = 0;

   /**
   * @brief Timer interrupt entry: fires every due callback
   */
   virtual void on_timer_isr() noexcept = 0;

   // Singleton access
   static ITimeDriver& get_instance()            { return *instance;  }
   static void set_instance(ITimeDriver* driver) { instance = driver; }

private:
   static ITimeDriver* instance;
};

} // namespace kestrel

#endif // KESTREL_TIME_DRIVER_HPP
