/**
 * @file signal.hpp
 * @brief Signal-like exception delivery on top of mailboxes
 *
 * A reserved code raised against a task is either sent, at the highest
 * message priority, to the handler target the task registered for it, or
 * handled by the code's default action. Every code has a default action, so
 * no signal goes unhandled.
 */

#ifndef KESTREL_SIGNAL_HPP
#define KESTREL_SIGNAL_HPP

#include "kestrel/kernel.hpp"
#include "kestrel/message.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <string_view>
#include <variant>

namespace kestrel
{

enum class DefaultAction : std::uint8_t
{
   Ignore,
   Terminate,
   LogAndTerminate,
};

[[nodiscard]] constexpr DefaultAction default_action(SignalCode code) noexcept
{
   switch (code) {
      case SignalCode::PageFault:          return DefaultAction::LogAndTerminate;
      case SignalCode::IllegalInstruction: return DefaultAction::LogAndTerminate;
      case SignalCode::GeneralProtection:  return DefaultAction::LogAndTerminate;
      case SignalCode::DivideError:        return DefaultAction::LogAndTerminate;
      case SignalCode::Breakpoint:         return DefaultAction::Ignore;
      case SignalCode::TerminateRequest:   return DefaultAction::Terminate;
      case SignalCode::Kill:               return DefaultAction::Terminate;
      case SignalCode::ChildExited:        return DefaultAction::Ignore;
   }
   return DefaultAction::LogAndTerminate;
}

[[nodiscard]] constexpr bool is_catchable(SignalCode code) noexcept
{
   return code != SignalCode::Kill;
}

struct NoHandler
{
   constexpr bool operator==(NoHandler const&) const = default;
};

/**
 * @brief Where a signal is delivered: a task's mailbox, tagged with slot
 */
struct HandlerTarget
{
   Task*         task{nullptr};
   std::uint32_t slot{0};

   constexpr bool operator==(HandlerTarget const&) const = default;
};

using SignalDisposition = std::variant<NoHandler, HandlerTarget>;

/**
 * @brief Machine state captured with a fault, carried in the message payload
 */
struct FaultContext
{
   std::uint64_t address{0};
   std::uint64_t instruction_pointer{0};
   std::uint64_t error_code{0};
};

enum class SignalOutcome : std::uint8_t
{
   Delivered,
   DefaultIgnored,
   DefaultTerminated,
};

/**
 * @brief Per-task code -> disposition map
 */
class SignalTable
{
public:
   SignalTable() = default;
   SignalTable(SignalTable const&)            = delete;
   SignalTable& operator=(SignalTable const&) = delete;

   [[nodiscard]] Status set(SignalCode code, HandlerTarget target) noexcept;
   void clear(SignalCode code) noexcept;
   [[nodiscard]] SignalDisposition lookup(SignalCode code) const noexcept;

private:
   mutable Spinlock guard;
   std::array<SignalDisposition, SIGNAL_CODE_COUNT> entries{};
};

class SignalAdapter
{
public:
   SignalAdapter() = default;
   SignalAdapter(SignalAdapter const&)            = delete;
   SignalAdapter& operator=(SignalAdapter const&) = delete;

   /**
    * @return InvalidArgument for an uncatchable code or a null target
    */
   [[nodiscard]] Status register_handler(Task& task, SignalCode code, HandlerTarget target);
   Status unregister_handler(Task& task, SignalCode code);

   /**
    * @brief Deliver or apply the default action for a condition on task
    *
    * Callable from interrupt context. When the task itself is the caller
    * and the default action terminates it, this does not return.
    */
   SignalOutcome raise(Task& task, SignalCode code, FaultContext const& context = {});

   [[nodiscard]] std::uint64_t delivered_count()      const noexcept { return delivered.load(std::memory_order_relaxed); }
   [[nodiscard]] std::uint64_t default_action_count() const noexcept { return defaulted.load(std::memory_order_relaxed); }
   void reset_counters() noexcept;

private:
   SignalOutcome apply_default(Task& task, SignalCode code, FaultContext const& context);

   std::atomic<std::uint64_t> delivered{0};
   std::atomic<std::uint64_t> defaulted{0};
};

/**
 * @brief Registry shorthands for kernel::signals()
 */
[[nodiscard]] Status register_handler(Task& task, SignalCode code, HandlerTarget target);
Status unregister_handler(Task& task, SignalCode code);

} // namespace kestrel

#endif // KESTREL_SIGNAL_HPP
