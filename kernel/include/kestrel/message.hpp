/**
 * @file message.hpp
 * @brief Message, reserved signal codes and receive modes
 */

#ifndef KESTREL_MESSAGE_HPP
#define KESTREL_MESSAGE_HPP

#include "kestrel/kernel.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace kestrel
{

enum class MessageKind : std::uint8_t
{
   Normal,
   Signal,  // carries a reserved code, bypasses backpressure
};

/**
 * @brief Reserved message codes for kernel-recognised conditions
 */
enum class SignalCode : std::uint8_t
{
   PageFault,
   IllegalInstruction,
   GeneralProtection,
   DivideError,
   Breakpoint,
   TerminateRequest,
   Kill,
   ChildExited,
};
static constexpr std::size_t SIGNAL_CODE_COUNT = 8;

[[nodiscard]] constexpr std::string_view to_string(SignalCode code) noexcept
{
   switch (code) {
      case SignalCode::PageFault:          return "PageFault";
      case SignalCode::IllegalInstruction: return "IllegalInstruction";
      case SignalCode::GeneralProtection:  return "GeneralProtection";
      case SignalCode::DivideError:        return "DivideError";
      case SignalCode::Breakpoint:         return "Breakpoint";
      case SignalCode::TerminateRequest:   return "TerminateRequest";
      case SignalCode::Kill:               return "Kill";
      case SignalCode::ChildExited:        return "ChildExited";
   }
   return "Unknown";
}

struct Message
{
   TaskId                        sender{KERNEL_TASK_ID};
   MessageKind                   kind{MessageKind::Normal};
   std::uint8_t                  priority{0};  // set by send
   std::optional<SignalCode>     code{};
   std::uint32_t                 tag{0};       // user tag, handler slot for signals
   std::array<std::uint64_t, 3>  payload{};
};

struct ReceiveMode
{
   enum class Kind : std::uint8_t { Blocking, NonBlocking, Until };

   Kind      kind{Kind::Blocking};
   TimePoint deadline{TimePoint::max()};

   [[nodiscard]] static constexpr ReceiveMode blocking() noexcept { return {Kind::Blocking, TimePoint::max()}; }
   [[nodiscard]] static constexpr ReceiveMode non_blocking() noexcept { return {Kind::NonBlocking, TimePoint::max()}; }
   [[nodiscard]] static constexpr ReceiveMode until(TimePoint deadline) noexcept { return {Kind::Until, deadline}; }
};

struct ReceiveResult
{
   Status  status{Status::Empty};
   Message message{};

   [[nodiscard]] bool ok() const noexcept { return status == Status::Ok; }
};

} // namespace kestrel

#endif // KESTREL_MESSAGE_HPP
