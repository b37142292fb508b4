// Channelled debug output. Define DEBUG_PRINT_ENABLE to 1 before including
// to turn the debug channels on for a translation unit. LOG_FAULT is always on.
#ifndef KESTREL_DEBUG_PRINT_HPP
#define KESTREL_DEBUG_PRINT_HPP

#include "kestrel/port.h"

#include <cinttypes>
#include <cstdint>
#include <cstdio>

namespace kestrel::debug
{
   enum class Channel
   {
      Scheduler,
      Port,
      Sync,
      Mailbox,
      Signal,
      Test,
      Fault
   };

   // Simple ANSI colour table
   inline const char* color(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Scheduler: return "\x1b[36m"; // cyan
         case Channel::Port:      return "\x1b[35m"; // magenta
         case Channel::Sync:      return "\x1b[33m"; // yellow
         case Channel::Mailbox:   return "\x1b[34m"; // blue
         case Channel::Signal:    return "\x1b[95m"; // bright magenta
         case Channel::Test:      return "\x1b[32m"; // green
         case Channel::Fault:     return "\x1b[31m"; // red
      }
      return "\x1b[0m";
   }

   inline const char* label(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Scheduler: return "SCHED ";
         case Channel::Port:      return "PORT  ";
         case Channel::Sync:      return "SYNC  ";
         case Channel::Mailbox:   return "MBOX  ";
         case Channel::Signal:    return "SIGNAL";
         case Channel::Test:      return "TEST  ";
         case Channel::Fault:     return "FAULT ";
      }
      return "????";
   }

   inline constexpr const char* reset() noexcept { return "\x1b[0m"; }

   template <typename... Args>
   inline void print(Channel ch, const char* fmt, Args... args)
   {
      std::FILE* out = (ch == Channel::Fault) ? stderr : stdout;
      // prefix with port time, cpu and channel label
      std::fprintf(out, "%s[t=%08" PRIu64 "][cpu%u][%s] ",
                   color(ch),
                   kestrel_port_time_now(),
                   kestrel_port_get_core_id(),
                   label(ch));
      if constexpr (sizeof...(args) == 0) std::fprintf(out, "%s", fmt);
      else std::fprintf(out, fmt, args...);
      std::fprintf(out, "%s\n", reset());
   }
}

#define LOG_FAULT(fmt, ...)         kestrel::debug::print(kestrel::debug::Channel::Fault,     fmt, ##__VA_ARGS__)

// Convenience macros
#if DEBUG_PRINT_ENABLE
#  define LOG_SCHED(fmt, ...)       kestrel::debug::print(kestrel::debug::Channel::Scheduler, fmt, ##__VA_ARGS__)
#  define LOG_PORT(fmt, ...)        kestrel::debug::print(kestrel::debug::Channel::Port,      fmt, ##__VA_ARGS__)
#  define LOG_SYNC(fmt, ...)        kestrel::debug::print(kestrel::debug::Channel::Sync,      fmt, ##__VA_ARGS__)
#  define LOG_MBOX(fmt, ...)        kestrel::debug::print(kestrel::debug::Channel::Mailbox,   fmt, ##__VA_ARGS__)
#  define LOG_SIGNAL(fmt, ...)      kestrel::debug::print(kestrel::debug::Channel::Signal,    fmt, ##__VA_ARGS__)
#  define LOG_TEST(fmt, ...)        kestrel::debug::print(kestrel::debug::Channel::Test,      fmt, ##__VA_ARGS__)
#else
#  define LOG_SCHED(...)  ((void)0)
#  define LOG_PORT(...)   ((void)0)
#  define LOG_SYNC(...)   ((void)0)
#  define LOG_MBOX(...)   ((void)0)
#  define LOG_SIGNAL(...) ((void)0)
#  define LOG_TEST(...)   ((void)0)
#endif

#endif
