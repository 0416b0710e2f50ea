// Just for debugging ;)
#ifndef DEBUG_PRINT_HPP
#define DEBUG_PRINT_HPP

#include <cstdint>
#include <cstdio>

extern "C" uint64_t fwcore_port_time_now(void);

namespace fwcore::debug
{
   enum class Channel
   {
      Irq,
      Exec,
      Sync,
      Port,
      Test
   };

#if DEBUG_PRINT_ENABLE
   // Simple ANSI colour table
   inline const char* color(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Irq:  return "\x1b[35m"; // magenta
         case Channel::Exec: return "\x1b[36m"; // cyan
         case Channel::Sync: return "\x1b[33m"; // yellow
         case Channel::Port: return "\x1b[34m"; // blue
         case Channel::Test: return "\x1b[32m"; // green
      }
      return "\x1b[0m";
   }

   inline const char* label(Channel ch) noexcept
   {
      switch (ch) {
         case Channel::Irq:  return "IRQ ";
         case Channel::Exec: return "EXEC";
         case Channel::Sync: return "SYNC";
         case Channel::Port: return "PORT";
         case Channel::Test: return "TEST";
      }
      return "????";
   }

   inline constexpr const char* reset() noexcept { return "\x1b[0m"; }

   template <typename... Args>
   inline void print(Channel ch, const char* fmt, Args... args)
   {
      // prefix with simulated time + channel label
      std::printf("%s[t=%010llu][%s] ",
                  color(ch),
                  static_cast<unsigned long long>(fwcore_port_time_now()),
                  label(ch));
      if constexpr (sizeof...(args) == 0) std::printf("%s", fmt);
      else std::printf(fmt, args...);
      std::printf("%s\n", reset());
   }

   inline constexpr const char* poll_to_str(bool ready) { return ready ? "Ready" : "Pending"; }
#endif

}

// Convenience macros
#if DEBUG_PRINT_ENABLE
#  define LOG_IRQ(fmt, ...)   fwcore::debug::print(fwcore::debug::Channel::Irq,  fmt, ##__VA_ARGS__)
#  define LOG_EXEC(fmt, ...)  fwcore::debug::print(fwcore::debug::Channel::Exec, fmt, ##__VA_ARGS__)
#  define LOG_SYNC(fmt, ...)  fwcore::debug::print(fwcore::debug::Channel::Sync, fmt, ##__VA_ARGS__)
#  define LOG_PORT(fmt, ...)  fwcore::debug::print(fwcore::debug::Channel::Port, fmt, ##__VA_ARGS__)
#  define LOG_TEST(fmt, ...)  fwcore::debug::print(fwcore::debug::Channel::Test, fmt, ##__VA_ARGS__)
#  define POLL_TO_STR(ready)  fwcore::debug::poll_to_str(ready)
#else
#  define LOG_IRQ(...)  ((void)0)
#  define LOG_EXEC(...) ((void)0)
#  define LOG_SYNC(...) ((void)0)
#  define LOG_PORT(...) ((void)0)
#  define LOG_TEST(...) ((void)0)
#  define POLL_TO_STR(ready)
#endif

#endif
