#pragma once
#include <concepts>
#include <cstdio>
#include <cstdlib>
#include <source_location>
#include <string_view>

namespace prio::util {
struct PanicMessage {
  template <class T>
    requires std::convertible_to<T, std::string_view>
  PanicMessage(T const& s, std::source_location loc = std::source_location::current()) noexcept
      : str(s), loc(loc)
  {
  }

  std::string_view str;
  std::source_location loc;
};

// For states the public API cannot reach. Never used to report caller errors.
[[noreturn]] inline auto panic(PanicMessage msg) noexcept -> void
{
  std::fprintf(stderr, "%s:%u panic: %.*s\n", msg.loc.file_name(), static_cast<unsigned>(msg.loc.line()),
               static_cast<int>(msg.str.size()), msg.str.data());
  std::abort();
}

inline auto panicIf(bool cond, PanicMessage msg) noexcept -> void
{
  if (cond) [[unlikely]] {
    panic(msg);
  }
}
} // namespace prio::util
