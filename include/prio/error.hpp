#pragma once

#include <string>
#include <system_error>

namespace prio {
enum class Errc : int {
  InvalidArgument = 1,
  Underflow,
  Configuration,
  Exhausted,
};

auto errorCategory() noexcept -> std::error_category const&;

inline auto make_error_code(Errc e) noexcept -> std::error_code { return {static_cast<int>(e), errorCategory()}; }

class Error : public std::system_error {
public:
  Error(Errc errc, std::string const& what) : std::system_error(make_error_code(errc), what) {}
  Error(Errc errc, char const* what) : std::system_error(make_error_code(errc), what) {}
};
} // namespace prio

template <>
struct std::is_error_code_enum<prio::Errc> : std::true_type {};
