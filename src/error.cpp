#include "prio/error.hpp"

namespace prio {
namespace {
class ErrorCategory final : public std::error_category {
public:
  auto name() const noexcept -> char const* override { return "prio"; }
  auto message(int ev) const -> std::string override
  {
    switch (static_cast<Errc>(ev)) {
    case Errc::InvalidArgument:
      return "invalid argument";
    case Errc::Underflow:
      return "underflow: priority queue is empty";
    case Errc::Configuration:
      return "key type is not comparable and no ordering function was provided";
    case Errc::Exhausted:
      return "iterator depleted";
    }
    return "unknown prio error";
  }
};
} // namespace

auto errorCategory() noexcept -> std::error_category const&
{
  static ErrorCategory const category;
  return category;
}
} // namespace prio
