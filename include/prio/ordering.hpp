#pragma once
#include "prio/__preclude.hpp"
#include "prio/error.hpp"

#include <compare>
#include <functional>

namespace prio {
template <typename K>
concept IntrinsicallyOrdered = std::three_way_comparable<K> || requires(K const& a, K const& b) {
  { a < b } -> std::convertible_to<bool>;
};

// Three-way ordering over keys: a caller-supplied comparator when one was given,
// otherwise the key type's own operator<=> or operator<.
template <typename K>
class Ordering {
public:
  using Comparator = std::function<int(K const&, K const&)>;

  Ordering() = default;
  explicit Ordering(Comparator fn) : mFn(std::move(fn)) {}

  // Negative if `a` comes first, positive if `b` does, zero for a tie.
  // Throws Errc::Configuration when there is nothing to compare with; only reached on
  // the first real comparison, so a heap of non-comparable keys is fine while it has
  // at most one key.
  auto compare(K const& a, K const& b) const -> int
  {
    if (mFn) {
      return mFn(a, b);
    }
    return intrinsic(a, b);
  }

  auto precedes(K const& a, K const& b) const -> bool { return compare(a, b) < 0; }

  auto isExplicit() const noexcept -> bool { return static_cast<bool>(mFn); }

  auto comparator() const -> std::optional<Comparator>
  {
    if (!mFn) {
      return std::nullopt;
    }
    return mFn;
  }

  auto reversed() const -> Ordering
  {
    if (mFn) {
      return Ordering([fn = mFn](K const& a, K const& b) { return fn(b, a); });
    }
    return Ordering([](K const& a, K const& b) { return intrinsic(b, a); });
  }

  static auto intrinsic(K const& a, K const& b) -> int
  {
    if constexpr (std::three_way_comparable<K>) {
      auto r = a <=> b;
      if (r < 0) {
        return -1;
      }
      return r > 0 ? 1 : 0;
    } else if constexpr (IntrinsicallyOrdered<K>) {
      if (a < b) {
        return -1;
      }
      return b < a ? 1 : 0;
    } else {
      throw Error(Errc::Configuration, "key type is not comparable and no ordering function was provided");
    }
  }

private:
  Comparator mFn;
};
} // namespace prio
