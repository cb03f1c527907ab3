#pragma once
#include "prio/__preclude.hpp"
#include "prio/error.hpp"
#include "prio/ordering.hpp"
#include "prio/util/slot_buffer.hpp"

#include <iterator>
#include <ostream>

namespace prio {
namespace detail {
template <typename T>
struct IsOptional : std::false_type {};
template <typename T>
struct IsOptional<std::optional<T>> : std::true_type {};

// Null raw/smart pointers and empty optionals are "absent" keys.
template <typename K>
auto isAbsent(K const& key) noexcept -> bool
{
  if constexpr (IsOptional<K>::value) {
    return !key.has_value();
  } else if constexpr (std::is_pointer_v<K>) {
    return key == nullptr;
  } else if constexpr (requires {
                         typename K::element_type;
                         static_cast<bool>(key);
                       }) {
    return !static_cast<bool>(key);
  } else {
    return false;
  }
}
} // namespace detail

template <typename K>
class Drain;

// Priority queue over a 1-indexed binary heap. The root is the key that comes first under
// the active Ordering, so the default is a min-heap; see reversed() for a max-heap.
//
// Storage grows by doubling when full and halves once it is a quarter used, never below
// util::SlotBuffer<K>::kMinCapacity. A capacity hint is taken as given, so a heap built
// with a hint well above its size sits below a quarter full until polls halve it down;
// each poll halves at most once.
template <typename K>
class BinaryHeap {
public:
  using value_type = K;
  using size_type = std::size_t;
  using Comparator = typename Ordering<K>::Comparator;

  static constexpr std::size_t kDefaultCapacity = util::SlotBuffer<K>::kMinCapacity;

  BinaryHeap() : BinaryHeap(kDefaultCapacity, Ordering<K>()) {}
  explicit BinaryHeap(std::size_t capacity) : BinaryHeap(capacity, Ordering<K>()) {}
  explicit BinaryHeap(Comparator comparator) : BinaryHeap(kDefaultCapacity, std::move(comparator)) {}
  BinaryHeap(std::size_t capacity, Comparator comparator)
      : BinaryHeap(capacity, comparator ? Ordering<K>(std::move(comparator)) : Ordering<K>())
  {
  }
  BinaryHeap(std::size_t capacity, Ordering<K> ordering)
      : mStore(checkedCapacity(capacity)), mOrdering(std::move(ordering))
  {
  }

  // Max-oriented heap over the key type's intrinsic order.
  static auto reversed(std::size_t capacity = kDefaultCapacity) -> BinaryHeap
  {
    return BinaryHeap(capacity, Ordering<K>().reversed());
  }

  auto size() const noexcept -> std::size_t { return mStore.length(); }
  auto empty() const noexcept -> bool { return size() == 0; }
  auto capacity() const noexcept -> std::size_t { return mStore.capacity(); }

  auto comparator() const -> std::optional<Comparator> { return mOrdering.comparator(); }
  auto ordering() const noexcept -> Ordering<K> const& { return mOrdering; }

  auto insert(K const& key) -> void
  {
    rejectAbsent(key, "argument to insert() is absent");
    mStore.append(key);
    swim(size());
  }

  auto insert(K&& key) -> void
  {
    rejectAbsent(key, "argument to insert() is absent");
    mStore.append(std::move(key));
    swim(size());
  }

  template <typename... Args>
  auto emplace(Args&&... args) -> void
  {
    insert(K(std::forward<Args>(args)...));
  }

  // Removes and returns the root. The caller owns the returned key; its slot is destroyed.
  auto poll() -> K
  {
    if (empty()) {
      throw Error(Errc::Underflow, "underflow: can't poll() from empty priority queue");
    }
    K key = std::move(mStore[1]);
    K last = mStore.removeLast();
    if (!empty()) {
      mStore[1] = std::move(last);
      sink(1);
    }
    mStore.ensureCapacityForRemoval();
    return key;
  }

  auto peek() const -> K const&
  {
    if (empty()) {
      throw Error(Errc::Underflow, "underflow: can't peek() at empty priority queue");
    }
    return mStore[1];
  }

  // Linear scan in storage order; heap order does not help an equality search.
  auto contains(K const& key) const -> bool
    requires std::equality_comparable<K>
  {
    rejectAbsent(key, "argument to contains() is absent");
    for (std::size_t i = 1; i <= size(); i++) {
      if (mStore[i] == key) {
        return true;
      }
    }
    return false;
  }

  // True when no key comes after either of its children.
  auto isHeapOrdered() const -> bool
  {
    for (std::size_t k = 2; k <= size(); k++) {
      if (precedes(k, k / 2)) {
        return false;
      }
    }
    return true;
  }

  // Keeps the ordering.
  auto clear() -> void { mStore.clear(kDefaultCapacity); }

  // Shares pointer-like keys with this heap; the storage itself is independent.
  auto copy() const -> BinaryHeap { return *this; }

  // Like copy(), but every key is replaced by transform(key). The transform is checked
  // as it runs, so an absent result fails mid-copy and the partial copy is released.
  auto deepcopy(std::function<K(K const&)> const& transform) const -> BinaryHeap
  {
    if (!transform) {
      throw Error(Errc::InvalidArgument, "argument to deepcopy() is absent");
    }
    return BinaryHeap(*this, [&transform](K const& key) {
      K out = transform(key);
      rejectAbsent(out, "deepcopy() transform returned an absent key");
      return out;
    });
  }

  auto drain() const -> Drain<K>;

private:
  template <typename F>
  BinaryHeap(BinaryHeap const& other, F&& fn) : mStore(other.mStore, std::forward<F>(fn)), mOrdering(other.mOrdering)
  {
  }

  static auto checkedCapacity(std::size_t capacity) -> std::size_t
  {
    if (capacity == 0) {
      throw Error(Errc::InvalidArgument, "capacity must be positive");
    }
    return capacity;
  }

  static auto rejectAbsent(K const& key, char const* what) -> void
  {
    if (detail::isAbsent(key)) {
      throw Error(Errc::InvalidArgument, what);
    }
  }

  auto precedes(std::size_t i, std::size_t j) const -> bool { return mOrdering.precedes(mStore[i], mStore[j]); }

  auto exchange(std::size_t i, std::size_t j) -> void
  {
    using std::swap;
    swap(mStore[i], mStore[j]);
  }

  // Stops only once the parent strictly precedes, so a key rises above equal ones.
  auto swim(std::size_t k) -> void
  {
    while (k > 1) {
      if (precedes(k / 2, k)) {
        break;
      }
      exchange(k, k / 2);
      k /= 2;
    }
  }

  // On equal children the left one (lower index) is taken.
  auto sink(std::size_t k) -> void
  {
    while (2 * k <= size()) {
      auto j = 2 * k;
      if (j + 1 <= size() && precedes(j + 1, j)) {
        j++;
      }
      if (!precedes(j, k)) {
        break;
      }
      exchange(j, k);
      k = j;
    }
  }

  util::SlotBuffer<K> mStore;
  Ordering<K> mOrdering;
};

// Yields the keys of a heap in priority order by polling a private copy of it. Single
// pass: once a key is produced it is gone from the copy. Changes to the source heap
// after drain() was called are not seen.
//
// Iterators point back at their Drain, so a Drain is neither copied nor moved.
template <typename K>
class Drain {
public:
  class Iterator {
  public:
    using iterator_concept = std::input_iterator_tag;
    using value_type = K;
    using difference_type = std::ptrdiff_t;

    Iterator() noexcept = default;
    explicit Iterator(Drain* drain) : mDrain(drain) { advance(); }

    auto operator*() const noexcept -> K& { return *mCurrent; }
    auto operator->() const noexcept -> K* { return &*mCurrent; }
    auto operator++() -> Iterator&
    {
      advance();
      return *this;
    }
    auto operator++(int) -> void { advance(); }

    friend auto operator==(Iterator const& it, std::default_sentinel_t) noexcept -> bool
    {
      return !it.mCurrent.has_value();
    }

  private:
    auto advance() -> void
    {
      if (mDrain != nullptr && mDrain->hasNext()) {
        mCurrent.emplace(mDrain->next());
      } else {
        mCurrent.reset();
      }
    }

    Drain* mDrain = nullptr;
    mutable std::optional<K> mCurrent;
  };

  explicit Drain(BinaryHeap<K> heap) noexcept : mHeap(std::move(heap)) {}
  Drain(Drain const&) = delete;
  auto operator=(Drain const&) -> Drain& = delete;

  auto hasNext() const noexcept -> bool { return !mHeap.empty(); }
  auto remaining() const noexcept -> std::size_t { return mHeap.size(); }

  auto next() -> K
  {
    if (!hasNext()) {
      throw Error(Errc::Exhausted, "iterator depleted");
    }
    return mHeap.poll();
  }

  // Valid while this Drain is alive.
  auto begin() -> Iterator { return Iterator(this); }
  auto end() const noexcept -> std::default_sentinel_t { return std::default_sentinel; }

private:
  BinaryHeap<K> mHeap;
};

template <typename K>
auto BinaryHeap<K>::drain() const -> Drain<K>
{
  return Drain<K>(copy());
}

// Same size and the same keys in the same priority order.
template <typename K>
  requires std::equality_comparable<K>
auto operator==(BinaryHeap<K> const& lhs, BinaryHeap<K> const& rhs) -> bool
{
  if (&lhs == &rhs) {
    return true;
  }
  if (lhs.size() != rhs.size()) {
    return false;
  }
  auto l = lhs.drain();
  auto r = rhs.drain();
  while (l.hasNext()) {
    if (!(l.next() == r.next())) {
      return false;
    }
  }
  return true;
}

template <typename K>
auto operator<<(std::ostream& os, BinaryHeap<K> const& heap) -> std::ostream&
{
  os << "BinaryHeap[" << heap.size() << "] [ ";
  auto first = true;
  for (auto&& key : heap.drain()) {
    if (!first) {
      os << ", ";
    }
    os << key;
    first = false;
  }
  if (!first) {
    os << ' ';
  }
  return os << ']';
}
} // namespace prio
