#pragma once
#include "prio/__preclude.hpp"
#include "prio/util/panic.hpp"

namespace prio::util {
// Growable 1-indexed slot array. Slot 0 is never constructed; slots 1..length() hold
// live objects and nothing beyond length() is alive. Capacity counts slot 0, so
// length() < capacity() always holds.
template <typename T>
class SlotBuffer {
public:
  static constexpr std::size_t kMinCapacity = 8;

  explicit SlotBuffer(std::size_t capacity = kMinCapacity) : mData(allocate(capacity)), mCapacity(capacity)
  {
    panicIf(capacity == 0, "slot buffer needs at least the sentinel slot");
  }

  // Sized by the copy policy, not by the source's capacity.
  SlotBuffer(SlotBuffer const& other)
      : SlotBuffer(other, [](T const& item) -> T const& { return item; })
  {
  }

  // Slot i of the new buffer holds fn(other[i]). The delegated constructor has already
  // completed, so if fn throws the destructor releases the slots built so far.
  template <typename F>
  SlotBuffer(SlotBuffer const& other, F&& fn) : SlotBuffer(copyCapacity(other.mLength))
  {
    for (std::size_t i = 1; i <= other.mLength; i++) {
      std::construct_at(mData + i, fn(other.mData[i]));
      mLength = i;
    }
  }

  SlotBuffer(SlotBuffer&& other) noexcept
      : mData(std::exchange(other.mData, nullptr)),
        mCapacity(std::exchange(other.mCapacity, 0)),
        mLength(std::exchange(other.mLength, 0))
  {
  }

  auto operator=(SlotBuffer const& other) -> SlotBuffer&
  {
    if (this != &other) {
      SlotBuffer tmp(other);
      swap(tmp);
    }
    return *this;
  }

  auto operator=(SlotBuffer&& other) noexcept -> SlotBuffer&
  {
    SlotBuffer tmp(std::move(other));
    swap(tmp);
    return *this;
  }

  ~SlotBuffer() noexcept
  {
    if (mData != nullptr) {
      destroyLive();
      deallocate(mData, mCapacity);
    }
  }

  auto swap(SlotBuffer& other) noexcept -> void
  {
    std::swap(mData, other.mData);
    std::swap(mCapacity, other.mCapacity);
    std::swap(mLength, other.mLength);
  }

  auto length() const noexcept -> std::size_t { return mLength; }
  auto capacity() const noexcept -> std::size_t { return mCapacity; }

  auto operator[](std::size_t i) noexcept -> T& { return mData[i]; }
  auto operator[](std::size_t i) const noexcept -> T const& { return mData[i]; }

  // args may refer to one of the live slots, so on growth the new object is built in the
  // new allocation before the old slots are moved out of the way.
  template <typename... Args>
  auto append(Args&&... args) -> T&
  {
    if (mLength + 1 >= mCapacity) {
      return growAppend(growCapacity(), std::forward<Args>(args)...);
    }
    T* slot = std::construct_at(mData + mLength + 1, std::forward<Args>(args)...);
    mLength += 1;
    return *slot;
  }

  // Moves the last live object out and destroys its slot.
  auto removeLast() -> T
  {
    panicIf(mLength == 0, "removeLast on empty slot buffer");
    T out = std::move(mData[mLength]);
    std::destroy_at(mData + mLength);
    mLength -= 1;
    return out;
  }

  auto clear(std::size_t capacity = kMinCapacity) -> void
  {
    SlotBuffer fresh(capacity);
    swap(fresh);
  }

  auto ensureCapacityForInsert() -> void
  {
    if (mLength + 1 >= mCapacity) {
      resize(growCapacity());
    }
  }

  auto ensureCapacityForRemoval() -> void
  {
    if (mLength <= mCapacity / 4 && mCapacity / 2 >= kMinCapacity) {
      resize(mCapacity / 2);
    }
  }

  static auto copyCapacity(std::size_t length) noexcept -> std::size_t
  {
    return length * 2 > kMinCapacity ? length * 2 : kMinCapacity;
  }

private:
  // A moved-from buffer has no allocation at all.
  auto growCapacity() const noexcept -> std::size_t { return mCapacity == 0 ? kMinCapacity : mCapacity * 2; }

  // Same slot numbers in a fresh allocation. If allocation or a transfer throws, the
  // buffer keeps its allocation and live slots.
  auto resize(std::size_t newCapacity) -> void
  {
    panicIf(newCapacity <= mLength, "resize would drop live slots");
    T* newData = allocate(newCapacity);
    try {
      transferTo(newData);
    } catch (...) {
      deallocate(newData, newCapacity);
      throw;
    }
    adopt(newData, newCapacity);
  }

  template <typename... Args>
  auto growAppend(std::size_t newCapacity, Args&&... args) -> T&
  {
    panicIf(newCapacity <= mLength + 1, "grow would leave no room for the new slot");
    T* newData = allocate(newCapacity);
    T* slot = nullptr;
    try {
      slot = std::construct_at(newData + mLength + 1, std::forward<Args>(args)...);
      transferTo(newData);
    } catch (...) {
      if (slot != nullptr) {
        std::destroy_at(slot);
      }
      deallocate(newData, newCapacity);
      throw;
    }
    adopt(newData, newCapacity);
    mLength += 1;
    return *slot;
  }

  // Builds slots 1..mLength of dst from the live slots, copying when T's move may throw.
  // On a throw the slots already built in dst are destroyed.
  auto transferTo(T* dst) -> void
  {
    std::size_t built = 0;
    try {
      for (; built < mLength; built++) {
        std::construct_at(dst + built + 1, std::move_if_noexcept(mData[built + 1]));
      }
    } catch (...) {
      std::destroy(dst + 1, dst + 1 + built);
      throw;
    }
  }

  // Releases the old allocation after transferTo() filled newData.
  auto adopt(T* newData, std::size_t newCapacity) noexcept -> void
  {
    std::destroy(mData + 1, mData + 1 + mLength);
    deallocate(mData, mCapacity);
    mData = newData;
    mCapacity = newCapacity;
  }

  auto destroyLive() noexcept -> void
  {
    for (std::size_t i = 1; i <= mLength; i++) {
      std::destroy_at(mData + i);
    }
    mLength = 0;
  }

  static auto allocate(std::size_t n) -> T* { return std::allocator<T>().allocate(n); }
  static auto deallocate(T* p, std::size_t n) noexcept -> void { std::allocator<T>().deallocate(p, n); }

  T* mData;
  std::size_t mCapacity;
  std::size_t mLength = 0;
};
} // namespace prio::util
