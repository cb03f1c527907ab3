#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "prio/util/slot_buffer.hpp"

using prio::util::SlotBuffer;

namespace {
struct Tracked {
  static inline int live = 0;

  explicit Tracked(int v) : v(v) { live++; }
  Tracked(Tracked const& o) : v(o.v) { live++; }
  Tracked(Tracked&& o) noexcept : v(o.v) { live++; }
  auto operator=(Tracked const&) -> Tracked& = default;
  auto operator=(Tracked&&) noexcept -> Tracked& = default;
  ~Tracked() { live--; }

  int v;
};

// Move may throw, so relocation copies; the copy fails once copiesLeft reaches zero.
struct Fragile {
  static inline int live = 0;
  static inline int copiesLeft = -1;

  explicit Fragile(int v) : v(v) { live++; }
  Fragile(Fragile const& o) : v(o.v)
  {
    if (copiesLeft == 0) {
      throw std::runtime_error("copy failed");
    }
    if (copiesLeft > 0) {
      copiesLeft--;
    }
    live++;
  }
  Fragile(Fragile&& o) : v(o.v) { live++; }
  auto operator=(Fragile const&) -> Fragile& = default;
  ~Fragile() { live--; }

  int v;
};
} // namespace

TEST(SlotBuffer, Defaults)
{
  auto buf = SlotBuffer<int>();
  ASSERT_EQ(buf.length(), 0);
  ASSERT_EQ(buf.capacity(), SlotBuffer<int>::kMinCapacity);
}

TEST(SlotBuffer, GrowsByDoublingAndKeepsSlots)
{
  auto buf = SlotBuffer<int>(4);
  buf.append(10);
  buf.append(20);
  buf.append(30);
  ASSERT_EQ(buf.capacity(), 4);
  buf.append(40);
  ASSERT_EQ(buf.capacity(), 8);
  ASSERT_EQ(buf.length(), 4);
  for (std::size_t i = 1; i <= 4; i++) {
    ASSERT_EQ(buf[i], static_cast<int>(i * 10));
  }

  buf.append(50);
  buf.append(60);
  buf.append(70);
  buf.ensureCapacityForInsert();
  ASSERT_EQ(buf.capacity(), 16);
  ASSERT_EQ(buf[7], 70);
}

TEST(SlotBuffer, ShrinksToQuarterButNotBelowFloor)
{
  auto buf = SlotBuffer<int>(4);
  for (int i = 1; i <= 10; i++) {
    buf.append(i);
    ASSERT_LT(buf.length(), buf.capacity());
  }
  ASSERT_EQ(buf.capacity(), 16);
  while (buf.length() > 0) {
    auto v = buf.removeLast();
    ASSERT_EQ(v, static_cast<int>(buf.length() + 1));
    buf.ensureCapacityForRemoval();
    if (buf.length() > 4) {
      ASSERT_EQ(buf.capacity(), 16);
    }
  }
  ASSERT_EQ(buf.capacity(), 8);
}

TEST(SlotBuffer, CopyCapacityPolicy)
{
  ASSERT_EQ(SlotBuffer<int>::copyCapacity(0), 8);
  ASSERT_EQ(SlotBuffer<int>::copyCapacity(3), 8);
  ASSERT_EQ(SlotBuffer<int>::copyCapacity(10), 20);

  auto buf = SlotBuffer<int>(64);
  for (int i = 1; i <= 10; i++) {
    buf.append(i);
  }
  auto cp = buf;
  ASSERT_EQ(cp.capacity(), 20);
  ASSERT_EQ(cp.length(), 10);
  for (std::size_t i = 1; i <= 10; i++) {
    ASSERT_EQ(cp[i], buf[i]);
  }
  cp[1] = 100;
  ASSERT_EQ(buf[1], 1);
}

TEST(SlotBuffer, TransformCopy)
{
  auto buf = SlotBuffer<int>();
  buf.append(1);
  buf.append(2);
  auto doubled = SlotBuffer<int>(buf, [](int const& v) { return v * 2; });
  ASSERT_EQ(doubled.length(), 2);
  ASSERT_EQ(doubled[1], 2);
  ASSERT_EQ(doubled[2], 4);
}

TEST(SlotBuffer, FailedTransformReleasesPartialCopy)
{
  {
    auto buf = SlotBuffer<Tracked>();
    buf.append(1);
    buf.append(2);
    buf.append(3);
    ASSERT_EQ(Tracked::live, 3);
    auto bad = [](Tracked const& t) {
      if (t.v == 3) {
        throw std::runtime_error("transform failed");
      }
      return Tracked(t.v);
    };
    EXPECT_THROW(static_cast<void>(SlotBuffer<Tracked>(buf, bad)), std::runtime_error);
    ASSERT_EQ(Tracked::live, 3);
  }
  ASSERT_EQ(Tracked::live, 0);
}

TEST(SlotBuffer, RemovedSlotIsReleased)
{
  auto key = std::make_shared<int>(5);
  auto buf = SlotBuffer<std::shared_ptr<int>>();
  buf.append(key);
  ASSERT_EQ(key.use_count(), 2);
  buf.removeLast();
  ASSERT_EQ(key.use_count(), 1);
}

TEST(SlotBuffer, MovedFromIsReusable)
{
  auto buf = SlotBuffer<int>();
  buf.append(1);
  auto other = std::move(buf);
  ASSERT_EQ(other.length(), 1);
  ASSERT_EQ(buf.length(), 0);
  buf.append(7);
  ASSERT_EQ(buf.length(), 1);
  ASSERT_EQ(buf[1], 7);
  ASSERT_EQ(buf.capacity(), SlotBuffer<int>::kMinCapacity);
}

TEST(SlotBuffer, ClearResetsCapacity)
{
  auto buf = SlotBuffer<int>(4);
  for (int i = 0; i < 20; i++) {
    buf.append(i);
  }
  buf.clear();
  ASSERT_EQ(buf.length(), 0);
  ASSERT_EQ(buf.capacity(), SlotBuffer<int>::kMinCapacity);
}

TEST(SlotBuffer, AppendOwnSlotWhileGrowing)
{
  auto buf = SlotBuffer<std::string>(4);
  buf.append(std::string(40, 'c'));
  buf.append(std::string(40, 'a'));
  buf.append(std::string(40, 'b'));
  ASSERT_EQ(buf.capacity(), 4);
  buf.append(buf[2]);
  ASSERT_EQ(buf.capacity(), 8);
  ASSERT_EQ(buf.length(), 4);
  ASSERT_EQ(buf[4], std::string(40, 'a'));
  ASSERT_EQ(buf[2], std::string(40, 'a'));
  ASSERT_EQ(buf[1], std::string(40, 'c'));
}

TEST(SlotBuffer, FailedGrowKeepsSlots)
{
  {
    auto buf = SlotBuffer<Fragile>(4);
    buf.append(1);
    buf.append(2);
    buf.append(3);
    ASSERT_EQ(Fragile::live, 3);

    Fragile::copiesLeft = 1;
    EXPECT_THROW(buf.append(4), std::runtime_error);
    Fragile::copiesLeft = -1;
    ASSERT_EQ(Fragile::live, 3);
    ASSERT_EQ(buf.capacity(), 4);
    ASSERT_EQ(buf.length(), 3);
    for (std::size_t i = 1; i <= 3; i++) {
      ASSERT_EQ(buf[i].v, static_cast<int>(i));
    }

    buf.append(4);
    ASSERT_EQ(buf.capacity(), 8);
    ASSERT_EQ(buf[4].v, 4);
  }
  ASSERT_EQ(Fragile::live, 0);
}

TEST(SlotBuffer, FailedShrinkKeepsSlots)
{
  {
    auto buf = SlotBuffer<Fragile>(32);
    buf.append(1);
    buf.append(2);
    buf.append(3);
    buf.removeLast();
    ASSERT_EQ(Fragile::live, 2);

    Fragile::copiesLeft = 0;
    EXPECT_THROW(buf.ensureCapacityForRemoval(), std::runtime_error);
    Fragile::copiesLeft = -1;
    ASSERT_EQ(Fragile::live, 2);
    ASSERT_EQ(buf.capacity(), 32);
    ASSERT_EQ(buf[1].v, 1);
    ASSERT_EQ(buf[2].v, 2);

    buf.ensureCapacityForRemoval();
    ASSERT_EQ(buf.capacity(), 16);
  }
  ASSERT_EQ(Fragile::live, 0);
}
