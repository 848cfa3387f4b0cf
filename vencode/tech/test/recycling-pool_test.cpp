#include "vencode/recycling-pool.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vencode {

namespace {

struct ThrowsOnce {
  ThrowsOnce() {
    if (gShouldThrow) {
      gShouldThrow = false;
      throw std::runtime_error("construction failed");
    }
  }

  inline static bool gShouldThrow = false;

  int value{42};
};

}  // namespace

TEST(RecyclingPoolTest, AcquireDefaultConstructs) {
  RecyclingPool<std::string> pool;
  std::string *str = pool.acquire();
  ASSERT_NE(str, nullptr);
  EXPECT_TRUE(str->empty());
  EXPECT_EQ(pool.size(), 1U);
  EXPECT_EQ(pool.nbConstructed(), 1U);
  pool.release(str);
  EXPECT_EQ(pool.size(), 0U);
  EXPECT_EQ(pool.nbConstructed(), 1U);
}

TEST(RecyclingPoolTest, ReleasedObjectIsReusedWithItsCapacity) {
  RecyclingPool<std::vector<int>> pool;
  std::vector<int> *vec = pool.acquire();
  vec->assign(100, 7);
  const auto *data = vec->data();
  pool.release(vec);

  std::vector<int> *again = pool.acquire();
  EXPECT_EQ(again, vec);
  EXPECT_EQ(again->data(), data);
  EXPECT_EQ(pool.nbConstructed(), 1U);
}

TEST(RecyclingPoolTest, GrowsOverSeveralBlocks) {
  RecyclingPool<std::string> pool;
  std::vector<std::string *> objs;
  for (int pos = 0; pos < 50; ++pos) {
    objs.push_back(pool.acquire());
    objs.back()->assign(std::to_string(pos));
  }
  EXPECT_EQ(pool.size(), 50U);
  for (int pos = 0; pos < 50; ++pos) {
    EXPECT_EQ(*objs[static_cast<std::size_t>(pos)], std::to_string(pos));
  }
  for (std::string *obj : objs) {
    pool.release(obj);
  }
  EXPECT_EQ(pool.size(), 0U);
  EXPECT_EQ(pool.nbConstructed(), 50U);
}

TEST(RecyclingPoolTest, RecycleAllMakesEveryObjectAvailable) {
  RecyclingPool<std::string> pool;
  for (int pos = 0; pos < 10; ++pos) {
    (void)pool.acquire();
  }
  EXPECT_EQ(pool.size(), 10U);
  pool.recycleAll();
  EXPECT_EQ(pool.size(), 0U);

  for (int pos = 0; pos < 10; ++pos) {
    (void)pool.acquire();
  }
  EXPECT_EQ(pool.size(), 10U);
  EXPECT_EQ(pool.nbConstructed(), 10U);
}

TEST(RecyclingPoolTest, MoveTransfersObjects) {
  RecyclingPool<std::string> pool;
  std::string *str = pool.acquire();
  str->assign("kept");

  RecyclingPool<std::string> moved(std::move(pool));
  EXPECT_EQ(moved.size(), 1U);
  EXPECT_EQ(*str, "kept");
  moved.release(str);

  RecyclingPool<std::string> assigned;
  (void)assigned.acquire();
  assigned = std::move(moved);
  EXPECT_EQ(assigned.nbConstructed(), 1U);
  EXPECT_EQ(assigned.size(), 0U);
}

TEST(RecyclingPoolTest, FailedConstructionKeepsSlotAvailable) {
  RecyclingPool<ThrowsOnce> pool;
  ThrowsOnce *first = pool.acquire();
  EXPECT_EQ(first->value, 42);

  ThrowsOnce::gShouldThrow = true;
  EXPECT_THROW((void)pool.acquire(), std::runtime_error);
  EXPECT_EQ(pool.size(), 1U);
  EXPECT_EQ(pool.nbConstructed(), 1U);

  ThrowsOnce *second = pool.acquire();
  EXPECT_EQ(second->value, 42);
  EXPECT_NE(second, first);
  EXPECT_EQ(pool.nbConstructed(), 2U);
  pool.release(second);
  pool.release(first);
}

}  // namespace vencode
