#include "deadsimple/shared-state.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace deadsimple {

TEST(SharedState, LockGivesAccessToInitialValue) {
  SharedState<std::string> state("initial");
  auto guard = state.lock();
  EXPECT_EQ(*guard, "initial");
  guard->append("+more");
  EXPECT_EQ(*guard, "initial+more");
}

TEST(SharedState, WithLockReturnsFunctionResult) {
  SharedState<std::vector<int>> state({1, 2});
  const auto size = state.withLock([](std::vector<int>& vec) {
    vec.push_back(3);
    return vec.size();
  });
  EXPECT_EQ(size, 3U);
  EXPECT_FALSE(state.isPoisoned());
}

TEST(SharedState, ConcurrentIncrementsAreNotLost) {
  SharedState<int> counter(0);
  constexpr int kNbThreads = 8;
  constexpr int kNbIncrements = 10000;

  std::vector<std::thread> threads;
  threads.reserve(kNbThreads);
  for (int threadPos = 0; threadPos < kNbThreads; ++threadPos) {
    threads.emplace_back([&counter] {
      for (int incr = 0; incr < kNbIncrements; ++incr) {
        counter.withLock([](int& value) { ++value; });
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(*counter.lock(), kNbThreads * kNbIncrements);
}

TEST(SharedState, ExceptionInsideWithLockPoisons) {
  SharedState<int> state(0);
  EXPECT_THROW(state.withLock([](int& value) {
    value = 42;
    throw std::runtime_error("failure while holding the lock");
  }),
               std::runtime_error);

  EXPECT_TRUE(state.isPoisoned());
  EXPECT_THROW((void)state.lock(), PoisonedStateError);
  EXPECT_THROW(state.withLock([](int&) {}), PoisonedStateError);
}

TEST(SharedState, GuardDestroyedDuringUnwindingPoisons) {
  SharedState<int> state(0);
  try {
    auto guard = state.lock();
    *guard = 1;
    throw std::logic_error("boom");
  } catch (const std::logic_error&) {
  }
  EXPECT_TRUE(state.isPoisoned());
  EXPECT_THROW((void)state.lock(), PoisonedStateError);
}

TEST(SharedState, ExceptionOutsideCriticalSectionDoesNotPoison) {
  SharedState<int> state(0);
  try {
    { auto guard = state.lock(); }
    throw std::logic_error("after release");
  } catch (const std::logic_error&) {
  }
  EXPECT_FALSE(state.isPoisoned());
  EXPECT_NO_THROW((void)state.lock());
}

TEST(SharedState, LockAcquiredWhileUnwindingAnotherExceptionIsNotPoisoned) {
  SharedState<int> state(0);
  struct LocksInDestructor {
    SharedState<int>& state;
    ~LocksInDestructor() { state.withLock([](int& value) { ++value; }); }
  };
  try {
    LocksInDestructor locker{state};
    throw std::logic_error("unrelated");
  } catch (const std::logic_error&) {
  }
  EXPECT_FALSE(state.isPoisoned());
  EXPECT_EQ(*state.lock(), 1);
}

}  // namespace deadsimple
