#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include "utils/parallel.hpp"
#include "test_utils.hpp"

using namespace shardpack;

class ParallelTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_logging();
  }
};

TEST_F(ParallelTest, RunsEveryIndexOnce) {
  std::vector<std::atomic<int>> hits(100);
  utils::run_indexed(hits.size(), 4, [&hits](std::size_t i) { ++hits[i]; });

  for (const auto& hit : hits) {
    EXPECT_EQ(hit.load(), 1);
  }
}

TEST_F(ParallelTest, SequentialRunsOnCallingThread) {
  const auto caller = std::this_thread::get_id();
  std::vector<std::size_t> order;

  utils::run_indexed(5, 1, [&](std::size_t i) {
    EXPECT_EQ(std::this_thread::get_id(), caller);
    order.push_back(i);
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3, 4}));
}

TEST_F(ParallelTest, UsesSeveralThreads) {
  std::mutex mutex;
  std::set<std::thread::id> threads;
  std::atomic<int> running{0};
  std::atomic<int> peak{0};

  utils::run_indexed(8, 4, [&](std::size_t) {
    int now = ++running;
    int previous = peak.load();
    while (now > previous && !peak.compare_exchange_weak(previous, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    --running;
    std::lock_guard<std::mutex> lock(mutex);
    threads.insert(std::this_thread::get_id());
  });

  EXPECT_GT(threads.size(), 1u);
  EXPECT_LE(peak.load(), 4);
}

TEST_F(ParallelTest, LowestFailingIndexRethrown) {
  try {
    utils::run_indexed(20, 4, [](std::size_t i) {
      if (i == 15) {
        throw std::runtime_error("fifteen");
      }
      if (i == 6) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        throw std::out_of_range("six");
      }
    });
    FAIL() << "Expected an exception";
  } catch (const std::out_of_range& e) {
    EXPECT_STREQ(e.what(), "six");
  }
}

TEST_F(ParallelTest, ZeroTasks) {
  bool called = false;
  utils::run_indexed(0, 4, [&called](std::size_t) { called = true; });
  EXPECT_FALSE(called);
}
