#include <gtest/gtest.h>
#include <procura/common/keyed_mutex.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

TEST(keyed_mutex, entries_are_dropped_after_release) {
  auto mutexes = procura::common::keyed_mutex<std::string>{};
  {
    auto first = mutexes.lock("ENG");
    auto second = mutexes.lock("OPS");
    EXPECT_EQ(mutexes.size(), 2u);
  }
  EXPECT_EQ(mutexes.size(), 0u);
}

TEST(keyed_mutex, same_key_is_mutually_exclusive) {
  auto mutexes = procura::common::keyed_mutex<std::string>{};
  auto inside = std::atomic<int>{};
  auto overlap = std::atomic<bool>{false};
  auto counter = 0;

  auto threads = std::vector<std::thread>{};
  for (auto i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      for (auto j = 0; j < 200; ++j) {
        auto guard = mutexes.lock("ENG");
        if (++inside > 1) {
          overlap = true;
        }
        ++counter;
        --inside;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_FALSE(overlap.load());
  EXPECT_EQ(counter, 8 * 200);
  EXPECT_EQ(mutexes.size(), 0u);
}

TEST(keyed_mutex, different_keys_do_not_block_each_other) {
  auto mutexes = procura::common::keyed_mutex<std::string>{};
  auto held = mutexes.lock("ENG");
  auto acquired = std::atomic<bool>{false};
  auto other = std::thread{[&] {
    auto guard = mutexes.lock("OPS");
    acquired = true;
  }};
  other.join();
  EXPECT_TRUE(acquired.load());
}
