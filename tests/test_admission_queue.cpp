#include <gtest/gtest.h>

#include "core/admission_queue.h"

#include <algorithm>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace easythreads::core;

TEST(AdmissionQueue, PopsLowestPriorityFirst) {
  AdmissionQueue queue;
  queue.push("three", 3);
  queue.push("one", 1);
  queue.push("two", 2);

  ASSERT_EQ(queue.pop().value(), "one");
  ASSERT_EQ(queue.pop().value(), "two");
  ASSERT_EQ(queue.pop().value(), "three");
}

TEST(AdmissionQueue, EqualPrioritiesPopInPushOrder) {
  AdmissionQueue queue;
  queue.push("a", 5);
  queue.push("b", 5);
  queue.push("urgent", 0);
  queue.push("c", 5);

  ASSERT_EQ(queue.names(),
            (std::vector<std::string>{"urgent", "a", "b", "c"}));
  ASSERT_EQ(queue.pop().value(), "urgent");
  ASSERT_EQ(queue.pop().value(), "a");
  ASSERT_EQ(queue.pop().value(), "b");
  ASSERT_EQ(queue.pop().value(), "c");
}

TEST(AdmissionQueue, NegativePrioritiesAreMoreUrgent) {
  AdmissionQueue queue;
  queue.push("zero", 0);
  queue.push("minus", -10);

  ASSERT_EQ(queue.pop().value(), "minus");
}

TEST(AdmissionQueue, EmptyPopReturnsNothing) {
  AdmissionQueue queue;
  ASSERT_TRUE(queue.empty());
  ASSERT_FALSE(queue.pop().has_value());

  queue.push("x", 1);
  ASSERT_FALSE(queue.empty());
  ASSERT_EQ(queue.size(), 1u);
  queue.pop();
  ASSERT_FALSE(queue.pop().has_value());
}

TEST(AdmissionQueue, NamesSnapshotDoesNotConsume) {
  AdmissionQueue queue;
  queue.push("b", 2);
  queue.push("a", 1);

  ASSERT_EQ(queue.names(), (std::vector<std::string>{"a", "b"}));
  ASSERT_EQ(queue.size(), 2u);

  queue.clear();
  ASSERT_TRUE(queue.empty());
  ASSERT_TRUE(queue.names().empty());
}

TEST(AdmissionQueue, RemoveKeepsOrderOfTheRest) {
  AdmissionQueue queue;
  queue.push("a", 1);
  queue.push("b", 0);
  queue.push("c", 1);
  queue.push("d", 2);

  ASSERT_TRUE(queue.contains("a"));
  ASSERT_TRUE(queue.remove("a"));
  ASSERT_FALSE(queue.contains("a"));
  ASSERT_FALSE(queue.remove("a"));
  ASSERT_FALSE(queue.remove("missing"));

  ASSERT_EQ(queue.size(), 3u);
  ASSERT_EQ(queue.names(), (std::vector<std::string>{"b", "c", "d"}));
  queue.push("e", 1);
  ASSERT_EQ(queue.names(), (std::vector<std::string>{"b", "c", "e", "d"}));
}

TEST(AdmissionQueue, ConcurrentPushPopDeliversEachNameOnce) {
  AdmissionQueue queue;
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 250;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue, p]() {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push("p" + std::to_string(p) + "-" + std::to_string(i), i % 7);
      }
    });
  }

  std::mutex seen_mutex;
  std::vector<std::string> seen;
  std::vector<std::thread> consumers;
  for (int c = 0; c < 3; ++c) {
    consumers.emplace_back([&]() {
      int idle_rounds = 0;
      while (idle_rounds < 200) {
        auto name = queue.pop();
        if (!name.has_value()) {
          ++idle_rounds;
          std::this_thread::yield();
          continue;
        }
        idle_rounds = 0;
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.push_back(*name);
      }
    });
  }

  for (auto &t : producers) {
    t.join();
  }
  for (auto &t : consumers) {
    t.join();
  }
  while (auto rest = queue.pop()) {
    seen.push_back(*rest);
  }

  ASSERT_EQ(seen.size(), static_cast<size_t>(kProducers * kPerProducer));
  std::set<std::string> unique(seen.begin(), seen.end());
  ASSERT_EQ(unique.size(), seen.size());
}
