// tests/test_thread_safe_queue.cpp
#include "fill_dispatcher.hpp"
#include "latency_tracker.hpp"
#include "thread_pool.hpp"
#include "thread_safe_queue.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

TEST(ThreadSafeQueueTest, FifoOrder) {
  ThreadSafeQueue<int> queue;
  queue.push(1);
  queue.push(2);
  queue.push(3);

  EXPECT_EQ(queue.size(), 3u);
  EXPECT_EQ(queue.try_pop(), 1);
  EXPECT_EQ(queue.pop(), 2);
  EXPECT_EQ(queue.pop(), 3);
  EXPECT_TRUE(queue.empty());
  EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(ThreadSafeQueueTest, CloseDrainsThenStops) {
  ThreadSafeQueue<int> queue;
  queue.push(7);
  queue.close();

  EXPECT_TRUE(queue.closed());
  EXPECT_FALSE(queue.push(8));
  EXPECT_EQ(queue.pop(), 7);
  EXPECT_FALSE(queue.pop().has_value());
}

TEST(ThreadSafeQueueTest, CloseWakesBlockedConsumer) {
  ThreadSafeQueue<int> queue;
  std::atomic<bool> returned{false};

  std::thread consumer([&]() {
    auto value = queue.pop();
    EXPECT_FALSE(value.has_value());
    returned = true;
  });

  queue.close();
  consumer.join();
  EXPECT_TRUE(returned.load());
}

TEST(ThreadSafeQueueTest, ConcurrentProducers) {
  ThreadSafeQueue<int> queue;
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 1000;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&queue]() {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(1);
      }
    });
  }
  for (auto &t : producers) {
    t.join();
  }

  int total = 0;
  while (auto value = queue.try_pop()) {
    total += *value;
  }
  EXPECT_EQ(total, kProducers * kPerProducer);
}

TEST(ThreadPoolTest, FuturesCarryResultsAndExceptions) {
  ThreadPool pool(3);
  EXPECT_EQ(pool.size(), 3u);

  std::vector<std::future<int>> results;
  for (int i = 0; i < 10; ++i) {
    results.push_back(pool.submit([i]() { return i * i; }));
  }
  int sum = 0;
  for (auto &f : results) {
    sum += f.get();
  }
  EXPECT_EQ(sum, 285);

  auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
  EXPECT_THROW(failing.get(), std::runtime_error);
}

TEST(FillDispatcherTest, DeliversToEveryListener) {
  FillDispatcher dispatcher;
  std::atomic<int> first{0};
  std::atomic<Quantity> second{0};

  dispatcher.add_listener([&first](const Fill &) { ++first; });
  dispatcher.add_listener([&second](const Fill &f) { second += f.quantity; });
  EXPECT_EQ(dispatcher.listener_count(), 2u);

  std::vector<Fill> fills;
  for (FillId id = 1; id <= 5; ++id) {
    fills.push_back(Fill{id, 1, 2, "TEST", Side::BUY, 10, 100.0, 100.0, 0,
                         LiquidityRole::TAKER, ""});
  }
  dispatcher.publish(fills);
  dispatcher.drain();

  EXPECT_EQ(first.load(), 5);
  EXPECT_EQ(second.load(), 50);
  EXPECT_EQ(dispatcher.delivered(), 5u);
}

TEST(FillDispatcherTest, ThrowingListenerDoesNotStopDelivery) {
  FillDispatcher dispatcher;
  std::atomic<int> delivered{0};
  dispatcher.add_listener(
      [](const Fill &) { throw std::runtime_error("sink offline"); });
  dispatcher.add_listener([&delivered](const Fill &) { ++delivered; });

  Fill fill{1, 1, 2, "TEST", Side::SELL, 1, 50.0, 50.0, 0,
            LiquidityRole::MAKER, ""};
  dispatcher.publish(fill);
  dispatcher.publish(fill);
  dispatcher.drain();

  EXPECT_EQ(delivered.load(), 2);
}

TEST(FillDispatcherTest, ShutdownDropsLaterFills) {
  FillDispatcher dispatcher;
  std::atomic<int> delivered{0};
  dispatcher.add_listener([&delivered](const Fill &) { ++delivered; });

  Fill fill{1, 1, 2, "TEST", Side::SELL, 1, 50.0, 50.0, 0,
            LiquidityRole::MAKER, ""};
  dispatcher.publish(fill);
  dispatcher.shutdown();
  dispatcher.publish(fill);
  dispatcher.drain();

  EXPECT_EQ(delivered.load(), 1);
}

TEST(FillDispatcherTest, DrainReturnsWhilePublishesAreDropped) {
  FillDispatcher dispatcher;
  dispatcher.add_listener([](const Fill &) {});
  dispatcher.shutdown();

  Fill fill{1, 1, 2, "TEST", Side::BUY, 1, 50.0, 50.0, 0,
            LiquidityRole::TAKER, ""};
  std::thread publisher([&]() {
    for (int i = 0; i < 20000; ++i) {
      dispatcher.publish(fill);
    }
  });
  std::thread drainer([&]() {
    for (int i = 0; i < 20000; ++i) {
      dispatcher.drain();
    }
  });
  publisher.join();
  drainer.join();

  EXPECT_EQ(dispatcher.delivered(), 0u);
}

TEST(LatencyTrackerTest, PercentilesAndBound) {
  LatencyTracker tracker(100);
  EXPECT_EQ(tracker.percentile(50), 0);

  for (long long i = 1; i <= 200; ++i) {
    tracker.record(i * 1000);
  }
  // Only the newest 100 samples are kept: 101..200 us
  EXPECT_EQ(tracker.count(), 100u);
  EXPECT_EQ(tracker.percentile(0), 101000);
  EXPECT_EQ(tracker.percentile(50), 151000);
  EXPECT_EQ(tracker.percentile(100), 200000);
}
