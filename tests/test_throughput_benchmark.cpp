#include "order_book.hpp"
#include "simulation.hpp"

#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>
#include <iostream>

TEST(ThroughputTest, Meets100kRestingOrdersPerSecond) {
  OrderBook book("BENCH");
  auto start = Clock::now();

  const int NUM_ORDERS = 100000;
  for (int i = 0; i < NUM_ORDERS; ++i) {
    book.add(Order(i + 1, "BENCH", Side::BUY, 100.0 - (i % 100) * 0.01, 10));
  }

  auto end = Clock::now();
  std::chrono::duration<double> elapsed = end - start;
  double seconds = std::max(elapsed.count(), 1e-9);
  double throughput = NUM_ORDERS / seconds;

  EXPECT_EQ(book.bid_level_count(), 100u);
  EXPECT_GT(throughput, 100000); // >= 100k orders/s
  std::cout << "Achieved: " << throughput << " orders/sec" << std::endl;
}

TEST(ThroughputTest, TicksPerSecondWithFullPopulation) {
  SimulationConfig config; // default population: 40 agents per symbol
  config.worker_threads = 4;
  Simulation sim(config);
  for (const auto &symbol : {"AAA", "BBB", "CCC", "DDD"}) {
    ASSERT_TRUE(sim.add_symbol(symbol, 100.0).ok());
  }

  const std::size_t NUM_TICKS = 500;
  auto start = Clock::now();
  ASSERT_TRUE(sim.run_ticks(NUM_TICKS).ok());
  auto end = Clock::now();

  std::chrono::duration<double> elapsed = end - start;
  double ticks_per_second = NUM_TICKS / std::max(elapsed.count(), 1e-9);

  EXPECT_TRUE(sim.halted_symbols().empty());
  EXPECT_GT(ticks_per_second, 100); // well above the 10 Hz default cadence
  std::cout << "Achieved: " << ticks_per_second << " ticks/sec ("
            << sim.tick_latency().percentile(99) / 1000 << " us p99)"
            << std::endl;
}
