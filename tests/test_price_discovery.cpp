// tests/test_price_discovery.cpp
#include "errors.hpp"
#include "liquidity_model.hpp"
#include "price_discovery.hpp"
#include <gtest/gtest.h>

#include <cmath>

class PriceDiscoveryTest : public ::testing::Test {
protected:
  PriceDiscoveryConfig config;
  LiquidityModel liquidity;

  void SetUp() override {
    // Deterministic by default, tests switch terms on as needed
    config.momentum_factor = 0.0;
    config.mean_reversion_rate = 0.0;
    config.volatility = 0.0;
    liquidity.add_symbol("TEST");
  }

  PriceDiscovery make(double price = 100.0, std::uint64_t seed = 42) {
    return PriceDiscovery(config, price, 0.01, seed);
  }
};

TEST_F(PriceDiscoveryTest, RejectsBadInitialPrice) {
  EXPECT_THROW(make(0.0), ValidationError);
  EXPECT_THROW(make(-5.0), ValidationError);
  EXPECT_THROW(make(std::nan("")), ValidationError);
}

TEST_F(PriceDiscoveryTest, QuietMarketHoldsPrice) {
  auto price = make();
  for (int i = 0; i < 10; ++i) {
    EXPECT_DOUBLE_EQ(price.step(0.0, liquidity, "TEST"), 100.0);
  }
  EXPECT_EQ(price.tick_count(), 10u);
  EXPECT_DOUBLE_EQ(price.volatility(), 0.0);
  EXPECT_DOUBLE_EQ(price.momentum(), 0.0);
}

TEST_F(PriceDiscoveryTest, BuyFlowPushesPriceUp) {
  auto price = make();
  const double next = price.step(100.0, liquidity, "TEST");

  // 100 * 0.01 * sqrt(100 / 10000)
  EXPECT_NEAR(next, 100.0 + 100.0 * 0.01 * 0.1, 1e-9);

  auto other = make();
  EXPECT_LT(other.step(-100.0, liquidity, "TEST"), 100.0);
}

TEST_F(PriceDiscoveryTest, FlowMoveIsCapped) {
  liquidity.apply_consumption("TEST", 1e9); // fully depleted

  auto up = make();
  EXPECT_NEAR(up.step(1e7, liquidity, "TEST"),
              100.0 * (1.0 + config.max_flow_return), 1e-9);

  auto down = make();
  EXPECT_NEAR(down.step(-1e7, liquidity, "TEST"),
              100.0 * (1.0 - config.max_flow_return), 1e-9);
}

TEST_F(PriceDiscoveryTest, MeanReversionPullsTowardRollingMean) {
  config.mean_reversion_rate = 0.5;
  auto price = make();

  // Push the price away with flow, then let it revert
  price.step(10000.0, liquidity, "TEST");
  const double displaced = price.last_price();
  ASSERT_GT(displaced, 100.0);

  const double mean = price.rolling_mean();
  const double next = price.step(0.0, liquidity, "TEST");
  EXPECT_LT(next, displaced);
  EXPECT_NEAR(next, displaced + 0.5 * (mean - displaced), 1e-9);
}

TEST_F(PriceDiscoveryTest, MomentumExtendsTrend) {
  config.momentum_factor = 1.0;
  auto price = make();

  price.step(2500.0, liquidity, "TEST");
  const double momentum = price.momentum();
  EXPECT_GT(momentum, 0.0);

  const double before = price.last_price();
  const double next = price.step(0.0, liquidity, "TEST");
  EXPECT_NEAR(next, before + momentum * before, 1e-9);
}

TEST_F(PriceDiscoveryTest, NoiseIsReproduciblePerSeed) {
  config.volatility = 0.01;
  auto a = make(100.0, 7);
  auto b = make(100.0, 7);
  auto c = make(100.0, 8);

  bool diverged = false;
  for (int i = 0; i < 50; ++i) {
    const double pa = a.step(0.0, liquidity, "TEST");
    const double pb = b.step(0.0, liquidity, "TEST");
    const double pc = c.step(0.0, liquidity, "TEST");
    EXPECT_DOUBLE_EQ(pa, pb);
    diverged = diverged || pa != pc;
  }
  EXPECT_TRUE(diverged);
  EXPECT_GT(a.volatility(), 0.0);
}

TEST_F(PriceDiscoveryTest, ExpectedMoveMatchesNextStepWithoutFlow) {
  config.volatility = 0.002;
  config.momentum_factor = 0.3;
  config.mean_reversion_rate = 0.05;
  auto price = make();

  for (int i = 0; i < 20; ++i) {
    const double expected = price.last_price() + price.expected_next_move();
    const double next = price.step(0.0, liquidity, "TEST");
    EXPECT_NEAR(next, std::max(expected, 0.01), 1e-9);
  }
}

TEST_F(PriceDiscoveryTest, PriceStaysPositiveUnderHeavySelling) {
  config.volatility = 0.05;
  auto price = make(1.0);
  for (int i = 0; i < 200; ++i) {
    const double next = price.step(-1e9, liquidity, "TEST");
    EXPECT_GE(next, 0.01);
    EXPECT_TRUE(std::isfinite(next));
  }
}

TEST_F(PriceDiscoveryTest, HistoryIsBounded) {
  config.history_length = 30;
  auto price = make();
  for (int i = 0; i < 100; ++i) {
    price.step(1.0, liquidity, "TEST");
  }
  EXPECT_EQ(price.history().size(), 30u);
  EXPECT_DOUBLE_EQ(price.history().back(), price.last_price());
}
