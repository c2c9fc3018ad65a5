// tests/test_execution_engine.cpp
#include "execution_engine.hpp"
#include <gtest/gtest.h>

#include <cmath>
#include <memory>

class ExecutionEngineTest : public ::testing::Test {
protected:
  OrderBookConfig book_config;
  LiquidityConfig liquidity_config;
  ExecutionConfig exec_config;

  std::unique_ptr<OrderBook> book;
  std::unique_ptr<LiquidityModel> liquidity;
  std::unique_ptr<ExecutionEngine> engine;

  void SetUp() override {
    exec_config.slippage_coefficient = 0.0;
    liquidity_config.impact_coefficient = 0.0;
    rebuild();
  }

  void rebuild() {
    engine.reset();
    book = std::make_unique<OrderBook>("TEST", book_config);
    liquidity = std::make_unique<LiquidityModel>(liquidity_config);
    engine = std::make_unique<ExecutionEngine>(*book, *liquidity, exec_config,
                                               book_config, 1);
  }

  OrderRequest limit(Side side, double price, Quantity qty) {
    OrderRequest request;
    request.symbol = "TEST";
    request.side = side;
    request.type = OrderType::LIMIT;
    request.price = price;
    request.quantity = qty;
    return request;
  }

  OrderRequest market(Side side, Quantity qty) {
    OrderRequest request;
    request.symbol = "TEST";
    request.side = side;
    request.type = OrderType::MARKET;
    request.quantity = qty;
    return request;
  }
};

TEST_F(ExecutionEngineTest, OrderIdsCarryLaneIndex) {
  OrderIdGenerator lane_three(3);
  const OrderId first = lane_three.next_id();
  const OrderId second = lane_three.next_id();

  EXPECT_EQ(lane_of(first), 3u);
  EXPECT_EQ(first & kSequenceMask, 1u);
  EXPECT_EQ(second, first + 1);

  auto report = engine->submit(limit(Side::BUY, 99.0, 10), 0);
  EXPECT_EQ(lane_of(report.order.id), 1u);
}

TEST_F(ExecutionEngineTest, LimitOrderRestsOpen) {
  auto report = engine->submit(limit(Side::BUY, 99.5, 100), 1000);

  EXPECT_EQ(report.order.state, OrderState::OPEN);
  EXPECT_EQ(report.order.timestamp, 1000);
  EXPECT_TRUE(report.fills.empty());
  EXPECT_TRUE(book->is_resting(report.order.id));
  EXPECT_EQ(engine->orders_submitted(), 1u);
}

TEST_F(ExecutionEngineTest, ValidationFailures) {
  EXPECT_THROW(engine->submit(limit(Side::BUY, 99.5, 0), 0), ValidationError);
  EXPECT_THROW(engine->submit(limit(Side::BUY, 99.505, 10), 0),
               ValidationError);

  OrderRequest no_price = limit(Side::BUY, 99.5, 10);
  no_price.price.reset();
  EXPECT_THROW(engine->submit(no_price, 0), ValidationError);

  OrderRequest wrong_symbol = limit(Side::BUY, 99.5, 10);
  wrong_symbol.symbol = "OTHER";
  EXPECT_THROW(engine->submit(wrong_symbol, 0), ValidationError);

  EXPECT_EQ(book->bid_level_count(), 0u);
}

TEST_F(ExecutionEngineTest, MarketOrderFillsWithLatency) {
  exec_config.latency_us = 750;
  rebuild();

  engine->submit(limit(Side::SELL, 100.5, 150), 0);
  auto report = engine->submit(market(Side::BUY, 100), 2000);

  EXPECT_EQ(report.order.state, OrderState::FILLED);
  ASSERT_EQ(report.fills.size(), 2u);
  EXPECT_EQ(report.fills[0].timestamp, 2750);
  EXPECT_EQ(engine->volume(), 100);
  EXPECT_EQ(engine->trade_count(), 1u);
}

TEST_F(ExecutionEngineTest, MarketOrderWithoutLiquidityIsRejected) {
  auto report = engine->submit(market(Side::SELL, 10), 0);

  EXPECT_TRUE(report.rejected());
  EXPECT_EQ(engine->orders_rejected(), 1u);
  EXPECT_EQ(engine->volume(), 0);
}

TEST_F(ExecutionEngineTest, NetFlowAccumulatesAndResets) {
  engine->submit(limit(Side::SELL, 101.0, 500), 0);
  engine->submit(limit(Side::BUY, 99.0, 500), 0);

  engine->submit(market(Side::BUY, 120), 0);
  engine->submit(market(Side::SELL, 20), 0);

  EXPECT_DOUBLE_EQ(engine->pending_net_flow(), 100.0);
  EXPECT_DOUBLE_EQ(engine->take_net_flow(), 100.0);
  EXPECT_DOUBLE_EQ(engine->pending_net_flow(), 0.0);
}

TEST_F(ExecutionEngineTest, FillsConsumeLiquidity) {
  engine->submit(limit(Side::SELL, 101.0, 500), 0);
  engine->submit(market(Side::BUY, 300), 0);

  EXPECT_DOUBLE_EQ(liquidity->level("TEST"),
                   liquidity_config.base_liquidity - 300.0);
}

TEST_F(ExecutionEngineTest, SlippageScalesWithModel) {
  exec_config.slippage_coefficient = 0.01;
  exec_config.slippage_model = SlippageModel::LINEAR;
  rebuild();
  engine->submit(limit(Side::SELL, 100.0, 5000), 0);

  Order probe(engine->next_order_id(), "TEST", Side::BUY, OrderType::MARKET,
              1000);
  const double ratio = 1000.0 / liquidity_config.base_liquidity;
  EXPECT_NEAR(engine->slippage(probe), 0.01 * ratio, 1e-12);

  exec_config.slippage_model = SlippageModel::SQUARE_ROOT;
  rebuild();
  engine->submit(limit(Side::SELL, 100.0, 5000), 0);
  EXPECT_NEAR(engine->slippage(probe), 0.01 * std::sqrt(ratio), 1e-12);

  exec_config.slippage_model = SlippageModel::QUADRATIC;
  rebuild();
  engine->submit(limit(Side::SELL, 100.0, 5000), 0);
  EXPECT_NEAR(engine->slippage(probe), 0.01 * ratio * ratio, 1e-12);
}

TEST_F(ExecutionEngineTest, SizeBeyondTopOfBookAddsImpact) {
  liquidity_config.impact_coefficient = 0.01;
  rebuild();
  engine->submit(limit(Side::SELL, 100.0, 100), 0);
  engine->submit(limit(Side::SELL, 101.0, 1000), 0);

  Order small(engine->next_order_id(), "TEST", Side::BUY, OrderType::MARKET,
              50);
  Order large(engine->next_order_id(), "TEST", Side::BUY, OrderType::MARKET,
              400);
  EXPECT_DOUBLE_EQ(engine->slippage(small), 0.0);
  EXPECT_NEAR(engine->slippage(large),
              0.01 * std::sqrt(400.0 / liquidity_config.base_liquidity),
              1e-12);
}

TEST_F(ExecutionEngineTest, TakerPaysSlippageInEffectivePrice) {
  exec_config.slippage_coefficient = 0.01;
  exec_config.slippage_model = SlippageModel::LINEAR;
  rebuild();

  engine->submit(limit(Side::SELL, 100.0, 1000), 0);
  auto report = engine->submit(market(Side::BUY, 1000), 0);

  ASSERT_EQ(report.fills.size(), 2u);
  const double adjustment = 0.01 * (1000.0 / liquidity_config.base_liquidity);
  EXPECT_NEAR(report.fills[0].effective_price, 100.0 * (1.0 + adjustment),
              1e-9);
  EXPECT_DOUBLE_EQ(report.fills[1].effective_price, 100.0);
}

TEST_F(ExecutionEngineTest, DepletedLiquidityKeepsSellPricesPositive) {
  exec_config = ExecutionConfig();
  liquidity_config = LiquidityConfig();
  rebuild();

  engine->submit(limit(Side::BUY, 100.00, 10000), 0);
  engine->submit(limit(Side::BUY, 99.99, 5000), 0);
  engine->submit(limit(Side::BUY, 99.98, 10000), 0);

  auto first = engine->submit(market(Side::SELL, 10000), 0);
  EXPECT_DOUBLE_EQ(liquidity->level("TEST"), 0.0);
  auto second = engine->submit(market(Side::SELL, 10000), 0);

  for (const auto *report : {&first, &second}) {
    ASSERT_FALSE(report->fills.empty());
    for (const auto &fill : report->fills) {
      EXPECT_GT(fill.effective_price, 0.0);
      EXPECT_GE(fill.effective_price,
                fill.price * (1.0 - exec_config.max_slippage) - 1e-9);
      EXPECT_LE(fill.effective_price, fill.price);
    }
  }
}

TEST_F(ExecutionEngineTest, SlippageIsCapped) {
  exec_config.slippage_coefficient = 1.0;
  exec_config.max_slippage = 0.02;
  rebuild();
  engine->submit(limit(Side::BUY, 100.0, 100), 0);

  Order huge(engine->next_order_id(), "TEST", Side::SELL, OrderType::MARKET,
             1000000);
  EXPECT_DOUBLE_EQ(engine->slippage(huge), 0.02);
}

TEST_F(ExecutionEngineTest, CancelRestingAndTerminalOrders) {
  auto resting = engine->submit(limit(Side::BUY, 99.0, 100), 0);
  EXPECT_TRUE(engine->cancel(resting.order.id).ok());

  Status again = engine->cancel(resting.order.id);
  EXPECT_EQ(again.code, ErrorCode::NOT_FOUND);

  Status unknown = engine->cancel(123456);
  EXPECT_EQ(unknown.code, ErrorCode::NOT_FOUND);
  EXPECT_EQ(book->bid_level_count(), 0u);
}

TEST_F(ExecutionEngineTest, MidBeforeIsRecorded) {
  engine->submit(limit(Side::BUY, 99.0, 100), 0);
  engine->submit(limit(Side::SELL, 101.0, 100), 0);

  auto report = engine->submit(market(Side::BUY, 10), 0);
  ASSERT_TRUE(report.mid_before.has_value());
  EXPECT_DOUBLE_EQ(*report.mid_before, 100.0);
}
