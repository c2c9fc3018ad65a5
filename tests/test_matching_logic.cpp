// tests/test_matching_logic.cpp
#include "test_helpers.hpp"

TEST_F(OrderBookTest, SimpleMatch) {
  add_limit_order(1, Side::BUY, 100.0, 100);
  auto result = add_limit_order(2, Side::SELL, 100.0, 100);

  EXPECT_EQ(fill_count(), 1u);
  EXPECT_TRUE(has_fill(2, 1, 100.0, 100));
  EXPECT_EQ(result.fills.size(), 2u); // taker + maker
  EXPECT_EQ(result.order.state, OrderState::FILLED);

  assert_empty_book(); // Both orders fully filled
}

TEST_F(OrderBookTest, TakerAndMakerFillsMirrorEachOther) {
  add_limit_order(1, Side::SELL, 100.0, 100);
  auto result = add_limit_order(2, Side::BUY, 100.0, 60);

  ASSERT_EQ(result.fills.size(), 2u);
  const Fill &taker = result.fills[0];
  const Fill &maker = result.fills[1];
  EXPECT_EQ(taker.liquidity, LiquidityRole::TAKER);
  EXPECT_EQ(maker.liquidity, LiquidityRole::MAKER);
  EXPECT_EQ(taker.order_id, 2u);
  EXPECT_EQ(maker.order_id, 1u);
  EXPECT_EQ(taker.counterparty_order_id, 1u);
  EXPECT_EQ(taker.side, Side::BUY);
  EXPECT_EQ(maker.side, Side::SELL);
  EXPECT_EQ(taker.quantity, maker.quantity);
  EXPECT_DOUBLE_EQ(taker.price, maker.price);
  EXPECT_NE(taker.id, maker.id);
}

TEST_F(OrderBookTest, AggressiveBuyerExecutesAtPassivePrice) {
  add_limit_order(1, Side::SELL, 100.0, 100);
  add_limit_order(2, Side::BUY, 101.0, 100); // Crosses spread

  EXPECT_EQ(fill_count(), 1u);
  EXPECT_TRUE(has_fill(2, 1, 100.0, 100));
  ASSERT_TRUE(book->last_trade_price().has_value());
  EXPECT_DOUBLE_EQ(*book->last_trade_price(), 100.0);
}

TEST_F(OrderBookTest, AggressiveSellerExecutesAtPassivePrice) {
  add_limit_order(1, Side::BUY, 100.0, 100);
  add_limit_order(2, Side::SELL, 99.0, 100); // Crosses spread

  EXPECT_EQ(fill_count(), 1u);
  EXPECT_TRUE(has_fill(2, 1, 100.0, 100));
}

TEST_F(OrderBookTest, PartialFillLeavesMakerAtFront) {
  add_limit_order(1, Side::BUY, 100.0, 100);
  add_limit_order(2, Side::BUY, 100.0, 100);
  add_limit_order(3, Side::SELL, 100.0, 50);

  EXPECT_TRUE(has_fill(3, 1, 100.0, 50));
  EXPECT_ORDER_STATE(1, OrderState::PARTIALLY_FILLED);
  EXPECT_ORDER_STATE(3, OrderState::FILLED);
  EXPECT_EQ(book->top_quantity(Side::BUY), 150);

  // Order 1 keeps its priority for the next sell
  add_limit_order(4, Side::SELL, 100.0, 60);
  EXPECT_TRUE(has_fill(4, 1, 100.0, 50));
  EXPECT_TRUE(has_fill(4, 2, 100.0, 10));
  EXPECT_ORDER_STATE(1, OrderState::FILLED);
}

TEST_F(OrderBookTest, TimePriorityWithinLevel) {
  add_limit_order(1, Side::SELL, 100.0, 50);
  add_limit_order(2, Side::SELL, 100.0, 50);
  add_limit_order(3, Side::SELL, 100.0, 50);

  add_limit_order(4, Side::BUY, 100.0, 120); // Matches multiple asks

  EXPECT_EQ(fill_count(), 3u);
  EXPECT_TRUE(has_fill(4, 1, 100.0, 50));
  EXPECT_TRUE(has_fill(4, 2, 100.0, 50));
  EXPECT_TRUE(has_fill(4, 3, 100.0, 20));

  auto order3 = book->get_order(3);
  ASSERT_TRUE(order3.has_value());
  EXPECT_EQ(order3->remaining(), 30);
}

TEST_F(OrderBookTest, LimitSweepsLevelsAndRestsRemainder) {
  add_limit_order(1, Side::SELL, 100.0, 50);
  add_limit_order(2, Side::SELL, 101.0, 50);
  add_limit_order(3, Side::SELL, 102.0, 50);

  auto result = add_limit_order(4, Side::BUY, 101.0, 150);

  EXPECT_TRUE(has_fill(4, 1, 100.0, 50));
  EXPECT_TRUE(has_fill(4, 2, 101.0, 50));
  EXPECT_EQ(result.order.state, OrderState::PARTIALLY_FILLED);

  // 50 rests at 101.0, the 102.0 ask is untouched
  EXPECT_DOUBLE_EQ(*best_bid_price(), 101.0);
  EXPECT_EQ(book->top_quantity(Side::BUY), 50);
  EXPECT_DOUBLE_EQ(*best_ask_price(), 102.0);
  EXPECT_NO_THROW(book->verify_invariants());
}

TEST_F(OrderBookTest, MarketOrderBuy) {
  add_limit_order(1, Side::SELL, 100.0, 100);
  auto result = add_market_order(2, Side::BUY, 100);

  EXPECT_EQ(fill_count(), 1u);
  EXPECT_EQ(result.order.state, OrderState::FILLED);
  assert_empty_book();
}

TEST_F(OrderBookTest, MarketOrderWithoutLiquidityIsRejected) {
  auto result = add_market_order(1, Side::BUY, 100);

  EXPECT_EQ(result.order.state, OrderState::REJECTED);
  EXPECT_TRUE(result.fills.empty());
  assert_empty_book();
}

TEST_F(OrderBookTest, MarketOrderRemainderLeftPartial) {
  add_limit_order(1, Side::SELL, 100.0, 40);
  auto result = add_market_order(2, Side::BUY, 100);

  EXPECT_EQ(result.order.state, OrderState::PARTIALLY_FILLED);
  EXPECT_EQ(result.order.filled_quantity, 40);
  EXPECT_FALSE(book->is_resting(2));
  EXPECT_THROW(book->remove(2), NotFoundError);
  assert_empty_book();
}

TEST_F(OrderBookTest, MarketOrderRemainderCancelledByPolicy) {
  add_limit_order(1, Side::SELL, 100.0, 40);

  MatchContext ctx;
  ctx.market_remainder = MarketRemainderPolicy::CANCEL_REMAINDER;
  auto result =
      book->match(Order(2, "TEST", Side::BUY, OrderType::MARKET, 100), ctx);

  EXPECT_EQ(result.order.state, OrderState::CANCELLED);
  EXPECT_EQ(result.order.filled_quantity, 40);
}

TEST_F(OrderBookTest, PriceAdjustmentOnlyAffectsTaker) {
  add_limit_order(1, Side::SELL, 100.0, 100);

  MatchContext ctx;
  ctx.fill_time = 500;
  ctx.price_adjustment = [](const Order &) { return 0.001; };
  auto result =
      book->match(Order(2, "TEST", Side::BUY, OrderType::MARKET, 100), ctx);

  ASSERT_EQ(result.fills.size(), 2u);
  EXPECT_DOUBLE_EQ(result.fills[0].price, 100.0);
  EXPECT_NEAR(result.fills[0].effective_price, 100.1, 1e-9);
  EXPECT_DOUBLE_EQ(result.fills[1].effective_price, 100.0);
  EXPECT_EQ(result.fills[0].timestamp, 500);

  // Average fill price uses the book price
  EXPECT_DOUBLE_EQ(*result.order.average_fill_price(), 100.0);
}

TEST_F(OrderBookTest, SellTakerReceivesLessUnderAdjustment) {
  add_limit_order(1, Side::BUY, 100.0, 100);

  MatchContext ctx;
  ctx.price_adjustment = [](const Order &) { return 0.002; };
  auto result =
      book->match(Order(2, "TEST", Side::SELL, OrderType::MARKET, 50), ctx);

  ASSERT_FALSE(result.fills.empty());
  EXPECT_NEAR(result.fills[0].effective_price, 99.8, 1e-9);
}

TEST_F(OrderBookTest, MatchingConservesQuantity) {
  add_limit_order(1, Side::SELL, 100.0, 70);
  add_limit_order(2, Side::SELL, 100.5, 80);
  add_limit_order(3, Side::SELL, 101.0, 90);

  auto result = add_market_order(4, Side::BUY, 200);

  Quantity taker_total = 0;
  Quantity maker_total = 0;
  for (const auto &fill : result.fills) {
    (fill.is_taker() ? taker_total : maker_total) += fill.quantity;
  }
  EXPECT_EQ(taker_total, maker_total);
  EXPECT_EQ(taker_total, result.order.filled_quantity);
  EXPECT_EQ(book->top_quantity(Side::SELL), 40);

  for (OrderId id : {1u, 2u, 3u}) {
    auto order = book->get_order(id);
    ASSERT_TRUE(order.has_value());
    EXPECT_GE(order->filled_quantity, 0);
    EXPECT_LE(order->filled_quantity, order->quantity);
  }
}

TEST_F(OrderBookTest, BookNeverCrossedAfterMatching) {
  add_limit_order(1, Side::BUY, 99.0, 100);
  add_limit_order(2, Side::SELL, 101.0, 100);
  add_limit_order(3, Side::BUY, 102.0, 150); // sweeps 101 and rests at 102
  add_limit_order(4, Side::SELL, 98.0, 30);  // hits the 102 bid

  auto bid = best_bid_price();
  auto ask = best_ask_price();
  if (bid && ask) {
    EXPECT_LT(*bid, *ask);
  }
  EXPECT_NO_THROW(book->verify_invariants());
}

TEST_F(OrderBookTest, FillIdsAreSequential) {
  add_limit_order(1, Side::SELL, 100.0, 10);
  add_limit_order(2, Side::SELL, 100.0, 10);
  add_market_order(3, Side::BUY, 20);

  const auto &fills = book->get_fills();
  ASSERT_EQ(fills.size(), 4u);
  for (size_t i = 1; i < fills.size(); ++i) {
    EXPECT_EQ(fills[i].id, fills[i - 1].id + 1);
  }
}
