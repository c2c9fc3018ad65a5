// tests/test_stop_orders.cpp
#include "test_helpers.hpp"

TEST_F(OrderBookTest, StopOrderParksOffBook) {
  auto result = add_stop_order(1, Side::SELL, 98.0, 100);

  EXPECT_EQ(result.order.state, OrderState::OPEN);
  EXPECT_EQ(pending_stop_count_int(), 1);
  EXPECT_TRUE(book->is_resting(1));
  assert_empty_book(); // Not in active book yet
}

TEST_F(OrderBookTest, StopLossTrigger) {
  add_stop_order(1, Side::SELL, 98.0, 100);

  // Liquidity below the stop, then a trade printing at the stop price
  add_limit_order(2, Side::BUY, 98.0, 100);
  add_limit_order(3, Side::BUY, 97.0, 200);
  auto result = add_limit_order(4, Side::SELL, 98.0, 100);

  EXPECT_EQ(book->pending_stop_count(), 0u);
  ASSERT_EQ(result.triggered_stops.size(), 1u);
  EXPECT_EQ(result.triggered_stops[0], 1u);

  // Stop became a market sell and hit the 97.0 bid
  EXPECT_TRUE(has_fill(1, 3, 97.0, 100));
  EXPECT_ORDER_STATE(1, OrderState::FILLED);
  EXPECT_EQ(book->top_quantity(Side::BUY), 100);
}

TEST_F(OrderBookTest, StopBuyTrigger) {
  add_stop_order(1, Side::BUY, 102.0, 100);
  EXPECT_EQ(pending_stop_count_int(), 1);

  add_limit_order(2, Side::SELL, 102.0, 50);
  add_limit_order(3, Side::SELL, 103.0, 200);
  add_market_order(4, Side::BUY, 50); // prints 102.0

  EXPECT_EQ(book->pending_stop_count(), 0u);
  EXPECT_TRUE(has_fill(1, 3, 103.0, 100));
  EXPECT_EQ(book->top_quantity(Side::SELL), 100);
}

TEST_F(OrderBookTest, StopLimitOrderRestsAtLimit) {
  // Stop-limit: trigger at 102.0, then place limit at 101.5
  add_stop_limit_order(1, Side::BUY, 102.0, 101.5, 150);
  EXPECT_EQ(pending_stop_count_int(), 1);

  add_limit_order(2, Side::SELL, 102.0, 200);
  add_limit_order(3, Side::BUY, 102.0, 10); // trade at 102.0 triggers

  EXPECT_EQ(book->pending_stop_count(), 0u);

  auto bid = best_bid_price();
  ASSERT_TRUE(bid.has_value());
  EXPECT_DOUBLE_EQ(*bid, 101.5);
  EXPECT_EQ(book->top_quantity(Side::BUY), 150);

  auto order = book->get_order(1);
  ASSERT_TRUE(order.has_value());
  EXPECT_EQ(order->type, OrderType::LIMIT);
  EXPECT_EQ(order->state, OrderState::OPEN);
}

TEST_F(OrderBookTest, StopTriggersImmediatelyWhenAlreadyThrough) {
  add_limit_order(1, Side::BUY, 99.0, 100);
  add_limit_order(2, Side::SELL, 99.0, 50); // last trade 99.0
  add_limit_order(3, Side::BUY, 98.0, 100);

  auto result = add_stop_order(4, Side::SELL, 99.5, 30);

  EXPECT_EQ(pending_stop_count_int(), 0);
  EXPECT_EQ(result.triggered_stops.size(), 1u);
  EXPECT_TRUE(has_fill(4, 1, 99.0, 30));
}

TEST_F(OrderBookTest, StopWithoutPriorTradeWaits) {
  add_limit_order(1, Side::BUY, 99.0, 100);
  add_stop_order(2, Side::SELL, 200.0, 30); // far above, but nothing traded

  EXPECT_EQ(pending_stop_count_int(), 1);
  EXPECT_EQ(fill_count(), 0u);
}

TEST_F(OrderBookTest, TriggeredStopWithNoLiquidityIsCancelled) {
  add_stop_order(1, Side::SELL, 100.0, 50);
  add_limit_order(2, Side::BUY, 100.0, 20);
  add_limit_order(3, Side::SELL, 100.0, 20); // empties the bid side

  EXPECT_EQ(pending_stop_count_int(), 0);
  EXPECT_ORDER_STATE(1, OrderState::CANCELLED);
  assert_empty_book();
}

TEST_F(OrderBookTest, StopCascade) {
  add_stop_order(1, Side::SELL, 99.0, 100);
  add_stop_order(2, Side::SELL, 98.0, 100);

  add_limit_order(3, Side::BUY, 99.0, 50);
  add_limit_order(4, Side::BUY, 98.0, 100);
  add_limit_order(5, Side::BUY, 97.0, 300);

  // Trade at 99 triggers stop 1, which prints 98 and triggers stop 2
  auto result = add_market_order(6, Side::SELL, 50);

  ASSERT_EQ(result.triggered_stops.size(), 2u);
  EXPECT_EQ(result.triggered_stops[0], 1u);
  EXPECT_EQ(result.triggered_stops[1], 2u);
  EXPECT_EQ(pending_stop_count_int(), 0);
  EXPECT_NO_THROW(book->verify_invariants());
}

TEST_F(OrderBookTest, CancelParkedStop) {
  add_stop_order(1, Side::BUY, 105.0, 100);
  EXPECT_EQ(pending_stop_count_int(), 1);

  EXPECT_TRUE(book->cancel_order(1));
  EXPECT_EQ(pending_stop_count_int(), 0);
  EXPECT_ORDER_STATE(1, OrderState::CANCELLED);
  EXPECT_FALSE(book->cancel_order(1));
}

TEST_F(OrderBookTest, EqualStopsTriggerInArrivalOrder) {
  add_stop_order(1, Side::SELL, 99.0, 10);
  add_stop_order(2, Side::SELL, 99.0, 10);

  add_limit_order(3, Side::BUY, 99.0, 10);
  add_limit_order(4, Side::BUY, 98.0, 100);
  auto result = add_market_order(5, Side::SELL, 10);

  ASSERT_EQ(result.triggered_stops.size(), 2u);
  EXPECT_EQ(result.triggered_stops[0], 1u);
  EXPECT_EQ(result.triggered_stops[1], 2u);
}
