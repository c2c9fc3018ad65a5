#include "order_book.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

MatchResult OrderBook::match(Order order, const MatchContext &ctx) {
  MatchResult result{order, {}, {}};
  const OrderId id = order.id;

  Order &incoming = store(std::move(order));

  if (incoming.is_stop_order()) {
    incoming.open();
    if (stop_should_trigger(incoming)) {
      incoming.trigger_stop();
      result.triggered_stops.push_back(id);
      run_matching(incoming, ctx, result);
    } else {
      park_stop(incoming);
    }
  } else if (incoming.is_market_order() && !is_marketable(incoming)) {
    // Nothing to trade against: the order is never accepted
    incoming.transition_to(OrderState::REJECTED);
    retire(incoming);
    log_debug("Market order " + std::to_string(id) + " rejected on " +
              symbol_ + ": no contra liquidity");
  } else {
    incoming.open();
    run_matching(incoming, ctx, result);
  }

  process_stop_triggers(ctx, result);

  result.order = orders_.at(id);
  check_not_crossed();
  prune();
  return result;
}

void OrderBook::run_matching(Order &order, const MatchContext &ctx,
                             MatchResult &result) {
  if (order.side == Side::BUY) {
    match_buy_order(order, ctx, result);
  } else {
    match_sell_order(order, ctx, result);
  }
  finalize_after_matching(order, ctx);
}

void OrderBook::match_buy_order(Order &buy_order, const MatchContext &ctx,
                                MatchResult &result) {
  sweep(buy_order, asks_, ctx, result);
}

void OrderBook::match_sell_order(Order &sell_order, const MatchContext &ctx,
                                 MatchResult &result) {
  sweep(sell_order, bids_, ctx, result);
}

bool OrderBook::price_acceptable(const Order &taker, double level_price) const {
  if (taker.is_market_order() || !taker.price) {
    return true;
  }
  if (taker.side == Side::BUY) {
    return *taker.price >= level_price;
  }
  return *taker.price <= level_price;
}

// Walk the contra side best price first, FIFO within each level
template <typename Levels>
void OrderBook::sweep(Order &taker, Levels &levels, const MatchContext &ctx,
                      MatchResult &result) {
  const double adjustment =
      ctx.price_adjustment ? ctx.price_adjustment(taker) : 0.0;

  while (taker.remaining() > 0 && !levels.empty()) {
    auto level_it = levels.begin();
    const double level_price = level_it->first;
    if (!price_acceptable(taker, level_price)) {
      break;
    }

    auto &level = level_it->second;
    while (taker.remaining() > 0 && !level.order_ids.empty()) {
      Order &maker = order_ref(level.order_ids.front());
      const Quantity before = maker.remaining();

      execute_trade(taker, maker, level_price, adjustment, ctx, result);

      level.total_quantity -= before - maker.remaining();
      if (level.total_quantity < 0) {
        std::ostringstream oss;
        oss << symbol_ << ": negative quantity at level " << level_price;
        throw InvariantViolation(oss.str());
      }

      if (maker.remaining() == 0) {
        level.order_ids.pop_front();
        retire(maker);
      }
    }

    if (level.order_ids.empty()) {
      if (level.total_quantity != 0) {
        std::ostringstream oss;
        oss << symbol_ << ": level " << level_price << " emptied with "
            << level.total_quantity << " unaccounted";
        throw InvariantViolation(oss.str());
      }
      levels.erase(level_it);
    }
  }
}

void OrderBook::execute_trade(Order &taker, Order &maker, double price,
                              double adjustment, const MatchContext &ctx,
                              MatchResult &result) {
  const Quantity trade_qty = std::min(taker.remaining(), maker.remaining());

  taker.apply_fill(trade_qty, price);
  maker.apply_fill(trade_qty, price);
  last_trade_price_ = price;

  // Taker pays the slippage, the maker receives the quoted price
  const double effective_price = price * (1.0 + side_sign(taker.side) * adjustment);

  record_fill(Fill{next_fill_id_++, taker.id, maker.id, symbol_, taker.side,
                   trade_qty, price, effective_price, ctx.fill_time,
                   LiquidityRole::TAKER, taker.owner},
              result);
  record_fill(Fill{next_fill_id_++, maker.id, taker.id, symbol_, maker.side,
                   trade_qty, price, price, ctx.fill_time,
                   LiquidityRole::MAKER, maker.owner},
              result);
}

void OrderBook::finalize_after_matching(Order &order, const MatchContext &ctx) {
  if (order.remaining() == 0) {
    retire(order);
    return;
  }

  if (order.can_rest_in_book()) {
    rest(order);
    return;
  }

  // Market remainder: nothing was filled (a triggered stop facing an empty
  // side) or the policy asks for the tail to be cancelled
  if (order.filled_quantity == 0 ||
      ctx.market_remainder == MarketRemainderPolicy::CANCEL_REMAINDER) {
    order.transition_to(OrderState::CANCELLED);
    log_debug("Market order " + std::to_string(order.id) + " on " + symbol_ +
              ": " + std::to_string(order.remaining()) + " unfilled, cancelled");
  }
  retire(order);
}

// ============================================================================
// STOP ORDERS
// ============================================================================

void OrderBook::park_stop(Order &order) {
  if (order.side == Side::BUY) {
    stop_buys_.emplace(*order.stop_price, order.id);
  } else {
    stop_sells_.emplace(*order.stop_price, order.id);
  }
  log_debug("Stop order " + std::to_string(order.id) + " parked on " + symbol_);
}

bool OrderBook::stop_should_trigger(const Order &order) const {
  if (!last_trade_price_ || !order.stop_price) {
    return false;
  }
  if (order.side == Side::BUY) {
    return *last_trade_price_ >= *order.stop_price;
  }
  return *last_trade_price_ <= *order.stop_price;
}

// Pops the next stop whose trigger the last trade has reached. Lower buy
// stops and higher sell stops go first; equal stops keep arrival order.
std::optional<OrderId> OrderBook::next_triggered_stop() {
  if (!last_trade_price_) {
    return std::nullopt;
  }
  const double last = *last_trade_price_;

  if (!stop_buys_.empty() && stop_buys_.begin()->first <= last) {
    OrderId id = stop_buys_.begin()->second;
    stop_buys_.erase(stop_buys_.begin());
    return id;
  }

  if (!stop_sells_.empty()) {
    const double highest = std::prev(stop_sells_.end())->first;
    if (highest >= last) {
      auto it = stop_sells_.lower_bound(highest);
      OrderId id = it->second;
      stop_sells_.erase(it);
      return id;
    }
  }

  return std::nullopt;
}

void OrderBook::process_stop_triggers(const MatchContext &ctx,
                                      MatchResult &result) {
  while (auto stop_id = next_triggered_stop()) {
    Order &stop = order_ref(*stop_id);
    stop.trigger_stop();
    result.triggered_stops.push_back(*stop_id);

    std::ostringstream oss;
    oss << "Stop-" << (stop.side == Side::BUY ? "buy" : "sell") << " order "
        << stop.id << " triggered at " << *last_trade_price_ << " on "
        << symbol_;
    log_debug(oss.str());

    run_matching(stop, ctx, result);
  }
}
