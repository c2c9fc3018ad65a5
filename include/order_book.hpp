#ifndef ORDER_BOOK_HPP
#define ORDER_BOOK_HPP

#include "config.hpp"
#include "fill.hpp"
#include "order.hpp"
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Aggregated view of one price level
struct PriceLevel {
  double price;
  Quantity total_quantity;
  std::size_t num_orders;
};

// Immutable copy of the book handed to readers
struct BookSnapshot {
  std::string symbol;
  std::vector<PriceLevel> bids; // strictly descending
  std::vector<PriceLevel> asks; // strictly ascending
  std::optional<double> best_bid;
  std::optional<double> best_ask;
  std::optional<double> mid_price;
  std::optional<double> spread;
  std::optional<double> last_trade_price;
  SimTime timestamp = 0;

  // Sums over the levels present in this snapshot
  Quantity total_bid_quantity() const;
  Quantity total_ask_quantity() const;
};

// Per-call execution parameters supplied by the execution engine
struct MatchContext {
  SimTime fill_time = 0;
  MarketRemainderPolicy market_remainder = MarketRemainderPolicy::LEAVE_PARTIAL;
  // Fraction of the book price the taker pays on top (buy) or gives up
  // (sell). Evaluated once per incoming order.
  std::function<double(const Order &)> price_adjustment;
};

struct MatchResult {
  Order order;             // incoming order in its post-match state
  std::vector<Fill> fills; // taker and maker fills, triggered stops included
  std::vector<OrderId> triggered_stops;
};

class OrderBook {
private:
  // Orders queued at one price. Holds ids into the arena, FIFO.
  struct LevelQueue {
    std::deque<OrderId> order_ids;
    Quantity total_quantity = 0;
  };

  using BidLevels = std::map<double, LevelQueue, std::greater<double>>;
  using AskLevels = std::map<double, LevelQueue>;

  std::string symbol_;
  OrderBookConfig config_;

  std::unordered_map<OrderId, Order> orders_; // arena, addressed by id
  BidLevels bids_;
  AskLevels asks_;

  // Stop orders parked off-book, sorted by stop price
  std::multimap<double, OrderId> stop_buys_;  // trigger at or above
  std::multimap<double, OrderId> stop_sells_; // trigger at or below

  std::deque<Fill> fills_;       // bounded ledger
  std::deque<OrderId> retired_;  // orders no longer live, oldest first
  std::optional<double> last_trade_price_;
  FillId next_fill_id_;

  Order &order_ref(OrderId id);
  Order &store(Order order);
  void rest(Order &order);
  void retire(const Order &order);
  void prune();
  void record_fill(const Fill &fill, MatchResult &result);

  bool price_acceptable(const Order &taker, double level_price) const;

  template <typename Levels>
  void sweep(Order &taker, Levels &levels, const MatchContext &ctx,
             MatchResult &result);

  void execute_trade(Order &taker, Order &maker, double price, double adjustment,
                     const MatchContext &ctx, MatchResult &result);

  void match_buy_order(Order &buy_order, const MatchContext &ctx,
                       MatchResult &result);
  void match_sell_order(Order &sell_order, const MatchContext &ctx,
                        MatchResult &result);
  void run_matching(Order &order, const MatchContext &ctx, MatchResult &result);
  void finalize_after_matching(Order &order, const MatchContext &ctx);

  void park_stop(Order &order);
  bool stop_should_trigger(const Order &order) const;
  std::optional<OrderId> next_triggered_stop();
  void process_stop_triggers(const MatchContext &ctx, MatchResult &result);

  void check_not_crossed() const;

public:
  explicit OrderBook(std::string symbol, OrderBookConfig config = {});

  // Rest a non-marketable limit order (PENDING -> OPEN). Throws
  // ValidationError for non-limit orders, missing price, duplicate ids or an
  // order that would cross the book.
  void add(Order order);

  // Remove a resting (or parked stop) order and mark it CANCELLED.
  // Throws NotFoundError when the order is not live in the book.
  Order remove(OrderId order_id);

  // Non-throwing variant of remove()
  bool cancel_order(OrderId order_id);

  // Match an incoming order with price-time priority. Limit remainders rest,
  // stops are parked or triggered, market remainders follow the context's
  // policy.
  MatchResult match(Order order, const MatchContext &ctx = {});

  // Throws InvariantViolation when level structure or aggregates are broken
  void verify_invariants() const;

  std::optional<Order> get_order(OrderId order_id) const;
  bool is_resting(OrderId order_id) const;
  // True when the order would trade immediately against the contra side
  bool is_marketable(const Order &order) const;

  std::optional<double> best_bid() const;
  std::optional<double> best_ask() const;
  std::optional<double> mid_price() const;
  std::optional<double> spread() const;
  std::optional<double> last_trade_price() const { return last_trade_price_; }

  // Resting quantity at the best price of the given side
  Quantity top_quantity(Side side) const;

  std::vector<PriceLevel> get_bid_levels(std::size_t max_levels) const;
  std::vector<PriceLevel> get_ask_levels(std::size_t max_levels) const;
  BookSnapshot snapshot(std::size_t depth, SimTime timestamp) const;

  const std::string &symbol() const { return symbol_; }
  const std::deque<Fill> &get_fills() const { return fills_; }

  std::size_t bid_level_count() const { return bids_.size(); }
  std::size_t ask_level_count() const { return asks_.size(); }
  std::size_t order_count() const { return orders_.size(); }
  std::size_t pending_stop_count() const {
    return stop_buys_.size() + stop_sells_.size();
  }

  // Statistics and display methods
  void print_fills() const;
  void print_top_of_book() const;
  void print_order_status(OrderId order_id) const;
  void print_market_depth(std::size_t levels) const;
  void print_pending_stops() const;
};

#endif // ORDER_BOOK_HPP
