#pragma once

#include "config.hpp"
#include "errors.hpp"
#include "fill.hpp"
#include "liquidity_model.hpp"
#include "order.hpp"
#include "order_book.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

// Order ids carry the owning lane in their upper bits so a cancel can be
// routed without a shared lookup table
constexpr unsigned kLaneShift = 40;
constexpr OrderId kSequenceMask = (OrderId{1} << kLaneShift) - 1;

inline std::uint64_t lane_of(OrderId id) { return id >> kLaneShift; }

class OrderIdGenerator {
public:
  explicit OrderIdGenerator(std::uint64_t lane_index)
      : prefix_(lane_index << kLaneShift) {}

  OrderIdGenerator(const OrderIdGenerator &) = delete;
  OrderIdGenerator &operator=(const OrderIdGenerator &) = delete;

  OrderId next_id() {
    return prefix_ | (next_seq_.fetch_add(1, std::memory_order_relaxed) &
                      kSequenceMask);
  }

private:
  OrderId prefix_;
  std::atomic<std::uint64_t> next_seq_{1};
};

// Outcome of one submission
struct ExecutionReport {
  Order order;
  std::vector<Fill> fills;
  std::vector<OrderId> triggered_stops;
  std::optional<double> mid_before; // book mid when the order arrived

  bool rejected() const { return order.state == OrderState::REJECTED; }
};

// Entry point for every order of one symbol. Routes to the book, prices
// slippage into the fills and feeds consumption back to the liquidity model.
class ExecutionEngine {
public:
  ExecutionEngine(OrderBook &book, LiquidityModel &liquidity,
                  const ExecutionConfig &config,
                  const OrderBookConfig &book_config,
                  std::uint64_t lane_index);

  // Build an order from the request and submit it. Throws ValidationError.
  ExecutionReport submit(const OrderRequest &request, SimTime now);
  ExecutionReport submit(Order order, SimTime now);

  // Cancel a resting order. NOT_FOUND for unknown or terminal orders.
  Status cancel(OrderId order_id);

  OrderId next_order_id() { return id_generator_.next_id(); }

  // Fraction of price the given order pays in slippage at current liquidity
  double slippage(const Order &order) const;

  // Signed taker flow accumulated since the last call
  double take_net_flow();
  double pending_net_flow() const { return net_flow_; }

  Quantity volume() const { return volume_; }
  std::uint64_t orders_submitted() const { return orders_submitted_; }
  std::uint64_t orders_rejected() const { return orders_rejected_; }
  std::uint64_t trade_count() const { return trade_count_; }

  const ExecutionConfig &config() const { return config_; }

private:
  OrderBook &book_;
  LiquidityModel &liquidity_;
  ExecutionConfig config_;
  OrderBookConfig book_config_;
  OrderIdGenerator id_generator_;

  double net_flow_;
  Quantity volume_;
  std::uint64_t orders_submitted_;
  std::uint64_t orders_rejected_;
  std::uint64_t trade_count_;

  void validate(const Order &order) const;
  bool on_tick(double price) const;
  void absorb_fills(const std::vector<Fill> &fills);
};
