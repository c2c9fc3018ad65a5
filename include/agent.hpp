#pragma once

#include "config.hpp"
#include "fill.hpp"
#include "market_state.hpp"
#include "order.hpp"
#include "order_book.hpp"
#include "types.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

// ============================================================================
// DECISION INPUT / OUTPUT
// ============================================================================

// Everything an agent may look at during one tick. Built once per tick and
// shared by every agent of the symbol.
struct AgentContext {
  const MarketState &market;
  const BookSnapshot &book;
  SimTime now;
  std::uint64_t tick;
  double expected_move; // preview of the next price-discovery move
  double tick_size;
};

enum class ActionType { SUBMIT, CANCEL };

struct AgentAction {
  ActionType type;
  OrderRequest request; // SUBMIT
  OrderId order_id;     // CANCEL

  static AgentAction submit(OrderRequest request) {
    return AgentAction{ActionType::SUBMIT, std::move(request), 0};
  }
  static AgentAction cancel(OrderId order_id) {
    return AgentAction{ActionType::CANCEL, OrderRequest{}, order_id};
  }
};

// ============================================================================
// AGENT STATISTICS
// ============================================================================

struct AgentStats {
  std::uint64_t decisions = 0;
  std::uint64_t orders_submitted = 0;
  std::uint64_t orders_rejected = 0;
  std::uint64_t cancels_sent = 0;
  std::uint64_t fills = 0;
  Quantity volume = 0;
};

// ============================================================================
// BASE AGENT CLASS
// ============================================================================

class Agent {
public:
  // Resting order as the agent remembers it
  struct OpenOrder {
    Side side;
    double price;
    Quantity remaining;
    std::uint64_t placed_tick;
  };

  Agent(std::string id, std::size_t index, AgentType type,
        const ParameterSet &params, std::uint64_t seed);
  virtual ~Agent() = default;

  Agent(const Agent &) = delete;
  Agent &operator=(const Agent &) = delete;

  // Main decision hook, called once per tick
  virtual std::vector<AgentAction> decide(const AgentContext &ctx) = 0;

  // Called for every fill on one of this agent's orders
  virtual void on_fill(const Fill &fill);

  // Called after a submission was processed by the execution engine
  virtual void on_order_accepted(const Order &order, std::uint64_t tick);

  // Called when the execution engine refused a submission
  virtual void on_order_rejected(const OrderRequest &request,
                                 const std::string &reason);

  const std::string &id() const { return id_; }
  std::size_t index() const { return index_; }
  AgentType type() const { return type_; }
  const ParameterSet &params() const { return params_; }

  Quantity inventory() const { return inventory_; }
  double cash() const { return cash_; }
  const std::map<OrderId, OpenOrder> &open_orders() const {
    return open_orders_;
  }
  const AgentStats &stats() const { return stats_; }

  // Mark-to-market value of cash plus inventory
  double equity(double mark_price) const {
    return cash_ + static_cast<double>(inventory_) * mark_price;
  }

  void print_summary(double mark_price) const;

protected:
  std::string id_;
  std::size_t index_;
  AgentType type_;
  ParameterSet params_;
  std::mt19937_64 rng_;

  Quantity inventory_;
  double cash_;
  std::map<OrderId, OpenOrder> open_orders_; // id order keeps cancels stable
  AgentStats stats_;

  // Random helpers on the agent's own stream
  double uniform(double lo, double hi);
  bool chance(double probability);
  Side random_side();
  Quantity random_quantity(double lo, double hi);

  // Reference price: the price-discovery level, the book mid as fallback.
  // Throws AgentDecisionError when neither is usable.
  double reference_price(const AgentContext &ctx) const;

  OrderRequest limit_order(const AgentContext &ctx, Side side, double price,
                           Quantity quantity) const;
  OrderRequest market_order(const AgentContext &ctx, Side side,
                            Quantity quantity) const;

  // Cancel every tracked order and forget it
  void cancel_all(std::vector<AgentAction> &actions);
};

// Factory over the closed set of agent variants
std::unique_ptr<Agent> make_agent(AgentType type, std::string id,
                                  std::size_t index, const ParameterSet &params,
                                  std::uint64_t seed);
