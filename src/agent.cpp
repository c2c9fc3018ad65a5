#include "agent.hpp"

#include "agents.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

// ============================================================================
// BASE AGENT
// ============================================================================

Agent::Agent(std::string id, std::size_t index, AgentType type,
             const ParameterSet &params, std::uint64_t seed)
    : id_(std::move(id)), index_(index), type_(type), params_(params),
      rng_(seed), inventory_(0),
      cash_(params.get_parameter("initial_cash", 1000000.0)) {}

void Agent::on_fill(const Fill &fill) {
  const int sign = side_sign(fill.side);
  inventory_ += sign * fill.quantity;
  cash_ -= sign * fill.effective_price * static_cast<double>(fill.quantity);

  stats_.fills++;
  stats_.volume += fill.quantity;

  auto it = open_orders_.find(fill.order_id);
  if (it != open_orders_.end()) {
    it->second.remaining -= fill.quantity;
    if (it->second.remaining <= 0) {
      open_orders_.erase(it);
    }
  }
}

void Agent::on_order_accepted(const Order &order, std::uint64_t tick) {
  stats_.orders_submitted++;
  if (order.state == OrderState::REJECTED) {
    stats_.orders_rejected++;
    return;
  }

  // Only orders still resting can be cancelled later
  if (order.is_active() && order.type == OrderType::LIMIT && order.price) {
    open_orders_[order.id] =
        OpenOrder{order.side, *order.price, order.remaining(), tick};
  }
}

void Agent::on_order_rejected(const OrderRequest & /* request */,
                              const std::string &reason) {
  stats_.orders_rejected++;
  log_debug("[" + id_ + "] order rejected: " + reason);
}

// ============================================================================
// HELPERS
// ============================================================================

double Agent::uniform(double lo, double hi) {
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(rng_);
}

bool Agent::chance(double probability) { return uniform(0.0, 1.0) < probability; }

Side Agent::random_side() { return chance(0.5) ? Side::BUY : Side::SELL; }

Quantity Agent::random_quantity(double lo, double hi) {
  const auto qty = static_cast<Quantity>(std::llround(uniform(lo, hi)));
  return std::max<Quantity>(qty, 1);
}

double Agent::reference_price(const AgentContext &ctx) const {
  if (std::isfinite(ctx.market.last_price) && ctx.market.last_price > 0.0) {
    return ctx.market.last_price;
  }
  if (ctx.book.mid_price && *ctx.book.mid_price > 0.0) {
    return *ctx.book.mid_price;
  }
  throw AgentDecisionError(id_ + ": no usable reference price for " +
                           ctx.market.symbol);
}

OrderRequest Agent::limit_order(const AgentContext &ctx, Side side,
                                double price, Quantity quantity) const {
  OrderRequest request;
  request.symbol = ctx.market.symbol;
  request.side = side;
  request.type = OrderType::LIMIT;
  request.quantity = quantity;
  request.price = std::max(round_to_tick(price, ctx.tick_size), ctx.tick_size);
  request.owner = id_;
  return request;
}

OrderRequest Agent::market_order(const AgentContext &ctx, Side side,
                                 Quantity quantity) const {
  OrderRequest request;
  request.symbol = ctx.market.symbol;
  request.side = side;
  request.type = OrderType::MARKET;
  request.quantity = quantity;
  request.owner = id_;
  return request;
}

void Agent::cancel_all(std::vector<AgentAction> &actions) {
  for (const auto &[order_id, open] : open_orders_) {
    actions.push_back(AgentAction::cancel(order_id));
    stats_.cancels_sent++;
  }
  open_orders_.clear();
}

// ============================================================================
// STATISTICS & REPORTING
// ============================================================================

void Agent::print_summary(double mark_price) const {
  std::cout << std::left << std::setw(14) << id_ << std::setw(17)
            << to_string(type_) << std::right << " inv " << std::setw(7)
            << inventory_ << "  orders " << std::setw(5)
            << stats_.orders_submitted << "  fills " << std::setw(5)
            << stats_.fills << "  open " << std::setw(3) << open_orders_.size()
            << std::fixed << std::setprecision(2) << "  equity $"
            << equity(mark_price) << std::defaultfloat << std::endl;
}

// ============================================================================
// FACTORY
// ============================================================================

std::unique_ptr<Agent> make_agent(AgentType type, std::string id,
                                  std::size_t index, const ParameterSet &params,
                                  std::uint64_t seed) {
  switch (type) {
  case AgentType::MARKET_MAKER:
    return std::make_unique<MarketMakerAgent>(std::move(id), index, params,
                                              seed);
  case AgentType::NOISE_TRADER:
    return std::make_unique<NoiseTraderAgent>(std::move(id), index, params,
                                              seed);
  case AgentType::INFORMED_TRADER:
    return std::make_unique<InformedTraderAgent>(std::move(id), index, params,
                                                 seed);
  case AgentType::MOMENTUM_TRADER:
    return std::make_unique<MomentumTraderAgent>(std::move(id), index, params,
                                                 seed);
  }
  throw ValidationError("Unknown agent type");
}
