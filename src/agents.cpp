#include "agents.hpp"

#include <algorithm>
#include <cmath>

namespace {

std::uint64_t to_ticks(double value) {
  return static_cast<std::uint64_t>(std::max(0.0, std::round(value)));
}

Quantity to_quantity(double value) {
  return std::max<Quantity>(1, static_cast<Quantity>(std::llround(value)));
}

} // namespace

// ============================================================================
// MARKET MAKER AGENT
// ============================================================================

MarketMakerAgent::MarketMakerAgent(std::string id, std::size_t index,
                                   const ParameterSet &params,
                                   std::uint64_t seed)
    : Agent(std::move(id), index, AgentType::MARKET_MAKER, params, seed),
      last_quote_tick_(0) {

  spread_bps_ = params_.get_parameter("spread_bps", 10.0); // 10 bps
  quote_size_ = to_quantity(params_.get_parameter("quote_size", 100.0));
  inventory_limit_ = params_.get_parameter("inventory_limit", 500.0);
  target_inventory_ = params_.get_parameter("target_inventory", 0.0);
  skew_factor_ = params_.get_parameter("skew_factor", 0.001);
  requote_interval_ = to_ticks(params_.get_parameter("requote_interval", 10.0));
  requote_threshold_bps_ = params_.get_parameter("requote_threshold_bps", 5.0);
}

double MarketMakerAgent::inventory_skew(double reference) const {
  if (inventory_limit_ <= 0.0) {
    return 0.0;
  }
  // Long inventory lowers both quotes to attract buyers, short raises them
  double inventory_ratio =
      (static_cast<double>(inventory_) - target_inventory_) / inventory_limit_;
  inventory_ratio = std::clamp(inventory_ratio, -1.0, 1.0);
  return -inventory_ratio * skew_factor_ * reference;
}

std::pair<double, double>
MarketMakerAgent::calculate_quotes(double reference, double tick_size) const {
  const double half_spread = (spread_bps_ / 10000.0) * reference / 2.0;
  const double skew = inventory_skew(reference);

  double bid_price = round_to_tick(reference - half_spread + skew, tick_size);
  double ask_price = round_to_tick(reference + half_spread + skew, tick_size);

  if (ask_price <= bid_price) {
    ask_price = round_to_tick(bid_price + tick_size, tick_size);
  }
  bid_price = std::max(bid_price, tick_size);

  return {bid_price, ask_price};
}

bool MarketMakerAgent::should_requote(double reference,
                                      std::uint64_t tick) const {
  if (open_orders_.empty() || !quoted_reference_) {
    return true;
  }
  if (tick - last_quote_tick_ >= requote_interval_) {
    return true;
  }
  const double moved_bps =
      std::abs(reference - *quoted_reference_) / *quoted_reference_ * 10000.0;
  return moved_bps >= requote_threshold_bps_;
}

std::vector<AgentAction> MarketMakerAgent::decide(const AgentContext &ctx) {
  std::vector<AgentAction> actions;
  stats_.decisions++;

  const double reference = reference_price(ctx);
  if (!should_requote(reference, ctx.tick)) {
    return actions;
  }

  cancel_all(actions);

  auto [bid_price, ask_price] = calculate_quotes(reference, ctx.tick_size);

  // Stop adding to inventory once the limit is reached
  if (static_cast<double>(inventory_) < inventory_limit_) {
    actions.push_back(AgentAction::submit(
        limit_order(ctx, Side::BUY, bid_price, quote_size_)));
  }
  if (static_cast<double>(inventory_) > -inventory_limit_) {
    actions.push_back(AgentAction::submit(
        limit_order(ctx, Side::SELL, ask_price, quote_size_)));
  }

  quoted_reference_ = reference;
  last_quote_tick_ = ctx.tick;
  return actions;
}

// ============================================================================
// NOISE TRADER AGENT
// ============================================================================

NoiseTraderAgent::NoiseTraderAgent(std::string id, std::size_t index,
                                   const ParameterSet &params,
                                   std::uint64_t seed)
    : Agent(std::move(id), index, AgentType::NOISE_TRADER, params, seed) {

  order_probability_ = params_.get_parameter("order_probability", 0.05);
  min_size_ = params_.get_parameter("min_size", 10.0);
  max_size_ = params_.get_parameter("max_size", 50.0);
  market_probability_ = params_.get_parameter("market_probability", 0.7);
  max_offset_pct_ = params_.get_parameter("max_offset_pct", 0.01); // +/- 1%
  max_order_age_ = to_ticks(params_.get_parameter("max_order_age", 50.0));
}

std::vector<AgentAction> NoiseTraderAgent::decide(const AgentContext &ctx) {
  std::vector<AgentAction> actions;
  stats_.decisions++;

  // Drop limit orders that have rested too long
  for (auto it = open_orders_.begin(); it != open_orders_.end();) {
    if (ctx.tick - it->second.placed_tick >= max_order_age_) {
      actions.push_back(AgentAction::cancel(it->first));
      stats_.cancels_sent++;
      it = open_orders_.erase(it);
    } else {
      ++it;
    }
  }

  if (!chance(order_probability_)) {
    return actions;
  }

  const double reference = reference_price(ctx);
  const Side side = random_side();
  const Quantity quantity = random_quantity(min_size_, max_size_);

  if (chance(market_probability_)) {
    actions.push_back(AgentAction::submit(market_order(ctx, side, quantity)));
  } else {
    const double offset = uniform(-max_offset_pct_, max_offset_pct_);
    actions.push_back(AgentAction::submit(
        limit_order(ctx, side, reference * (1.0 + offset), quantity)));
  }

  return actions;
}

// ============================================================================
// INFORMED TRADER AGENT
// ============================================================================

InformedTraderAgent::InformedTraderAgent(std::string id, std::size_t index,
                                         const ParameterSet &params,
                                         std::uint64_t seed)
    : Agent(std::move(id), index, AgentType::INFORMED_TRADER, params, seed) {

  order_probability_ = params_.get_parameter("order_probability", 0.1);
  signal_threshold_ = params_.get_parameter("signal_threshold", 0.0005);
  signal_noise_ = params_.get_parameter("signal_noise", 0.0002);
  order_size_ = to_quantity(params_.get_parameter("order_size", 75.0));
}

double InformedTraderAgent::perceived_signal(const AgentContext &ctx) {
  const double reference = reference_price(ctx);
  double signal = ctx.expected_move / reference;
  if (signal_noise_ > 0.0) {
    std::normal_distribution<double> noise(0.0, signal_noise_);
    signal += noise(rng_);
  }
  return signal;
}

std::vector<AgentAction> InformedTraderAgent::decide(const AgentContext &ctx) {
  std::vector<AgentAction> actions;
  stats_.decisions++;

  if (!chance(order_probability_)) {
    return actions;
  }

  const double signal = perceived_signal(ctx);
  if (std::abs(signal) < signal_threshold_) {
    return actions; // No edge
  }

  const Side side = (signal > 0.0) ? Side::BUY : Side::SELL;
  actions.push_back(AgentAction::submit(market_order(ctx, side, order_size_)));
  return actions;
}

// ============================================================================
// MOMENTUM TRADER AGENT
// ============================================================================

MomentumTraderAgent::MomentumTraderAgent(std::string id, std::size_t index,
                                         const ParameterSet &params,
                                         std::uint64_t seed)
    : Agent(std::move(id), index, AgentType::MOMENTUM_TRADER, params, seed) {

  order_probability_ = params_.get_parameter("order_probability", 0.08);
  lookback_ = static_cast<std::size_t>(
      std::max(1.0, params_.get_parameter("lookback", 10.0)));
  momentum_threshold_ = params_.get_parameter("momentum_threshold", 0.001);
  order_size_ = to_quantity(params_.get_parameter("order_size", 60.0));
  price_offset_ = params_.get_parameter("price_offset", 0.0005);
  max_order_age_ = to_ticks(params_.get_parameter("max_order_age", 20.0));
}

double MomentumTraderAgent::trend() const {
  if (price_history_.size() < lookback_ + 1) {
    return 0.0;
  }
  const double past = price_history_.front();
  if (past <= 0.0) {
    return 0.0;
  }
  return (price_history_.back() - past) / past;
}

std::vector<AgentAction> MomentumTraderAgent::decide(const AgentContext &ctx) {
  std::vector<AgentAction> actions;
  stats_.decisions++;

  const double reference = reference_price(ctx);
  price_history_.push_back(reference);
  while (price_history_.size() > lookback_ + 1) {
    price_history_.pop_front();
  }

  for (auto it = open_orders_.begin(); it != open_orders_.end();) {
    if (ctx.tick - it->second.placed_tick >= max_order_age_) {
      actions.push_back(AgentAction::cancel(it->first));
      stats_.cancels_sent++;
      it = open_orders_.erase(it);
    } else {
      ++it;
    }
  }

  if (!chance(order_probability_)) {
    return actions;
  }

  const double momentum = trend();
  if (std::abs(momentum) < momentum_threshold_) {
    return actions; // Momentum too weak
  }

  // Limit slightly through the reference in the trend direction
  const Side side = (momentum > 0.0) ? Side::BUY : Side::SELL;
  const double price = reference * (1.0 + side_sign(side) * price_offset_);
  actions.push_back(
      AgentAction::submit(limit_order(ctx, side, price, order_size_)));
  return actions;
}
