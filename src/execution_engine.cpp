#include "execution_engine.hpp"

#include "log.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

ExecutionEngine::ExecutionEngine(OrderBook &book, LiquidityModel &liquidity,
                                 const ExecutionConfig &config,
                                 const OrderBookConfig &book_config,
                                 std::uint64_t lane_index)
    : book_(book), liquidity_(liquidity), config_(config),
      book_config_(book_config), id_generator_(lane_index), net_flow_(0.0),
      volume_(0), orders_submitted_(0), orders_rejected_(0), trade_count_(0) {
  liquidity_.add_symbol(book_.symbol());
}

bool ExecutionEngine::on_tick(double price) const {
  if (!book_config_.enforce_tick_size) {
    return true;
  }
  const double steps = price / book_config_.tick_size;
  return std::abs(steps - std::round(steps)) < 1e-6;
}

void ExecutionEngine::validate(const Order &order) const {
  if (order.symbol != book_.symbol()) {
    throw ValidationError("Order for " + order.symbol + " routed to " +
                          book_.symbol());
  }
  if (order.price && !on_tick(*order.price)) {
    std::ostringstream oss;
    oss << "Price " << *order.price << " is not a multiple of tick size "
        << book_config_.tick_size;
    throw ValidationError(oss.str());
  }
  if (order.stop_price && !on_tick(*order.stop_price)) {
    std::ostringstream oss;
    oss << "Stop price " << *order.stop_price
        << " is not a multiple of tick size " << book_config_.tick_size;
    throw ValidationError(oss.str());
  }
}

ExecutionReport ExecutionEngine::submit(const OrderRequest &request,
                                        SimTime now) {
  return submit(Order::from_request(next_order_id(), request), now);
}

ExecutionReport ExecutionEngine::submit(Order order, SimTime now) {
  validate(order);
  if (book_config_.enforce_tick_size) {
    if (order.price) {
      order.price = round_to_tick(*order.price, book_config_.tick_size);
    }
    if (order.stop_price) {
      order.stop_price = round_to_tick(*order.stop_price, book_config_.tick_size);
    }
  }
  order.timestamp = now;
  ++orders_submitted_;

  ExecutionReport report{order, {}, {}, book_.mid_price()};

  if (order.type == OrderType::LIMIT && !book_.is_marketable(order)) {
    const OrderId id = order.id;
    book_.add(std::move(order));
    auto stored = book_.get_order(id);
    if (!stored) {
      throw InvariantViolation("Order " + std::to_string(id) +
                               " vanished after being added");
    }
    report.order = *stored;
    return report;
  }

  MatchContext ctx;
  ctx.fill_time = now + config_.latency_us;
  ctx.market_remainder = config_.market_remainder;
  ctx.price_adjustment = [this](const Order &o) { return slippage(o); };

  MatchResult result = book_.match(std::move(order), ctx);
  report.order = std::move(result.order);
  report.fills = std::move(result.fills);
  report.triggered_stops = std::move(result.triggered_stops);

  if (report.rejected()) {
    ++orders_rejected_;
  }

  absorb_fills(report.fills);
  return report;
}

Status ExecutionEngine::cancel(OrderId order_id) {
  try {
    book_.remove(order_id);
  } catch (const NotFoundError &e) {
    return Status::error(ErrorCode::NOT_FOUND, e.what());
  }
  return Status::success();
}

double ExecutionEngine::slippage(const Order &order) const {
  const double quantity = static_cast<double>(order.remaining());
  const double liquidity =
      std::max(liquidity_.level(book_.symbol()), liquidity_.impact_floor());
  const double ratio = quantity / liquidity;

  double curve = ratio;
  switch (config_.slippage_model) {
  case SlippageModel::LINEAR:
    curve = ratio;
    break;
  case SlippageModel::SQUARE_ROOT:
    curve = std::sqrt(ratio);
    break;
  case SlippageModel::QUADRATIC:
    curve = ratio * ratio;
    break;
  }

  double adjustment = config_.slippage_coefficient * curve;

  // Size beyond the visible top of book walks into hidden liquidity
  const Quantity visible = book_.top_quantity(opposite(order.side));
  if (order.remaining() > visible) {
    adjustment += std::abs(liquidity_.impact(quantity, liquidity, order.side));
  }
  // Capped below 1 so a sell taker keeps a positive effective price
  return std::min(adjustment, config_.max_slippage);
}

void ExecutionEngine::absorb_fills(const std::vector<Fill> &fills) {
  for (const auto &fill : fills) {
    if (!fill.is_taker()) {
      continue;
    }
    const double qty = static_cast<double>(fill.quantity);
    liquidity_.apply_consumption(fill.symbol, qty);
    net_flow_ += side_sign(fill.side) * qty;
    volume_ += fill.quantity;
    ++trade_count_;
  }
}

double ExecutionEngine::take_net_flow() {
  const double flow = net_flow_;
  net_flow_ = 0.0;
  return flow;
}
