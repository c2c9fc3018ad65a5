#include "symbol_lane.hpp"

#include "log.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

// FNV-1a, stable across platforms so runs reproduce per seed
std::uint64_t hash_symbol(const std::string &symbol) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : symbol) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::uint64_t lane_seed(std::uint64_t seed, const std::string &symbol,
                        std::uint64_t lane_index) {
  return seed ^ hash_symbol(symbol) ^ (lane_index * 0x9E3779B97F4A7C15ULL);
}

} // namespace

SymbolLane::SymbolLane(std::string symbol, double initial_price,
                       std::uint64_t lane_index,
                       const SimulationConfig &config)
    : config_(config), symbol_(std::move(symbol)), lane_index_(lane_index),
      book_(symbol_, config.book), liquidity_(config.liquidity),
      price_(config.price, initial_price, config.book.tick_size,
             lane_seed(config.seed, symbol_, lane_index) + 1),
      engine_(book_, liquidity_, config.execution, config.book, lane_index),
      agents_(symbol_, config.agents,
              lane_seed(config.seed, symbol_, lane_index)),
      analytics_(symbol_, config.analytics), tick_(0), now_(0),
      halted_(false) {
  publish();
}

// ============================================================================
// TICK
// ============================================================================

std::vector<Fill> SymbolLane::step(std::uint64_t tick, SimTime now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Fill> fills;
  if (halted_) {
    return fills;
  }

  try {
    tick_ = tick;
    now_ = now;

    // Flow of the previous tick moves the reference price
    const double net_flow = engine_.take_net_flow();
    price_.step(net_flow, liquidity_, symbol_);
    liquidity_.decay_toward_base(symbol_, 1);

    const MarketState market = market_state();
    const BookSnapshot book = book_.snapshot(config_.book.max_depth, now);
    const AgentContext ctx{market, book, now, tick,
                           price_.expected_next_move(),
                           config_.book.tick_size};

    auto reports = agents_.run_tick(ctx, engine_);
    for (const auto &report : reports) {
      record_trades(report);
      fills.insert(fills.end(), report.fills.begin(), report.fills.end());
    }

    book_.verify_invariants();

    if (analytics_.should_recompute()) {
      analytics_.recompute(book_.snapshot(config_.book.max_depth, now), now);
    }
    publish();
  } catch (const InvariantViolation &e) {
    halt(e.what());
  } catch (const std::exception &e) {
    halt(std::string("unexpected error: ") + e.what());
  }

  return fills;
}

// ============================================================================
// EXTERNAL COMMANDS
// ============================================================================

Result<ExecutionReport> SymbolLane::submit(const OrderRequest &request) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (halted_) {
    return Status::error(ErrorCode::LANE_HALTED,
                         "Symbol " + symbol_ + " is halted: " + halt_reason_);
  }

  try {
    ExecutionReport report = engine_.submit(request, now_);
    agents_.route_fills(report.fills);
    record_trades(report);
    publish();
    return report;
  } catch (const ValidationError &e) {
    return Status::error(ErrorCode::VALIDATION_ERROR, e.what());
  } catch (const InvariantViolation &e) {
    halt(e.what());
    return Status::error(ErrorCode::INVARIANT_VIOLATION, e.what());
  } catch (const std::exception &e) {
    halt(std::string("unexpected error: ") + e.what());
    return Status::error(ErrorCode::INVALID_STATE, e.what());
  }
}

Status SymbolLane::cancel(OrderId order_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (halted_) {
    return Status::error(ErrorCode::LANE_HALTED,
                         "Symbol " + symbol_ + " is halted: " + halt_reason_);
  }

  try {
    Status status = engine_.cancel(order_id);
    if (status.ok()) {
      publish();
    }
    return status;
  } catch (const InvariantViolation &e) {
    halt(e.what());
    return Status::error(ErrorCode::INVARIANT_VIOLATION, e.what());
  } catch (const std::exception &e) {
    halt(std::string("unexpected error: ") + e.what());
    return Status::error(ErrorCode::INVALID_STATE, e.what());
  }
}

std::optional<Order> SymbolLane::get_order(OrderId order_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return book_.get_order(order_id);
}

// ============================================================================
// SNAPSHOTS
// ============================================================================

MarketState SymbolLane::market_state() const {
  MarketState state;
  state.symbol = symbol_;
  state.last_price = price_.last_price();
  state.volatility = price_.volatility();
  state.momentum = price_.momentum();
  state.liquidity = liquidity_.level(symbol_);
  state.volume = engine_.volume();
  state.timestamp = now_;
  state.tick = tick_;
  return state;
}

void SymbolLane::record_trades(const ExecutionReport &report) {
  for (const auto &fill : report.fills) {
    if (fill.is_taker()) {
      analytics_.record_trade(fill, report.mid_before);
    }
  }
}

void SymbolLane::publish() {
  auto snap = std::make_shared<LaneSnapshot>();
  snap->book = book_.snapshot(config_.book.max_depth, now_);
  snap->market = market_state();
  snap->analytics = analytics_.latest();
  snap->tick = tick_;

  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  snapshot_ = std::move(snap);
}

std::shared_ptr<const LaneSnapshot> SymbolLane::snapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

// ============================================================================
// HALT
// ============================================================================

void SymbolLane::halt(const std::string &reason) {
  halt_reason_ = reason;
  halted_ = true;
  log_error("Lane " + symbol_ + " halted at tick " + std::to_string(tick_) +
            ": " + reason);
  log_error("Lane " + symbol_ + " state: " + describe_book());
}

std::string SymbolLane::halt_reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return halt_reason_;
}

std::string SymbolLane::describe_book() const {
  std::ostringstream oss;
  auto show = [&oss](const char *label, const std::optional<double> &value) {
    oss << label << "=";
    if (value) {
      oss << *value;
    } else {
      oss << "none";
    }
  };

  show("best_bid", book_.best_bid());
  oss << " ";
  show("best_ask", book_.best_ask());
  oss << " ";
  show("last_trade", book_.last_trade_price());
  oss << " bid_levels=" << book_.bid_level_count()
      << " ask_levels=" << book_.ask_level_count()
      << " orders=" << book_.order_count()
      << " stops=" << book_.pending_stop_count()
      << " ref_price=" << price_.last_price()
      << " liquidity=" << liquidity_.level(symbol_);

  for (const auto &level : book_.get_bid_levels(5)) {
    oss << " | B " << level.price << " x " << level.total_quantity;
  }
  for (const auto &level : book_.get_ask_levels(5)) {
    oss << " | A " << level.price << " x " << level.total_quantity;
  }
  return oss.str();
}

// ============================================================================
// REPORTING
// ============================================================================

void SymbolLane::print_summary() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::cout << "\n" << std::string(70, '=') << std::endl;
  std::cout << "SYMBOL " << symbol_ << (halted_ ? "  [HALTED]" : "")
            << std::endl;
  std::cout << std::string(70, '=') << std::endl;

  const MarketState state = market_state();
  std::cout << std::fixed << std::setprecision(4);
  std::cout << "Reference Price:  " << state.last_price << std::endl;
  std::cout << "Momentum:         " << state.momentum << std::endl;
  std::cout << "Volatility:       " << state.volatility << std::endl;
  std::cout << std::setprecision(1);
  std::cout << "Liquidity:        " << state.liquidity << " / "
            << liquidity_.base_level() << std::endl;
  std::cout << std::defaultfloat;
  std::cout << "Volume:           " << state.volume << std::endl;
  std::cout << "Orders submitted: " << engine_.orders_submitted()
            << "  rejected: " << engine_.orders_rejected() << std::endl;

  book_.print_market_depth(5);
  analytics_.print_report();
  agents_.print_summary(state.last_price);
}
