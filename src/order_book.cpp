#include "order_book.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

template <typename Levels>
bool level_contains(const Levels &levels, double price, OrderId id) {
  auto level_it = levels.find(price);
  if (level_it == levels.end()) {
    return false;
  }
  const auto &ids = level_it->second.order_ids;
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

// Unlink an order from its level; drops the level once it empties
template <typename Levels>
bool erase_from_level(Levels &levels, double price, OrderId id,
                      Quantity remaining) {
  auto level_it = levels.find(price);
  if (level_it == levels.end()) {
    return false;
  }
  auto &level = level_it->second;
  auto id_it = std::find(level.order_ids.begin(), level.order_ids.end(), id);
  if (id_it == level.order_ids.end()) {
    return false;
  }
  level.order_ids.erase(id_it);
  level.total_quantity -= remaining;
  if (level.total_quantity < 0) {
    throw InvariantViolation("Negative level quantity after removing order " +
                             std::to_string(id));
  }
  if (level.order_ids.empty()) {
    levels.erase(level_it);
  }
  return true;
}

template <typename Levels>
std::vector<PriceLevel> collect_levels(const Levels &levels,
                                       std::size_t max_levels) {
  std::vector<PriceLevel> result;
  result.reserve(std::min(max_levels, levels.size()));
  for (const auto &[price, level] : levels) {
    if (result.size() >= max_levels) {
      break;
    }
    result.push_back({price, level.total_quantity, level.order_ids.size()});
  }
  return result;
}

Quantity sum_quantity(const std::vector<PriceLevel> &levels) {
  Quantity total = 0;
  for (const auto &level : levels) {
    total += level.total_quantity;
  }
  return total;
}

} // namespace

Quantity BookSnapshot::total_bid_quantity() const { return sum_quantity(bids); }

Quantity BookSnapshot::total_ask_quantity() const { return sum_quantity(asks); }

// ============================================================================
// CONSTRUCTOR
// ============================================================================

OrderBook::OrderBook(std::string symbol, OrderBookConfig config)
    : symbol_(std::move(symbol)), config_(config), next_fill_id_(1) {}

// ============================================================================
// ARENA HELPERS
// ============================================================================

Order &OrderBook::order_ref(OrderId id) {
  auto it = orders_.find(id);
  if (it == orders_.end()) {
    throw InvariantViolation("Book " + symbol_ + " references unknown order " +
                             std::to_string(id));
  }
  return it->second;
}

Order &OrderBook::store(Order order) {
  if (order.symbol != symbol_) {
    throw ValidationError("Order " + std::to_string(order.id) + " is for " +
                          order.symbol + ", book is " + symbol_);
  }
  if (order.state != OrderState::PENDING) {
    throw ValidationError("Order " + std::to_string(order.id) +
                          " was already submitted");
  }
  const OrderId id = order.id;
  auto [it, inserted] = orders_.emplace(id, std::move(order));
  if (!inserted) {
    throw ValidationError("Duplicate order id " + std::to_string(id));
  }
  return it->second;
}

void OrderBook::rest(Order &order) {
  const double price = *order.price;
  if (order.side == Side::BUY) {
    auto &level = bids_[price];
    level.order_ids.push_back(order.id);
    level.total_quantity += order.remaining();
  } else {
    auto &level = asks_[price];
    level.order_ids.push_back(order.id);
    level.total_quantity += order.remaining();
  }
}

void OrderBook::retire(const Order &order) { retired_.push_back(order.id); }

void OrderBook::prune() {
  if (config_.retained_terminal_orders == 0) {
    return;
  }
  while (retired_.size() > config_.retained_terminal_orders) {
    orders_.erase(retired_.front());
    retired_.pop_front();
  }
}

void OrderBook::record_fill(const Fill &fill, MatchResult &result) {
  fills_.push_back(fill);
  if (config_.retained_fills > 0 && fills_.size() > config_.retained_fills) {
    fills_.pop_front();
  }
  result.fills.push_back(fill);
}

// ============================================================================
//  CORE ORDER OPERATIONS
// ============================================================================

void OrderBook::add(Order order) {
  if (order.type != OrderType::LIMIT || !order.price) {
    throw ValidationError("Only limit orders with a price can rest, order " +
                          std::to_string(order.id) + " is " +
                          order.type_to_string());
  }
  if (is_marketable(order)) {
    std::ostringstream oss;
    oss << "Limit " << order.side_to_string() << " " << order.id << " @ "
        << *order.price << " would cross the book";
    throw ValidationError(oss.str());
  }

  Order &stored = store(std::move(order));
  stored.open();
  rest(stored);

  log_debug("Order " + std::to_string(stored.id) + " resting on " + symbol_);
  prune();
}

Order OrderBook::remove(OrderId order_id) {
  auto it = orders_.find(order_id);
  if (it == orders_.end() || !it->second.is_active()) {
    throw NotFoundError("Order " + std::to_string(order_id) +
                        " is not resting in " + symbol_);
  }

  Order &order = it->second;
  bool removed = false;

  if (order.is_stop_order()) {
    auto &stops = (order.side == Side::BUY) ? stop_buys_ : stop_sells_;
    auto range = stops.equal_range(*order.stop_price);
    for (auto stop_it = range.first; stop_it != range.second; ++stop_it) {
      if (stop_it->second == order_id) {
        stops.erase(stop_it);
        removed = true;
        break;
      }
    }
  } else if (order.price && order.can_rest_in_book()) {
    removed = (order.side == Side::BUY)
                  ? erase_from_level(bids_, *order.price, order_id,
                                     order.remaining())
                  : erase_from_level(asks_, *order.price, order_id,
                                     order.remaining());
  }

  if (!removed) {
    // Live but not in the book, e.g. the unfilled tail of a market order
    throw NotFoundError("Order " + std::to_string(order_id) +
                        " is not resting in " + symbol_);
  }

  order.transition_to(OrderState::CANCELLED);
  retire(order);
  Order cancelled = order;

  log_debug("Order " + std::to_string(order_id) + " cancelled on " + symbol_);
  prune();
  return cancelled;
}

bool OrderBook::cancel_order(OrderId order_id) {
  if (!is_resting(order_id)) {
    return false;
  }
  remove(order_id);
  return true;
}

// ============================================================================
// INVARIANTS
// ============================================================================

void OrderBook::check_not_crossed() const {
  auto bid = best_bid();
  auto ask = best_ask();
  if (bid && ask && *bid >= *ask) {
    std::ostringstream oss;
    oss << "Crossed book on " << symbol_ << ": bid " << *bid << " >= ask "
        << *ask;
    throw InvariantViolation(oss.str());
  }
}

void OrderBook::verify_invariants() const {
  auto check_side = [this](const auto &levels, Side side) {
    const std::string name = (side == Side::BUY) ? "bid" : "ask";
    std::optional<double> previous;

    for (const auto &[price, level] : levels) {
      if (previous &&
          !(side == Side::BUY ? price < *previous : price > *previous)) {
        throw InvariantViolation(symbol_ + ": " + name +
                                 " levels are not strictly sorted");
      }
      previous = price;

      if (level.order_ids.empty() || level.total_quantity <= 0) {
        std::ostringstream oss;
        oss << symbol_ << ": empty or non-positive " << name << " level at "
            << price << " (qty " << level.total_quantity << ")";
        throw InvariantViolation(oss.str());
      }

      Quantity sum = 0;
      for (OrderId id : level.order_ids) {
        auto it = orders_.find(id);
        if (it == orders_.end()) {
          throw InvariantViolation(symbol_ + ": level references unknown order " +
                                   std::to_string(id));
        }
        const Order &o = it->second;
        if (!o.is_active() || o.side != side || !o.price || *o.price != price) {
          throw InvariantViolation(symbol_ + ": order " + std::to_string(id) +
                                   " does not belong to its level");
        }
        sum += o.remaining();
      }

      if (sum != level.total_quantity) {
        std::ostringstream oss;
        oss << symbol_ << ": " << name << " level " << price << " aggregate "
            << level.total_quantity << " != resting " << sum;
        throw InvariantViolation(oss.str());
      }
    }
  };

  check_side(bids_, Side::BUY);
  check_side(asks_, Side::SELL);
  check_not_crossed();
}

// ============================================================================
// QUERY METHODS
// ============================================================================

std::optional<Order> OrderBook::get_order(OrderId order_id) const {
  auto it = orders_.find(order_id);
  if (it == orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool OrderBook::is_resting(OrderId order_id) const {
  auto it = orders_.find(order_id);
  if (it == orders_.end() || !it->second.is_active()) {
    return false;
  }

  const Order &order = it->second;
  if (order.is_stop_order()) {
    return true;
  }
  if (!order.price || !order.can_rest_in_book()) {
    return false;
  }
  return (order.side == Side::BUY)
             ? level_contains(bids_, *order.price, order_id)
             : level_contains(asks_, *order.price, order_id);
}

bool OrderBook::is_marketable(const Order &order) const {
  if (order.side == Side::BUY) {
    return !asks_.empty() && price_acceptable(order, asks_.begin()->first);
  }
  return !bids_.empty() && price_acceptable(order, bids_.begin()->first);
}

std::optional<double> OrderBook::best_bid() const {
  if (bids_.empty()) {
    return std::nullopt;
  }
  return bids_.begin()->first;
}

std::optional<double> OrderBook::best_ask() const {
  if (asks_.empty()) {
    return std::nullopt;
  }
  return asks_.begin()->first;
}

std::optional<double> OrderBook::mid_price() const {
  auto bid = best_bid();
  auto ask = best_ask();
  if (!bid || !ask) {
    return std::nullopt;
  }
  return (*bid + *ask) / 2.0;
}

std::optional<double> OrderBook::spread() const {
  auto bid = best_bid();
  auto ask = best_ask();
  if (!bid || !ask) {
    return std::nullopt;
  }
  return *ask - *bid;
}

Quantity OrderBook::top_quantity(Side side) const {
  if (side == Side::BUY) {
    return bids_.empty() ? 0 : bids_.begin()->second.total_quantity;
  }
  return asks_.empty() ? 0 : asks_.begin()->second.total_quantity;
}

std::vector<PriceLevel> OrderBook::get_bid_levels(std::size_t max_levels) const {
  return collect_levels(bids_, max_levels);
}

std::vector<PriceLevel> OrderBook::get_ask_levels(std::size_t max_levels) const {
  return collect_levels(asks_, max_levels);
}

BookSnapshot OrderBook::snapshot(std::size_t depth, SimTime timestamp) const {
  BookSnapshot snap;
  snap.symbol = symbol_;
  snap.bids = get_bid_levels(depth);
  snap.asks = get_ask_levels(depth);
  snap.best_bid = best_bid();
  snap.best_ask = best_ask();
  snap.mid_price = mid_price();
  snap.spread = spread();
  snap.last_trade_price = last_trade_price_;
  snap.timestamp = timestamp;
  return snap;
}

// ============================================================================
// DISPLAY METHODS
// ============================================================================

void OrderBook::print_fills() const {
  std::cout << "\n=== Fills Generated (" << symbol_ << ") ===" << std::endl;
  if (fills_.empty()) {
    std::cout << "No fills yet." << std::endl;
    return;
  }
  for (const auto &fill : fills_) {
    std::cout << fill << std::endl;
  }
}

void OrderBook::print_top_of_book() const {
  std::cout << "--- Top of Book (" << symbol_ << ") ---" << std::endl;

  auto bid = best_bid();
  if (bid) {
    std::cout << "Best Bid: " << *bid << " (qty: " << top_quantity(Side::BUY)
              << ")" << std::endl;
  } else {
    std::cout << "Best Bid: N/A" << std::endl;
  }

  auto ask = best_ask();
  if (ask) {
    std::cout << "Best Ask: " << *ask << " (qty: " << top_quantity(Side::SELL)
              << ")" << std::endl;
  } else {
    std::cout << "Best Ask: N/A" << std::endl;
  }

  auto sprd = spread();
  if (sprd) {
    std::cout << "Spread: " << *sprd << std::endl;
  }
}

void OrderBook::print_order_status(OrderId order_id) const {
  auto order = get_order(order_id);
  if (order) {
    std::cout << "\n=== Order Status ===" << std::endl;
    std::cout << *order << std::endl;
  } else {
    std::cout << "Order " << order_id << " not found." << std::endl;
  }
}

void OrderBook::print_market_depth(std::size_t levels) const {
  auto bid_levels = get_bid_levels(levels);
  auto ask_levels = get_ask_levels(levels);

  std::cout << "\n=== Market Depth: " << symbol_ << " (" << levels
            << " levels) ===" << std::endl;
  std::cout << std::string(70, '=') << std::endl;

  // Header
  std::cout << std::setw(25) << std::right << "BIDS"
            << " | " << std::setw(10) << "PRICE"
            << " | " << std::setw(25) << std::left << "ASKS" << std::endl;
  std::cout << std::string(70, '-') << std::endl;

  auto describe = [](const PriceLevel &level) {
    std::ostringstream oss;
    oss << level.total_quantity << " (" << level.num_orders << " order"
        << (level.num_orders > 1 ? "s" : "") << ")";
    return oss.str();
  };

  auto format_price = [](double price) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << "$" << price;
    return oss.str();
  };

  // Asks from highest to lowest, then bids from highest to lowest
  for (auto it = ask_levels.rbegin(); it != ask_levels.rend(); ++it) {
    std::cout << std::setw(25) << std::right << "" << " | " << std::setw(10)
              << std::left << format_price(it->price) << " | "
              << std::setw(25) << std::left << describe(*it) << std::endl;
  }
  for (const auto &level : bid_levels) {
    std::cout << std::setw(25) << std::right << describe(level) << " | "
              << std::setw(10) << std::left << format_price(level.price)
              << " | " << std::setw(25) << std::left << "" << std::endl;
  }

  // Footer with totals
  std::cout << std::string(70, '-') << std::endl;
  std::cout << std::setw(25) << std::right
            << ("Total: " + std::to_string(sum_quantity(bid_levels)) +
                " shares")
            << " | " << std::setw(10) << " "
            << " | " << std::setw(25) << std::left
            << ("Total: " + std::to_string(sum_quantity(ask_levels)) +
                " shares")
            << std::endl;
  std::cout << std::string(70, '=') << std::endl;

  auto sprd = spread();
  if (sprd && !bid_levels.empty()) {
    double spread_bps = (*sprd / bid_levels[0].price) * 10000;
    std::cout << "Spread: $" << std::fixed << std::setprecision(4) << *sprd
              << " (" << std::fixed << std::setprecision(2) << spread_bps
              << " bps)" << std::defaultfloat << std::endl;
  }
  std::cout << std::endl;
}

void OrderBook::print_pending_stops() const {
  std::cout << "\n=== Pending Stop Orders (" << symbol_ << ") ===" << std::endl;

  if (stop_buys_.empty() && stop_sells_.empty()) {
    std::cout << "No pending stop orders." << std::endl;
    return;
  }

  auto print_side = [this](const std::multimap<double, OrderId> &stops) {
    for (const auto &[price, id] : stops) {
      auto it = orders_.find(id);
      std::cout << "  $" << std::fixed << std::setprecision(2) << price
                << std::defaultfloat << " -> Order #" << id;
      if (it != orders_.end()) {
        std::cout << " (" << it->second.remaining() << " shares)";
      }
      std::cout << std::endl;
    }
  };

  if (!stop_buys_.empty()) {
    std::cout << "\nStop-Buy Orders (trigger at or above):" << std::endl;
    print_side(stop_buys_);
  }

  if (!stop_sells_.empty()) {
    std::cout << "\nStop-Sell Orders (trigger at or below):" << std::endl;
    print_side(stop_sells_);
  }

  std::cout << std::endl;
}
