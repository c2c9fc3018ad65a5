#include "order.hpp"
#include "errors.hpp"
#include "fill.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace {

void validate_common(const std::string &symbol, Quantity qty) {
  if (symbol.empty()) {
    throw ValidationError("Order symbol must not be empty");
  }
  if (qty <= 0) {
    throw ValidationError("Order quantity must be positive, got " +
                          std::to_string(qty));
  }
}

void validate_price(double price, const char *what) {
  if (!std::isfinite(price) || price <= 0.0) {
    std::ostringstream oss;
    oss << what << " must be positive and finite, got " << price;
    throw ValidationError(oss.str());
  }
}

} // namespace

// Constructor for LIMIT orders
Order::Order(OrderId id_, std::string symbol_, Side side_, double price_,
             Quantity qty_, std::string owner_)
    : id(id_), symbol(std::move(symbol_)), side(side_), type(OrderType::LIMIT),
      quantity(qty_), price(price_), filled_quantity(0), filled_notional(0.0),
      state(OrderState::PENDING), timestamp(0), owner(std::move(owner_)),
      stop_triggered(false) {
  validate_common(symbol, quantity);
  validate_price(price_, "Limit price");
}

// Constructor for MARKET Orders
Order::Order(OrderId id_, std::string symbol_, Side side_, OrderType type_,
             Quantity qty_, std::string owner_)
    : id(id_), symbol(std::move(symbol_)), side(side_), type(type_),
      quantity(qty_), filled_quantity(0), filled_notional(0.0),
      state(OrderState::PENDING), timestamp(0), owner(std::move(owner_)),
      stop_triggered(false) {
  if (type_ != OrderType::MARKET) {
    throw ValidationError("Use the priced constructors for " +
                          to_string(type_) + " orders");
  }
  validate_common(symbol, quantity);
}

// Constructor for STOP / STOP_LIMIT Orders
Order::Order(OrderId id_, std::string symbol_, Side side_, double stop_price_,
             std::optional<double> limit_price_, Quantity qty_,
             std::string owner_)
    : id(id_), symbol(std::move(symbol_)), side(side_),
      type(limit_price_ ? OrderType::STOP_LIMIT : OrderType::STOP),
      quantity(qty_), price(limit_price_), stop_price(stop_price_),
      filled_quantity(0), filled_notional(0.0), state(OrderState::PENDING),
      timestamp(0), owner(std::move(owner_)), stop_triggered(false) {
  validate_common(symbol, quantity);
  validate_price(stop_price_, "Stop price");
  if (limit_price_) {
    validate_price(*limit_price_, "Stop-limit price");
  }
}

Order Order::from_request(OrderId id, const OrderRequest &request) {
  switch (request.type) {
  case OrderType::MARKET:
    if (request.price || request.stop_price) {
      throw ValidationError("Market orders must not carry a price");
    }
    return Order(id, request.symbol, request.side, OrderType::MARKET,
                 request.quantity, request.owner);
  case OrderType::LIMIT:
    if (!request.price) {
      throw ValidationError("Limit orders require a price");
    }
    return Order(id, request.symbol, request.side, *request.price,
                 request.quantity, request.owner);
  case OrderType::STOP:
    if (!request.stop_price) {
      throw ValidationError("Stop orders require a stop price");
    }
    return Order(id, request.symbol, request.side, *request.stop_price,
                 std::nullopt, request.quantity, request.owner);
  case OrderType::STOP_LIMIT:
    if (!request.stop_price || !request.price) {
      throw ValidationError("Stop-limit orders require stop and limit prices");
    }
    return Order(id, request.symbol, request.side, *request.stop_price,
                 request.price, request.quantity, request.owner);
  }
  throw ValidationError("Unknown order type");
}

std::optional<double> Order::average_fill_price() const {
  if (filled_quantity <= 0) {
    return std::nullopt;
  }
  return filled_notional / static_cast<double>(filled_quantity);
}

bool Order::is_filled() const {
  return filled_quantity == quantity || state == OrderState::FILLED;
}

bool Order::is_active() const {
  return state == OrderState::OPEN || state == OrderState::PARTIALLY_FILLED;
}

bool Order::is_market_order() const { return type == OrderType::MARKET; }

bool Order::is_stop_order() const {
  return (type == OrderType::STOP || type == OrderType::STOP_LIMIT) &&
         !stop_triggered;
}

bool Order::can_rest_in_book() const { return type == OrderType::LIMIT; }

void Order::open() { transition_to(OrderState::OPEN); }

void Order::apply_fill(Quantity qty, double fill_price) {
  if (qty <= 0 || qty > remaining()) {
    std::ostringstream oss;
    oss << "Fill of " << qty << " exceeds remaining " << remaining()
        << " on order " << id;
    throw InvariantViolation(oss.str());
  }

  filled_quantity += qty;
  filled_notional += fill_price * static_cast<double>(qty);

  transition_to(filled_quantity == quantity ? OrderState::FILLED
                                            : OrderState::PARTIALLY_FILLED);
}

void Order::transition_to(OrderState next) {
  if (!is_valid_transition(state, next)) {
    throw InvariantViolation("Order " + std::to_string(id) +
                             ": illegal transition " + to_string(state) +
                             " -> " + to_string(next));
  }
  state = next;
}

void Order::trigger_stop() {
  if (!is_stop_order()) {
    throw InvariantViolation("Order " + std::to_string(id) +
                             " is not an untriggered stop");
  }
  stop_triggered = true;
  // Stop-Market -> Market, Stop-Limit -> Limit at its existing limit price
  type = (type == OrderType::STOP) ? OrderType::MARKET : OrderType::LIMIT;
}

bool is_valid_transition(OrderState from, OrderState to) {
  switch (from) {
  case OrderState::PENDING:
    return to == OrderState::OPEN || to == OrderState::REJECTED;
  case OrderState::OPEN:
    return to == OrderState::PARTIALLY_FILLED || to == OrderState::FILLED ||
           to == OrderState::CANCELLED;
  case OrderState::PARTIALLY_FILLED:
    return to == OrderState::PARTIALLY_FILLED || to == OrderState::FILLED ||
           to == OrderState::CANCELLED;
  case OrderState::FILLED:
  case OrderState::CANCELLED:
  case OrderState::REJECTED:
    return false;
  }
  return false;
}

std::string Order::side_to_string() const { return to_string(side); }

std::string Order::type_to_string() const { return to_string(type); }

std::string Order::state_to_string() const { return to_string(state); }

std::ostream &operator<<(std::ostream &os, const Order &o) {
  os << "Order{id=" << o.id << ", symbol=" << o.symbol
     << ", type=" << o.type_to_string() << ", side=" << o.side_to_string()
     << ", price=";

  if (o.price) {
    os << *o.price;
  } else {
    os << "MARKET";
  }

  if (o.stop_price) {
    os << ", stop=" << *o.stop_price;
  }

  os << ", filled=" << o.filled_quantity << "/" << o.quantity;

  if (auto avg = o.average_fill_price()) {
    os << " @ " << std::fixed << std::setprecision(4) << *avg
       << std::defaultfloat;
  }

  os << ", state=" << o.state_to_string() << ", ts=" << o.timestamp;
  if (!o.owner.empty()) {
    os << ", owner=" << o.owner;
  }
  os << "}";
  return os;
}

std::ostream &operator<<(std::ostream &os, const Fill &f) {
  os << "Fill{id=" << f.id << ", order=" << f.order_id
     << ", contra=" << f.counterparty_order_id << ", " << f.symbol << " "
     << to_string(f.side) << " " << f.quantity << " @ " << f.price
     << " (eff " << f.effective_price << "), "
     << to_string(f.liquidity) << ", ts=" << f.timestamp << "}";
  return os;
}

// ============================================================================
// ENUM NAMES
// ============================================================================

std::string to_string(Side side) { return side == Side::BUY ? "BUY" : "SELL"; }

std::string to_string(OrderType type) {
  switch (type) {
  case OrderType::MARKET:
    return "MARKET";
  case OrderType::LIMIT:
    return "LIMIT";
  case OrderType::STOP:
    return "STOP";
  case OrderType::STOP_LIMIT:
    return "STOP_LIMIT";
  default:
    return "UNKNOWN";
  }
}

std::string to_string(OrderState state) {
  switch (state) {
  case OrderState::PENDING:
    return "PENDING";
  case OrderState::OPEN:
    return "OPEN";
  case OrderState::PARTIALLY_FILLED:
    return "PARTIALLY_FILLED";
  case OrderState::FILLED:
    return "FILLED";
  case OrderState::CANCELLED:
    return "CANCELLED";
  case OrderState::REJECTED:
    return "REJECTED";
  default:
    return "UNKNOWN";
  }
}

std::string to_string(LiquidityRole role) {
  return role == LiquidityRole::MAKER ? "MAKER" : "TAKER";
}

std::string to_string(AgentType type) {
  switch (type) {
  case AgentType::MARKET_MAKER:
    return "MARKET_MAKER";
  case AgentType::NOISE_TRADER:
    return "NOISE_TRADER";
  case AgentType::INFORMED_TRADER:
    return "INFORMED_TRADER";
  case AgentType::MOMENTUM_TRADER:
    return "MOMENTUM_TRADER";
  default:
    return "UNKNOWN";
  }
}

std::string to_string(ErrorCode code) {
  switch (code) {
  case ErrorCode::OK:
    return "OK";
  case ErrorCode::VALIDATION_ERROR:
    return "VALIDATION_ERROR";
  case ErrorCode::NOT_FOUND:
    return "NOT_FOUND";
  case ErrorCode::ALREADY_EXISTS:
    return "ALREADY_EXISTS";
  case ErrorCode::INVARIANT_VIOLATION:
    return "INVARIANT_VIOLATION";
  case ErrorCode::LANE_HALTED:
    return "LANE_HALTED";
  case ErrorCode::INVALID_STATE:
    return "INVALID_STATE";
  default:
    return "UNKNOWN";
  }
}
