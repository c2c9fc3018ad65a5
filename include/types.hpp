#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>

// Common type aliases
using Clock = std::chrono::steady_clock;

using OrderId = std::uint64_t;
using FillId = std::uint64_t;
using Quantity = std::int64_t;

// Simulated time in microseconds since the simulation started
using SimTime = std::int64_t;

// Order side of book
enum class Side { BUY, SELL };

// Order Type
enum class OrderType {
  MARKET,    // Market order (no price limit)
  LIMIT,     // limit order (has price limit)
  STOP,      // becomes MARKET once the stop price trades
  STOP_LIMIT // becomes LIMIT once the stop price trades
};

// Order States to track order lifecycle
enum class OrderState {
  PENDING,          // Just created, not validated yet
  OPEN,             // Accepted: resting in book or parked as a stop
  PARTIALLY_FILLED, // Some quantity filled
  FILLED,           // Completely filled
  CANCELLED,        // Canceled by user
  REJECTED          // Rejected (e.g., invalid parameters)
};

// Which side of a trade a fill was on
enum class LiquidityRole { MAKER, TAKER };

// Shape of the execution cost curve
enum class SlippageModel { LINEAR, SQUARE_ROOT, QUADRATIC };

// What happens to the unfilled part of a market order
enum class MarketRemainderPolicy { LEAVE_PARTIAL, CANCEL_REMAINDER };

enum class AgentType {
  MARKET_MAKER,
  NOISE_TRADER,
  INFORMED_TRADER,
  MOMENTUM_TRADER
};

inline bool is_terminal(OrderState state) {
  return state == OrderState::FILLED || state == OrderState::CANCELLED ||
         state == OrderState::REJECTED;
}

// +1 for buys, -1 for sells
inline int side_sign(Side side) { return side == Side::BUY ? 1 : -1; }

inline Side opposite(Side side) {
  return side == Side::BUY ? Side::SELL : Side::BUY;
}

// Snap a price onto the tick grid. Divides by an integral ticks-per-unit when
// the tick allows it so that 99.5 stays exactly 99.5.
inline double round_to_tick(double price, double tick_size) {
  const double per_unit = std::round(1.0 / tick_size);
  if (per_unit >= 1.0 && std::abs(per_unit * tick_size - 1.0) < 1e-9) {
    return std::round(price * per_unit) / per_unit;
  }
  return std::round(price / tick_size) * tick_size;
}

std::string to_string(Side side);
std::string to_string(OrderType type);
std::string to_string(OrderState state);
std::string to_string(LiquidityRole role);
std::string to_string(AgentType type);

#endif // TYPES_HPP
