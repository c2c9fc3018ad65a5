#ifndef ORDER_HPP
#define ORDER_HPP

#include "types.hpp"
#include <iostream>
#include <optional>
#include <string>

// Permissive description of an order as it arrives from a caller or an agent.
// Turned into an Order (which enforces its invariants) on submission.
struct OrderRequest {
  std::string symbol;
  Side side = Side::BUY;
  OrderType type = OrderType::LIMIT;
  Quantity quantity = 0;
  std::optional<double> price;      // LIMIT, STOP_LIMIT
  std::optional<double> stop_price; // STOP, STOP_LIMIT
  std::string owner;                // participant reference
};

struct Order {
  OrderId id;
  std::string symbol;
  Side side;
  OrderType type;
  Quantity quantity;                // Total original quantity
  std::optional<double> price;      // Limit price (none for market orders)
  std::optional<double> stop_price; // Trigger price for stop types
  Quantity filled_quantity;
  double filled_notional; // sum(price * qty) over fills
  OrderState state;
  SimTime timestamp;
  std::string owner;
  bool stop_triggered;

  // Constructor for LIMIT orders
  Order(OrderId id_, std::string symbol_, Side side_, double price_,
        Quantity qty_, std::string owner_ = "");

  // Constructor for MARKET orders
  Order(OrderId id_, std::string symbol_, Side side_, OrderType type_,
        Quantity qty_, std::string owner_ = "");

  // Constructor for STOP (limit_price empty) and STOP_LIMIT orders
  Order(OrderId id_, std::string symbol_, Side side_, double stop_price_,
        std::optional<double> limit_price_, Quantity qty_,
        std::string owner_ = "");

  // Throws ValidationError when the request cannot form a valid order
  static Order from_request(OrderId id, const OrderRequest &request);

  Quantity remaining() const { return quantity - filled_quantity; }
  std::optional<double> average_fill_price() const;

  bool is_filled() const;
  bool is_active() const; // OPEN or PARTIALLY_FILLED
  bool is_market_order() const;
  bool is_stop_order() const; // untriggered STOP / STOP_LIMIT
  bool can_rest_in_book() const;

  // Accept the order (PENDING -> OPEN)
  void open();
  // Record an execution. Throws InvariantViolation on over-fill.
  void apply_fill(Quantity qty, double fill_price);
  // Throws InvariantViolation for transitions the lifecycle forbids
  void transition_to(OrderState next);
  // Convert a triggered stop into its market / limit form
  void trigger_stop();

  std::string side_to_string() const;
  std::string type_to_string() const;
  std::string state_to_string() const;

  friend std::ostream &operator<<(std::ostream &os, const Order &o);
};

bool is_valid_transition(OrderState from, OrderState to);

#endif // ORDER_HPP
