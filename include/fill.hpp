#ifndef FILL_HPP
#define FILL_HPP

#include "types.hpp"
#include <iostream>
#include <string>

// One side of one trade. A match creates two: one for the taker and one for
// the maker, with identical quantity and price.
struct Fill {
  FillId id;
  OrderId order_id;
  OrderId counterparty_order_id;
  std::string symbol;
  Side side;
  Quantity quantity;
  double price;           // book price the trade printed at
  double effective_price; // price after slippage / impact (taker only)
  SimTime timestamp;      // tick time plus execution latency
  LiquidityRole liquidity;
  std::string owner;

  bool is_taker() const { return liquidity == LiquidityRole::TAKER; }
  double notional() const { return price * static_cast<double>(quantity); }

  friend std::ostream &operator<<(std::ostream &os, const Fill &f);
};

#endif // FILL_HPP
