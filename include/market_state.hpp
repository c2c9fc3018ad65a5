#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>

// Per-symbol state derived from price discovery and the liquidity model
struct MarketState {
  std::string symbol;
  double last_price = 0.0;
  double volatility = 0.0; // std-dev of recent log returns
  double momentum = 0.0;   // mean simple return over the trend window
  double liquidity = 0.0;
  Quantity volume = 0; // cumulative traded quantity
  SimTime timestamp = 0;
  std::uint64_t tick = 0;
};
