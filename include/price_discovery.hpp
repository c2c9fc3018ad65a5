#pragma once

#include "config.hpp"
#include "market_state.hpp"

#include <cstdint>
#include <deque>
#include <random>
#include <string>

class LiquidityModel;

// Reference price process for one symbol:
//   next = price + momentum + reversion + noise + flow impact
class PriceDiscovery {
public:
  PriceDiscovery(const PriceDiscoveryConfig &config, double initial_price,
                 double tick_size, std::uint64_t seed);

  // Advance one tick using the signed net order flow of the prior tick.
  // Returns the new reference price.
  double step(double net_flow, const LiquidityModel &liquidity,
              const std::string &symbol);

  // Momentum, reversion and the already drawn noise of the next step, without
  // the flow term. Informed traders see a noisy version of this.
  double expected_next_move() const;

  double last_price() const { return price_; }
  double momentum() const;   // mean simple return over the trend window
  double volatility() const; // std-dev of log returns over the window
  double rolling_mean() const;
  std::uint64_t tick_count() const { return ticks_; }
  const std::deque<double> &history() const { return history_; }

  const PriceDiscoveryConfig &config() const { return config_; }

private:
  PriceDiscoveryConfig config_;
  double tick_size_;
  double price_;
  std::deque<double> history_; // oldest first, includes price_
  std::uint64_t ticks_;

  std::mt19937_64 rng_;
  std::normal_distribution<double> standard_normal_;
  double next_shock_; // pre-drawn Z for the coming step

  double momentum_term() const;
  double reversion_term() const;
  double noise_term() const;
  void record(double price);
};
