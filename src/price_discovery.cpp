#include "price_discovery.hpp"

#include "errors.hpp"
#include "liquidity_model.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

PriceDiscovery::PriceDiscovery(const PriceDiscoveryConfig &config,
                               double initial_price, double tick_size,
                               std::uint64_t seed)
    : config_(config), tick_size_(tick_size), price_(initial_price), ticks_(0),
      rng_(seed), standard_normal_(0.0, 1.0), next_shock_(0.0) {
  if (!std::isfinite(initial_price) || initial_price <= 0.0) {
    std::ostringstream oss;
    oss << "Initial price must be positive and finite, got " << initial_price;
    throw ValidationError(oss.str());
  }
  record(initial_price);
  next_shock_ = standard_normal_(rng_);
}

void PriceDiscovery::record(double price) {
  history_.push_back(price);
  while (history_.size() > config_.history_length) {
    history_.pop_front();
  }
}

double PriceDiscovery::momentum() const {
  const std::size_t returns =
      std::min(config_.trend_window, history_.size() - 1);
  if (returns == 0) {
    return 0.0;
  }

  double sum = 0.0;
  for (std::size_t i = history_.size() - returns; i < history_.size(); ++i) {
    sum += history_[i] / history_[i - 1] - 1.0;
  }
  return sum / static_cast<double>(returns);
}

double PriceDiscovery::rolling_mean() const {
  const std::size_t n = std::min(config_.reversion_window, history_.size());
  double sum = 0.0;
  for (std::size_t i = history_.size() - n; i < history_.size(); ++i) {
    sum += history_[i];
  }
  return sum / static_cast<double>(n);
}

double PriceDiscovery::volatility() const {
  const std::size_t returns =
      std::min(config_.volatility_window, history_.size() - 1);
  if (returns < 2) {
    return 0.0;
  }

  std::vector<double> log_returns;
  log_returns.reserve(returns);
  for (std::size_t i = history_.size() - returns; i < history_.size(); ++i) {
    log_returns.push_back(std::log(history_[i] / history_[i - 1]));
  }

  double mean = 0.0;
  for (double r : log_returns) {
    mean += r;
  }
  mean /= static_cast<double>(log_returns.size());

  double variance = 0.0;
  for (double r : log_returns) {
    variance += (r - mean) * (r - mean);
  }
  variance /= static_cast<double>(log_returns.size());
  return std::sqrt(variance);
}

double PriceDiscovery::momentum_term() const {
  return config_.momentum_factor * momentum() * price_;
}

double PriceDiscovery::reversion_term() const {
  return config_.mean_reversion_rate * (rolling_mean() - price_);
}

double PriceDiscovery::noise_term() const {
  return price_ * config_.volatility * next_shock_;
}

double PriceDiscovery::expected_next_move() const {
  return momentum_term() + reversion_term() + noise_term();
}

double PriceDiscovery::step(double net_flow, const LiquidityModel &liquidity,
                            const std::string &symbol) {
  const Side flow_side = (net_flow >= 0.0) ? Side::BUY : Side::SELL;
  const double max_flow_move = config_.max_flow_return * price_;
  const double flow_term = std::clamp(
      price_ * liquidity.impact(symbol, std::abs(net_flow), flow_side),
      -max_flow_move, max_flow_move);

  double next = price_ + momentum_term() + reversion_term() + noise_term() +
                flow_term;

  if (!std::isfinite(next)) {
    throw InvariantViolation("Price discovery produced a non-finite price for " +
                             symbol);
  }
  // A single tick never more than halves the price, and never reaches zero
  next = std::max({next, price_ * 0.5, tick_size_});

  price_ = next;
  record(price_);
  ++ticks_;
  next_shock_ = standard_normal_(rng_);
  return price_;
}
