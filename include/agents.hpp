#pragma once

#include "agent.hpp"

#include <deque>
#include <utility>

// ============================================================================
// MARKET MAKER AGENT
// ============================================================================

// Quotes both sides around the reference price and skews the quotes against
// its inventory
class MarketMakerAgent : public Agent {
private:
  double spread_bps_;       // full quoted spread
  Quantity quote_size_;
  double inventory_limit_;  // no quoting further in this direction beyond it
  double target_inventory_;
  double skew_factor_;      // fraction of price shifted at the inventory limit
  std::uint64_t requote_interval_; // ticks between forced requotes
  double requote_threshold_bps_;   // reference move that forces a requote

  std::optional<double> quoted_reference_;
  std::uint64_t last_quote_tick_;

  bool should_requote(double reference, std::uint64_t tick) const;

public:
  MarketMakerAgent(std::string id, std::size_t index, const ParameterSet &params,
                   std::uint64_t seed);

  std::vector<AgentAction> decide(const AgentContext &ctx) override;

  // Price shift applied to both quotes, negative when long
  double inventory_skew(double reference) const;
  std::pair<double, double> calculate_quotes(double reference,
                                             double tick_size) const;
};

// ============================================================================
// NOISE TRADER AGENT
// ============================================================================

// Random side, size and timing with no information
class NoiseTraderAgent : public Agent {
private:
  double order_probability_;
  double min_size_;
  double max_size_;
  double market_probability_; // share of market orders
  double max_offset_pct_;     // limit price offset around the reference
  std::uint64_t max_order_age_;

public:
  NoiseTraderAgent(std::string id, std::size_t index, const ParameterSet &params,
                   std::uint64_t seed);

  std::vector<AgentAction> decide(const AgentContext &ctx) override;
};

// ============================================================================
// INFORMED TRADER AGENT
// ============================================================================

// Trades on a noisy preview of the next price-discovery move
class InformedTraderAgent : public Agent {
private:
  double order_probability_;
  double signal_threshold_; // relative move needed to act
  double signal_noise_;     // std-dev of the error on the relative preview
  Quantity order_size_;

public:
  InformedTraderAgent(std::string id, std::size_t index,
                      const ParameterSet &params, std::uint64_t seed);

  std::vector<AgentAction> decide(const AgentContext &ctx) override;

  // Relative expected move as this agent perceives it
  double perceived_signal(const AgentContext &ctx);
};

// ============================================================================
// MOMENTUM TRADER AGENT
// ============================================================================

// Extrapolates the realized trend of the reference price
class MomentumTraderAgent : public Agent {
private:
  double order_probability_;
  std::size_t lookback_;
  double momentum_threshold_;
  Quantity order_size_;
  double price_offset_; // how far through the reference the limit is placed
  std::uint64_t max_order_age_;

  std::deque<double> price_history_;

public:
  MomentumTraderAgent(std::string id, std::size_t index,
                      const ParameterSet &params, std::uint64_t seed);

  std::vector<AgentAction> decide(const AgentContext &ctx) override;

  // Simple return over the lookback, 0 until enough history exists
  double trend() const;
};
