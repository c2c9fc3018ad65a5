#pragma once

#include "config.hpp"
#include "fill.hpp"
#include "order_book.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

// Microstructure metrics for one symbol, as of the last recompute
struct AnalyticsSnapshot {
  std::string symbol;
  std::optional<double> spread;
  std::optional<double> mid_price;
  std::optional<double> effective_spread; // mean 2*D*(price - mid)
  double realized_volatility = 0.0;       // std-dev of trade log returns
  std::optional<double> imbalance;        // bid / (bid + ask), top N levels
  std::optional<double> vwap;             // over the trade window
  Quantity bid_depth = 0;                 // top N levels
  Quantity ask_depth = 0;
  std::uint64_t trade_count = 0;
  Quantity volume = 0;
  SimTime timestamp = 0;
};

class AnalyticsEngine {
public:
  AnalyticsEngine(std::string symbol, const AnalyticsConfig &config);

  // Record one trade from its taker fill and the book mid when it arrived
  void record_trade(const Fill &taker_fill, std::optional<double> mid_at_trade);

  // EVERY_TICK: always; EVERY_N_TRADES: once N trades have accumulated
  bool should_recompute() const;

  const AnalyticsSnapshot &recompute(const BookSnapshot &book, SimTime now);
  const AnalyticsSnapshot &latest() const { return latest_; }

  std::uint64_t trade_count() const { return trade_count_; }
  Quantity volume() const { return volume_; }

  // Building blocks, usable on any series
  static double realized_volatility(const std::vector<double> &prices);
  static std::optional<double> imbalance(const BookSnapshot &book,
                                         std::size_t levels);

  void print_report() const;

private:
  struct TradeRecord {
    double price;
    Quantity quantity;
    Side aggressor;
    std::optional<double> mid_at_trade;
  };

  std::string symbol_;
  AnalyticsConfig config_;
  std::deque<TradeRecord> trades_; // newest at the back
  std::size_t max_trades_;

  std::uint64_t trade_count_;
  Quantity volume_;
  std::uint64_t trades_since_recompute_;
  bool computed_;
  AnalyticsSnapshot latest_;

  std::optional<double> compute_effective_spread() const;
  std::optional<double> compute_vwap() const;
  double compute_volatility() const;
};
