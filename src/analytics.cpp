#include "analytics.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

AnalyticsEngine::AnalyticsEngine(std::string symbol,
                                 const AnalyticsConfig &config)
    : symbol_(std::move(symbol)), config_(config),
      max_trades_(std::max({config.volatility_window + 1, config.vwap_window,
                            config.effective_spread_window})),
      trade_count_(0), volume_(0), trades_since_recompute_(0),
      computed_(false) {
  latest_.symbol = symbol_;
}

void AnalyticsEngine::record_trade(const Fill &taker_fill,
                                   std::optional<double> mid_at_trade) {
  if (!taker_fill.is_taker()) {
    throw ValidationError("Analytics records trades from taker fills only");
  }

  trades_.push_back(TradeRecord{taker_fill.price, taker_fill.quantity,
                                taker_fill.side, mid_at_trade});
  while (trades_.size() > max_trades_) {
    trades_.pop_front();
  }

  ++trade_count_;
  ++trades_since_recompute_;
  volume_ += taker_fill.quantity;
}

bool AnalyticsEngine::should_recompute() const {
  if (!computed_ || config_.trigger == AnalyticsTrigger::EVERY_TICK) {
    return true;
  }
  return trades_since_recompute_ >= config_.every_n_trades;
}

const AnalyticsSnapshot &AnalyticsEngine::recompute(const BookSnapshot &book,
                                                    SimTime now) {
  AnalyticsSnapshot snap;
  snap.symbol = symbol_;
  snap.spread = book.spread;
  snap.mid_price = book.mid_price;
  snap.effective_spread = compute_effective_spread();
  snap.realized_volatility = compute_volatility();
  snap.imbalance = imbalance(book, config_.imbalance_levels);
  snap.vwap = compute_vwap();

  const std::size_t bid_n = std::min(config_.imbalance_levels, book.bids.size());
  const std::size_t ask_n = std::min(config_.imbalance_levels, book.asks.size());
  for (std::size_t i = 0; i < bid_n; ++i) {
    snap.bid_depth += book.bids[i].total_quantity;
  }
  for (std::size_t i = 0; i < ask_n; ++i) {
    snap.ask_depth += book.asks[i].total_quantity;
  }

  snap.trade_count = trade_count_;
  snap.volume = volume_;
  snap.timestamp = now;

  latest_ = std::move(snap);
  trades_since_recompute_ = 0;
  computed_ = true;
  return latest_;
}

std::optional<double> AnalyticsEngine::compute_effective_spread() const {
  const std::size_t window =
      std::min(config_.effective_spread_window, trades_.size());

  double sum = 0.0;
  std::size_t count = 0;
  for (std::size_t i = trades_.size() - window; i < trades_.size(); ++i) {
    const auto &trade = trades_[i];
    if (!trade.mid_at_trade) {
      continue;
    }
    // Positive when the aggressor paid through the mid
    sum += 2.0 * side_sign(trade.aggressor) * (trade.price - *trade.mid_at_trade);
    ++count;
  }

  if (count == 0) {
    return std::nullopt;
  }
  return sum / static_cast<double>(count);
}

std::optional<double> AnalyticsEngine::compute_vwap() const {
  const std::size_t window = std::min(config_.vwap_window, trades_.size());
  if (window == 0) {
    return std::nullopt;
  }

  double notional = 0.0;
  Quantity quantity = 0;
  for (std::size_t i = trades_.size() - window; i < trades_.size(); ++i) {
    notional += trades_[i].price * static_cast<double>(trades_[i].quantity);
    quantity += trades_[i].quantity;
  }
  return notional / static_cast<double>(quantity);
}

double AnalyticsEngine::compute_volatility() const {
  const std::size_t window =
      std::min(config_.volatility_window + 1, trades_.size());
  std::vector<double> prices;
  prices.reserve(window);
  for (std::size_t i = trades_.size() - window; i < trades_.size(); ++i) {
    prices.push_back(trades_[i].price);
  }
  return realized_volatility(prices);
}

double AnalyticsEngine::realized_volatility(const std::vector<double> &prices) {
  if (prices.size() < 3) {
    return 0.0;
  }

  std::vector<double> returns;
  returns.reserve(prices.size() - 1);
  for (std::size_t i = 1; i < prices.size(); ++i) {
    if (prices[i - 1] <= 0.0 || prices[i] <= 0.0) {
      continue;
    }
    returns.push_back(std::log(prices[i] / prices[i - 1]));
  }
  if (returns.size() < 2) {
    return 0.0;
  }

  double mean = 0.0;
  for (double r : returns) {
    mean += r;
  }
  mean /= static_cast<double>(returns.size());

  double sum_squared_diff = 0.0;
  for (double r : returns) {
    sum_squared_diff += (r - mean) * (r - mean);
  }
  return std::sqrt(sum_squared_diff / static_cast<double>(returns.size()));
}

std::optional<double> AnalyticsEngine::imbalance(const BookSnapshot &book,
                                                 std::size_t levels) {
  Quantity bid_qty = 0;
  Quantity ask_qty = 0;
  for (std::size_t i = 0; i < std::min(levels, book.bids.size()); ++i) {
    bid_qty += book.bids[i].total_quantity;
  }
  for (std::size_t i = 0; i < std::min(levels, book.asks.size()); ++i) {
    ask_qty += book.asks[i].total_quantity;
  }

  if (bid_qty + ask_qty == 0) {
    return std::nullopt;
  }
  return static_cast<double>(bid_qty) / static_cast<double>(bid_qty + ask_qty);
}

void AnalyticsEngine::print_report() const {
  auto show = [](const std::optional<double> &value, int precision) {
    if (!value) {
      std::cout << "N/A";
      return;
    }
    std::cout << std::fixed << std::setprecision(precision) << *value
              << std::defaultfloat;
  };

  std::cout << "\n=== Analytics: " << symbol_ << " ===" << std::endl;
  std::cout << "Spread:              ";
  show(latest_.spread, 4);
  std::cout << "\nMid Price:           ";
  show(latest_.mid_price, 4);
  std::cout << "\nEffective Spread:    ";
  show(latest_.effective_spread, 4);
  std::cout << "\nRealized Volatility: " << std::fixed << std::setprecision(6)
            << latest_.realized_volatility << std::defaultfloat;
  std::cout << "\nImbalance:           ";
  show(latest_.imbalance, 3);
  std::cout << "\nVWAP:                ";
  show(latest_.vwap, 4);
  std::cout << "\nDepth (bid/ask):     " << latest_.bid_depth << " / "
            << latest_.ask_depth;
  std::cout << "\nTrades / Volume:     " << latest_.trade_count << " / "
            << latest_.volume << std::endl;
}
