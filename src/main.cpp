#include "log.hpp"
#include "simulation.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

SimulationConfig build_config() {
  SimulationConfig config;
  config.tick_interval = std::chrono::milliseconds(20);
  config.seed = 2024;
  config.book.max_depth = 20;
  config.analytics.trigger = AnalyticsTrigger::EVERY_N_TRADES;
  config.analytics.every_n_trades = 5;

  // Wider, deeper quotes than the defaults
  config.agents.market_maker_params.set_parameter("spread_bps", 8.0);
  config.agents.market_maker_params.set_parameter("quote_size", 150.0);
  config.agents.noise_trader_params.set_parameter("order_probability", 0.08);
  return config;
}

void print_book_line(const Simulation &sim, const std::string &symbol) {
  auto book = sim.get_order_book(symbol, 5);
  auto state = sim.get_market_state(symbol);
  if (!book.ok() || !state.ok()) {
    std::cout << "  " << symbol << ": " << book.status().message << std::endl;
    return;
  }

  std::cout << std::fixed << std::setprecision(2);
  std::cout << "  " << std::left << std::setw(6) << symbol << std::right
            << " ref=" << state->last_price;
  if (book->best_bid && book->best_ask) {
    std::cout << " bid=" << *book->best_bid << " ask=" << *book->best_ask
              << " spread=" << *book->spread;
  } else {
    std::cout << " (one-sided book)";
  }
  std::cout << " liq=" << std::setprecision(0) << state->liquidity
            << " vol=" << state->volume << std::defaultfloat << std::endl;
}

} // namespace

int main() {
  std::cout << "╔════════════════════════════════════════════════════════════╗\n"
            << "║        Prism – Physics-Inspired Market Simulator           ║\n"
            << "╚════════════════════════════════════════════════════════════╝\n"
            << std::endl;

  set_log_level(LogLevel::INFO);
  Simulation sim(build_config());

  const std::vector<std::pair<std::string, double>> instruments = {
      {"AAPL", 185.0}, {"MSFT", 410.0}, {"SPY", 520.0}};
  for (const auto &[symbol, price] : instruments) {
    Status status = sim.add_symbol(symbol, price);
    if (!status.ok()) {
      log_error("Cannot register " + symbol + ": " + status.message);
      return 1;
    }
  }

  std::atomic<std::uint64_t> fill_events{0};
  sim.add_fill_listener([&fill_events, printed = 0](const Fill &fill) mutable {
    if (printed < 8 && fill.is_taker()) {
      std::cout << "  • " << fill << "\n";
      ++printed;
    }
    ++fill_events;
  });

  std::cout << "\n--- Phase 1: Warm-up (manual ticks) ---\n";
  Status warmup = sim.run_ticks(50);
  if (!warmup.ok()) {
    log_error("Warm-up failed: " + warmup.message);
    return 1;
  }
  for (const auto &[symbol, price] : instruments) {
    print_book_line(sim, symbol);
  }

  std::cout << "\n--- Phase 2: External order flow ---\n";
  OrderRequest sweep;
  sweep.symbol = "AAPL";
  sweep.side = Side::BUY;
  sweep.type = OrderType::MARKET;
  sweep.quantity = 400;
  sweep.owner = "desk";

  auto report = sim.execute_order(sweep);
  if (report.ok()) {
    std::cout << "  Market buy " << report->order.id << " -> "
              << to_string(report->order.state) << ", "
              << report->order.filled_quantity << " filled in "
              << report->fills.size() / 2 << " trades" << std::endl;
  } else {
    std::cout << "  Market buy failed: " << report.status().message << std::endl;
  }

  OrderRequest protective;
  protective.symbol = "AAPL";
  protective.side = Side::SELL;
  protective.type = OrderType::STOP;
  protective.stop_price = 170.0;
  protective.quantity = 100;
  protective.owner = "desk";
  auto stop_id = sim.submit_order(protective);
  if (stop_id.ok()) {
    std::cout << "  Stop-sell parked as order " << *stop_id << std::endl;
  }

  OrderRequest bad;
  bad.symbol = "NOPE";
  bad.side = Side::BUY;
  bad.type = OrderType::LIMIT;
  bad.price = 10.0;
  bad.quantity = 1;
  auto rejected = sim.submit_order(bad);
  std::cout << "  Unknown symbol -> " << to_string(rejected.code()) << ": "
            << rejected.status().message << std::endl;

  std::cout << "\n--- Phase 3: Real-time clock ---\n";
  Status started = sim.start();
  if (!started.ok()) {
    log_error("Cannot start clock: " + started.message);
    return 1;
  }
  for (int i = 0; i < 5; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    std::cout << "[tick " << sim.current_tick() << "]" << std::endl;
    print_book_line(sim, "AAPL");
  }
  Status stopped = sim.stop();
  if (!stopped.ok()) {
    log_warn("Clock stop: " + stopped.message);
  }

  if (stop_id.ok()) {
    Status cancelled = sim.cancel_order(*stop_id);
    std::cout << "  Cancel stop " << *stop_id << " -> "
              << (cancelled.ok() ? "OK" : cancelled.message) << std::endl;
  }

  std::cout << "\n--- Phase 4: Reporting ---\n";
  for (const auto &symbol : sim.symbols()) {
    auto analytics = sim.get_analytics(symbol);
    if (!analytics.ok()) {
      continue;
    }
    std::cout << std::fixed << std::setprecision(5);
    std::cout << "  " << symbol << " eff.spread=" << analytics->effective_spread.value_or(0.0)
              << " rvol=" << analytics->realized_volatility
              << " vwap=" << std::setprecision(2)
              << analytics->vwap.value_or(0.0)
              << " trades=" << analytics->trade_count << std::defaultfloat
              << std::endl;
  }

  sim.print_summary();
  std::cout << "\nFill events delivered to listeners: " << fill_events.load()
            << std::endl;
  return 0;
}
