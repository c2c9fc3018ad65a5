// examples/simulator_demo.cpp
#include "log.hpp"
#include "simulation.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <vector>

namespace {

struct RunOutcome {
  double final_price = 0.0;
  Quantity volume = 0;
  std::uint64_t trades = 0;
};

RunOutcome run_backtest(std::uint64_t seed, std::size_t ticks) {
  SimulationConfig config;
  config.seed = seed;
  config.worker_threads = 2;

  Simulation sim(config);
  for (const char *symbol : {"AAA", "BBB"}) {
    Status status = sim.add_symbol(symbol, 100.0);
    if (!status.ok()) {
      log_error(status.message);
      return {};
    }
  }

  Status status = sim.run_ticks(ticks);
  if (!status.ok()) {
    log_error("Backtest failed: " + status.message);
    return {};
  }

  RunOutcome outcome;
  auto state = sim.get_market_state("AAA");
  auto analytics = sim.get_analytics("AAA");
  if (state.ok() && analytics.ok()) {
    outcome.final_price = state->last_price;
    outcome.volume = state->volume;
    outcome.trades = analytics->trade_count;
  }
  return outcome;
}

void run_reproducibility_demo() {
  std::cout << "\n╔═══════════════════════════════════════════════════════╗"
            << std::endl;
  std::cout << "║        DEMO: Reproducible Backtest (same seed)        ║"
            << std::endl;
  std::cout << "╚═══════════════════════════════════════════════════════╝"
            << std::endl;

  const std::size_t ticks = 300;
  std::cout << "\nRunning two backtests of " << ticks << " ticks, seed 7..."
            << std::endl;
  RunOutcome first = run_backtest(7, ticks);
  RunOutcome second = run_backtest(7, ticks);
  RunOutcome other = run_backtest(8, ticks);

  auto show = [](const char *label, const RunOutcome &run) {
    std::cout << "  " << std::left << std::setw(10) << label << std::right
              << std::fixed << std::setprecision(4)
              << " price=" << run.final_price << std::defaultfloat
              << " volume=" << run.volume << " trades=" << run.trades
              << std::endl;
  };
  show("seed 7", first);
  show("seed 7", second);
  show("seed 8", other);

  const bool identical = first.final_price == second.final_price &&
                         first.volume == second.volume &&
                         first.trades == second.trades;
  std::cout << (identical ? "✓ Identical outcomes for identical seeds"
                          : "✗ Runs diverged")
            << std::endl;
}

void run_stop_cascade_demo() {
  std::cout << "\n╔═══════════════════════════════════════════════════════╗"
            << std::endl;
  std::cout << "║          DEMO: Stop Orders and Liquidity Sweep        ║"
            << std::endl;
  std::cout << "╚═══════════════════════════════════════════════════════╝"
            << std::endl;

  // Book built by hand only
  SimulationConfig config;
  config.agents.market_makers = 0;
  config.agents.noise_traders = 0;
  config.agents.informed_traders = 0;
  config.agents.momentum_traders = 0;

  Simulation sim(config);
  if (!sim.add_symbol("DEMO", 50.0).ok()) {
    return;
  }

  auto limit = [](Side side, double price, Quantity qty) {
    OrderRequest request;
    request.symbol = "DEMO";
    request.side = side;
    request.type = OrderType::LIMIT;
    request.price = price;
    request.quantity = qty;
    request.owner = "ladder";
    return request;
  };

  const std::vector<OrderRequest> ladder = {
      limit(Side::BUY, 49.90, 100), limit(Side::BUY, 49.80, 200),
      limit(Side::BUY, 49.70, 300), limit(Side::SELL, 50.10, 100),
      limit(Side::SELL, 50.20, 200)};
  for (const auto &request : ladder) {
    auto result = sim.submit_order(request);
    if (!result.ok()) {
      std::cout << "  Ladder order rejected: " << result.status().message
                << std::endl;
    }
  }

  OrderRequest stop;
  stop.symbol = "DEMO";
  stop.side = Side::SELL;
  stop.type = OrderType::STOP;
  stop.stop_price = 49.85;
  stop.quantity = 250;
  stop.owner = "stopper";
  auto stop_id = sim.submit_order(stop);

  OrderRequest hit;
  hit.symbol = "DEMO";
  hit.side = Side::SELL;
  hit.type = OrderType::MARKET;
  hit.quantity = 150;
  hit.owner = "seller";

  std::cout << "\nMarket sell 150 into a 49.90 bid of 100, stop-sell 250 @ "
               "49.85 parked..."
            << std::endl;
  auto report = sim.execute_order(hit);
  if (report.ok()) {
    std::cout << "  Fills: " << report->fills.size()
              << "  triggered stops: " << report->triggered_stops.size()
              << std::endl;
    for (const auto &fill : report->fills) {
      if (fill.is_taker()) {
        std::cout << "    " << fill << std::endl;
      }
    }
  }

  if (stop_id.ok()) {
    auto order = sim.get_order(*stop_id);
    if (order.ok()) {
      std::cout << "  Stop order now: " << *order << std::endl;
    }
  }

  if (SymbolLane *lane = sim.lane("DEMO")) {
    lane->order_book().print_market_depth(5);
  }
}

} // namespace

int main(int argc, char **argv) {
  std::cout << "\n╔═══════════════════════════════════════════════════════╗"
            << std::endl;
  std::cout << "║            MARKET SIMULATOR DEMONSTRATION             ║"
            << std::endl;
  std::cout << "╚═══════════════════════════════════════════════════════╝"
            << std::endl;

  std::cout << "\nAvailable demos:" << std::endl;
  std::cout << "  1. Reproducible Backtest (Seeded Agents)" << std::endl;
  std::cout << "  2. Stop Orders and Liquidity Sweep" << std::endl;
  std::cout << "  3. Run Both" << std::endl;

  set_log_level(LogLevel::WARN);

  int choice = 3;
  if (argc > 1) {
    choice = std::atoi(argv[1]);
  } else {
    std::cout << "\nSelect demo (1-3) [default=3]: ";
    if (!(std::cin >> choice)) {
      choice = 3;
    }
  }

  switch (choice) {
  case 1:
    run_reproducibility_demo();
    break;
  case 2:
    run_stop_cascade_demo();
    break;
  case 3:
    run_reproducibility_demo();
    std::cout << "\n\n";
    run_stop_cascade_demo();
    break;
  default:
    std::cerr << "Invalid choice!" << std::endl;
    return 1;
  }

  std::cout << "\n╔═══════════════════════════════════════════════════════╗"
            << std::endl;
  std::cout << "║              DEMONSTRATION COMPLETE                   ║"
            << std::endl;
  std::cout << "╚═══════════════════════════════════════════════════════╝"
            << std::endl;

  return 0;
}
