#include "simulation.hpp"
#include "log.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iomanip>
#include <iostream>

namespace {

std::size_t worker_count(const SimulationConfig &config) {
  if (config.worker_threads > 0) {
    return config.worker_threads;
  }
  const unsigned hardware = std::thread::hardware_concurrency();
  return hardware > 0 ? hardware : 1;
}

SimulationConfig validated(SimulationConfig config) {
  config.validate();
  return config;
}

} // namespace

Simulation::Simulation(SimulationConfig config)
    : config_(validated(std::move(config))),
      pool_(worker_count(config_)), tick_(0), running_(false),
      stop_requested_(false) {}

Simulation::~Simulation() {
  if (running_) {
    Status status = stop();
    if (!status.ok()) {
      log_warn("Simulation shutdown: " + status.message);
    }
  }
}

// ============================================================================
// SETUP
// ============================================================================

Status Simulation::add_symbol(const std::string &symbol, double initial_price) {
  if (symbol.empty()) {
    return Status::error(ErrorCode::VALIDATION_ERROR, "Symbol must not be empty");
  }
  if (!std::isfinite(initial_price) || initial_price <= 0.0) {
    return Status::error(ErrorCode::VALIDATION_ERROR,
                         "Initial price for " + symbol + " must be positive");
  }

  // Held across construction so lane indices match registration order
  std::lock_guard<std::mutex> lock(lanes_mutex_);
  if (lanes_by_symbol_.count(symbol)) {
    return Status::error(ErrorCode::ALREADY_EXISTS,
                         "Symbol " + symbol + " already exists");
  }

  const std::uint64_t lane_index = lanes_.size() + 1;
  if (lane_index > (std::uint64_t{1} << (64 - kLaneShift)) - 1) {
    return Status::error(ErrorCode::INVALID_STATE, "Too many symbols");
  }

  try {
    auto lane = std::make_unique<SymbolLane>(symbol, initial_price, lane_index,
                                             config_);
    lanes_by_symbol_[symbol] = lane.get();
    lanes_.push_back(std::move(lane));
  } catch (const ValidationError &e) {
    return Status::error(ErrorCode::VALIDATION_ERROR, e.what());
  } catch (const std::exception &e) {
    return Status::error(ErrorCode::INVALID_STATE,
                         "Cannot register " + symbol + ": " + e.what());
  }

  log_info("Registered " + symbol + " at " + std::to_string(initial_price) +
           " (lane " + std::to_string(lane_index) + ")");
  return Status::success();
}

// ============================================================================
// CLOCK
// ============================================================================

Status Simulation::start() {
  std::lock_guard<std::mutex> control(control_mutex_);
  if (running_) {
    return Status::error(ErrorCode::INVALID_STATE, "Simulation already running");
  }

  {
    std::lock_guard<std::mutex> lock(clock_mutex_);
    stop_requested_ = false;
  }
  running_ = true;
  clock_thread_ = std::thread([this]() { run_clock(); });

  log_info("Simulation started (" + std::to_string(config_.tick_interval.count()) +
           " ms per tick)");
  return Status::success();
}

Status Simulation::stop() {
  std::lock_guard<std::mutex> control(control_mutex_);
  if (!running_) {
    return Status::error(ErrorCode::INVALID_STATE, "Simulation is not running");
  }

  {
    std::lock_guard<std::mutex> lock(clock_mutex_);
    stop_requested_ = true;
  }
  clock_cv_.notify_all();
  if (clock_thread_.joinable()) {
    clock_thread_.join();
  }
  running_ = false;

  dispatcher_.drain();
  log_info("Simulation stopped after tick " + std::to_string(tick_.load()));
  return Status::success();
}

void Simulation::run_clock() {
  auto next_tick = std::chrono::steady_clock::now();
  std::unique_lock<std::mutex> lock(clock_mutex_);

  while (!stop_requested_) {
    lock.unlock();
    advance_tick();
    lock.lock();

    next_tick += config_.tick_interval;
    clock_cv_.wait_until(lock, next_tick, [this]() { return stop_requested_; });
  }
}

Status Simulation::step() {
  if (running_) {
    return Status::error(ErrorCode::INVALID_STATE,
                         "Manual stepping while the clock is running");
  }
  advance_tick();
  return Status::success();
}

Status Simulation::run_ticks(std::size_t num_ticks) {
  for (std::size_t i = 0; i < num_ticks; ++i) {
    Status status = step();
    if (!status.ok()) {
      return status;
    }
  }
  return Status::success();
}

// Every lane runs the same tick in parallel; the tick ends when all are done
void Simulation::advance_tick() {
  std::lock_guard<std::mutex> step_lock(step_mutex_);
  const auto started = std::chrono::steady_clock::now();

  const std::uint64_t tick = tick_.load() + 1;
  const SimTime now = static_cast<SimTime>(tick) * config_.tick_duration_us;

  const std::vector<SymbolLane *> lanes = lane_list();
  std::vector<std::future<std::vector<Fill>>> pending;
  pending.reserve(lanes.size());
  for (SymbolLane *lane : lanes) {
    pending.push_back(
        pool_.submit([lane, tick, now]() { return lane->step(tick, now); }));
  }

  for (std::size_t i = 0; i < pending.size(); ++i) {
    try {
      dispatcher_.publish(pending[i].get());
    } catch (const std::exception &e) {
      log_error("Tick " + std::to_string(tick) + " failed on " +
                lanes[i]->symbol() + ": " + e.what());
    }
  }

  tick_ = tick;

  const auto elapsed = std::chrono::steady_clock::now() - started;
  tick_latency_.record(
      std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
}

// ============================================================================
// ORDER ENTRY
// ============================================================================

Result<ExecutionReport> Simulation::execute_order(const OrderRequest &request) {
  SymbolLane *lane = find_lane(request.symbol);
  if (!lane) {
    return Status::error(ErrorCode::VALIDATION_ERROR,
                         "Unknown symbol: " + request.symbol);
  }

  Result<ExecutionReport> result = lane->submit(request);
  if (result.ok()) {
    dispatcher_.publish(result->fills);
  }
  return result;
}

Result<OrderId> Simulation::submit_order(const OrderRequest &request) {
  Result<ExecutionReport> result = execute_order(request);
  if (!result.ok()) {
    return result.status();
  }
  return result->order.id;
}

Status Simulation::cancel_order(OrderId order_id) {
  SymbolLane *lane = lane_for_order(order_id);
  if (!lane) {
    return Status::error(ErrorCode::NOT_FOUND,
                         "Order " + std::to_string(order_id) + " not found");
  }
  return lane->cancel(order_id);
}

Result<Order> Simulation::get_order(OrderId order_id) const {
  SymbolLane *lane = lane_for_order(order_id);
  if (lane) {
    if (auto order = lane->get_order(order_id)) {
      return *order;
    }
  }
  return Status::error(ErrorCode::NOT_FOUND,
                       "Order " + std::to_string(order_id) + " not found");
}

// ============================================================================
// SNAPSHOT ACCESSORS
// ============================================================================

Result<BookSnapshot> Simulation::get_order_book(const std::string &symbol,
                                                std::size_t depth) const {
  SymbolLane *lane = find_lane(symbol);
  if (!lane) {
    return Status::error(ErrorCode::NOT_FOUND, "Unknown symbol: " + symbol);
  }

  BookSnapshot book = lane->snapshot()->book;
  if (book.bids.size() > depth) {
    book.bids.resize(depth);
  }
  if (book.asks.size() > depth) {
    book.asks.resize(depth);
  }
  return book;
}

Result<MarketState> Simulation::get_market_state(const std::string &symbol) const {
  SymbolLane *lane = find_lane(symbol);
  if (!lane) {
    return Status::error(ErrorCode::NOT_FOUND, "Unknown symbol: " + symbol);
  }
  return lane->snapshot()->market;
}

Result<AnalyticsSnapshot>
Simulation::get_analytics(const std::string &symbol) const {
  SymbolLane *lane = find_lane(symbol);
  if (!lane) {
    return Status::error(ErrorCode::NOT_FOUND, "Unknown symbol: " + symbol);
  }
  return lane->snapshot()->analytics;
}

std::vector<std::string> Simulation::symbols() const {
  std::vector<std::string> result;
  for (SymbolLane *lane : lane_list()) {
    result.push_back(lane->symbol());
  }
  return result;
}

std::vector<std::string> Simulation::halted_symbols() const {
  std::vector<std::string> result;
  for (SymbolLane *lane : lane_list()) {
    if (lane->halted()) {
      result.push_back(lane->symbol());
    }
  }
  return result;
}

// ============================================================================
// FILL EVENTS
// ============================================================================

void Simulation::add_fill_listener(FillListener listener) {
  dispatcher_.add_listener(std::move(listener));
}

void Simulation::drain_fills() { dispatcher_.drain(); }

// ============================================================================
// LANE LOOKUP
// ============================================================================

std::vector<SymbolLane *> Simulation::lane_list() const {
  std::lock_guard<std::mutex> lock(lanes_mutex_);
  std::vector<SymbolLane *> result;
  result.reserve(lanes_.size());
  for (const auto &lane : lanes_) {
    result.push_back(lane.get());
  }
  return result;
}

SymbolLane *Simulation::find_lane(const std::string &symbol) const {
  std::lock_guard<std::mutex> lock(lanes_mutex_);
  auto it = lanes_by_symbol_.find(symbol);
  return it != lanes_by_symbol_.end() ? it->second : nullptr;
}

SymbolLane *Simulation::lane_for_order(OrderId order_id) const {
  const std::uint64_t index = lane_of(order_id);
  std::lock_guard<std::mutex> lock(lanes_mutex_);
  if (index == 0 || index > lanes_.size()) {
    return nullptr;
  }
  return lanes_[index - 1].get();
}

// ============================================================================
// REPORTING
// ============================================================================

void Simulation::print_summary() const {
  std::cout << "\n" << std::string(70, '#') << std::endl;
  std::cout << "SIMULATION SUMMARY" << std::endl;
  std::cout << std::string(70, '#') << std::endl;

  const auto lanes = lane_list();
  std::cout << "Ticks:          " << tick_.load() << std::endl;
  std::cout << "Simulated time: " << std::fixed << std::setprecision(3)
            << static_cast<double>(current_time()) / 1e6 << " s"
            << std::defaultfloat << std::endl;
  std::cout << "Symbols:        " << lanes.size() << std::endl;
  std::cout << "Fills emitted:  " << dispatcher_.delivered() << " delivered"
            << std::endl;

  const auto halted = halted_symbols();
  if (!halted.empty()) {
    std::cout << "Halted:        ";
    for (const auto &symbol : halted) {
      std::cout << " " << symbol;
    }
    std::cout << std::endl;
  }

  for (SymbolLane *lane : lanes) {
    lane->print_summary();
  }

  tick_latency_.print_statistics();
}
