#include "agent_simulator.hpp"

#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <iostream>
#include <numeric>

namespace {

// Derive a per-agent stream from the lane seed
std::uint64_t mix_seed(std::uint64_t seed, std::uint64_t salt) {
  std::uint64_t z = seed + 0x9E3779B97F4A7C15ULL * (salt + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

const char *id_prefix(AgentType type) {
  switch (type) {
  case AgentType::MARKET_MAKER:
    return "mm_";
  case AgentType::NOISE_TRADER:
    return "noise_";
  case AgentType::INFORMED_TRADER:
    return "informed_";
  case AgentType::MOMENTUM_TRADER:
    return "momentum_";
  }
  return "agent_";
}

} // namespace

AgentSimulator::AgentSimulator(std::string symbol,
                               const AgentPopulationConfig &config,
                               std::uint64_t seed)
    : symbol_(std::move(symbol)), config_(config), rng_(mix_seed(seed, 0)),
      decision_failures_(0), actions_applied_(0) {
  populate(seed);
  log_debug("AgentSimulator for " + symbol_ + " initialized with " +
            std::to_string(agents_.size()) + " agents");
}

void AgentSimulator::populate(std::uint64_t seed) {
  const std::pair<AgentType, std::size_t> population[] = {
      {AgentType::MARKET_MAKER, config_.market_makers},
      {AgentType::NOISE_TRADER, config_.noise_traders},
      {AgentType::INFORMED_TRADER, config_.informed_traders},
      {AgentType::MOMENTUM_TRADER, config_.momentum_traders},
  };

  for (const auto &[type, count] : population) {
    for (std::size_t i = 0; i < count; ++i) {
      const std::size_t index = agents_.size();
      add_agent(make_agent(type, id_prefix(type) + std::to_string(i), index,
                           config_.params_for(type),
                           mix_seed(seed, index + 1)));
    }
  }
}

void AgentSimulator::add_agent(std::unique_ptr<Agent> agent) {
  if (!agent) {
    throw ValidationError("Cannot add a null agent");
  }
  if (by_id_.count(agent->id())) {
    throw ValidationError("Duplicate agent id " + agent->id());
  }
  by_id_[agent->id()] = agent.get();
  agents_.push_back(std::move(agent));

  // Keep the stable ordering key sorted
  std::stable_sort(agents_.begin(), agents_.end(),
                   [](const auto &a, const auto &b) {
                     return a->index() < b->index();
                   });
}

const Agent *AgentSimulator::find_agent(const std::string &id) const {
  auto it = by_id_.find(id);
  return (it != by_id_.end()) ? it->second : nullptr;
}

std::vector<std::size_t> AgentSimulator::application_order() {
  std::vector<std::size_t> order(agents_.size());
  std::iota(order.begin(), order.end(), 0);
  if (config_.ordering == AgentOrdering::SEEDED_SHUFFLE) {
    std::shuffle(order.begin(), order.end(), rng_);
  }
  return order;
}

std::vector<ExecutionReport> AgentSimulator::run_tick(const AgentContext &ctx,
                                                      ExecutionEngine &engine) {
  // Decision phase: everyone sees the same snapshot
  std::vector<std::vector<AgentAction>> decisions(agents_.size());
  for (std::size_t i = 0; i < agents_.size(); ++i) {
    Agent &agent = *agents_[i];
    try {
      decisions[i] = agent.decide(ctx);
    } catch (const InvariantViolation &) {
      throw;
    } catch (const std::exception &e) {
      ++decision_failures_;
      log_warn("[" + agent.id() + "] decision skipped on " + symbol_ +
               " at tick " + std::to_string(ctx.tick) + ": " + e.what());
    }
  }

  // Application phase
  std::vector<ExecutionReport> reports;
  for (std::size_t i : application_order()) {
    for (const auto &action : decisions[i]) {
      apply(*agents_[i], action, ctx, engine, reports);
    }
  }
  return reports;
}

void AgentSimulator::apply(Agent &agent, const AgentAction &action,
                           const AgentContext &ctx, ExecutionEngine &engine,
                           std::vector<ExecutionReport> &reports) {
  ++actions_applied_;

  if (action.type == ActionType::CANCEL) {
    Status status = engine.cancel(action.order_id);
    if (!status.ok()) {
      // Usually filled since the decision was taken
      log_debug("[" + agent.id() + "] cancel " +
                std::to_string(action.order_id) + ": " + status.message);
    }
    return;
  }

  try {
    ExecutionReport report = engine.submit(action.request, ctx.now);
    // Fills first so the accepted order is tracked with its resting remainder
    route_fills(report.fills);
    agent.on_order_accepted(report.order, ctx.tick);
    reports.push_back(std::move(report));
  } catch (const ValidationError &e) {
    agent.on_order_rejected(action.request, e.what());
    log_warn("[" + agent.id() + "] order rejected on " + symbol_ + ": " +
             e.what());
  }
}

void AgentSimulator::route_fill(const Fill &fill) {
  if (fill.owner.empty()) {
    return;
  }
  auto it = by_id_.find(fill.owner);
  if (it != by_id_.end()) {
    it->second->on_fill(fill);
  }
}

void AgentSimulator::route_fills(const std::vector<Fill> &fills) {
  for (const auto &fill : fills) {
    route_fill(fill);
  }
}

Quantity AgentSimulator::net_inventory() const {
  Quantity total = 0;
  for (const auto &agent : agents_) {
    total += agent->inventory();
  }
  return total;
}

void AgentSimulator::print_summary(double mark_price) const {
  std::cout << "\n--- Agents (" << symbol_ << ", " << agents_.size()
            << ") ---" << std::endl;
  for (const auto &agent : agents_) {
    agent->print_summary(mark_price);
  }
  std::cout << "Net agent inventory: " << net_inventory()
            << "  decision failures: " << decision_failures_ << std::endl;
}
