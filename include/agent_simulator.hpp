#pragma once

#include "agent.hpp"
#include "config.hpp"
#include "execution_engine.hpp"

#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

// Population of synthetic participants trading one symbol
class AgentSimulator {
public:
  AgentSimulator(std::string symbol, const AgentPopulationConfig &config,
                 std::uint64_t seed);

  AgentSimulator(const AgentSimulator &) = delete;
  AgentSimulator &operator=(const AgentSimulator &) = delete;

  // Throws ValidationError on duplicate agent ids
  void add_agent(std::unique_ptr<Agent> agent);

  // Every agent decides on the same context, then the actions are applied
  // through the engine in the configured order. A failing agent is skipped
  // for this tick; InvariantViolation propagates.
  std::vector<ExecutionReport> run_tick(const AgentContext &ctx,
                                        ExecutionEngine &engine);

  // Deliver a fill to the agent that owns the order, if any
  void route_fill(const Fill &fill);
  void route_fills(const std::vector<Fill> &fills);

  std::size_t agent_count() const { return agents_.size(); }
  const std::vector<std::unique_ptr<Agent>> &agents() const { return agents_; }
  const Agent *find_agent(const std::string &id) const;

  // Sum of agent inventories. Zero when agents only traded with each other.
  Quantity net_inventory() const;

  std::uint64_t decision_failures() const { return decision_failures_; }
  std::uint64_t actions_applied() const { return actions_applied_; }

  void print_summary(double mark_price) const;

private:
  std::string symbol_;
  AgentPopulationConfig config_;
  std::mt19937_64 rng_; // action ordering only
  std::vector<std::unique_ptr<Agent>> agents_;
  std::unordered_map<std::string, Agent *> by_id_;

  std::uint64_t decision_failures_;
  std::uint64_t actions_applied_;

  void populate(std::uint64_t seed);
  std::vector<std::size_t> application_order();
  void apply(Agent &agent, const AgentAction &action, const AgentContext &ctx,
             ExecutionEngine &engine, std::vector<ExecutionReport> &reports);
};
