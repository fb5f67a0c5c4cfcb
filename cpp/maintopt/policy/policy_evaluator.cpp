/*
================================================================================
Policy: Monte Carlo Policy Evaluator (Implementation)
FILE: cpp/maintopt/policy/policy_evaluator.cpp
================================================================================
*/

#include "maintopt/policy/policy_evaluator.hpp"
#include "maintopt/core/error.hpp"
#include "maintopt/core/parallel.hpp"
#include "maintopt/stats/online_stats.hpp"

namespace maintopt {

namespace {

void validate_inputs(const Policy& policy,
                     const TransitionMatrix& P,
                     const CostModel& cost,
                     const NumericalSettings& num) {
  num.validate_or_throw();
  validate_transition_matrix(P, num.row_sum_tol);
  cost.check_compatible(num_states(P));
  validate_policy(policy, num_states(P));
}

}  // namespace

TransitionMatrix effective_matrix(const Policy& policy, const TransitionMatrix& P) {
  validate_policy(policy, num_states(P));

  TransitionMatrix E = P;
  const State best = best_state(P);
  for (State s = 1; s < failed_state(P); ++s) {
    if (!maintains(policy, s)) continue;
    E.row(s).setZero();
    E(s, best) = 1.0;
  }
  return E;
}

PolicyEvaluation evaluate_detailed(const Policy& policy,
                                   const TransitionMatrix& P,
                                   const CostModel& cost,
                                   const SimulationConfig& sim,
                                   const NumericalSettings& num) {
  sim.validate_or_throw();
  validate_inputs(policy, P, cost, num);

  const TransitionMatrix E = effective_matrix(policy, P);
  const std::size_t n_trials = static_cast<std::size_t>(sim.num_trials);

  std::vector<TrialOutcome> outcomes(n_trials);
  parallel_for(n_trials, sim.threads, [&](std::size_t k) {
    stats::SplitMix64 rng(stats::derive_seed(sim.rng_seed, static_cast<std::uint64_t>(k)));
    stats::InverseCdfSampler sampler;
    outcomes[k] = simulate_trial(policy, E, cost, sim.horizon, rng, sampler);
  });

  stats::OnlineStats acc;
  PolicyEvaluation out;
  for (const TrialOutcome& o : outcomes) {
    acc.push(o.cost_rate);
    out.preventive_actions += o.preventive_actions;
    out.failures += o.failures;
  }

  out.mean_cost = acc.mean;
  out.stddev = acc.stddev_sample();
  out.std_error = acc.std_error();
  out.ci95_half_width = acc.ci95_half_width();
  out.min_trial_cost = acc.min();
  out.max_trial_cost = acc.max();
  out.trials = sim.num_trials;
  out.horizon = sim.horizon;
  return out;
}

double evaluate(const Policy& policy,
                const TransitionMatrix& P,
                const CostModel& cost,
                const SimulationConfig& sim,
                const NumericalSettings& num) {
  return evaluate_detailed(policy, P, cost, sim, num).mean_cost;
}

double baseline_cost(const TransitionMatrix& P,
                     const CostModel& cost,
                     const SimulationConfig& sim,
                     const NumericalSettings& num) {
  num.validate_or_throw();
  validate_transition_matrix(P, num.row_sum_tol);
  return evaluate(never_maintain(num_states(P)), P, cost, sim, num);
}

SimulatedTrajectory simulate_trajectory(const Policy& policy,
                                        const TransitionMatrix& P,
                                        const CostModel& cost,
                                        int length,
                                        std::uint64_t seed,
                                        const NumericalSettings& num) {
  validate_inputs(policy, P, cost, num);
  if (length <= 0) {
    MAINTOPT_THROW(ErrorCode::kInvalidSimulationConfig, "trajectory length must be positive");
  }

  const TransitionMatrix E = effective_matrix(policy, P);
  stats::SplitMix64 rng(seed);
  stats::InverseCdfSampler sampler;

  SimulatedTrajectory out;
  out.states.reserve(static_cast<std::size_t>(length) + 1);
  const TrialOutcome o = simulate_trial(policy, E, cost, length, rng, sampler, &out.states);

  out.total_cost = o.cost_rate * static_cast<double>(length);
  out.preventive_actions = o.preventive_actions;
  out.failures = o.failures;
  return out;
}

}  // namespace maintopt
