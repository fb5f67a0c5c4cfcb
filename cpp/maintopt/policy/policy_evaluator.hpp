#pragma once
/*
================================================================================
Policy: Monte Carlo Policy Evaluator
FILE: cpp/maintopt/policy/policy_evaluator.hpp

Purpose:
  - Estimate the long-run average cost per period of a maintenance policy by
    simulating num_trials independent trajectories of `horizon` steps, each
    starting in the best state, and averaging the per-trial cost rates.

Step rule (current state s, never the failed state):
  - s maintainable and flagged: pay preventive cost, go to best state.
  - otherwise draw j from row s of the effective matrix:
      j == failed -> pay repair[s] + production loss, asset is repaired
                     (next state = best)
      else        -> move to j

Determinism:
  - Trial k draws from SplitMix64(derive_seed(sim.rng_seed, k)). Results are
    bit-identical for any thread count; trial rates are reduced in index order.

Validation (fail fast, nothing clamped):
  - P                   -> kInvalidTransitionMatrix
  - cost model length   -> kInvalidCostModel
  - policy length       -> kInvalidPolicyLength
  - trials / horizon    -> kInvalidSimulationConfig
================================================================================
*/

#include "maintopt/core/settings.hpp"
#include "maintopt/model/maintenance_model.hpp"
#include "maintopt/stats/rng.hpp"

#include <cstdint>
#include <vector>

namespace maintopt {

struct PolicyEvaluation {
  double mean_cost = 0.0;        // mean of per-trial cost rates
  double stddev = 0.0;           // sample stddev of per-trial cost rates
  double std_error = 0.0;
  double ci95_half_width = 0.0;
  double min_trial_cost = 0.0;
  double max_trial_cost = 0.0;

  int trials = 0;
  int horizon = 0;

  // Totals over all trials.
  std::uint64_t preventive_actions = 0;
  std::uint64_t failures = 0;
};

struct TrialOutcome {
  double cost_rate = 0.0;        // accumulated cost / horizon
  std::uint64_t preventive_actions = 0;
  std::uint64_t failures = 0;
};

struct SimulatedTrajectory {
  // states[0] is the start (best state); states[t+1] is the state after
  // step t. A failure is recorded as the failed state; the following step
  // continues from the best state.
  std::vector<State> states;
  double total_cost = 0.0;
  std::uint64_t preventive_actions = 0;
  std::uint64_t failures = 0;
};

// Copy of P where every flagged maintainable state's row is a deterministic
// transition to the best state. Validates policy length against P.
TransitionMatrix effective_matrix(const Policy& policy, const TransitionMatrix& P);

// One simulation trial. Inputs are assumed validated by the caller; the
// sampler and rng are owned by this trial. When `trajectory` is non-null the
// visited states are appended to it.
template <stats::CategoricalSampler Sampler>
TrialOutcome simulate_trial(const Policy& policy,
                            const TransitionMatrix& effective,
                            const CostModel& cost,
                            int horizon,
                            stats::SplitMix64& rng,
                            Sampler& sampler,
                            std::vector<State>* trajectory = nullptr) {
  const State best = best_state(effective);
  const State failed = failed_state(effective);

  TrialOutcome out;
  double total = 0.0;
  State s = best;
  if (trajectory) trajectory->push_back(s);

  for (int t = 0; t < horizon; ++t) {
    if (maintains(policy, s)) {
      total += cost.preventive_cost();
      ++out.preventive_actions;
      s = best;
      if (trajectory) trajectory->push_back(s);
      continue;
    }

    const stats::ProbRow row(effective.row(s));
    const State next = static_cast<State>(sampler(row, rng));
    if (next == failed) {
      total += cost.failure_cost(s);
      ++out.failures;
      if (trajectory) trajectory->push_back(failed);
      s = best;
    } else {
      s = next;
      if (trajectory) trajectory->push_back(s);
    }
  }

  out.cost_rate = total / static_cast<double>(horizon);
  return out;
}

// Full statistics of the Monte Carlo estimate.
PolicyEvaluation evaluate_detailed(const Policy& policy,
                                   const TransitionMatrix& P,
                                   const CostModel& cost,
                                   const SimulationConfig& sim,
                                   const NumericalSettings& num = {});

// Estimated average cost per period.
double evaluate(const Policy& policy,
                const TransitionMatrix& P,
                const CostModel& cost,
                const SimulationConfig& sim,
                const NumericalSettings& num = {});

// Cost of never maintaining (all-zero policy) under the same configuration.
double baseline_cost(const TransitionMatrix& P,
                     const CostModel& cost,
                     const SimulationConfig& sim,
                     const NumericalSettings& num = {});

// One trial of `length` steps recorded step by step (for plotting).
SimulatedTrajectory simulate_trajectory(const Policy& policy,
                                        const TransitionMatrix& P,
                                        const CostModel& cost,
                                        int length,
                                        std::uint64_t seed,
                                        const NumericalSettings& num = {});

}  // namespace maintopt
