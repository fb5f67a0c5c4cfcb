/*
  Policy Evaluator Selftest

  Exact finite-horizon expectations for the reference scenario (horizon 100,
  start in the best state), obtained by propagating the state distribution:
    never maintain  [0,0,0] -> 2.9535558712121217
    [0,1,1]                 -> 0.5758362168396796
    always maintain [1,1,1] -> 0.8263888888888887
  The Monte Carlo estimates must land within a few standard errors.
*/

#include "maintopt/core/selftest.hpp"
#include "maintopt/policy/policy_evaluator.hpp"

#include <cmath>
#include <vector>

namespace maintopt {
namespace {

using selftest::expect_error;
using selftest::expect_near;
using selftest::expect_true;

constexpr double kExactNever = 2.9535558712121217;
constexpr double kExactMiddle = 0.5758362168396796;
constexpr double kExactAlways = 0.8263888888888887;

SimulationConfig sim_config(int trials, int horizon, std::uint64_t seed, int threads = 0) {
  SimulationConfig s;
  s.num_trials = trials;
  s.horizon = horizon;
  s.rng_seed = seed;
  s.threads = threads;
  return s;
}

// Always moves to the worst reachable outcome of the row. On the reference
// chain the unmanaged path is 0 -> 2 -> fail -> 0 -> 2 -> ...
struct WorstOutcomeSampler {
  int operator()(const stats::ProbRow& row, stats::SplitMix64&) const {
    int last = 0;
    for (Eigen::Index j = 0; j < row.size(); ++j) {
      if (row(j) > 0.0) last = static_cast<int>(j);
    }
    return last;
  }
};

static_assert(stats::CategoricalSampler<WorstOutcomeSampler>);

void test_effective_matrix() {
  const TransitionMatrix P = reference_transition_matrix();
  const TransitionMatrix E = effective_matrix(Policy{1, 0, 1}, P);

  expect_true(E(1, 0) == 1.0 && E.row(1).sum() == 1.0, "flagged state 1 resets to best");
  expect_true(E(3, 0) == 1.0 && E.row(3).sum() == 1.0, "flagged state 3 resets to best");
  expect_true(E.row(2) == P.row(2), "unflagged state keeps its row");
  expect_true(E.row(0) == P.row(0), "best state keeps its row");
  expect_true(E.row(4) == P.row(4), "failed state keeps its identity row");

  expect_error(ErrorCode::kInvalidPolicyLength, [&] { effective_matrix(Policy{1, 0}, P); },
               "effective matrix checks policy length");
}

void test_scripted_trial() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();
  stats::SplitMix64 rng(1);
  WorstOutcomeSampler sampler;

  // 0 -> 2 -> fail(8 + 20) repeating: 5 failures over 10 steps.
  const Policy never{0, 0, 0};
  std::vector<State> states;
  const TrialOutcome a = simulate_trial(never, effective_matrix(never, P), cost, 10, rng, sampler, &states);
  expect_near(a.cost_rate, 5.0 * 28.0 / 10.0, 1e-12, "scripted never-maintain cost rate");
  expect_true(a.failures == 5 && a.preventive_actions == 0, "scripted never-maintain counts");
  expect_true(states.size() == 11, "trajectory has horizon + 1 states");
  expect_true(states == std::vector<State>({0, 2, 4, 2, 4, 2, 4, 2, 4, 2, 4}),
              "failure recorded as failed state, next step starts from best");

  // 0 -> 2 -> maintain(5) -> 0 repeating.
  const Policy middle{0, 1, 0};
  const TrialOutcome b = simulate_trial(middle, effective_matrix(middle, P), cost, 10, rng, sampler);
  expect_near(b.cost_rate, 5.0 * 5.0 / 10.0, 1e-12, "scripted maintain-at-2 cost rate");
  expect_true(b.failures == 0 && b.preventive_actions == 5, "scripted maintain-at-2 counts");
}

void test_determinism() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();
  const Policy never{0, 0, 0};

  const double a = evaluate(never, P, cost, sim_config(2000, 100, 11, 1));
  const double b = evaluate(never, P, cost, sim_config(2000, 100, 11, 1));
  const double c = evaluate(never, P, cost, sim_config(2000, 100, 11, 6));
  expect_true(a == b, "same seed -> bit-identical estimate");
  expect_true(a == c, "thread count does not change the estimate");

  const double d = evaluate(never, P, cost, sim_config(2000, 100, 12, 1));
  expect_true(a != d, "different seed -> different sample path");
}

void test_convergence_to_exact_value() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();

  struct Case {
    Policy policy;
    double exact;
    const char* name;
  };
  const std::vector<Case> cases = {
      {Policy{0, 0, 0}, kExactNever, "never maintain matches exact expectation"},
      {Policy{0, 1, 1}, kExactMiddle, "[0,1,1] matches exact expectation"},
      {Policy{1, 1, 1}, kExactAlways, "always maintain matches exact expectation"},
  };
  for (const Case& c : cases) {
    const PolicyEvaluation e = evaluate_detailed(c.policy, P, cost, sim_config(8000, 100, 3));
    expect_near(e.mean_cost, c.exact, 5.0 * e.std_error + 1e-12, c.name);
  }

  // Independent seeds agree within their combined uncertainty, and the
  // interval shrinks with more trials.
  const Policy never{0, 0, 0};
  const PolicyEvaluation s1 = evaluate_detailed(never, P, cost, sim_config(4000, 100, 101));
  const PolicyEvaluation s2 = evaluate_detailed(never, P, cost, sim_config(4000, 100, 202));
  const double combined = std::sqrt(s1.std_error * s1.std_error + s2.std_error * s2.std_error);
  expect_near(s1.mean_cost, s2.mean_cost, 5.0 * combined, "independent seeds converge to the same value");

  const PolicyEvaluation small = evaluate_detailed(never, P, cost, sim_config(250, 100, 101));
  expect_true(small.ci95_half_width > s1.ci95_half_width, "confidence interval shrinks with more trials");
}

void test_policy_ordering() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();
  const SimulationConfig sim = sim_config(3000, 100, 77);

  const double never = evaluate(Policy{0, 0, 0}, P, cost, sim);
  const double always = evaluate(Policy{1, 1, 1}, P, cost, sim);
  const double middle = evaluate(Policy{0, 1, 1}, P, cost, sim);

  expect_true(never != always, "always and never maintain differ");
  expect_true(never > middle, "preventive maintenance saves cost on the reference scenario");
  expect_true(baseline_cost(P, cost, sim) == never, "baseline is the never-maintain evaluation");

  const PolicyEvaluation e = evaluate_detailed(Policy{1, 0, 0}, P, cost, sim);
  expect_true(e.min_trial_cost >= 0.0, "cost is never negative");
  expect_true(e.trials == 3000 && e.horizon == 100, "evaluation reports its configuration");
}

void test_trajectory() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();

  const SimulatedTrajectory t = simulate_trajectory(Policy{0, 0, 0}, P, cost, 500, 99);
  expect_true(t.states.size() == 501, "trajectory length + 1 states");
  expect_true(t.states.front() == 0, "trajectory starts in the best state");

  bool consistent = true;
  for (std::size_t i = 1; i < t.states.size(); ++i) {
    const State prev = t.states[i - 1];
    const State cur = t.states[i];
    consistent = consistent && cur >= 0 && cur <= 4;
    // Only wear states 2 and 3 can fail directly on the reference chain.
    if (cur == 4) consistent = consistent && (prev == 2 || prev == 3);
  }
  expect_true(consistent, "trajectory only takes allowed transitions");

  const SimulatedTrajectory again = simulate_trajectory(Policy{0, 0, 0}, P, cost, 500, 99);
  expect_true(t.states == again.states, "trajectory is reproducible for a seed");

  const SimulatedTrajectory maintained = simulate_trajectory(Policy{1, 1, 1}, P, cost, 300, 5);
  bool resets = true;
  for (std::size_t i = 1; i + 1 < maintained.states.size(); ++i) {
    const State s = maintained.states[i];
    if (s >= 1 && s <= 3) resets = resets && maintained.states[i + 1] == 0;
  }
  expect_true(resets, "every maintained state is followed by the best state");
  expect_true(maintained.failures == 0, "always maintain never fails on the reference chain");
}

void test_validation() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();
  const Policy p{0, 1, 0};

  expect_error(ErrorCode::kInvalidSimulationConfig, [&] { evaluate(p, P, cost, sim_config(0, 100, 1)); },
               "zero trials rejected");
  expect_error(ErrorCode::kInvalidSimulationConfig, [&] { evaluate(p, P, cost, sim_config(10, -1, 1)); },
               "negative horizon rejected");
  expect_error(ErrorCode::kInvalidPolicyLength, [&] { evaluate(Policy{0, 1}, P, cost, sim_config(10, 10, 1)); },
               "policy length mismatch rejected");

  const CostModel short_cost(5.0, {0.0, 2.0, 8.0, 15.0}, 20.0);
  expect_error(ErrorCode::kInvalidCostModel, [&] { evaluate(p, P, short_cost, sim_config(10, 10, 1)); },
               "cost model length mismatch rejected");

  TransitionMatrix bad = P;
  bad(2, 3) = 0.4;
  expect_error(ErrorCode::kInvalidTransitionMatrix, [&] { evaluate(p, bad, cost, sim_config(10, 10, 1)); },
               "non-stochastic matrix rejected");

  expect_error(ErrorCode::kInvalidSimulationConfig,
               [&] { simulate_trajectory(p, P, cost, 0, 1); },
               "empty trajectory rejected");
}

}  // namespace
}  // namespace maintopt

int main() {
  using namespace maintopt;

  test_effective_matrix();
  test_scripted_trial();
  test_determinism();
  test_convergence_to_exact_value();
  test_policy_ordering();
  test_trajectory();
  test_validation();

  return selftest::finish("policy_evaluator_selftest");
}
