/*
  Genetic Optimizer Selftest

  Operators are checked in isolation with fixed inputs; the end-to-end run
  uses the reference scenario, where the cheapest policy is [0,1,1]
  (exact horizon-100 cost 0.5758 against 0.8264 for the runner-up).
*/

#include "maintopt/core/selftest.hpp"
#include "maintopt/optimization/genetic_optimizer.hpp"
#include "maintopt/policy/policy_evaluator.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace maintopt {
namespace {

using selftest::expect_error;
using selftest::expect_true;

bool non_increasing(const std::vector<double>& v) {
  for (std::size_t i = 1; i < v.size(); ++i) {
    if (v[i] > v[i - 1]) return false;
  }
  return true;
}

std::size_t hamming(const Policy& a, const Policy& b) {
  std::size_t d = 0;
  for (std::size_t i = 0; i < a.size(); ++i) d += (a[i] != b[i]) ? 1 : 0;
  return d;
}

GaConfig reference_ga() {
  GaConfig ga;
  ga.population_size = 20;
  ga.num_generations = 30;
  ga.mutation_rate = 0.2;
  ga.rng_seed = 7;
  ga.simulation.num_trials = 500;
  ga.simulation.horizon = 100;
  ga.simulation.rng_seed = 42;
  return ga;
}

void test_crossover() {
  const auto [c1, c2] = crossover(Policy{1, 1, 1}, Policy{0, 0, 0}, 1);
  expect_true(c1 == Policy({1, 0, 0}), "crossover child 1 takes head of a, tail of b");
  expect_true(c2 == Policy({0, 1, 1}), "crossover child 2 takes head of b, tail of a");

  const Policy a{1, 0, 1, 1, 0, 0, 1};
  const Policy b{0, 1, 1, 0, 1, 0, 0};
  bool lengths_kept = true;
  for (std::size_t point = 0; point <= a.size(); ++point) {
    const auto [x, y] = crossover(a, b, point);
    lengths_kept = lengths_kept && x.size() == a.size() && y.size() == a.size();
  }
  expect_true(lengths_kept, "crossover preserves length at every cut");

  const auto [same1, same2] = crossover(a, b, 0);
  expect_true(same1 == b && same2 == a, "cut at 0 swaps the parents");

  expect_error(ErrorCode::kInvalidArgument, [&] { crossover(Policy{1, 0}, Policy{1, 0, 1}, 1); },
               "crossover rejects parents of different length");
  expect_error(ErrorCode::kInvalidArgument, [&] { crossover(a, b, a.size() + 1); },
               "crossover rejects a cut past the end");

  stats::SplitMix64 rng(3);
  bool in_range = true;
  for (int i = 0; i < 1000; ++i) {
    const std::size_t p = draw_crossover_point(5, rng);
    in_range = in_range && p >= 1 && p <= 4;
  }
  expect_true(in_range, "crossover point drawn from [1, L-1]");
  expect_true(draw_crossover_point(1, rng) == 1, "length-1 policy uses cut 1");
}

void test_mutation() {
  stats::SplitMix64 rng(11);

  const Policy original{0, 1, 1, 0, 1};
  bool untouched = true;
  for (int i = 0; i < 200; ++i) {
    Policy p = original;
    const bool flipped = mutate(p, 0.0, rng);
    untouched = untouched && !flipped && p == original;
  }
  expect_true(untouched, "rate 0 never mutates");

  bool one_bit = true;
  for (int i = 0; i < 200; ++i) {
    Policy p = original;
    const bool flipped = mutate(p, 1.0, rng);
    one_bit = one_bit && flipped && hamming(p, original) == 1;
  }
  expect_true(one_bit, "rate 1 flips exactly one bit");

  Policy empty;
  expect_true(!mutate(empty, 1.0, rng), "empty policy is left alone");
}

void test_selection() {
  Population pop = {
      {Policy{0, 0, 0}, 3.0},
      {Policy{1, 0, 0}, 1.0},
      {Policy{0, 1, 0}, 2.0},
      {Policy{0, 0, 1}, 1.0},
  };
  const Population kept = select_survivors(pop, 3);
  expect_true(kept.size() == 3, "survivor count honored");
  expect_true(kept[0].policy == Policy({1, 0, 0}) && kept[1].policy == Policy({0, 0, 1}),
              "ties keep their original order");
  expect_true(kept[2].policy == Policy({0, 1, 0}), "survivors ascending by cost");
}

void test_recombine_odd_survivors() {
  const Population survivors = {
      {Policy{1, 1, 1}, 0.5},
      {Policy{0, 0, 0}, 0.6},
      {Policy{1, 0, 1}, 0.7},
  };
  stats::SplitMix64 rng(5);
  const Population children = recombine(survivors, 6, rng);

  expect_true(children.size() == 6, "recombine produces the requested offspring");
  expect_true(children[2].policy == Policy({1, 0, 1}) && children[3].policy == Policy({1, 0, 1}),
              "odd last survivor pairs with itself");

  bool from_first_pair = true;
  for (std::size_t i : {std::size_t{0}, std::size_t{1}, std::size_t{4}, std::size_t{5}}) {
    const Policy& c = children[i].policy;
    // Children of [1,1,1] x [0,0,0] are a prefix of ones then zeros, or the reverse.
    const bool ones_first = std::is_sorted(c.begin(), c.end(), [](auto x, auto y) { return x > y; });
    const bool zeros_first = std::is_sorted(c.begin(), c.end());
    from_first_pair = from_first_pair && (ones_first || zeros_first);
  }
  expect_true(from_first_pair, "pairs are reused cyclically");
}

void test_population_size_is_stable() {
  bool stable = true;
  for (std::size_t n = 2; n <= 25; ++n) {
    stats::SplitMix64 rng(n);
    Population pop = random_population(static_cast<int>(n), 4, rng);
    for (int g = 0; g < 10; ++g) {
      for (Individual& ind : pop) ind.fitness = rng.next_u01();
      pop = next_generation(pop, n, 0.3, rng);
      stable = stable && pop.size() == n;
      for (const Individual& ind : pop) stable = stable && ind.policy.size() == 4;
    }
  }
  expect_true(stable, "population size constant for N = 2..25");

  stats::SplitMix64 rng(9);
  Population pop = random_population(6, 3, rng);
  for (std::size_t i = 0; i < pop.size(); ++i) pop[i].fitness = static_cast<double>(pop.size() - i);
  const Population next = next_generation(pop, 6, 0.0, rng);
  expect_true(next[0].policy == pop[5].policy && next[0].fitness == 1.0,
              "elite survives with its fitness");
}

void test_reference_optimization() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();
  const GaConfig ga = reference_ga();

  const OptimizationResult r = optimize(P, cost, ga);
  const double never = evaluate(never_maintain(num_states(P)), P, cost, ga.simulation);

  expect_true(r.best_policy.size() == 3, "best policy has one flag per maintainable state");
  expect_true(r.best_cost < never, "optimized policy beats never maintaining");
  expect_true(r.trace.size() == 30 && r.best_so_far.size() == 30, "one trace entry per generation");
  expect_true(r.generations == 30, "generation count reported");
  expect_true(r.evaluations == 620, "N per generation plus the final evaluation");
  expect_true(non_increasing(r.trace), "shared seed plus elitism: trace never rises");
  expect_true(non_increasing(r.best_so_far), "running best never rises");
  expect_true(r.best_cost <= r.best_so_far.back(), "final evaluation keeps the best");

  const ExhaustiveResult all = optimize_exhaustive(P, cost, ga.simulation);
  expect_true(all.ranking.size() == 8, "exhaustive ranks all 2^3 policies");
  expect_true(all.best_policy == Policy({0, 1, 1}), "exhaustive optimum is [0,1,1]");
  expect_true(r.best_policy == all.best_policy, "genetic search finds the exhaustive optimum");
  expect_true(r.best_cost == all.best_cost, "same seed gives the same cost for the same policy");

  bool ranked = true;
  for (std::size_t i = 1; i < all.ranking.size(); ++i) {
    ranked = ranked && all.ranking[i - 1].fitness <= all.ranking[i].fitness;
  }
  expect_true(ranked, "exhaustive ranking ascending");
}

void test_thread_count_invariance() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();

  GaConfig ga = reference_ga();
  ga.num_generations = 8;
  ga.simulation.num_trials = 200;

  ga.threads = 1;
  const OptimizationResult a = optimize(P, cost, ga);
  ga.threads = 4;
  const OptimizationResult b = optimize(P, cost, ga);

  expect_true(a.best_policy == b.best_policy && a.best_cost == b.best_cost,
              "result independent of worker count");
  expect_true(a.trace == b.trace, "trace independent of worker count");
}

void test_reseeding() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();

  GaConfig ga = reference_ga();
  ga.num_generations = 10;
  ga.simulation.num_trials = 200;
  ga.reseed_each_generation = true;

  const OptimizationResult r = optimize(P, cost, ga);
  expect_true(r.trace.size() == 10, "reseeded run completes");
  expect_true(non_increasing(r.best_so_far), "running best never rises when reseeding");
}

void test_validation() {
  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();

  const CostModel short_cost(5.0, {0.0, 2.0, 8.0, 15.0}, 20.0);
  expect_error(ErrorCode::kInvalidCostModel, [&] { optimize(P, short_cost, reference_ga()); },
               "cost model length mismatch aborts the search");

  GaConfig tiny = reference_ga();
  tiny.population_size = 1;
  expect_error(ErrorCode::kInvalidOptimizerConfig, [&] { optimize(P, cost, tiny); },
               "population of one rejected");

  GaConfig wild = reference_ga();
  wild.mutation_rate = 1.5;
  expect_error(ErrorCode::kInvalidOptimizerConfig, [&] { optimize(P, cost, wild); },
               "mutation rate above 1 rejected");

  GaConfig no_trials = reference_ga();
  no_trials.simulation.num_trials = 0;
  expect_error(ErrorCode::kInvalidSimulationConfig, [&] { optimize(P, cost, no_trials); },
               "simulation config checked before searching");

  // 23 states -> 21 maintainable states, past the enumeration guard.
  const int n = 23;
  TransitionMatrix big = TransitionMatrix::Zero(n, n);
  for (int i = 0; i < n - 1; ++i) {
    big(i, i) = 0.5;
    big(i, n - 1) = 0.5;
  }
  big(n - 1, n - 1) = 1.0;
  const CostModel big_cost(1.0, std::vector<double>(static_cast<std::size_t>(n), 1.0), 1.0);
  SimulationConfig sim;
  sim.num_trials = 1;
  sim.horizon = 1;
  expect_error(ErrorCode::kInvalidOptimizerConfig, [&] { optimize_exhaustive(big, big_cost, sim); },
               "exhaustive search refuses 2^21 policies");
}

}  // namespace
}  // namespace maintopt

int main() {
  using namespace maintopt;

  test_crossover();
  test_mutation();
  test_selection();
  test_recombine_odd_survivors();
  test_population_size_is_stable();
  test_reference_optimization();
  test_thread_count_invariance();
  test_reseeding();
  test_validation();

  return selftest::finish("genetic_optimizer_selftest");
}
