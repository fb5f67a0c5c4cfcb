#pragma once
/*
================================================================================
Optimization: Genetic Search over Binary Maintenance Policies
FILE: cpp/maintopt/optimization/genetic_optimizer.hpp

Purpose:
  - Evolve a fixed-size population of policies with the Monte Carlo evaluator
    as fitness (lower cost is better):

      Initialize -> { Evaluate -> Select -> Recombine -> Mutate } x G -> Finalize

  - Evaluate:  every individual, in parallel; join before selection.
  - Select:    stable sort ascending, keep floor(N/2) (>= 1) survivors.
  - Recombine: survivors paired in order (0,1),(2,3),...; an odd last survivor
               is paired with itself. One-point crossover, both children kept,
               pairs reused cyclically until N - survivors children exist.
  - Mutate:    each child, with probability mutation_rate, gets exactly one
               uniformly chosen bit flipped.
  - Next population = survivors + children, always exactly N individuals.
  - Finalize:  re-evaluate the last population, return its cheapest member.

Determinism:
  - Search randomness comes from SplitMix64(ga.rng_seed) on the calling thread
    only; fitness uses the simulation seed (see GaConfig) so worker scheduling
    never changes the result.

Failure:
  - Inputs are validated up front. Any error inside a fitness evaluation
    aborts the whole run and propagates to the caller unchanged.
================================================================================
*/

#include "maintopt/core/settings.hpp"
#include "maintopt/model/maintenance_model.hpp"
#include "maintopt/stats/rng.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace maintopt {

struct Individual {
  Policy policy;
  double fitness = std::numeric_limits<double>::infinity();
};

using Population = std::vector<Individual>;

struct OptimizationResult {
  Policy best_policy;
  double best_cost = std::numeric_limits<double>::infinity();

  // Minimum fitness of each generation's evaluated population.
  std::vector<double> trace;

  // Running minimum of `trace`.
  std::vector<double> best_so_far;

  std::uint64_t evaluations = 0;
  int generations = 0;
};

struct ExhaustiveResult {
  Policy best_policy;
  double best_cost = std::numeric_limits<double>::infinity();

  // Every policy with its cost, ascending by cost.
  Population ranking;
};

// Largest policy length optimize_exhaustive() will enumerate.
inline constexpr int kMaxExhaustivePolicyLength = 20;

// ----------------------------- Operators -------------------------------------

Population random_population(int size, int policy_len, stats::SplitMix64& rng);

// Evaluates every individual in place on up to `threads` workers; each
// evaluation runs its trials single-threaded with sim's seed.
void evaluate_population(Population& pop,
                         const TransitionMatrix& P,
                         const CostModel& cost,
                         const SimulationConfig& sim,
                         int threads,
                         const NumericalSettings& num = {});

// Stable ascending sort by fitness, truncated to `count`.
Population select_survivors(Population pop, std::size_t count);

// Children swap suffixes at `point` (0..L). Throws kInvalidArgument on
// mismatched lengths or point > L.
std::pair<Policy, Policy> crossover(const Policy& a, const Policy& b, std::size_t point);

// Random cut in [1, L-1]; L < 2 returns 1 (children are copies).
std::size_t draw_crossover_point(std::size_t policy_len, stats::SplitMix64& rng);

Population recombine(const Population& survivors, std::size_t offspring_count, stats::SplitMix64& rng);

// Returns true when a bit was flipped.
bool mutate(Policy& policy, double mutation_rate, stats::SplitMix64& rng);

// Select + Recombine + Mutate on an evaluated population. The result has
// exactly population_size individuals; offspring fitness is unset.
Population next_generation(const Population& evaluated,
                           std::size_t population_size,
                           double mutation_rate,
                           stats::SplitMix64& rng);

// ----------------------------- Drivers ---------------------------------------

OptimizationResult optimize(const TransitionMatrix& P,
                            const CostModel& cost,
                            const GaConfig& ga,
                            const NumericalSettings& num = {});

// Evaluates all 2^(n-2) policies with the same simulation configuration.
// Throws kInvalidOptimizerConfig when n-2 > kMaxExhaustivePolicyLength.
ExhaustiveResult optimize_exhaustive(const TransitionMatrix& P,
                                     const CostModel& cost,
                                     const SimulationConfig& sim,
                                     const NumericalSettings& num = {});

}  // namespace maintopt
