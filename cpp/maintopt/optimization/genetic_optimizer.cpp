/*
================================================================================
Optimization: Genetic Search (Implementation)
FILE: cpp/maintopt/optimization/genetic_optimizer.cpp
================================================================================
*/

#include "maintopt/optimization/genetic_optimizer.hpp"
#include "maintopt/core/error.hpp"
#include "maintopt/core/logging.hpp"
#include "maintopt/core/parallel.hpp"
#include "maintopt/policy/policy_evaluator.hpp"

#include <algorithm>
#include <sstream>

namespace maintopt {

namespace {

bool fitter(const Individual& a, const Individual& b) {
  return a.fitness < b.fitness;
}

const Individual& fittest(const Population& pop) {
  return *std::min_element(pop.begin(), pop.end(), fitter);
}

SimulationConfig single_threaded(const SimulationConfig& sim) {
  SimulationConfig s = sim;
  s.threads = 1;
  return s;
}

}  // namespace

Population random_population(int size, int policy_len, stats::SplitMix64& rng) {
  MAINTOPT_ENSURE(size > 0, ErrorCode::kInvalidOptimizerConfig, "population size must be positive");
  MAINTOPT_ENSURE(policy_len > 0, ErrorCode::kInvalidPolicyLength, "policy length must be positive");

  Population pop(static_cast<std::size_t>(size));
  for (Individual& ind : pop) {
    ind.policy.resize(static_cast<std::size_t>(policy_len));
    for (auto& bit : ind.policy) bit = static_cast<std::uint8_t>(rng.next_below(2));
  }
  return pop;
}

void evaluate_population(Population& pop,
                         const TransitionMatrix& P,
                         const CostModel& cost,
                         const SimulationConfig& sim,
                         int threads,
                         const NumericalSettings& num) {
  const SimulationConfig per_individual = single_threaded(sim);
  parallel_for(pop.size(), threads, [&](std::size_t i) {
    pop[i].fitness = evaluate(pop[i].policy, P, cost, per_individual, num);
  });
}

Population select_survivors(Population pop, std::size_t count) {
  std::stable_sort(pop.begin(), pop.end(), fitter);
  if (pop.size() > count) pop.resize(count);
  return pop;
}

std::pair<Policy, Policy> crossover(const Policy& a, const Policy& b, std::size_t point) {
  if (a.size() != b.size()) {
    MAINTOPT_THROW(ErrorCode::kInvalidArgument, "crossover parents differ in length");
  }
  if (point > a.size()) {
    MAINTOPT_THROW(ErrorCode::kInvalidArgument, "crossover point beyond policy length");
  }

  Policy c1(a.begin(), a.begin() + static_cast<std::ptrdiff_t>(point));
  c1.insert(c1.end(), b.begin() + static_cast<std::ptrdiff_t>(point), b.end());

  Policy c2(b.begin(), b.begin() + static_cast<std::ptrdiff_t>(point));
  c2.insert(c2.end(), a.begin() + static_cast<std::ptrdiff_t>(point), a.end());

  return {std::move(c1), std::move(c2)};
}

std::size_t draw_crossover_point(std::size_t policy_len, stats::SplitMix64& rng) {
  if (policy_len < 2) return 1;
  return 1 + static_cast<std::size_t>(rng.next_below(policy_len - 1));
}

Population recombine(const Population& survivors, std::size_t offspring_count, stats::SplitMix64& rng) {
  Population children;
  if (offspring_count == 0) return children;
  MAINTOPT_ENSURE(!survivors.empty(), ErrorCode::kInvalidArgument, "recombine needs at least one survivor");

  children.reserve(offspring_count + 1);
  std::size_t i = 0;
  while (children.size() < offspring_count) {
    const std::size_t ia = i % survivors.size();
    // Odd survivor count: the last one pairs with itself.
    const std::size_t ib = (ia + 1 < survivors.size()) ? ia + 1 : ia;
    i = (ib == ia) ? 0 : ia + 2;

    const Policy& a = survivors[ia].policy;
    const Policy& b = survivors[ib].policy;
    auto [c1, c2] = crossover(a, b, draw_crossover_point(a.size(), rng));

    children.push_back(Individual{std::move(c1)});
    if (children.size() < offspring_count) children.push_back(Individual{std::move(c2)});
  }
  return children;
}

bool mutate(Policy& policy, double mutation_rate, stats::SplitMix64& rng) {
  if (policy.empty()) return false;
  if (!rng.chance(mutation_rate)) return false;
  const std::size_t bit = static_cast<std::size_t>(rng.next_below(policy.size()));
  policy[bit] = static_cast<std::uint8_t>(policy[bit] ? 0 : 1);
  return true;
}

Population next_generation(const Population& evaluated,
                           std::size_t population_size,
                           double mutation_rate,
                           stats::SplitMix64& rng) {
  const std::size_t n_survivors = std::max<std::size_t>(1, population_size / 2);

  Population next = select_survivors(evaluated, n_survivors);
  const std::size_t n_offspring = population_size - next.size();

  Population children = recombine(next, n_offspring, rng);
  for (Individual& child : children) mutate(child.policy, mutation_rate, rng);

  next.insert(next.end(),
              std::make_move_iterator(children.begin()),
              std::make_move_iterator(children.end()));
  return next;
}

OptimizationResult optimize(const TransitionMatrix& P,
                            const CostModel& cost,
                            const GaConfig& ga,
                            const NumericalSettings& num) {
  ga.validate_or_throw();
  num.validate_or_throw();
  validate_transition_matrix(P, num.row_sum_tol);
  cost.check_compatible(num_states(P));

  const int policy_len = policy_length(num_states(P));
  const std::size_t pop_size = static_cast<std::size_t>(ga.population_size);

  auto generation_sim = [&](int g) {
    SimulationConfig s = ga.simulation;
    if (ga.reseed_each_generation) {
      s.rng_seed = stats::derive_seed(ga.simulation.rng_seed, static_cast<std::uint64_t>(g));
    }
    return s;
  };

  MAINTOPT_LOG(INFO, "GA start: states=" << num_states(P)
                     << " population=" << ga.population_size
                     << " generations=" << ga.num_generations
                     << " mutation_rate=" << ga.mutation_rate
                     << " trials=" << ga.simulation.num_trials
                     << " horizon=" << ga.simulation.horizon);

  stats::SplitMix64 rng(ga.rng_seed);
  Population pop = random_population(ga.population_size, policy_len, rng);

  OptimizationResult out;
  out.trace.reserve(static_cast<std::size_t>(ga.num_generations));
  out.best_so_far.reserve(static_cast<std::size_t>(ga.num_generations));

  for (int g = 0; g < ga.num_generations; ++g) {
    evaluate_population(pop, P, cost, generation_sim(g), ga.threads, num);
    out.evaluations += pop.size();

    const Individual& best = fittest(pop);
    out.trace.push_back(best.fitness);
    const double running = out.best_so_far.empty() ? best.fitness
                                                   : std::min(out.best_so_far.back(), best.fitness);
    out.best_so_far.push_back(running);

    MAINTOPT_LOG(DEBUG, "generation " << g << " best=" << best.fitness
                        << " policy=" << policy_to_string(best.policy));

    pop = next_generation(pop, pop_size, ga.mutation_rate, rng);
    out.generations = g + 1;
  }

  evaluate_population(pop, P, cost, generation_sim(ga.num_generations), ga.threads, num);
  out.evaluations += pop.size();

  const Individual& winner = fittest(pop);
  out.best_policy = winner.policy;
  out.best_cost = winner.fitness;

  MAINTOPT_LOG(INFO, "GA done: best policy " << policy_to_string(out.best_policy)
                     << " cost/period=" << out.best_cost
                     << " evaluations=" << out.evaluations);
  return out;
}

ExhaustiveResult optimize_exhaustive(const TransitionMatrix& P,
                                     const CostModel& cost,
                                     const SimulationConfig& sim,
                                     const NumericalSettings& num) {
  sim.validate_or_throw();
  num.validate_or_throw();
  validate_transition_matrix(P, num.row_sum_tol);
  cost.check_compatible(num_states(P));

  const int policy_len = policy_length(num_states(P));
  if (policy_len > kMaxExhaustivePolicyLength) {
    std::ostringstream oss;
    oss << "exhaustive search over 2^" << policy_len << " policies exceeds the 2^"
        << kMaxExhaustivePolicyLength << " guard";
    MAINTOPT_THROW(ErrorCode::kInvalidOptimizerConfig, oss.str());
  }

  const std::size_t count = std::size_t{1} << policy_len;
  Population all(count);
  for (std::size_t mask = 0; mask < count; ++mask) {
    Policy& p = all[mask].policy;
    p.resize(static_cast<std::size_t>(policy_len));
    for (int bit = 0; bit < policy_len; ++bit) {
      p[static_cast<std::size_t>(bit)] = static_cast<std::uint8_t>((mask >> bit) & 1u);
    }
  }

  evaluate_population(all, P, cost, sim, sim.threads, num);

  ExhaustiveResult out;
  out.ranking = select_survivors(std::move(all), count);
  out.best_policy = out.ranking.front().policy;
  out.best_cost = out.ranking.front().fitness;

  MAINTOPT_LOG(INFO, "exhaustive: " << count << " policies, best " << policy_to_string(out.best_policy)
                     << " cost/period=" << out.best_cost);
  return out;
}

}  // namespace maintopt
