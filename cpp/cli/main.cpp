/*
================================================================================
CLI: Main Entry Point (maintopt_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line harness for the maintenance-policy engine on the reference
    5-state degradation chain and cost model.

Usage:
  maintopt_cli [command] [args] [--flag value ...]

Commands:
  analyze                    Stationary distribution + time-to-failure stats
  evaluate <policy>          Monte Carlo cost of a policy vs never-maintain
  optimize                   Genetic search for the cheapest policy
  exhaustive                 Evaluate every policy (small chains only)
  trajectory <policy> [len]  One simulated state sequence
  help                       Show help message

Hardening:
  - Explicit exit codes for CI integration
  - Every engine error is reported with its code; nothing is swallowed
================================================================================
*/

#include "maintopt/core/error.hpp"
#include "maintopt/core/logging.hpp"
#include "maintopt/core/settings.hpp"
#include "maintopt/markov/chain_analyzer.hpp"
#include "maintopt/model/maintenance_model.hpp"
#include "maintopt/optimization/genetic_optimizer.hpp"
#include "maintopt/policy/policy_evaluator.hpp"

#include <charconv>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace maintopt;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
};

namespace {

void print_help() {
  std::cout << R"(
maintopt_cli - Preventive Maintenance Policy Optimizer

Usage:
  maintopt_cli [command] [args] [--flag value ...]

Commands:
  analyze                    Stationary distribution and time to failure (unmanaged chain)
  evaluate <policy>          Monte Carlo cost per period of a policy, e.g. 011 or 0,1,1
  optimize                   Genetic search for the cheapest policy
  exhaustive                 Evaluate all 2^(n-2) policies
  trajectory <policy> [len]  Print one simulated state sequence
  help                       Show this help message

Flags:
  --seed N        simulation seed (default 42)
  --ga-seed N     search seed (default 7)
  --trials N      Monte Carlo trials per evaluation (default 1000)
  --horizon N     periods per trial (default 100)
  --pop N         GA population size (default 20)
  --gens N        GA generations (default 30)
  --mutation X    GA mutation rate in [0,1] (default 0.2)
  --threads N     worker threads, 0 = auto (default 0)
  --reseed 0|1    new simulation seed every generation (default 0)
  --log-level L   debug|info|warn|error (default info)

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
)";
}

template <class T>
bool parse_number(std::string_view s, T* out) {
  T v{};
  const auto* first = s.data();
  const auto* last = s.data() + s.size();
  const auto r = std::from_chars(first, last, v);
  if (r.ec != std::errc{} || r.ptr != last) return false;
  *out = v;
  return true;
}

bool parse_double(const std::string& s, double* out) {
  try {
    std::size_t used = 0;
    const double v = std::stod(s, &used);
    if (used != s.size()) return false;
    *out = v;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

// A malformed policy on the command line is an argument error (exit 1), not
// a validation failure of the engine inputs.
bool parse_policy_arg(const std::string& text, Policy* out) {
  try {
    *out = parse_policy(text);
    return true;
  } catch (const Error& e) {
    if (e.code() != ErrorCode::kInvalidArgument) throw;
    std::cerr << "Invalid policy '" << text << "': expected flags like 011 or 0,1,1\n";
    return false;
  }
}

struct Args {
  std::string command = "help";
  std::vector<std::string> positional;
  RunSettings settings = RunSettings::defaults();
};

// Returns false (after printing the reason) on a malformed command line.
bool parse_args(int argc, char** argv, Args* args) {
  if (argc >= 2) args->command = argv[1];

  GaConfig& ga = args->settings.ga;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    if (a.rfind("--", 0) != 0) {
      args->positional.push_back(a);
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << a << "\n";
      return false;
    }
    const std::string v = argv[++i];

    bool ok = true;
    if (a == "--seed") {
      ok = parse_number(v, &ga.simulation.rng_seed);
    } else if (a == "--ga-seed") {
      ok = parse_number(v, &ga.rng_seed);
    } else if (a == "--trials") {
      ok = parse_number(v, &ga.simulation.num_trials);
    } else if (a == "--horizon") {
      ok = parse_number(v, &ga.simulation.horizon);
    } else if (a == "--pop") {
      ok = parse_number(v, &ga.population_size);
    } else if (a == "--gens") {
      ok = parse_number(v, &ga.num_generations);
    } else if (a == "--mutation") {
      ok = parse_double(v, &ga.mutation_rate);
    } else if (a == "--threads") {
      ok = parse_number(v, &ga.threads);
      ga.simulation.threads = ga.threads;
    } else if (a == "--reseed") {
      ok = (v == "0" || v == "1");
      ga.reseed_each_generation = (v == "1");
    } else if (a == "--log-level") {
      LogLevel lvl = LogLevel::INFO;
      ok = parse_log_level(v, &lvl);
      if (ok) set_log_level(lvl);
    } else {
      std::cerr << "Unknown flag: " << a << "\n";
      return false;
    }

    if (!ok) {
      std::cerr << "Invalid value for " << a << ": " << v << "\n";
      return false;
    }
  }
  return true;
}

void print_vector(const char* label, const Eigen::VectorXd& v) {
  std::cout << "  " << label << ":";
  for (Eigen::Index i = 0; i < v.size(); ++i) std::cout << " " << v(i);
  std::cout << "\n";
}

int cmd_analyze(const Args& args) {
  std::cout << "=== Unmanaged Chain Analysis ===\n";

  const TransitionMatrix P = reference_transition_matrix();
  const NumericalSettings& num = args.settings.numerics;

  std::cout << std::fixed << std::setprecision(6);
  print_vector("stationary distribution", stationary_distribution(P, num));
  print_vector("mean periods to failure by state", mean_times_to_absorption(P, num));
  print_vector("variance of periods to failure", absorption_time_variance(P, num));
  std::cout << "  mean time to failure from best state: "
            << mean_time_to_absorption(P, best_state(P), num) << " periods\n";
  return ExitCode::SUCCESS;
}

int cmd_evaluate(const Args& args) {
  if (args.positional.empty()) {
    std::cerr << "evaluate: missing <policy>\n";
    return ExitCode::INVALID_ARGS;
  }
  std::cout << "=== Policy Evaluation ===\n";

  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();
  Policy policy;
  if (!parse_policy_arg(args.positional[0], &policy)) return ExitCode::INVALID_ARGS;
  const SimulationConfig& sim = args.settings.ga.simulation;

  const PolicyEvaluation e = evaluate_detailed(policy, P, cost, sim, args.settings.numerics);
  const double base = baseline_cost(P, cost, sim, args.settings.numerics);

  std::cout << std::fixed << std::setprecision(4);
  std::cout << "Policy: " << policy_to_string(policy) << "\n";
  std::cout << "  cost/period: " << e.mean_cost << " +/- " << e.ci95_half_width << " (95%)\n";
  std::cout << "  trial stddev: " << e.stddev << "\n";
  std::cout << "  trials x horizon: " << e.trials << " x " << e.horizon << "\n";
  std::cout << "  preventive actions: " << e.preventive_actions << "\n";
  std::cout << "  failures: " << e.failures << "\n";
  std::cout << "Baseline (never maintain): " << base << "\n";
  std::cout << "Saving vs baseline: " << (base - e.mean_cost) << "\n";
  return ExitCode::SUCCESS;
}

int cmd_optimize(const Args& args) {
  std::cout << "=== Genetic Policy Search ===\n";

  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();
  const GaConfig& ga = args.settings.ga;

  const double mttf = mean_time_to_absorption(P, best_state(P), args.settings.numerics);
  const OptimizationResult r = optimize(P, cost, ga, args.settings.numerics);
  const double base = baseline_cost(P, cost, ga.simulation, args.settings.numerics);

  std::cout << std::fixed << std::setprecision(4);
  std::cout << "Mean time to failure (unmanaged, from best state): " << mttf << " periods\n";
  std::cout << "Best cost per generation:\n";
  for (std::size_t g = 0; g < r.trace.size(); ++g) {
    std::cout << "  gen " << std::setw(3) << g << ": " << r.trace[g] << "\n";
  }
  std::cout << "Best policy: " << policy_to_string(r.best_policy) << "\n";
  std::cout << "Best cost/period: " << r.best_cost << "\n";
  std::cout << "Baseline (never maintain): " << base << "\n";
  std::cout << "Saving vs baseline: " << (base - r.best_cost) << "\n";
  std::cout << "Evaluations: " << r.evaluations << "\n";
  return ExitCode::SUCCESS;
}

int cmd_exhaustive(const Args& args) {
  std::cout << "=== Exhaustive Policy Evaluation ===\n";

  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();
  const ExhaustiveResult r = optimize_exhaustive(P, cost, args.settings.ga.simulation, args.settings.numerics);

  std::cout << std::fixed << std::setprecision(4);
  for (const Individual& ind : r.ranking) {
    std::cout << "  " << policy_to_string(ind.policy) << "  " << ind.fitness << "\n";
  }
  std::cout << "Best policy: " << policy_to_string(r.best_policy) << " (" << r.best_cost << ")\n";
  return ExitCode::SUCCESS;
}

int cmd_trajectory(const Args& args) {
  if (args.positional.empty()) {
    std::cerr << "trajectory: missing <policy>\n";
    return ExitCode::INVALID_ARGS;
  }
  int length = args.settings.trajectory_length;
  if (args.positional.size() >= 2 && !parse_number(args.positional[1], &length)) {
    std::cerr << "trajectory: invalid length '" << args.positional[1] << "'\n";
    return ExitCode::INVALID_ARGS;
  }

  const TransitionMatrix P = reference_transition_matrix();
  const CostModel cost = reference_cost_model();
  Policy policy;
  if (!parse_policy_arg(args.positional[0], &policy)) return ExitCode::INVALID_ARGS;

  const SimulatedTrajectory t = simulate_trajectory(policy, P, cost, length,
                                                    args.settings.ga.simulation.rng_seed,
                                                    args.settings.numerics);

  std::cout << "step,state\n";
  for (std::size_t i = 0; i < t.states.size(); ++i) {
    std::cout << i << "," << t.states[i] << "\n";
  }
  MAINTOPT_LOG(INFO, "trajectory: " << t.failures << " failures, " << t.preventive_actions
                     << " preventive actions, total cost " << t.total_cost);
  return ExitCode::SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  if (!parse_args(argc, argv, &args)) {
    std::cerr << "Run 'maintopt_cli help' for usage information.\n";
    return ExitCode::INVALID_ARGS;
  }

  const std::string& cmd = args.command;
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return ExitCode::SUCCESS;
  }

  try {
    args.settings.validate_or_throw();

    if (cmd == "analyze") return cmd_analyze(args);
    if (cmd == "evaluate") return cmd_evaluate(args);
    if (cmd == "optimize") return cmd_optimize(args);
    if (cmd == "exhaustive") return cmd_exhaustive(args);
    if (cmd == "trajectory") return cmd_trajectory(args);

  } catch (const Error& e) {
    log(LogLevel::ERROR, e.what());
    const bool computation = e.code() == ErrorCode::kSingularFundamentalMatrix ||
                             e.code() == ErrorCode::kInternal;
    return computation ? ExitCode::COMPUTATION_FAILED : ExitCode::VALIDATION_FAILED;
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, std::string("Error: ") + e.what());
    return ExitCode::COMPUTATION_FAILED;
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'maintopt_cli help' for usage information.\n";
  return ExitCode::INVALID_ARGS;
}
