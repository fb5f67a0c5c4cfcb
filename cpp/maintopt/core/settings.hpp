#pragma once
/*
================================================================================
Core: Run Settings (Simulation + Search + Numerics)
FILE: cpp/maintopt/core/settings.hpp

Purpose:
  - Centralize every knob that changes a run's numbers: tolerances, Monte
    Carlo trial count and horizon, GA population/generations/mutation, seeds.
  - Same seeds + same settings => bit-identical results, regardless of the
    number of worker threads.

Hardening:
  - validate_or_throw() on every struct; entry points call it before work.
  - No clamping: an out-of-range knob is an error, never silently fixed.
================================================================================
*/

#include <cmath>
#include <cstdint>
#include <string>

#include "maintopt/core/error.hpp"

namespace maintopt {

// ----------------------------- Numerical -------------------------------------
struct NumericalSettings {
  // Row-sum tolerance for a transition matrix to count as stochastic.
  double row_sum_tol = 1e-9;

  // |det|-style threshold used to reject (I - Q) as singular.
  double singular_tol = 1e-12;

  void validate_or_throw() const {
    if (!(row_sum_tol > 0.0) || row_sum_tol > 1e-3) {
      MAINTOPT_THROW(ErrorCode::kInvalidArgument, "NumericalSettings: row_sum_tol outside (0, 1e-3]");
    }
    if (!(singular_tol > 0.0) || singular_tol > 1e-3) {
      MAINTOPT_THROW(ErrorCode::kInvalidArgument, "NumericalSettings: singular_tol outside (0, 1e-3]");
    }
  }
};

// ----------------------------- Simulation ------------------------------------
// Monte Carlo policy evaluation. Trial k draws from derive_seed(rng_seed, k).
struct SimulationConfig {
  int num_trials = 1000;
  int horizon = 100;
  uint64_t rng_seed = 42;

  // Worker threads for the trial loop: 0 = hardware concurrency.
  int threads = 0;

  void validate_or_throw() const {
    if (num_trials <= 0) {
      MAINTOPT_THROW(ErrorCode::kInvalidSimulationConfig, "SimulationConfig: num_trials must be positive");
    }
    if (horizon <= 0) {
      MAINTOPT_THROW(ErrorCode::kInvalidSimulationConfig, "SimulationConfig: horizon must be positive");
    }
    if (threads < 0) {
      MAINTOPT_THROW(ErrorCode::kInvalidSimulationConfig, "SimulationConfig: threads must be >= 0");
    }
  }
};

// ----------------------------- Genetic search --------------------------------
struct GaConfig {
  int population_size = 20;
  int num_generations = 30;
  double mutation_rate = 0.2;

  // Seeds initialization, crossover points and mutation.
  uint64_t rng_seed = 7;

  // Workers evaluating individuals of one generation: 0 = hardware concurrency.
  int threads = 0;

  // false: every fitness call in the run shares simulation.rng_seed (common
  //        random numbers), so an unchanged policy keeps its exact cost.
  // true:  generation g evaluates with derive_seed(simulation.rng_seed, g).
  bool reseed_each_generation = false;

  SimulationConfig simulation;

  void validate_or_throw() const {
    if (population_size < 2) {
      MAINTOPT_THROW(ErrorCode::kInvalidOptimizerConfig, "GaConfig: population_size must be >= 2");
    }
    if (num_generations < 1) {
      MAINTOPT_THROW(ErrorCode::kInvalidOptimizerConfig, "GaConfig: num_generations must be >= 1");
    }
    if (!std::isfinite(mutation_rate) || mutation_rate < 0.0 || mutation_rate > 1.0) {
      MAINTOPT_THROW(ErrorCode::kInvalidOptimizerConfig, "GaConfig: mutation_rate must be in [0,1]");
    }
    if (threads < 0) {
      MAINTOPT_THROW(ErrorCode::kInvalidOptimizerConfig, "GaConfig: threads must be >= 0");
    }
    simulation.validate_or_throw();
  }
};

// ----------------------------- RunSettings -----------------------------------
struct RunSettings {
  NumericalSettings numerics;
  GaConfig ga;

  // Length of the optional trajectory dump.
  int trajectory_length = 50;

  void validate_or_throw() const {
    numerics.validate_or_throw();
    ga.validate_or_throw();
    if (trajectory_length < 1) {
      MAINTOPT_THROW(ErrorCode::kInvalidArgument, "RunSettings: trajectory_length must be >= 1");
    }
  }

  static RunSettings defaults() {
    RunSettings s;
    return s;
  }
};

}  // namespace maintopt
