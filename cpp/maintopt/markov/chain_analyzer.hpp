#pragma once
/*
================================================================================
Markov: Chain Analyzer (Exact Linear Algebra over the Unmanaged Chain)
FILE: cpp/maintopt/markov/chain_analyzer.hpp

Purpose:
  - Stationary distribution: solve [P^T - I; 1..1] pi = [0..0, 1] in the
    least-squares sense (column-pivoting QR), then renormalize to sum 1.
  - Absorption analysis on the transient block Q (all states but the last):
      N = (I - Q)^-1           fundamental matrix
      t = N * 1                expected periods to failure per start state
      v = (2N - I) t - t.^2    variance of periods to failure

Notes:
  - With an absorbing failed state the stationary distribution collapses onto
    that state. It is a diagnostic of the unmanaged chain, not a planning
    quantity.
  - (I - Q) is checked with a rank-revealing LU; a transient class that can
    never reach failure makes it singular -> kSingularFundamentalMatrix.
  - Every entry point validates P first (kInvalidTransitionMatrix). The
    stationary solve only needs a row-stochastic matrix; absorption analysis
    needs the full degradation-chain structure.
================================================================================
*/

#include "maintopt/core/settings.hpp"
#include "maintopt/model/maintenance_model.hpp"

#include <Eigen/Dense>

namespace maintopt {

Eigen::VectorXd stationary_distribution(const TransitionMatrix& P,
                                        const NumericalSettings& num = {});

// (n-1) x (n-1) fundamental matrix of the transient states.
Eigen::MatrixXd fundamental_matrix(const TransitionMatrix& P,
                                   const NumericalSettings& num = {});

// Expected periods to failure for every transient state (size n-1).
Eigen::VectorXd mean_times_to_absorption(const TransitionMatrix& P,
                                         const NumericalSettings& num = {});

// Expected periods to failure starting in initial_state. The failed state
// itself yields 0. Throws kInvalidArgument for a state outside [0, n).
double mean_time_to_absorption(const TransitionMatrix& P,
                               State initial_state,
                               const NumericalSettings& num = {});

// Variance of periods to failure for every transient state (size n-1).
Eigen::VectorXd absorption_time_variance(const TransitionMatrix& P,
                                         const NumericalSettings& num = {});

}  // namespace maintopt
