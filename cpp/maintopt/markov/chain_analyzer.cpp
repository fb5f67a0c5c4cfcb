/*
================================================================================
Markov: Chain Analyzer (Implementation)
FILE: cpp/maintopt/markov/chain_analyzer.cpp
================================================================================
*/

#include "maintopt/markov/chain_analyzer.hpp"
#include "maintopt/core/error.hpp"
#include "maintopt/core/logging.hpp"

#include <cmath>
#include <sstream>

namespace maintopt {

namespace {

bool all_finite(const Eigen::MatrixXd& m) {
  return m.array().isFinite().all();
}

}  // namespace

Eigen::VectorXd stationary_distribution(const TransitionMatrix& P,
                                        const NumericalSettings& num) {
  num.validate_or_throw();
  validate_stochastic_matrix(P, num.row_sum_tol);

  const Eigen::Index n = P.rows();

  Eigen::MatrixXd A(n + 1, n);
  A.topRows(n) = P.transpose() - Eigen::MatrixXd::Identity(n, n);
  A.row(n).setOnes();

  Eigen::VectorXd b = Eigen::VectorXd::Zero(n + 1);
  b(n) = 1.0;

  Eigen::VectorXd pi = A.colPivHouseholderQr().solve(b);

  const double total = pi.sum();
  if (!all_finite(pi) || !(std::fabs(total) > num.singular_tol)) {
    MAINTOPT_THROW(ErrorCode::kInternal, "stationary solve produced a degenerate distribution");
  }
  pi /= total;
  return pi;
}

Eigen::MatrixXd fundamental_matrix(const TransitionMatrix& P,
                                   const NumericalSettings& num) {
  num.validate_or_throw();
  validate_transition_matrix(P, num.row_sum_tol);

  const Eigen::Index m = P.rows() - 1;
  const Eigen::MatrixXd I_minus_Q = Eigen::MatrixXd::Identity(m, m) - P.topLeftCorner(m, m);

  Eigen::FullPivLU<Eigen::MatrixXd> lu(I_minus_Q);
  lu.setThreshold(num.singular_tol);
  if (!lu.isInvertible()) {
    std::ostringstream oss;
    oss << "I - Q is singular (rank " << lu.rank() << " of " << m
        << "); some transient state cannot reach the failed state";
    MAINTOPT_THROW(ErrorCode::kSingularFundamentalMatrix, oss.str());
  }

  Eigen::MatrixXd N = lu.inverse();
  if (!all_finite(N)) {
    MAINTOPT_THROW(ErrorCode::kSingularFundamentalMatrix, "fundamental matrix is not finite");
  }
  return N;
}

Eigen::VectorXd mean_times_to_absorption(const TransitionMatrix& P,
                                         const NumericalSettings& num) {
  const Eigen::MatrixXd N = fundamental_matrix(P, num);
  return N.rowwise().sum();
}

double mean_time_to_absorption(const TransitionMatrix& P,
                               State initial_state,
                               const NumericalSettings& num) {
  const Eigen::VectorXd t = mean_times_to_absorption(P, num);

  const int n = num_states(P);
  if (initial_state < 0 || initial_state >= n) {
    MAINTOPT_THROW(ErrorCode::kInvalidArgument,
                   "initial state " + std::to_string(initial_state) + " outside [0, " + std::to_string(n) + ")");
  }
  if (initial_state == failed_state(P)) return 0.0;

  const double value = t(initial_state);
  MAINTOPT_LOG(DEBUG, "mean time to absorption from state " << initial_state << " = " << value);
  return value;
}

Eigen::VectorXd absorption_time_variance(const TransitionMatrix& P,
                                         const NumericalSettings& num) {
  const Eigen::MatrixXd N = fundamental_matrix(P, num);
  const Eigen::VectorXd t = N.rowwise().sum();
  const Eigen::MatrixXd I = Eigen::MatrixXd::Identity(N.rows(), N.cols());

  Eigen::VectorXd v = (2.0 * N - I) * t - t.cwiseProduct(t);
  return v;
}

}  // namespace maintopt
