/*
  Chain Analyzer Selftest

  Reference chain, closed-form expectations:
    t = (I - Q)^-1 * 1 = [11, 20/3, 4, 2]   (periods to failure)
    Var(T | start in severe wear) = (1 - p) / p^2 with p = 0.5 -> 2
*/

#include "maintopt/core/selftest.hpp"
#include "maintopt/markov/chain_analyzer.hpp"

namespace maintopt {
namespace {

using selftest::expect_error;
using selftest::expect_near;
using selftest::expect_true;

void test_stationary_regular_chain() {
  TransitionMatrix P(2, 2);
  P << 0.9, 0.1,
       0.5, 0.5;
  const Eigen::VectorXd pi = stationary_distribution(P);
  expect_near(pi(0), 5.0 / 6.0, 1e-9, "regular chain: pi(0) = 5/6");
  expect_near(pi(1), 1.0 / 6.0, 1e-9, "regular chain: pi(1) = 1/6");
  expect_near(pi.sum(), 1.0, 1e-12, "stationary distribution sums to 1");

  const Eigen::RowVectorXd drift = pi.transpose() * P - pi.transpose();
  expect_true(drift.cwiseAbs().maxCoeff() < 1e-9, "pi P = pi");
}

void test_stationary_absorbing_chain_collapses() {
  const TransitionMatrix P = reference_transition_matrix();
  const Eigen::VectorXd pi = stationary_distribution(P);
  expect_true(pi.size() == 5, "one probability per state");
  expect_near(pi(4), 1.0, 1e-9, "all mass on the failed state");
  expect_near(pi.head(4).cwiseAbs().sum(), 0.0, 1e-9, "no mass on transient states");
}

void test_mean_time_to_absorption_reference() {
  const TransitionMatrix P = reference_transition_matrix();

  const double from_best = mean_time_to_absorption(P, best_state(P));
  expect_true(std::isfinite(from_best) && from_best > 0.0, "finite positive time to failure from best state");
  expect_near(from_best, 11.0, 1e-9, "time to failure from best state = 11");
  expect_near(mean_time_to_absorption(P, 1), 20.0 / 3.0, 1e-9, "time to failure from state 1 = 20/3");
  expect_near(mean_time_to_absorption(P, 2), 4.0, 1e-9, "time to failure from state 2 = 4");
  expect_near(mean_time_to_absorption(P, 3), 2.0, 1e-9, "time to failure from state 3 = 2");
  expect_near(mean_time_to_absorption(P, 4), 0.0, 0.0, "failed state has zero time to failure");

  const Eigen::VectorXd t = mean_times_to_absorption(P);
  expect_true(t.size() == 4, "one time per transient state");
  expect_true(t(0) > t(1) && t(1) > t(2) && t(2) > t(3), "worse condition fails sooner");

  const Eigen::MatrixXd N = fundamental_matrix(P);
  expect_near(N(3, 3), 2.0, 1e-9, "expected visits to severe wear starting there = 2");
  expect_true((N.array() >= -1e-12).all(), "fundamental matrix is non-negative");
}

void test_absorption_time_variance() {
  const TransitionMatrix P = reference_transition_matrix();
  const Eigen::VectorXd v = absorption_time_variance(P);
  expect_true(v.size() == 4, "one variance per transient state");
  expect_near(v(3), 2.0, 1e-9, "geometric sojourn variance in severe wear");
  expect_true((v.array() >= -1e-9).all(), "variances are non-negative");
}

void test_singular_fundamental_matrix() {
  // States 1 and 2 swap forever: a closed transient class that never fails.
  TransitionMatrix P = reference_transition_matrix();
  P.row(1) << 0.0, 0.0, 1.0, 0.0, 0.0;
  P.row(2) << 0.0, 1.0, 0.0, 0.0, 0.0;

  expect_error(ErrorCode::kSingularFundamentalMatrix,
               [&] { mean_time_to_absorption(P, 0); },
               "closed transient class -> SingularFundamentalMatrix");
  expect_error(ErrorCode::kSingularFundamentalMatrix,
               [&] { absorption_time_variance(P); },
               "variance also requires an invertible I - Q");

  // State 2 holds forever once entered.
  TransitionMatrix stuck = reference_transition_matrix();
  stuck.row(2) << 0.0, 0.0, 1.0, 0.0, 0.0;
  expect_error(ErrorCode::kSingularFundamentalMatrix,
               [&] { mean_time_to_absorption(stuck, 0); },
               "self-looping transient state -> SingularFundamentalMatrix");
  expect_error(ErrorCode::kSingularFundamentalMatrix,
               [&] { fundamental_matrix(stuck); },
               "fundamental matrix rejects a state that never fails");
}

void test_input_validation() {
  const TransitionMatrix P = reference_transition_matrix();
  expect_error(ErrorCode::kInvalidArgument, [&] { mean_time_to_absorption(P, -1); },
               "negative initial state is rejected");
  expect_error(ErrorCode::kInvalidArgument, [&] { mean_time_to_absorption(P, 5); },
               "initial state beyond the chain is rejected");

  TransitionMatrix bad = P;
  bad(0, 0) = 0.5;
  expect_error(ErrorCode::kInvalidTransitionMatrix, [&] { mean_time_to_absorption(bad, 0); },
               "non-stochastic row is rejected before solving");
  expect_error(ErrorCode::kInvalidTransitionMatrix, [&] { stationary_distribution(bad); },
               "stationary solve validates too");
}

}  // namespace
}  // namespace maintopt

int main() {
  using namespace maintopt;

  test_stationary_regular_chain();
  test_stationary_absorbing_chain_collapses();
  test_mean_time_to_absorption_reference();
  test_absorption_time_variance();
  test_singular_fundamental_matrix();
  test_input_validation();

  return selftest::finish("chain_analyzer_selftest");
}
