/*
  Model + Stats Selftest

  Covers the validated domain records (transition matrix, cost model, policy),
  the random streams and categorical sampler, online statistics, the batch
  worker pool, run settings and log-level parsing.

      ./model_selftest      (non-zero exit on failure)
*/

#include "maintopt/core/logging.hpp"
#include "maintopt/core/parallel.hpp"
#include "maintopt/core/selftest.hpp"
#include "maintopt/core/settings.hpp"
#include "maintopt/model/maintenance_model.hpp"
#include "maintopt/stats/online_stats.hpp"
#include "maintopt/stats/rng.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

namespace maintopt {
namespace {

using selftest::expect_error;
using selftest::expect_near;
using selftest::expect_no_error;
using selftest::expect_true;

void test_reference_chain_is_valid() {
  const TransitionMatrix P = reference_transition_matrix();
  expect_true(num_states(P) == 5, "reference chain has 5 states");
  expect_no_error([&] { validate_transition_matrix(P); }, "reference chain validates");

  for (int i = 0; i < num_states(P); ++i) {
    expect_near(P.row(i).sum(), 1.0, 1e-9, "reference row sums to 1");
  }
  expect_true(P(4, 4) == 1.0, "failed state is absorbing");
}

void test_transition_matrix_rejections() {
  TransitionMatrix off = reference_transition_matrix();
  off(1, 1) += 1e-6;
  expect_error(ErrorCode::kInvalidTransitionMatrix, [&] { validate_transition_matrix(off); },
               "row sum off by 1e-6 is rejected");

  TransitionMatrix tiny = reference_transition_matrix();
  tiny(1, 1) += 1e-12;
  expect_no_error([&] { validate_transition_matrix(tiny); }, "row sum off by 1e-12 is tolerated");

  TransitionMatrix rect(4, 5);
  rect.setZero();
  expect_error(ErrorCode::kInvalidTransitionMatrix, [&] { validate_transition_matrix(rect); },
               "non-square matrix is rejected");

  TransitionMatrix neg = reference_transition_matrix();
  neg(0, 0) = 1.0;
  neg(0, 1) = -0.05;
  neg(0, 2) = 0.05;
  expect_error(ErrorCode::kInvalidTransitionMatrix, [&] { validate_transition_matrix(neg); },
               "negative probability is rejected");

  TransitionMatrix leaky = reference_transition_matrix();
  leaky(4, 4) = 0.9;
  leaky(4, 0) = 0.1;
  expect_error(ErrorCode::kInvalidTransitionMatrix, [&] { validate_transition_matrix(leaky); },
               "non-absorbing failed state is rejected");

  TransitionMatrix stuck = reference_transition_matrix();
  stuck.row(2).setZero();
  stuck(2, 2) = 1.0;
  expect_no_error([&] { validate_transition_matrix(stuck); },
               "self-looping transient state is structurally valid");

  TransitionMatrix two(2, 2);
  two << 0.5, 0.5,
         0.0, 1.0;
  expect_error(ErrorCode::kInvalidTransitionMatrix, [&] { validate_transition_matrix(two); },
               "two-state chain has no maintainable state");
  expect_error(ErrorCode::kInvalidTransitionMatrix, [&] { validate_transition_matrix(TransitionMatrix()); },
               "empty matrix is rejected");
  expect_no_error([&] { validate_stochastic_matrix(two); }, "two-state chain is still stochastic");

  std::string too_small_msg;
  try {
    validate_transition_matrix(two);
  } catch (const Error& e) {
    too_small_msg = e.what();
  }
  expect_true(too_small_msg.find("at least " + std::to_string(kMinStates)) != std::string::npos,
              "state-count message quotes the minimum");
}

void test_cost_model() {
  const CostModel c = reference_cost_model();
  expect_true(c.preventive_cost() == 5.0, "reference preventive cost");
  expect_true(c.repair_cost_by_state().size() == 5, "reference repair cost length");
  expect_true(c.failure_cost(3) == 35.0, "failure cost = repair[s] + production loss");

  expect_error(ErrorCode::kInvalidCostModel, [] { CostModel(-1.0, {0, 1, 2}, 0.0); },
               "negative preventive cost is rejected");
  expect_error(ErrorCode::kInvalidCostModel, [] { CostModel(1.0, {0, -1, 2}, 0.0); },
               "negative repair cost is rejected");
  expect_error(ErrorCode::kInvalidCostModel, [] { CostModel(1.0, {0, 1, 2}, std::nan("")); },
               "NaN production loss is rejected");
  expect_error(ErrorCode::kInvalidCostModel, [] { CostModel::make(5.0, {0, 2, 8, 15}, 20.0, 5); },
               "repair cost length must match state count");
}

void test_policy_helpers() {
  expect_no_error([] { validate_policy(Policy{0, 1, 1}, 5); }, "length-3 policy is valid for 5 states");
  expect_error(ErrorCode::kInvalidPolicyLength, [] { validate_policy(Policy{0, 1}, 5); },
               "short policy is rejected");
  expect_error(ErrorCode::kInvalidPolicyLength, [] { validate_policy(Policy{0, 1, 1, 0}, 5); },
               "long policy is rejected");
  expect_error(ErrorCode::kInvalidArgument, [] { validate_policy(Policy{0, 2, 1}, 5); },
               "non-binary flag is rejected");

  expect_true(parse_policy("011") == Policy({0, 1, 1}), "parse '011'");
  expect_true(parse_policy("0,1,1") == Policy({0, 1, 1}), "parse '0,1,1'");
  expect_true(parse_policy("[0, 1, 1]") == Policy({0, 1, 1}), "parse '[0, 1, 1]'");
  expect_error(ErrorCode::kInvalidArgument, [] { parse_policy("01x"); }, "parse rejects junk");
  expect_true(policy_to_string(Policy{1, 0, 1}) == "[1,0,1]", "policy_to_string");

  const Policy p{0, 1, 0};
  expect_true(!maintains(p, 0), "best state is never maintained");
  expect_true(!maintains(p, 1) && maintains(p, 2) && !maintains(p, 3), "flag i maps to state i+1");
  expect_true(!maintains(p, 4), "failed state is never maintained");
}

void test_rng_streams() {
  stats::SplitMix64 a(123), b(123);
  bool same = true;
  for (int i = 0; i < 1000; ++i) same = same && (a.next_u64() == b.next_u64());
  expect_true(same, "SplitMix64 is deterministic for a seed");

  expect_true(stats::derive_seed(42, 0) != stats::derive_seed(42, 1), "sub-streams differ by index");
  expect_true(stats::derive_seed(42, 7) != stats::derive_seed(43, 7), "sub-streams differ by run seed");

  stats::SplitMix64 r(9);
  bool in_range = true;
  for (int i = 0; i < 10000; ++i) {
    const double u = r.next_u01();
    in_range = in_range && u >= 0.0 && u < 1.0;
    in_range = in_range && r.next_below(3) < 3;
  }
  expect_true(in_range, "uniform draws stay in range");
}

void test_inverse_cdf_sampler() {
  const TransitionMatrix P = reference_transition_matrix();
  stats::SplitMix64 rng(2024);
  stats::InverseCdfSampler sampler;

  const int draws = 200000;
  std::vector<int> counts(5, 0);
  for (int i = 0; i < draws; ++i) {
    const int j = sampler(stats::ProbRow(P.row(1)), rng);
    ++counts[static_cast<std::size_t>(j)];
  }
  expect_true(counts[0] == 0 && counts[4] == 0, "zero-probability states are never drawn");
  expect_near(counts[1] / static_cast<double>(draws), 0.7, 0.01, "P(1->1) frequency");
  expect_near(counts[2] / static_cast<double>(draws), 0.2, 0.01, "P(1->2) frequency");
  expect_near(counts[3] / static_cast<double>(draws), 0.1, 0.01, "P(1->3) frequency");
}

void test_online_stats() {
  stats::OnlineStats s;
  for (double x : {1.0, 2.0, 3.0, 4.0}) s.push(x);
  s.push(std::nan(""));
  expect_true(s.count() == 4, "NaN samples are ignored");
  expect_near(s.mean, 2.5, 1e-12, "Welford mean");
  expect_near(s.variance_sample(), 5.0 / 3.0, 1e-12, "Welford sample variance");
  expect_near(s.std_error(), std::sqrt(5.0 / 3.0) / 2.0, 1e-12, "standard error");
  expect_true(s.min() == 1.0 && s.max() == 4.0, "min/max");
}

void test_parallel_for() {
  std::vector<std::uint64_t> serial(1000), pooled(1000);
  auto fill = [](std::vector<std::uint64_t>& out) {
    return [&out](std::size_t i) {
      stats::SplitMix64 r(stats::derive_seed(5, i));
      out[i] = r.next_u64();
    };
  };
  parallel_for(serial.size(), 1, fill(serial));
  parallel_for(pooled.size(), 8, fill(pooled));
  expect_true(serial == pooled, "parallel_for result is independent of thread count");

  bool rethrown = false;
  try {
    parallel_for(100, 4, [](std::size_t i) {
      if (i == 37) throw std::runtime_error("boom");
    });
  } catch (const std::runtime_error&) {
    rethrown = true;
  }
  expect_true(rethrown, "worker exception is rethrown on the caller");

  // Thread creation fails after one extra worker: the batch still completes.
  std::vector<std::uint64_t> degraded(1000);
  int spawned = 0;
  auto flaky_spawn = [&spawned](const auto& worker) {
    if (spawned++ >= 1) {
      throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    }
    return std::thread(worker);
  };
  parallel_for(degraded.size(), 8, fill(degraded), flaky_spawn);
  expect_true(degraded == serial, "failed worker start loses no index");

  std::vector<std::uint64_t> inline_only(1000);
  auto no_spawn = [](const auto&) -> std::thread {
    throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
  };
  parallel_for(inline_only.size(), 4, fill(inline_only), no_spawn);
  expect_true(inline_only == serial, "caller finishes the batch when no thread starts");
}

void test_settings() {
  expect_no_error([] { RunSettings::defaults().validate_or_throw(); }, "default settings are valid");

  SimulationConfig sim;
  sim.horizon = 0;
  expect_error(ErrorCode::kInvalidSimulationConfig, [&] { sim.validate_or_throw(); }, "zero horizon rejected");

  GaConfig ga;
  ga.num_generations = 0;
  expect_error(ErrorCode::kInvalidOptimizerConfig, [&] { ga.validate_or_throw(); }, "zero generations rejected");

  ga = GaConfig{};
  ga.mutation_rate = -0.1;
  expect_error(ErrorCode::kInvalidOptimizerConfig, [&] { ga.validate_or_throw(); }, "negative mutation rate rejected");

  ga = GaConfig{};
  ga.simulation.num_trials = -5;
  expect_error(ErrorCode::kInvalidSimulationConfig, [&] { ga.validate_or_throw(); },
               "nested simulation config validated");

  NumericalSettings num;
  num.row_sum_tol = 0.0;
  expect_error(ErrorCode::kInvalidArgument, [&] { num.validate_or_throw(); }, "zero tolerance rejected");
}

void test_log_level_parsing() {
  LogLevel lvl = LogLevel::INFO;
  expect_true(parse_log_level("debug", &lvl) && lvl == LogLevel::DEBUG, "parse 'debug'");
  expect_true(parse_log_level("WARN", &lvl) && lvl == LogLevel::WARN, "parse is case-insensitive");
  expect_true(!parse_log_level("loud", &lvl) && lvl == LogLevel::WARN, "unknown level leaves value untouched");

  const LogLevel before = get_log_level();
  set_log_level(LogLevel::ERROR);
  expect_true(!log_enabled(LogLevel::INFO) && log_enabled(LogLevel::ERROR), "level filters messages");
  set_log_level(before);
}

}  // namespace
}  // namespace maintopt

int main() {
  using namespace maintopt;

  test_reference_chain_is_valid();
  test_transition_matrix_rejections();
  test_cost_model();
  test_policy_helpers();
  test_rng_streams();
  test_inverse_cdf_sampler();
  test_online_stats();
  test_parallel_for();
  test_settings();
  test_log_level_parsing();

  return selftest::finish("model_selftest");
}
