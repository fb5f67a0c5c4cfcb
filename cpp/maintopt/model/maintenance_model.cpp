/*
================================================================================
Model: Degradation Chain, Cost Model, Maintenance Policy (Implementation)
FILE: cpp/maintopt/model/maintenance_model.cpp
================================================================================
*/

#include "maintopt/model/maintenance_model.hpp"
#include "maintopt/core/error.hpp"

#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

namespace maintopt {

void validate_stochastic_matrix(const TransitionMatrix& P, double tol) {
  if (P.rows() != P.cols() || P.rows() == 0) {
    std::ostringstream oss;
    oss << "transition matrix is not square (" << P.rows() << "x" << P.cols() << ")";
    MAINTOPT_THROW(ErrorCode::kInvalidTransitionMatrix, oss.str());
  }
  const int n = num_states(P);

  for (int i = 0; i < n; ++i) {
    double row_sum = 0.0;
    for (int j = 0; j < n; ++j) {
      const double p = P(i, j);
      if (!std::isfinite(p) || p < 0.0) {
        std::ostringstream oss;
        oss << "entry (" << i << "," << j << ") = " << p << " is not a probability";
        MAINTOPT_THROW(ErrorCode::kInvalidTransitionMatrix, oss.str());
      }
      row_sum += p;
    }
    if (std::fabs(row_sum - 1.0) > tol) {
      std::ostringstream oss;
      oss.precision(17);
      oss << "row " << i << " sums to " << row_sum << ", expected 1";
      MAINTOPT_THROW(ErrorCode::kInvalidTransitionMatrix, oss.str());
    }
  }
}

void validate_transition_matrix(const TransitionMatrix& P, double tol) {
  validate_stochastic_matrix(P, tol);

  const int n = num_states(P);
  if (n < kMinStates) {
    std::ostringstream oss;
    oss << "transition matrix has " << n << " states, needs at least " << kMinStates
        << " (best, one maintainable, failed)";
    MAINTOPT_THROW(ErrorCode::kInvalidTransitionMatrix, oss.str());
  }

  const int failed = n - 1;
  if (std::fabs(P(failed, failed) - 1.0) > tol) {
    MAINTOPT_THROW(ErrorCode::kInvalidTransitionMatrix,
                   "last state must be absorbing (identity row)");
  }
  // A transient state that can never fail (self-loop or closed class) is a
  // valid stochastic chain; fundamental_matrix() reports it as singular.
}

// ----------------------------- CostModel -------------------------------------

CostModel::CostModel(double preventive_cost,
                     std::vector<double> repair_cost_by_state,
                     double production_loss_cost)
    : preventive_cost_(preventive_cost),
      repair_cost_by_state_(std::move(repair_cost_by_state)),
      production_loss_cost_(production_loss_cost) {
  auto nonneg = [](double x) { return std::isfinite(x) && x >= 0.0; };

  MAINTOPT_ENSURE(nonneg(preventive_cost_), ErrorCode::kInvalidCostModel,
                  "preventive cost must be finite and >= 0");
  MAINTOPT_ENSURE(nonneg(production_loss_cost_), ErrorCode::kInvalidCostModel,
                  "production loss cost must be finite and >= 0");
  MAINTOPT_ENSURE(!repair_cost_by_state_.empty(), ErrorCode::kInvalidCostModel,
                  "repair cost sequence is empty");
  for (std::size_t i = 0; i < repair_cost_by_state_.size(); ++i) {
    if (!nonneg(repair_cost_by_state_[i])) {
      MAINTOPT_THROW(ErrorCode::kInvalidCostModel,
                     "repair cost for state " + std::to_string(i) + " must be finite and >= 0");
    }
  }
}

CostModel CostModel::make(double preventive_cost,
                          std::vector<double> repair_cost_by_state,
                          double production_loss_cost,
                          int num_states) {
  CostModel m(preventive_cost, std::move(repair_cost_by_state), production_loss_cost);
  m.check_compatible(num_states);
  return m;
}

void CostModel::check_compatible(int num_states) const {
  if (static_cast<int>(repair_cost_by_state_.size()) != num_states) {
    std::ostringstream oss;
    oss << "repair cost sequence has " << repair_cost_by_state_.size()
        << " entries, chain has " << num_states << " states";
    MAINTOPT_THROW(ErrorCode::kInvalidCostModel, oss.str());
  }
}

// ----------------------------- Policy ----------------------------------------

void validate_policy(const Policy& policy, int n_states) {
  const int expected = policy_length(n_states);
  if (static_cast<int>(policy.size()) != expected) {
    std::ostringstream oss;
    oss << "policy has " << policy.size() << " flags, expected " << expected
        << " (one per maintainable state)";
    MAINTOPT_THROW(ErrorCode::kInvalidPolicyLength, oss.str());
  }
  for (std::size_t i = 0; i < policy.size(); ++i) {
    if (policy[i] > 1) {
      MAINTOPT_THROW(ErrorCode::kInvalidArgument, "policy flag " + std::to_string(i) + " is not 0/1");
    }
  }
}

std::string policy_to_string(const Policy& policy) {
  std::string s = "[";
  for (std::size_t i = 0; i < policy.size(); ++i) {
    if (i) s += ',';
    s += policy[i] ? '1' : '0';
  }
  s += ']';
  return s;
}

Policy parse_policy(const std::string& text) {
  Policy p;
  for (char c : text) {
    if (c == '0' || c == '1') {
      p.push_back(static_cast<std::uint8_t>(c - '0'));
    } else if (c == ',' || c == '[' || c == ']' || std::isspace(static_cast<unsigned char>(c))) {
      continue;
    } else {
      MAINTOPT_THROW(ErrorCode::kInvalidArgument, "cannot parse policy '" + text + "'");
    }
  }
  if (p.empty()) {
    MAINTOPT_THROW(ErrorCode::kInvalidArgument, "empty policy '" + text + "'");
  }
  return p;
}

// ----------------------------- Reference scenario ----------------------------

TransitionMatrix reference_transition_matrix() {
  TransitionMatrix P(5, 5);
  P << 0.80, 0.15, 0.05, 0.00, 0.00,
       0.00, 0.70, 0.20, 0.10, 0.00,
       0.00, 0.00, 0.60, 0.30, 0.10,
       0.00, 0.00, 0.00, 0.50, 0.50,
       0.00, 0.00, 0.00, 0.00, 1.00;
  return P;
}

CostModel reference_cost_model() {
  return CostModel::make(5.0, {0.0, 2.0, 8.0, 15.0, 50.0}, 20.0, 5);
}

}  // namespace maintopt
