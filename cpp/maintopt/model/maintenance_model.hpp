#pragma once
/*
================================================================================
Model: Degradation Chain, Cost Model, Maintenance Policy
FILE: cpp/maintopt/model/maintenance_model.hpp

State convention (enforced, not inferred):
  - states are 0..n-1, ordered best -> worst condition
  - state 0 is the best ("as new") state and is never absorbing
  - state n-1 is the absorbing ("failed") state: identity row. Another
    state that cannot reach it makes I - Q singular (ChainAnalyzer error).
  - maintainable states are 1..n-2; policy flag i belongs to state i+1

All validators throw maintopt::Error with the matching ErrorCode.
================================================================================
*/

#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace maintopt {

using State = int;

// Row-stochastic n x n matrix, one row per current state.
using TransitionMatrix = Eigen::MatrixXd;

// One flag per maintainable state; 1 = maintain whenever observed there.
using Policy = std::vector<std::uint8_t>;

inline constexpr int kMinStates = 3;

inline int num_states(const TransitionMatrix& P) noexcept { return static_cast<int>(P.rows()); }
inline State best_state(const TransitionMatrix&) noexcept { return 0; }
inline State failed_state(const TransitionMatrix& P) noexcept { return num_states(P) - 1; }
inline int policy_length(int n_states) noexcept { return n_states - 2; }

// Throws kInvalidTransitionMatrix on: empty or non-square matrix, non-finite
// or negative entries, |row sum - 1| > tol.
void validate_stochastic_matrix(const TransitionMatrix& P, double tol = 1e-9);

// validate_stochastic_matrix() plus the degradation-chain structure: at least
// kMinStates states and an identity last row.
void validate_transition_matrix(const TransitionMatrix& P, double tol = 1e-9);

// ----------------------------- CostModel -------------------------------------
// Costs are validated at construction; the length check against a chain needs
// the state count and is done by make() / check_compatible().
class CostModel {
 public:
  CostModel(double preventive_cost,
            std::vector<double> repair_cost_by_state,
            double production_loss_cost);

  // Construct and check that repair costs cover exactly num_states states.
  static CostModel make(double preventive_cost,
                        std::vector<double> repair_cost_by_state,
                        double production_loss_cost,
                        int num_states);

  void check_compatible(int num_states) const;

  double preventive_cost() const noexcept { return preventive_cost_; }
  double production_loss_cost() const noexcept { return production_loss_cost_; }
  const std::vector<double>& repair_cost_by_state() const noexcept { return repair_cost_by_state_; }

  // Cost charged when the chain fails out of pre-failure state s.
  double failure_cost(State s) const { return repair_cost_by_state_.at(static_cast<std::size_t>(s)) + production_loss_cost_; }

 private:
  double preventive_cost_;
  std::vector<double> repair_cost_by_state_;
  double production_loss_cost_;
};

// ----------------------------- Policy ----------------------------------------
// Throws kInvalidPolicyLength if size != n_states - 2; kInvalidArgument for a
// flag other than 0/1.
void validate_policy(const Policy& policy, int n_states);

inline bool maintains(const Policy& policy, State s) noexcept {
  return s >= 1 && static_cast<std::size_t>(s) <= policy.size() && policy[static_cast<std::size_t>(s - 1)] != 0;
}

inline Policy never_maintain(int n_states) { return Policy(static_cast<std::size_t>(policy_length(n_states)), 0); }
inline Policy always_maintain(int n_states) { return Policy(static_cast<std::size_t>(policy_length(n_states)), 1); }

// "[0,1,1]"
std::string policy_to_string(const Policy& policy);

// Accepts "011", "0,1,1" or "[0,1,1]". Throws kInvalidArgument otherwise.
Policy parse_policy(const std::string& text);

// ----------------------------- Reference scenario ----------------------------
// 5-state degradation chain (new, minor wear, moderate wear, severe wear, failed).
TransitionMatrix reference_transition_matrix();

// preventive = 5, repair = [0, 2, 8, 15, 50], production loss = 20.
CostModel reference_cost_model();

}  // namespace maintopt
