#pragma once
#include "markov_model.hpp"
#include <string>
#include <vector>
#include <unordered_map>

// Interventions on a learned transition matrix and their long-term payoff.

// "rest": in every row move min(P[i][injured], 0.05) of mass from the
// `injured` column to the `good` column, then renormalize rows.
// Returns P unchanged when either label is missing from `states`.
Matrix apply_rest_action(const Matrix &P, const std::vector<std::string> &states);

struct ActionEvaluation {
    double expected_reward = 0.0;
    StateDistribution stationary;
};

// Apply `action` ("rest" or "none") and score the resulting chain by the
// expected per-step reward under its stationary distribution.
// Throws std::invalid_argument on an unknown action or a state with no reward.
ActionEvaluation evaluate_action_long_term(const Matrix &P,
                                           const std::vector<std::string> &states,
                                           const std::string &action,
                                           const std::unordered_map<std::string, double> &reward_per_state);
