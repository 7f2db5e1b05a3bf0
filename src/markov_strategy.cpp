#include "markov_strategy.hpp"
#include <algorithm>
#include <stdexcept>

static const double REST_SHIFT = 0.05;

Matrix apply_rest_action(const Matrix &P, const std::vector<std::string> &states) {
    Matrix Q = P;
    auto inj = std::find(states.begin(), states.end(), "injured");
    auto good = std::find(states.begin(), states.end(), "good");
    if (inj == states.end() || good == states.end()) return Q;
    const size_t i_inj = static_cast<size_t>(inj - states.begin());
    const size_t i_good = static_cast<size_t>(good - states.begin());

    for (auto &row : Q) {
        double delta = std::min(row[i_inj], REST_SHIFT);
        row[i_inj] -= delta;
        row[i_good] += delta;
        double sum = 0.0;
        for (double x : row) sum += x;
        if (sum > 0.0)
            for (double &x : row) x /= sum;
    }
    return Q;
}

ActionEvaluation evaluate_action_long_term(const Matrix &P,
                                           const std::vector<std::string> &states,
                                           const std::string &action,
                                           const std::unordered_map<std::string, double> &reward_per_state) {
    Matrix Q;
    if (action == "rest") Q = apply_rest_action(P, states);
    else if (action == "none") Q = P;
    else throw std::invalid_argument("unknown action '" + action + "'");

    PowerIteration pi = power_iterate(Q, 1e-9, 1000);

    ActionEvaluation out;
    for (size_t i = 0; i < states.size(); i++) {
        auto it = reward_per_state.find(states[i]);
        if (it == reward_per_state.end())
            throw std::invalid_argument("no reward for state '" + states[i] + "'");
        out.expected_reward += pi.vector[i] * it->second;
        out.stationary.emplace_back(states[i], pi.vector[i]);
    }
    return out;
}
