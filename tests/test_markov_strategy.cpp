// tests/test_markov_strategy.cpp
#include <iostream>
#include <cmath>
#include <string>
#include <vector>
#include <unordered_map>
#include <stdexcept>
#include "../src/markov_strategy.hpp"

int main() {
    const std::vector<std::string> S{"peak", "good", "average", "declining", "injured"};
    const Matrix P{
        {0.30, 0.30, 0.20, 0.10, 0.10},
        {0.20, 0.40, 0.20, 0.10, 0.10},
        {0.10, 0.30, 0.30, 0.20, 0.10},
        {0.05, 0.15, 0.30, 0.30, 0.20},
        {0.00, 0.20, 0.20, 0.20, 0.40},
    };
    const std::unordered_map<std::string, double> R{
        {"peak", 1.0}, {"good", 0.8}, {"average", 0.5}, {"declining", 0.2}, {"injured", 0.0}};

    Matrix Q = apply_rest_action(P, S);
    for (size_t i = 0; i < Q.size(); i++) {
        double s = 0.0;
        for (double x : Q[i]) s += x;
        if (std::fabs(s - 1.0) > 1e-12) {
            std::cerr << "strategy: row " << i << " not stochastic\n";
            return 1;
        }
        if (std::fabs(Q[i][4] - (P[i][4] - 0.05)) > 1e-12 || std::fabs(Q[i][1] - (P[i][1] + 0.05)) > 1e-12) {
            std::cerr << "strategy: rest did not shift 0.05 from injured to good in row " << i << "\n";
            return 2;
        }
    }

    // shift is capped by the available injured mass
    Matrix small{{0.5, 0.49, 0.01}, {0.3, 0.3, 0.4}, {0.2, 0.2, 0.6}};
    Matrix qs = apply_rest_action(small, {"peak", "good", "injured"});
    if (qs[0][2] != 0.0 || std::fabs(qs[0][1] - 0.5) > 1e-12) {
        std::cerr << "strategy: shift not capped at P[i][injured]\n";
        return 3;
    }

    // missing label leaves the matrix alone
    if (apply_rest_action(small, {"peak", "good", "hurt"}) != small) {
        std::cerr << "strategy: rest changed a matrix without an injured state\n";
        return 4;
    }

    ActionEvaluation none = evaluate_action_long_term(P, S, "none", R);
    ActionEvaluation rest = evaluate_action_long_term(P, S, "rest", R);
    if (std::fabs(none.expected_reward - 0.51302368) > 1e-5 || std::fabs(rest.expected_reward - 0.58062386) > 1e-5) {
        std::cerr << "strategy: rewards " << none.expected_reward << " / " << rest.expected_reward << "\n";
        return 5;
    }
    if (rest.stationary[4].second > none.stationary[4].second) {
        std::cerr << "strategy: rest increased long-run injury probability\n";
        return 6;
    }
    if (rest.stationary.size() != S.size() || rest.stationary[1].first != "good") {
        std::cerr << "strategy: stationary labels wrong\n";
        return 7;
    }

    bool threw = false;
    try { evaluate_action_long_term(P, S, "substitute", R); } catch (const std::invalid_argument &) { threw = true; }
    if (!threw) {
        std::cerr << "strategy: unknown action accepted\n";
        return 8;
    }
    threw = false;
    auto partial = R;
    partial.erase("declining");
    try { evaluate_action_long_term(P, S, "rest", partial); } catch (const std::invalid_argument &) { threw = true; }
    if (!threw) {
        std::cerr << "strategy: missing reward accepted\n";
        return 9;
    }

    std::cout << "test_markov_strategy: OK\n";
    return 0;
}
