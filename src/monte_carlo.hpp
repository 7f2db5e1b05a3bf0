#pragma once
#include <random>
#include <mutex>
#include <cstdint>
#include <cstddef>

// MonteCarloSimulator: probability that an action succeeds given speed (m/s),
// accuracy (0-100) and stamina (0-100).
//
// base = (speed/30)*0.4 + (accuracy/100)*0.4 + (stamina/100)*0.2; each trial
// perturbs base with N(0, 0.1), clamps to [0,1] and draws success with that
// probability. Results depend on the engine seed; equal seeds replay equal
// call sequences.
class MonteCarloSimulator {
public:
    // throws std::invalid_argument if default_trials == 0
    explicit MonteCarloSimulator(size_t default_trials = 1000, uint64_t seed = 42);

    // trials == 0 uses the default; safe to call from several threads
    double simulate(double speed, double accuracy, double stamina, size_t trials = 0);

    static double base_probability(double speed, double accuracy, double stamina);

    size_t default_trials() const { return default_trials_; }

private:
    size_t default_trials_;
    std::mt19937_64 rng_;
    std::mutex rng_mu_;
};
