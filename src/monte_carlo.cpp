#include "monte_carlo.hpp"
#include <algorithm>
#include <stdexcept>

static const double SPEED_SCALE = 30.0;
static const double NOISE_STDDEV = 0.1;

MonteCarloSimulator::MonteCarloSimulator(size_t default_trials, uint64_t seed)
    : default_trials_(default_trials), rng_(seed)
{
    if (default_trials_ == 0) throw std::invalid_argument("MonteCarloSimulator: trials must be >= 1");
}

double MonteCarloSimulator::base_probability(double speed, double accuracy, double stamina) {
    return (speed / SPEED_SCALE) * 0.4 + (accuracy / 100.0) * 0.4 + (stamina / 100.0) * 0.2;
}

double MonteCarloSimulator::simulate(double speed, double accuracy, double stamina, size_t trials) {
    if (trials == 0) trials = default_trials_;
    const double base = base_probability(speed, accuracy, stamina);

    std::normal_distribution<double> noise(0.0, NOISE_STDDEV);
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    std::lock_guard<std::mutex> lk(rng_mu_);
    size_t wins = 0;
    for (size_t t = 0; t < trials; t++) {
        double p = std::clamp(base + noise(rng_), 0.0, 1.0);
        if (coin(rng_) < p) ++wins;
    }
    return static_cast<double>(wins) / static_cast<double>(trials);
}
