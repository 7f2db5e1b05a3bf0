#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <memory>
#include <mutex>
#include <utility>
#include <cstddef>

using Matrix = std::vector<std::vector<double>>;

// Distribution over states, in the model's configured state order.
using StateDistribution = std::vector<std::pair<std::string, double>>;

struct PowerIteration {
    std::vector<double> vector;
    size_t iterations = 0;
    bool converged = false;
};

// v * P
std::vector<double> step_distribution(const std::vector<double> &v, const Matrix &P);

// Power iteration from the uniform vector; stops once the L1 distance between
// successive iterates is below tol, else returns the last iterate after max_iter.
PowerIteration power_iterate(const Matrix &P, double tol, size_t max_iter);

// MarkovModel: discrete-state chain learned online from observed transitions.
//
// Counts are raw observation weights; the transition matrix is
// (count + smoothing) normalized per row, so every row is a proper
// distribution even for states never left. The matrix is cached and the cache
// is dropped by every observe_transition().
//
// observe_transition() is single-writer. The const queries may run
// concurrently with each other; the lazily built cache has its own lock.
class MarkovModel {
public:
    struct Stationary {
        StateDistribution distribution;
        size_t iterations = 0;
        bool converged = false;
    };

    // throws std::invalid_argument on an empty or duplicated state list, or smoothing <= 0
    explicit MarkovModel(std::vector<std::string> states, double smoothing = 1e-3);

    // Unknown labels are ignored, as are weights that are not finite and
    // positive; counts never go negative.
    void observe_transition(const std::string &from, const std::string &to, double weight = 1.0);

    Matrix transition_matrix() const;
    std::optional<double> transition_probability(const std::string &from, const std::string &to) const;

    // nullopt if `state` is not one of the configured states
    std::optional<StateDistribution> predict_distribution(const std::string &state, size_t steps = 1) const;

    Stationary stationary_distribution(double tol = 1e-9, size_t max_iter = 10000) const;

    // Heuristic: true on any self-loop, else true if some boolean power of the
    // support matrix up to 10 has a fully positive diagonal. Chains whose
    // period shows only beyond the 10th power are reported periodic, and a
    // pure 2-cycle (diagonal positive at power 2) is reported aperiodic.
    bool is_aperiodic() const;

    // Single-source check: every state reachable from states()[0] through
    // observed (unsmoothed) transitions. This is not a strong-connectivity
    // test; a chain where state 0 reaches all but not vice versa passes.
    bool is_irreducible() const;

    // Worst case over one-hot starting states of the first step at which the
    // total-variation distance to the stationary distribution is < tol;
    // max_steps when a start never gets there.
    size_t mixing_time_approx(double tol = 1e-3, size_t max_steps = 1000) const;

    const std::vector<std::string> &states() const { return states_; }
    std::optional<size_t> index_of(const std::string &state) const;
    double count(size_t from, size_t to) const { return counts_[from][to]; }
    double smoothing() const { return smoothing_; }

private:
    std::vector<std::string> states_;
    std::unordered_map<std::string, size_t> idx_;
    Matrix counts_;
    double smoothing_;

    mutable std::mutex cache_mu_;
    mutable std::shared_ptr<const Matrix> cached_p_;

    std::shared_ptr<const Matrix> matrix_snapshot() const;
    StateDistribution label(const std::vector<double> &v) const;
};
