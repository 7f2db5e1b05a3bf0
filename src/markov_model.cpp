#include "markov_model.hpp"
#include <cmath>
#include <algorithm>
#include <stdexcept>

static const double POSITIVE_EPS = 1e-12;
static const size_t APERIODICITY_MAX_POWER = 10;

std::vector<double> step_distribution(const std::vector<double> &v, const Matrix &P) {
    const size_t n = v.size();
    std::vector<double> out(n, 0.0);
    for (size_t i = 0; i < n; i++) {
        if (v[i] == 0.0) continue;
        for (size_t j = 0; j < n; j++) out[j] += v[i] * P[i][j];
    }
    return out;
}

PowerIteration power_iterate(const Matrix &P, double tol, size_t max_iter) {
    PowerIteration r;
    const size_t n = P.size();
    if (n == 0) return r;
    r.vector.assign(n, 1.0 / static_cast<double>(n));
    for (size_t it = 0; it < max_iter; it++) {
        std::vector<double> next = step_distribution(r.vector, P);
        double l1 = 0.0;
        for (size_t i = 0; i < n; i++) l1 += std::fabs(next[i] - r.vector[i]);
        r.vector.swap(next);
        r.iterations = it + 1;
        if (l1 < tol) {
            r.converged = true;
            break;
        }
    }
    return r;
}

MarkovModel::MarkovModel(std::vector<std::string> states, double smoothing)
    : states_(std::move(states)), smoothing_(smoothing)
{
    if (states_.empty())
        throw std::invalid_argument("MarkovModel: state list must not be empty");
    if (!(smoothing_ > 0.0))
        throw std::invalid_argument("MarkovModel: smoothing must be > 0");
    for (size_t i = 0; i < states_.size(); i++) {
        if (!idx_.emplace(states_[i], i).second)
            throw std::invalid_argument("MarkovModel: duplicate state '" + states_[i] + "'");
    }
    counts_.assign(states_.size(), std::vector<double>(states_.size(), 0.0));
}

std::optional<size_t> MarkovModel::index_of(const std::string &state) const {
    auto it = idx_.find(state);
    if (it == idx_.end()) return std::nullopt;
    return it->second;
}

void MarkovModel::observe_transition(const std::string &from, const std::string &to, double weight) {
    if (!(weight > 0.0) || !std::isfinite(weight)) return;
    auto i = index_of(from);
    auto j = index_of(to);
    if (!i || !j) return;
    // writer path: take the cache lock so readers never see a half-updated row
    std::lock_guard<std::mutex> lk(cache_mu_);
    counts_[*i][*j] += weight;
    cached_p_.reset();
}

std::shared_ptr<const Matrix> MarkovModel::matrix_snapshot() const {
    std::lock_guard<std::mutex> lk(cache_mu_);
    if (cached_p_) return cached_p_;

    const size_t n = states_.size();
    auto P = std::make_shared<Matrix>(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; i++) {
        double row_sum = 0.0;
        for (size_t j = 0; j < n; j++) {
            (*P)[i][j] = counts_[i][j] + smoothing_;
            row_sum += (*P)[i][j];
        }
        for (size_t j = 0; j < n; j++) (*P)[i][j] /= row_sum;
    }
    cached_p_ = P;
    return cached_p_;
}

Matrix MarkovModel::transition_matrix() const {
    return *matrix_snapshot();
}

std::optional<double> MarkovModel::transition_probability(const std::string &from, const std::string &to) const {
    auto i = index_of(from);
    auto j = index_of(to);
    if (!i || !j) return std::nullopt;
    return (*matrix_snapshot())[*i][*j];
}

StateDistribution MarkovModel::label(const std::vector<double> &v) const {
    StateDistribution out;
    out.reserve(states_.size());
    for (size_t i = 0; i < states_.size(); i++) out.emplace_back(states_[i], v[i]);
    return out;
}

std::optional<StateDistribution> MarkovModel::predict_distribution(const std::string &state, size_t steps) const {
    auto start = index_of(state);
    if (!start) return std::nullopt;
    auto P = matrix_snapshot();
    std::vector<double> v(states_.size(), 0.0);
    v[*start] = 1.0;
    for (size_t s = 0; s < steps; s++) v = step_distribution(v, *P);
    return label(v);
}

MarkovModel::Stationary MarkovModel::stationary_distribution(double tol, size_t max_iter) const {
    auto P = matrix_snapshot();
    PowerIteration r = power_iterate(*P, tol, max_iter);
    Stationary out;
    out.distribution = label(r.vector);
    out.iterations = r.iterations;
    out.converged = r.converged;
    return out;
}

bool MarkovModel::is_aperiodic() const {
    auto P = matrix_snapshot();
    const size_t n = states_.size();
    for (size_t i = 0; i < n; i++) {
        if ((*P)[i][i] > POSITIVE_EPS) return true;
    }

    std::vector<std::vector<char>> A(n, std::vector<char>(n, 0));
    for (size_t i = 0; i < n; i++)
        for (size_t j = 0; j < n; j++) A[i][j] = (*P)[i][j] > POSITIVE_EPS;

    auto M = A;
    for (size_t power = 1; power <= APERIODICITY_MAX_POWER; power++) {
        bool all_diag = true;
        for (size_t i = 0; i < n && all_diag; i++) all_diag = M[i][i] != 0;
        if (all_diag) return true;

        // boolean product M = M * A
        std::vector<std::vector<char>> next(n, std::vector<char>(n, 0));
        for (size_t i = 0; i < n; i++)
            for (size_t k = 0; k < n; k++) {
                if (!M[i][k]) continue;
                for (size_t j = 0; j < n; j++)
                    if (A[k][j]) next[i][j] = 1;
            }
        M.swap(next);
    }
    return false;
}

bool MarkovModel::is_irreducible() const {
    const size_t n = states_.size();
    std::vector<char> visited(n, 0);
    std::vector<size_t> stack{0};
    visited[0] = 1;
    size_t reached = 0;

    std::lock_guard<std::mutex> lk(cache_mu_); // counts_ are read directly
    while (!stack.empty()) {
        size_t u = stack.back();
        stack.pop_back();
        ++reached;
        for (size_t v = 0; v < n; v++) {
            if (counts_[u][v] > 0.0 && !visited[v]) {
                visited[v] = 1;
                stack.push_back(v);
            }
        }
    }
    return reached == n;
}

size_t MarkovModel::mixing_time_approx(double tol, size_t max_steps) const {
    auto P = matrix_snapshot();
    const std::vector<double> pi = power_iterate(*P, 1e-9, 10000).vector;
    const size_t n = states_.size();

    size_t worst = 0;
    for (size_t s = 0; s < n; s++) {
        std::vector<double> v(n, 0.0);
        v[s] = 1.0;
        size_t mixed_at = max_steps;
        for (size_t t = 1; t <= max_steps; t++) {
            v = step_distribution(v, *P);
            double tvd = 0.0;
            for (size_t i = 0; i < n; i++) tvd += std::fabs(v[i] - pi[i]);
            tvd *= 0.5;
            if (tvd < tol) {
                mixed_at = t;
                break;
            }
        }
        worst = std::max(worst, mixed_at);
    }
    return worst;
}
