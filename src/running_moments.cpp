#include "running_moments.hpp"
#include <cmath>

void RunningMoments::update(double x) noexcept {
    const double n1 = static_cast<double>(n_);
    ++n_;
    const double n = static_cast<double>(n_);
    const double delta = x - mean_;
    const double delta_n = delta / n;
    const double delta_n2 = delta_n * delta_n;
    const double term1 = delta * delta_n * n1;

    mean_ += delta_n;
    // order matters: M4 uses the old M2/M3, M3 the old M2
    m4_ += term1 * delta_n2 * (n * n - 3 * n + 3) + 6 * delta_n2 * m2_ - 4 * delta_n * m3_;
    m3_ += term1 * delta_n * (n - 2) - 3 * delta_n * m2_;
    m2_ += term1;
}

double RunningMoments::mean() const noexcept {
    return n_ ? mean_ : 0.0;
}

double RunningMoments::variance() const noexcept {
    return n_ > 1 ? m2_ / static_cast<double>(n_ - 1) : 0.0;
}

double RunningMoments::skewness() const noexcept {
    if (n_ < 3 || m2_ <= 0.0) return 0.0;
    return std::sqrt(static_cast<double>(n_)) * m3_ / std::pow(m2_, 1.5);
}

double RunningMoments::kurtosis() const noexcept {
    if (n_ < 4 || m2_ <= 0.0) return 0.0;
    return static_cast<double>(n_) * m4_ / (m2_ * m2_) - 3.0;
}
