#pragma once
#include <cstdint>

// Single-pass mean and central moments (Welford / Terriberry update).
// Accessors return 0 when there are too few samples for the statistic
// (mean: 1, variance: 2, skewness: 3, kurtosis: 4); check count() to tell
// "zero" from "not enough data".
class RunningMoments {
public:
    void update(double x) noexcept;

    uint64_t count() const noexcept { return n_; }
    double mean() const noexcept;
    double variance() const noexcept;   // sample variance, M2 / (n-1)
    double skewness() const noexcept;
    double kurtosis() const noexcept;   // excess kurtosis

private:
    uint64_t n_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
    double m3_ = 0.0;
    double m4_ = 0.0;
};
