// ============================================================================
// Stats: Online Mean/Variance (Welford) for Monte Carlo Cost Rates
// File: online_stats.hpp
// ============================================================================
//
// Single-pass count/mean/variance/min/max. Samples must be pushed in a fixed
// order for bit-identical results; the evaluator pushes trial 0..n-1 after the
// parallel phase.
//
// ============================================================================

#pragma once

#include <cmath>
#include <cstdint>
#include <limits>

namespace maintopt::stats {

struct OnlineStats final {
    std::uint64_t n = 0;
    double mean = 0.0;
    double M2 = 0.0; // sum of squares of differences from the current mean
    double min_v = std::numeric_limits<double>::infinity();
    double max_v = -std::numeric_limits<double>::infinity();

    void reset() noexcept {
        n = 0;
        mean = 0.0;
        M2 = 0.0;
        min_v = std::numeric_limits<double>::infinity();
        max_v = -std::numeric_limits<double>::infinity();
    }

    void push(double x) noexcept {
        if (!std::isfinite(x)) return;

        ++n;
        if (x < min_v) min_v = x;
        if (x > max_v) max_v = x;

        const double delta = x - mean;
        mean += delta / static_cast<double>(n);
        const double delta2 = x - mean;
        M2 += delta * delta2;
        if (M2 < 0.0) M2 = 0.0;
    }

    std::uint64_t count() const noexcept { return n; }

    double variance_sample() const noexcept {
        if (n < 2) return 0.0;
        return M2 / static_cast<double>(n - 1);
    }

    double stddev_sample() const noexcept { return std::sqrt(variance_sample()); }

    // Standard error of the mean.
    double std_error() const noexcept {
        if (n == 0) return 0.0;
        return stddev_sample() / std::sqrt(static_cast<double>(n));
    }

    // Normal-approximation 95% half-width.
    double ci95_half_width() const noexcept { return 1.959963984540054 * std_error(); }

    double min() const noexcept { return n == 0 ? 0.0 : min_v; }
    double max() const noexcept { return n == 0 ? 0.0 : max_v; }
};

} // namespace maintopt::stats
