// ============================================================================
// Stats: Deterministic Random Streams + Categorical Sampling
// File: rng.hpp
// ============================================================================
//
// Purpose:
// - SplitMix64 generator with explicit seeding (no global RNG anywhere).
// - derive_seed(): independent sub-streams per trial / individual / generation,
//   so parallel work reproduces the serial result exactly.
// - Sampler concept: "probability row in, state index out". The evaluator is
//   templated on it so tests can inject a scripted sampler.
//
// ============================================================================

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>

#include <Eigen/Dense>

namespace maintopt::stats {

// -----------------------------
// SplitMix64
// -----------------------------
struct SplitMix64 final {
    std::uint64_t s = 0;

    explicit SplitMix64(std::uint64_t seed = 0x9E3779B97F4A7C15ull) : s(seed) {}

    std::uint64_t next_u64() noexcept {
        std::uint64_t z = (s += 0x9E3779B97F4A7C15ull);
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
        return z ^ (z >> 31);
    }

    // Uniform in [0,1), 53-bit mantissa.
    double next_u01() noexcept {
        const std::uint64_t mant = next_u64() >> 11;
        return static_cast<double>(mant) * (1.0 / 9007199254740992.0);
    }

    // Uniform integer in [0, n). Rejection sampling, no modulo bias.
    std::uint64_t next_below(std::uint64_t n) noexcept {
        if (n <= 1) return 0;
        const std::uint64_t threshold = (0 - n) % n;
        for (;;) {
            const std::uint64_t r = next_u64();
            if (r >= threshold) return r % n;
        }
    }

    bool chance(double p) noexcept { return next_u01() < p; }
};

// Mix a run seed with a stream index into a fresh, decorrelated seed.
inline std::uint64_t derive_seed(std::uint64_t run_seed, std::uint64_t stream) noexcept {
    std::uint64_t z = run_seed ^ (stream * 0xD6E8FEB86659FD93ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    z ^= z >> 31;
    return z + stream;
}

// -----------------------------
// Sampler concept
// -----------------------------
// A probability row viewed in place (a row of a column-major matrix has a
// non-unit inner stride, so no copy is made).
using ProbRow = Eigen::Ref<const Eigen::RowVectorXd, 0, Eigen::InnerStride<>>;

// Signature:
//   int operator()(const ProbRow& row, SplitMix64& rng);
// Must return an index in [0, row.size()).
template <class S>
concept CategoricalSampler = requires(S& s, const ProbRow& row, SplitMix64& rng) {
    { s(row, rng) } -> std::convertible_to<int>;
};

// Inverse-CDF draw. The last positive-probability index absorbs rounding so a
// row summing to 1 - 1e-12 never falls off the end.
struct InverseCdfSampler final {
    int operator()(const ProbRow& row, SplitMix64& rng) const noexcept {
        const double u = rng.next_u01();
        double acc = 0.0;
        int last_positive = 0;
        for (Eigen::Index j = 0; j < row.size(); ++j) {
            const double p = row(j);
            if (p <= 0.0) continue;
            last_positive = static_cast<int>(j);
            acc += p;
            if (u < acc) return static_cast<int>(j);
        }
        return last_positive;
    }
};

static_assert(CategoricalSampler<InverseCdfSampler>);

} // namespace maintopt::stats
