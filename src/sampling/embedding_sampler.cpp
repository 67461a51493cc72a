/// @file src/sampling/embedding_sampler.cpp
/// @brief Deterministic stride sampler for embedding sets.

#include "chit/sampler.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace chit::sampling {

namespace {

struct DimensionTally {
    std::size_t count = 0;
    std::size_t first_row = 0;
};

/// Most common dimension; ties go to the one whose first row comes earliest.
/// 0 when there are no rows.
std::size_t majority_dimension(const std::map<std::size_t, DimensionTally>& tallies) {
    std::size_t best_dim = 0;
    const DimensionTally* best = nullptr;
    for (const auto& [dim, tally] : tallies) {
        if (!best || tally.count > best->count ||
            (tally.count == best->count && tally.first_row < best->first_row)) {
            best_dim = dim;
            best = &tally;
        }
    }
    return best_dim;
}

} // anonymous namespace

// ─── SamplerLimits ────────────────────────────────────────────────────────────

std::size_t SamplerLimits::cap_for(AnalysisMode mode) const noexcept {
    const std::size_t cap = (mode == AnalysisMode::Exact)
        ? std::min(exact_sample_cap, sample_cap)
        : sample_cap;
    // A cap below the minimum would make every request Indeterminate.
    return std::max(cap, constants::MIN_SAMPLE_SIZE);
}

// ─── Sample ───────────────────────────────────────────────────────────────────

bool Sample::sufficient() const noexcept {
    return points.size() >= constants::MIN_SAMPLE_SIZE;
}

// ─── EmbeddingSampler ─────────────────────────────────────────────────────────

EmbeddingSampler::EmbeddingSampler(SamplerLimits limits) noexcept
    : limits_(limits) {}

bool EmbeddingSampler::is_finite_row(const RawVector& row) noexcept {
    return std::all_of(row.begin(), row.end(),
                       [](double v) { return std::isfinite(v); });
}

std::vector<std::size_t>
EmbeddingSampler::stride_indices(std::size_t n, std::size_t cap) {
    std::vector<std::size_t> idx;
    if (n <= cap) {
        idx.resize(n);
        for (std::size_t i = 0; i < n; ++i) idx[i] = i;
        return idx;
    }
    idx.reserve(cap);
    for (std::size_t i = 0; i < cap; ++i) {
        // ⌊i·n/cap⌋ is strictly increasing because n > cap.
        idx.push_back(i * n / cap);
    }
    return idx;
}

Sample EmbeddingSampler::sample(const std::vector<RawVector>& vectors,
                                AnalysisMode mode) const {
    Sample out;
    out.source_count = vectors.size();

    // ── Step 1: validation pass ───────────────────────────────────────────────
    std::vector<std::size_t> finite;
    finite.reserve(vectors.size());
    std::map<std::size_t, DimensionTally> tallies;

    for (std::size_t i = 0; i < vectors.size(); ++i) {
        const RawVector& row = vectors[i];
        if (row.empty() || !is_finite_row(row)) {
            ++out.dropped_count;
            continue;
        }
        ++tallies.try_emplace(row.size(), DimensionTally{0, i}).first->second.count;
        finite.push_back(i);
    }

    const std::size_t dim = majority_dimension(tallies);
    std::vector<std::size_t> usable;
    usable.reserve(finite.size());
    for (std::size_t i : finite) {
        if (vectors[i].size() == dim) {
            usable.push_back(i);
        } else {
            ++out.dropped_count;
        }
    }
    out.usable_count = usable.size();

    // ── Step 2: stride selection ──────────────────────────────────────────────
    const auto picks = stride_indices(usable.size(), limits_.cap_for(mode));
    out.points.reserve(picks.size());
    for (std::size_t p : picks) {
        const RawVector& row = vectors[usable[p]];
        out.points.emplace_back(
            Eigen::Map<const Eigen::VectorXd>(row.data(),
                                              static_cast<Eigen::Index>(row.size())));
    }

    return out;
}

} // namespace chit::sampling
