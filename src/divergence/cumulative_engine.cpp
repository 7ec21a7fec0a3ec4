/// @file src/divergence/cumulative_engine.cpp
/// @brief Cumulative Divergence Engine: sequential fold and sharded pass.
///
/// The sharded pass runs in two phases:
///   1. Per shard (parallel): z(k), ℓ(k) and shard-local running sums of
///      both counts, written into the shard's own slice of V and U.
///   2. Merge (sequential): add the totals of all earlier shards to each
///      slice, then derive S and d.

#include "zeck/divergence.hpp"
#include "zeck/decomposition.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <new>

namespace zeck::divergence {

namespace {

struct ShardRange {
    std::int64_t first;
    std::int64_t last;   ///< inclusive
};

/// Split [0, N] into `shards` contiguous, near-equal ranges.
std::vector<ShardRange> split_range(std::int64_t N, std::size_t shards) {
    const std::int64_t len = N + 1;
    const auto count = static_cast<std::int64_t>(shards);
    std::vector<ShardRange> out;
    out.reserve(shards);
    std::int64_t start = 0;
    for (std::int64_t s = 0; s < count; ++s) {
        const std::int64_t width = len / count + (s < len % count ? 1 : 0);
        out.push_back({start, start + width - 1});
        start += width;
    }
    return out;
}

/// Phase 1 for one shard. Returns false if any count could not be formed.
bool fill_shard(const ShardRange& r,
                const sequences::SequenceTable& fib,
                const sequences::SequenceTable& luc,
                CumulativeProfile& p) noexcept {
    std::int64_t v_run = 0;
    std::int64_t u_run = 0;
    BigInt k_big;
    for (std::int64_t k = r.first; k <= r.last; ++k) {
        k_big = static_cast<long>(k);
        const auto zk = decomposition::zeckendorf_count(k_big, fib);
        const auto lk = decomposition::lucas_count(k_big, luc);
        if (!zk || !lk) return false;

        const auto i = static_cast<std::size_t>(k);
        p.z[i]   = static_cast<std::int64_t>(*zk);
        p.ell[i] = static_cast<std::int64_t>(*lk);
        v_run += p.z[i];
        u_run += p.ell[i];
        p.V[i] = v_run;
        p.U[i] = u_run;
    }
    return true;
}

} // anonymous namespace

// ─── CumulativeProfile ────────────────────────────────────────────────────────

bool CumulativeProfile::well_formed() const noexcept {
    if (range_end < 0) return false;
    const auto len = static_cast<std::size_t>(range_end) + 1;
    return V.size() == len && U.size() == len && S.size() == len &&
           d.size() == len && z.size() == len && ell.size() == len;
}

std::optional<ProfilePoint> CumulativeProfile::at(std::int64_t n) const noexcept {
    if (!well_formed()) return std::nullopt;
    if (n < 0 || static_cast<std::size_t>(n) >= size()) return std::nullopt;
    const auto i = static_cast<std::size_t>(n);
    return ProfilePoint{
        .n   = n,
        .V   = V[i],
        .U   = U[i],
        .S   = S[i],
        .d   = d[i],
        .z   = z[i],
        .ell = ell[i],
    };
}

// ─── cumulative_profile ───────────────────────────────────────────────────────

std::optional<CumulativeProfile>
cumulative_profile(std::int64_t N,
                   const sequences::SequenceTable& fib,
                   const sequences::SequenceTable& luc,
                   const ProfileConfig& config) noexcept {
    if (N < 0 || N > constants::MAX_RANGE_END) return std::nullopt;
    const BigInt limit{static_cast<long>(N)};
    if (fib.kind() != SequenceKind::Fibonacci || !fib.covers(limit)) return std::nullopt;
    if (luc.kind() != SequenceKind::Lucas || !luc.covers(limit)) return std::nullopt;

    const auto len = static_cast<std::size_t>(N) + 1;
    const std::size_t shards =
        std::clamp<std::size_t>(config.shards, 1,
                                std::min(constants::MAX_SHARDS, len));

    CumulativeProfile p;
    p.range_end = N;
    std::vector<ShardRange> ranges;
    std::vector<char> ok;
    try {
        p.V.assign(len, 0);
        p.U.assign(len, 0);
        p.S.assign(len, 0);
        p.d.assign(len, 0);
        p.z.assign(len, 0);
        p.ell.assign(len, 0);
        ranges = split_range(N, shards);
        ok.assign(ranges.size(), 0);
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }

    // ── Phase 1: shard-local counts and partial sums ──────────────────────
    const auto shard_count = static_cast<std::int64_t>(ranges.size());
    #pragma omp parallel for schedule(dynamic, 1) if (shard_count > 1)
    for (std::int64_t s = 0; s < shard_count; ++s) {
        const auto idx = static_cast<std::size_t>(s);
        ok[idx] = fill_shard(ranges[idx], fib, luc, p) ? 1 : 0;
    }
    if (std::find(ok.begin(), ok.end(), 0) != ok.end()) return std::nullopt;

    // ── Phase 2: prefix merge across shard boundaries ─────────────────────
    std::int64_t v_offset = 0;
    std::int64_t u_offset = 0;
    for (const auto& r : ranges) {
        for (std::int64_t k = r.first; k <= r.last; ++k) {
            const auto i = static_cast<std::size_t>(k);
            p.V[i] += v_offset;
            p.U[i] += u_offset;
            p.S[i] = p.V[i] - p.U[i];
            p.d[i] = p.z[i] - p.ell[i];
        }
        const auto last = static_cast<std::size_t>(r.last);
        v_offset = p.V[last];
        u_offset = p.U[last];
    }

    if (config.verbose) {
        fmt::print(stderr, "[profile] N={} shards={} V(N)={} U(N)={} S(N)={}\n",
                   N, ranges.size(), p.V.back(), p.U.back(), p.S.back());
    }
    return p;
}

std::optional<CumulativeProfile>
cumulative_profile(std::int64_t N, const ProfileConfig& config) noexcept {
    if (N < 0 || N > constants::MAX_RANGE_END) return std::nullopt;
    const BigInt limit{static_cast<long>(N)};
    auto fib = sequences::SequenceTable::up_to_value(SequenceKind::Fibonacci, limit);
    auto luc = sequences::SequenceTable::up_to_value(SequenceKind::Lucas, limit);
    if (!fib || !luc) return std::nullopt;
    return cumulative_profile(N, *fib, *luc, config);
}

// ─── profile_at ───────────────────────────────────────────────────────────────

std::optional<ProfilePoint> profile_at(std::int64_t n) noexcept {
    if (n < 0 || n > constants::MAX_RANGE_END) return std::nullopt;
    const BigInt limit{static_cast<long>(n)};
    auto fib = sequences::SequenceTable::up_to_value(SequenceKind::Fibonacci, limit);
    auto luc = sequences::SequenceTable::up_to_value(SequenceKind::Lucas, limit);
    if (!fib || !luc) return std::nullopt;

    ProfilePoint pt{.n = n, .V = 0, .U = 0, .S = 0, .d = 0, .z = 0, .ell = 0};
    for (std::int64_t k = 0; k <= n; ++k) {
        const BigInt kb{static_cast<long>(k)};
        const auto zk = decomposition::zeckendorf_count(kb, *fib);
        const auto lk = decomposition::lucas_count(kb, *luc);
        if (!zk || !lk) return std::nullopt;
        pt.V += static_cast<std::int64_t>(*zk);
        pt.U += static_cast<std::int64_t>(*lk);
        if (k == n) {
            pt.z   = static_cast<std::int64_t>(*zk);
            pt.ell = static_cast<std::int64_t>(*lk);
        }
    }
    pt.S = pt.V - pt.U;
    pt.d = pt.z - pt.ell;
    return pt;
}

// ─── summarize ────────────────────────────────────────────────────────────────

std::optional<DivergenceSummary>
summarize(const CumulativeProfile& profile) noexcept {
    if (profile.size() == 0 || !profile.well_formed()) return std::nullopt;

    DivergenceSummary out{
        .range_end      = profile.range_end,
        .mean_V         = 0.0,
        .mean_U         = 0.0,
        .max_V          = profile.V.back(),
        .max_U          = profile.U.back(),
        .min_S          = profile.S.front(),
        .max_S          = profile.S.front(),
        .zero_count     = 0,
        .positive_count = 0,
    };

    double v_sum = 0.0;
    double u_sum = 0.0;
    for (std::size_t i = 0; i < profile.size(); ++i) {
        v_sum += static_cast<double>(profile.V[i]);
        u_sum += static_cast<double>(profile.U[i]);
        out.min_S = std::min(out.min_S, profile.S[i]);
        out.max_S = std::max(out.max_S, profile.S[i]);
        if (profile.S[i] == 0) ++out.zero_count;
        if (profile.S[i] > 0)  ++out.positive_count;
    }
    const auto count = static_cast<double>(profile.size());
    out.mean_V = v_sum / count;
    out.mean_U = u_sum / count;
    return out;
}

} // namespace zeck::divergence
