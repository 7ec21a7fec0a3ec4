/// @file src/decomposition/lucas.cpp
/// @brief Lucas decomposer: largest Lucas value ≤ residual, no repeats.

#include "zeck/decomposition.hpp"
#include "greedy_walk.hpp"

namespace zeck::decomposition {

// ─── decompose_lucas ──────────────────────────────────────────────────────────

std::optional<Representation>
decompose_lucas(const BigInt& n,
                const sequences::SequenceTable& luc) noexcept {
    if (n < 0) return std::nullopt;
    if (luc.kind() != SequenceKind::Lucas || !luc.covers(n)) {
        return std::nullopt;
    }

    Representation rep{n, SequenceKind::Lucas, {}, {}};
    const bool complete = detail::lucas_walk(
        n, luc, [&rep](Index i, const BigInt& v) {
            rep.indices.push_back(i);
            rep.values.push_back(v);
        });

    if (!complete || !is_valid(rep, luc)) return std::nullopt;
    return rep;
}

std::optional<Representation> decompose_lucas(const BigInt& n) noexcept {
    auto luc = sequences::SequenceTable::up_to_value(SequenceKind::Lucas, n);
    if (!luc) return std::nullopt;
    return decompose_lucas(n, *luc);
}

std::optional<Representation> decompose_lucas(std::int64_t n) noexcept {
    if (n < 0) return std::nullopt;
    return decompose_lucas(BigInt{static_cast<long>(n)});
}

// ─── lucas_count ──────────────────────────────────────────────────────────────

std::optional<std::size_t>
lucas_count(const BigInt& n,
            const sequences::SequenceTable& luc) noexcept {
    if (n < 0) return std::nullopt;
    if (luc.kind() != SequenceKind::Lucas || !luc.covers(n)) {
        return std::nullopt;
    }

    std::size_t count = 0;
    const bool complete = detail::lucas_walk(
        n, luc, [&count](Index, const BigInt&) { ++count; });
    if (!complete) return std::nullopt;
    return count;
}

} // namespace zeck::decomposition
