/// @file src/decomposition/zeckendorf.cpp
/// @brief Zeckendorf decomposer: greedy descent over Fibonacci terms.

#include "zeck/decomposition.hpp"
#include "greedy_walk.hpp"

namespace zeck::decomposition {

// ─── decompose_zeckendorf ─────────────────────────────────────────────────────

std::optional<Representation>
decompose_zeckendorf(const BigInt& n,
                     const sequences::SequenceTable& fib) noexcept {
    if (n < 0) return std::nullopt;
    if (fib.kind() != SequenceKind::Fibonacci || !fib.covers(n)) {
        return std::nullopt;
    }

    Representation rep{n, SequenceKind::Fibonacci, {}, {}};
    const bool complete = detail::zeckendorf_walk(
        n, fib, [&rep](Index i, const BigInt& v) {
            rep.indices.push_back(i);
            rep.values.push_back(v);
        });

    // Post-condition: exact sum, strictly decreasing, non-adjacent.
    if (!complete || !is_valid(rep, fib)) return std::nullopt;
    return rep;
}

std::optional<Representation> decompose_zeckendorf(const BigInt& n) noexcept {
    auto fib = sequences::SequenceTable::up_to_value(SequenceKind::Fibonacci, n);
    if (!fib) return std::nullopt;
    return decompose_zeckendorf(n, *fib);
}

std::optional<Representation> decompose_zeckendorf(std::int64_t n) noexcept {
    if (n < 0) return std::nullopt;
    return decompose_zeckendorf(BigInt{static_cast<long>(n)});
}

// ─── zeckendorf_count ─────────────────────────────────────────────────────────

std::optional<std::size_t>
zeckendorf_count(const BigInt& n,
                 const sequences::SequenceTable& fib) noexcept {
    if (n < 0) return std::nullopt;
    if (fib.kind() != SequenceKind::Fibonacci || !fib.covers(n)) {
        return std::nullopt;
    }

    std::size_t count = 0;
    const bool complete = detail::zeckendorf_walk(
        n, fib, [&count](Index, const BigInt&) { ++count; });
    if (!complete) return std::nullopt;
    return count;
}

} // namespace zeck::decomposition
