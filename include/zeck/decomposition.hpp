#pragma once

/// @file include/zeck/decomposition.hpp
/// @brief Zeckendorf and Lucas decomposers.
///
/// # Module: Decomposition
///
/// ## Responsibility
/// Write n ≥ 0 as a sum of distinct terms of a basis sequence:
///   - Zeckendorf: Fibonacci terms F(i), i ≥ 2, no two indices adjacent.
///     Unique by Zeckendorf's theorem; z(n) = term count.
///   - Lucas: Lucas terms L(i), i ≥ 0; ℓ(n) = term count.
///
/// ## Lucas selection policy
/// Take the largest Lucas *value* not exceeding the residual, never reusing
/// an index. Values are ordered 1 = L(1) < 2 = L(0) < 3 = L(2) < 4 = L(3) …,
/// so a residual of 2 takes L(0) and a residual of 1 takes L(1). After
/// taking L(k), k ≥ 2, the residual is below L(k−1), which forces:
///   - indices strictly decreasing and pairwise non-adjacent
///   - L(0) and L(2) never both present
///   - no repeated term is ever required
/// The resulting representation has count 1 exactly when n is a Lucas
/// number.
///
/// ## Guarantees
/// - Every decomposition is checked before it is returned: values sum to n,
///   indices strictly decrease, no two indices differ by 1. A failed check
///   yields `std::nullopt`
/// - Negative n, a table of the wrong kind, or a table that does not cover
///   n yield `std::nullopt`
/// - O(log n) terms and big-integer operations per call
///
/// ## NOT Responsible For
/// - Cumulative counts over a range (see zeck/divergence.hpp)

#include "zeck/sequences.hpp"
#include "zeck/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace zeck::decomposition {

// ─── Representation ───────────────────────────────────────────────────────────

/// Decomposition of one integer against one basis sequence.
struct Representation {
    BigInt              n;        ///< The decomposed integer
    SequenceKind        basis;    ///< Sequence the indices refer to
    std::vector<Index>  indices;  ///< Strictly decreasing term indices
    std::vector<BigInt> values;   ///< values[i] = basis(indices[i])

    /// Number of terms: z(n) or ℓ(n).
    [[nodiscard]] std::size_t count() const noexcept { return indices.size(); }

    /// Σ values.
    [[nodiscard]] BigInt sum() const;
};

// ─── Zeckendorf ───────────────────────────────────────────────────────────────

/// Zeckendorf decomposition of n against a caller-owned Fibonacci table.
[[nodiscard]] std::optional<Representation>
decompose_zeckendorf(const BigInt& n,
                     const sequences::SequenceTable& fib) noexcept;

/// Zeckendorf decomposition of n; builds a local table.
[[nodiscard]] std::optional<Representation>
decompose_zeckendorf(const BigInt& n) noexcept;

[[nodiscard]] std::optional<Representation>
decompose_zeckendorf(std::int64_t n) noexcept;

/// z(n) without materialising the representation.
[[nodiscard]] std::optional<std::size_t>
zeckendorf_count(const BigInt& n,
                 const sequences::SequenceTable& fib) noexcept;

// ─── Lucas ────────────────────────────────────────────────────────────────────

/// Lucas decomposition of n against a caller-owned Lucas table.
[[nodiscard]] std::optional<Representation>
decompose_lucas(const BigInt& n,
                const sequences::SequenceTable& luc) noexcept;

/// Lucas decomposition of n; builds a local table.
[[nodiscard]] std::optional<Representation>
decompose_lucas(const BigInt& n) noexcept;

[[nodiscard]] std::optional<Representation>
decompose_lucas(std::int64_t n) noexcept;

/// ℓ(n) without materialising the representation.
[[nodiscard]] std::optional<std::size_t>
lucas_count(const BigInt& n,
            const sequences::SequenceTable& luc) noexcept;

// ─── Validation & Formatting ──────────────────────────────────────────────────

/// Re-check every invariant of a representation from scratch:
/// sizes agree, each value equals its basis term, the sum equals n, indices
/// strictly decrease and are non-adjacent, Zeckendorf indices are ≥ 2, and a
/// Lucas representation never holds both L(0) and L(2).
[[nodiscard]] bool is_valid(const Representation& rep) noexcept;

/// Same checks against a caller-owned table of the representation's basis.
/// `false` if the table has the other kind or is too short for an index.
[[nodiscard]] bool is_valid(const Representation& rep,
                            const sequences::SequenceTable& table) noexcept;

/// "100 = F(11) + F(6) + F(4) = 89 + 8 + 3"; "0 = 0" when empty.
[[nodiscard]] std::string to_string(const Representation& rep);

/// Zeckendorf binary word, most significant first; bit i ↔ F(i+2).
/// "0" for n = 0; `nullopt` for a Lucas representation.
[[nodiscard]] std::optional<std::string>
to_zeckendorf_binary(const Representation& rep);

/// Inverse of `to_zeckendorf_binary`. `nullopt` for an empty word, any
/// character other than '0'/'1', or two adjacent ones.
[[nodiscard]] std::optional<BigInt>
from_zeckendorf_binary(std::string_view bits) noexcept;

} // namespace zeck::decomposition
