#pragma once

/// @file include/zeck/sequences.hpp
/// @brief Sequence Generator: exact Fibonacci and Lucas values.
///
/// # Module: Sequence Generator
///
/// ## Responsibility
/// Produce exact F(n) and L(n) for any n ≥ 0 in two access modes:
///   - sparse random access in O(log n) big-integer steps (fast doubling)
///   - dense forward generation of 0..N, one addition per term
///
/// ## Doubling identities
///   F(2k)   = F(k) · (2F(k+1) − F(k))
///   F(2k+1) = F(k)² + F(k+1)²
///   L(2k)   = L(k)² − 2(−1)^k
///   L(2k+1) = L(k)·L(k+1) − (−1)^k
///
/// ## Guarantees
/// - All values are GMP integers; no floating-point derivation anywhere
/// - Negative indices yield `std::nullopt`
/// - `SequenceTable` is immutable after construction and safe to share by
///   const reference across threads
///
/// ## NOT Responsible For
/// - Decomposition (see zeck/decomposition.hpp)

#include "zeck/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace zeck::sequences {

// ─── Sparse Access ────────────────────────────────────────────────────────────

/// Two consecutive terms (value(n), value(n+1)).
struct TermPair {
    BigInt value;
    BigInt next;
};

/// Exact F(n). `nullopt` for n < 0.
[[nodiscard]] std::optional<BigInt> fibonacci(std::int64_t n) noexcept;

/// Exact L(n). `nullopt` for n < 0.
[[nodiscard]] std::optional<BigInt> lucas(std::int64_t n) noexcept;

/// (F(n), F(n+1)) by fast doubling. `nullopt` for n < 0.
[[nodiscard]] std::optional<TermPair> fibonacci_pair(std::int64_t n) noexcept;

/// (L(n), L(n+1)) by fast doubling. `nullopt` for n < 0.
[[nodiscard]] std::optional<TermPair> lucas_pair(std::int64_t n) noexcept;

/// Dispatch on `kind`.
[[nodiscard]] std::optional<BigInt> term(SequenceKind kind, std::int64_t n) noexcept;

// ─── Dense Generation ─────────────────────────────────────────────────────────

/// F(0..n) inclusive. `nullopt` for n < 0.
[[nodiscard]] std::optional<std::vector<BigInt>>
fibonacci_sequence(std::int64_t n) noexcept;

/// L(0..n) inclusive. `nullopt` for n < 0.
[[nodiscard]] std::optional<std::vector<BigInt>>
lucas_sequence(std::int64_t n) noexcept;

// ─── SequenceTable ────────────────────────────────────────────────────────────

/// Immutable dense lookup table of one sequence, sized once per batch.
///
/// Decomposers and the cumulative engine receive a table by const reference
/// instead of consulting any shared cache. A table built with
/// `up_to_value(kind, limit)` covers every residual ≤ limit: its last term
/// is the first term (at index ≥ 2) that exceeds `limit`.
class SequenceTable {
public:
    /// Terms 0..count-1. `nullopt` when count < 3.
    [[nodiscard]] static std::optional<SequenceTable>
    first(SequenceKind kind, std::size_t count) noexcept;

    /// Every term needed to decompose values up to `limit`.
    /// `nullopt` when `limit` is negative.
    [[nodiscard]] static std::optional<SequenceTable>
    up_to_value(SequenceKind kind, const BigInt& limit) noexcept;

    [[nodiscard]] SequenceKind kind() const noexcept { return kind_; }
    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }

    /// Term at `i`. Precondition: i < size().
    [[nodiscard]] const BigInt& operator[](Index i) const noexcept { return values_[i]; }

    /// Term at `i`, or `nullopt` when out of range.
    [[nodiscard]] std::optional<BigInt> at(Index i) const noexcept;

    [[nodiscard]] std::span<const BigInt> values() const noexcept { return values_; }

    /// True when every value ≤ v can be decomposed against this table.
    [[nodiscard]] bool covers(const BigInt& v) const noexcept;

    /// Largest index i ≥ min_index with value(i) ≤ v, searching only the
    /// strictly increasing tail [min_index, size). `nullopt` when none.
    ///
    /// Fibonacci is strictly increasing from index 2, Lucas from index 1.
    [[nodiscard]] std::optional<Index>
    largest_index_at_most(const BigInt& v, Index min_index) const noexcept;

    /// Smallest index whose term equals v, or `nullopt`.
    [[nodiscard]] std::optional<Index> index_of(const BigInt& v) const noexcept;

private:
    SequenceTable(SequenceKind kind, std::vector<BigInt> values) noexcept;

    SequenceKind        kind_;
    std::vector<BigInt> values_;
};

// ─── Membership ───────────────────────────────────────────────────────────────

/// v is some F(n). Uses the 5v² ± 4 perfect-square test.
[[nodiscard]] bool is_fibonacci_number(const BigInt& v) noexcept;

/// v is some L(n). Uses the (v² ∓ 4)/5 perfect-square test.
[[nodiscard]] bool is_lucas_number(const BigInt& v) noexcept;

/// Smallest n with F(n) = v (so 1 ↦ 1), or `nullopt`.
[[nodiscard]] std::optional<Index> fibonacci_index_of(const BigInt& v) noexcept;

/// The n with L(n) = v (2 ↦ 0, 1 ↦ 1), or `nullopt`.
[[nodiscard]] std::optional<Index> lucas_index_of(const BigInt& v) noexcept;

// ─── Identities ───────────────────────────────────────────────────────────────

/// Outcome of one classical identity evaluated exactly at a given n.
struct IdentityCheck {
    std::string name;   ///< e.g. "cassini"
    bool        holds;  ///< true when both sides agree exactly
};

/// Evaluate Cassini, L(n)=F(n−1)+F(n+1), F(2n)=F(n)L(n) and
/// L(n)²−5F(n)²=4(−1)^n at n. `nullopt` for n < 1.
[[nodiscard]] std::optional<std::vector<IdentityCheck>>
verify_identities(std::int64_t n) noexcept;

} // namespace zeck::sequences
