/// @file src/sequences/sequence_table.cpp
/// @brief SequenceTable: immutable dense lookup table for one sequence.

#include "zeck/sequences.hpp"
#include "zeck/constants.hpp"

#include <algorithm>
#include <utility>

namespace zeck::sequences {

namespace {

std::pair<long, long> base_cases(SequenceKind kind) noexcept {
    if (kind == SequenceKind::Fibonacci) {
        return {constants::FIB_0, constants::FIB_1};
    }
    return {constants::LUCAS_0, constants::LUCAS_1};
}

} // anonymous namespace

SequenceTable::SequenceTable(SequenceKind kind, std::vector<BigInt> values) noexcept
    : kind_(kind), values_(std::move(values)) {}

// ─── Factories ────────────────────────────────────────────────────────────────

std::optional<SequenceTable>
SequenceTable::first(SequenceKind kind, std::size_t count) noexcept {
    if (count < 3) return std::nullopt;
    const auto [b0, b1] = base_cases(kind);

    std::vector<BigInt> values;
    values.reserve(count);
    values.emplace_back(b0);
    values.emplace_back(b1);
    while (values.size() < count) {
        const std::size_t k = values.size();
        values.emplace_back(values[k - 1] + values[k - 2]);
    }
    return SequenceTable{kind, std::move(values)};
}

std::optional<SequenceTable>
SequenceTable::up_to_value(SequenceKind kind, const BigInt& limit) noexcept {
    if (limit < 0) return std::nullopt;
    const auto [b0, b1] = base_cases(kind);

    std::vector<BigInt> values;
    // ~log_φ(limit) terms; the bit size gives a cheap upper estimate.
    const std::size_t bits = mpz_sizeinbase(limit.get_mpz_t(), 2);
    values.reserve(bits * 3 / 2 + 4);
    values.emplace_back(b0);
    values.emplace_back(b1);
    // Stop at the first term past index 1 that exceeds the limit; the
    // sequences are strictly increasing from there.
    while (values.size() < 3 || values.back() <= limit) {
        const std::size_t k = values.size();
        values.emplace_back(values[k - 1] + values[k - 2]);
    }
    return SequenceTable{kind, std::move(values)};
}

// ─── Lookups ──────────────────────────────────────────────────────────────────

std::optional<BigInt> SequenceTable::at(Index i) const noexcept {
    if (i >= values_.size()) return std::nullopt;
    return values_[i];
}

bool SequenceTable::covers(const BigInt& v) const noexcept {
    return v >= 0 && values_.size() >= 3 && values_.back() > v;
}

std::optional<Index>
SequenceTable::largest_index_at_most(const BigInt& v, Index min_index) const noexcept {
    if (min_index >= values_.size()) return std::nullopt;
    const auto first = values_.begin() + static_cast<std::ptrdiff_t>(min_index);
    const auto it = std::upper_bound(first, values_.end(), v);
    if (it == first) return std::nullopt;
    return static_cast<Index>(std::distance(values_.begin(), it) - 1);
}

std::optional<Index> SequenceTable::index_of(const BigInt& v) const noexcept {
    if (values_.empty()) return std::nullopt;
    if (values_[0] == v) return Index{0};
    // Both sequences are non-decreasing from index 1.
    const auto first = values_.begin() + 1;
    const auto it = std::lower_bound(first, values_.end(), v);
    if (it == values_.end() || *it != v) return std::nullopt;
    return static_cast<Index>(std::distance(values_.begin(), it));
}

} // namespace zeck::sequences
