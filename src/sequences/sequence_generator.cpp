/// @file src/sequences/sequence_generator.cpp
/// @brief Fast-doubling and dense generation of Fibonacci / Lucas terms.

#include "zeck/sequences.hpp"
#include "zeck/constants.hpp"

#include <bit>
#include <cstdint>
#include <limits>

namespace zeck::sequences {

namespace {

/// Number of significant bits in n (0 for n == 0).
int bit_length(std::uint64_t n) noexcept {
    return 64 - std::countl_zero(n);
}

/// Dense forward generation of value(0..n) from the two base cases.
std::vector<BigInt> generate_dense(std::int64_t b0, std::int64_t b1,
                                   std::int64_t n) {
    std::vector<BigInt> out;
    out.reserve(static_cast<std::size_t>(n) + 1);
    out.emplace_back(static_cast<long>(b0));
    if (n >= 1) out.emplace_back(static_cast<long>(b1));
    for (std::int64_t k = 2; k <= n; ++k) {
        const auto i = static_cast<std::size_t>(k);
        out.emplace_back(out[i - 1] + out[i - 2]);
    }
    return out;
}

} // anonymous namespace

// ─── fibonacci_pair ───────────────────────────────────────────────────────────

std::optional<TermPair> fibonacci_pair(std::int64_t n) noexcept {
    if (n < 0) return std::nullopt;

    // Invariant: (a, b) = (F(k), F(k+1)) for the prefix k of n's bits.
    BigInt a = constants::FIB_0;
    BigInt b = constants::FIB_1;
    const auto bits = static_cast<std::uint64_t>(n);

    for (int i = bit_length(bits) - 1; i >= 0; --i) {
        BigInt c = a * (2 * b - a);   // F(2k)
        BigInt d = a * a + b * b;     // F(2k+1)
        if ((bits >> i) & 1u) {
            a = d;
            b = c + d;
        } else {
            a = std::move(c);
            b = std::move(d);
        }
    }
    return TermPair{std::move(a), std::move(b)};
}

// ─── lucas_pair ───────────────────────────────────────────────────────────────

std::optional<TermPair> lucas_pair(std::int64_t n) noexcept {
    if (n < 0) return std::nullopt;

    // Invariant: (a, b) = (L(k), L(k+1)); `odd` tracks the parity of k.
    BigInt a = constants::LUCAS_0;
    BigInt b = constants::LUCAS_1;
    bool odd = false;
    const auto bits = static_cast<std::uint64_t>(n);

    for (int i = bit_length(bits) - 1; i >= 0; --i) {
        const long s = odd ? -1 : 1;     // (−1)^k
        BigInt l2k  = a * a - 2 * s;     // L(2k)
        BigInt l2k1 = a * b - s;         // L(2k+1)
        if ((bits >> i) & 1u) {
            BigInt l2k2 = b * b + 2 * s; // L(2k+2)
            a = std::move(l2k1);
            b = std::move(l2k2);
            odd = true;
        } else {
            a = std::move(l2k);
            b = std::move(l2k1);
            odd = false;
        }
    }
    return TermPair{std::move(a), std::move(b)};
}

// ─── fibonacci / lucas / term ─────────────────────────────────────────────────

std::optional<BigInt> fibonacci(std::int64_t n) noexcept {
    auto p = fibonacci_pair(n);
    if (!p) return std::nullopt;
    return std::move(p->value);
}

std::optional<BigInt> lucas(std::int64_t n) noexcept {
    auto p = lucas_pair(n);
    if (!p) return std::nullopt;
    return std::move(p->value);
}

std::optional<BigInt> term(SequenceKind kind, std::int64_t n) noexcept {
    return kind == SequenceKind::Fibonacci ? fibonacci(n) : lucas(n);
}

// ─── Dense generation ─────────────────────────────────────────────────────────

std::optional<std::vector<BigInt>> fibonacci_sequence(std::int64_t n) noexcept {
    if (n < 0) return std::nullopt;
    return generate_dense(constants::FIB_0, constants::FIB_1, n);
}

std::optional<std::vector<BigInt>> lucas_sequence(std::int64_t n) noexcept {
    if (n < 0) return std::nullopt;
    return generate_dense(constants::LUCAS_0, constants::LUCAS_1, n);
}

// ─── Membership ───────────────────────────────────────────────────────────────

bool is_fibonacci_number(const BigInt& v) noexcept {
    if (v < 0) return false;
    const BigInt five_sq = 5 * v * v;
    const BigInt plus  = five_sq + 4;
    const BigInt minus = five_sq - 4;
    if (mpz_perfect_square_p(plus.get_mpz_t()) != 0) return true;
    return minus >= 0 && mpz_perfect_square_p(minus.get_mpz_t()) != 0;
}

bool is_lucas_number(const BigInt& v) noexcept {
    // L(n)² − 5F(n)² = ±4, so v is Lucas iff (v² ∓ 4)/5 is a square.
    if (v <= 0) return false;
    const BigInt sq = v * v;
    for (const long shift : {-4L, 4L}) {
        const BigInt num = sq + shift;
        if (num < 0) continue;
        if (mpz_divisible_ui_p(num.get_mpz_t(), 5) == 0) continue;
        const BigInt f_sq = num / 5;
        if (mpz_perfect_square_p(f_sq.get_mpz_t()) != 0) return true;
    }
    return false;
}

std::optional<Index> fibonacci_index_of(const BigInt& v) noexcept {
    if (!is_fibonacci_number(v)) return std::nullopt;
    auto table = SequenceTable::up_to_value(SequenceKind::Fibonacci, v);
    if (!table) return std::nullopt;
    return table->index_of(v);
}

std::optional<Index> lucas_index_of(const BigInt& v) noexcept {
    if (!is_lucas_number(v)) return std::nullopt;
    auto table = SequenceTable::up_to_value(SequenceKind::Lucas, v);
    if (!table) return std::nullopt;
    return table->index_of(v);
}

// ─── verify_identities ────────────────────────────────────────────────────────

std::optional<std::vector<IdentityCheck>>
verify_identities(std::int64_t n) noexcept {
    // F(2n) needs 2n to fit in 64 bits.
    if (n < 1 || n > std::numeric_limits<std::int64_t>::max() / 2) return std::nullopt;

    auto fp = fibonacci_pair(n - 1);   // F(n−1), F(n)
    auto fn1 = fibonacci(n + 1);
    auto ln = lucas(n);
    auto f2n = fibonacci(2 * n);
    if (!fp || !fn1 || !ln || !f2n) return std::nullopt;

    const BigInt& f_prev = fp->value;
    const BigInt& f_n    = fp->next;
    const long sign = (n % 2 == 0) ? 1 : -1;   // (−1)^n

    std::vector<IdentityCheck> out;
    out.reserve(4);
    out.push_back({"cassini", f_prev * *fn1 - f_n * f_n == sign});
    out.push_back({"lucas_from_fibonacci", *ln == f_prev + *fn1});
    out.push_back({"fibonacci_doubling", *f2n == f_n * *ln});
    out.push_back({"lucas_fibonacci_norm", *ln * *ln - 5 * f_n * f_n == 4 * sign});
    return out;
}

} // namespace zeck::sequences
