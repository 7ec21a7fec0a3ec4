#pragma once

/// @file include/zeck/types.hpp
/// @brief Shared primitive types for the zeck Zeckendorf/Lucas toolkit.
///
/// Every module includes this file. It defines the exact-integer alias used
/// for sequence values and the small closed set of validated numeric
/// variants accepted at the API boundary.
///
/// ## Guarantees
/// - Validating constructors never coerce: a negative, non-integral or
///   non-finite input yields `std::nullopt`
/// - `BigInt` is GMP's `mpz_class`; values are exact at any magnitude

#include <gmpxx.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace zeck {

/// Exact arbitrary-precision integer used for every sequence value.
using BigInt = mpz_class;

/// Rank of a term inside the Fibonacci or Lucas sequence.
using Index = std::size_t;

// ─── Numeric Variants ─────────────────────────────────────────────────────────

/// ℕ: a non-negative integer.
class Natural {
public:
    /// Returns `nullopt` for v < 0.
    [[nodiscard]] static std::optional<Natural> make(std::int64_t v) noexcept {
        if (v < 0) return std::nullopt;
        return Natural{static_cast<std::uint64_t>(v)};
    }

    /// Accepts a double only when it is finite, integral and in [0, 2^53].
    [[nodiscard]] static std::optional<Natural> from_real(double v) noexcept {
        if (!std::isfinite(v) || v < 0.0 || v > 9007199254740992.0) {
            return std::nullopt;
        }
        if (std::floor(v) != v) return std::nullopt;
        return Natural{static_cast<std::uint64_t>(v)};
    }

    [[nodiscard]] std::uint64_t value() const noexcept { return value_; }

private:
    explicit Natural(std::uint64_t v) noexcept : value_(v) {}
    std::uint64_t value_;
};

/// ℤ: any integer representable in 64 bits.
class Integer {
public:
    [[nodiscard]] static std::optional<Integer> make(std::int64_t v) noexcept {
        return Integer{v};
    }

    /// Accepts a double only when it is finite and integral.
    [[nodiscard]] static std::optional<Integer> from_real(double v) noexcept {
        if (!std::isfinite(v) || std::floor(v) != v) return std::nullopt;
        if (std::abs(v) > 9007199254740992.0) return std::nullopt;
        return Integer{static_cast<std::int64_t>(v)};
    }

    [[nodiscard]] std::int64_t value() const noexcept { return value_; }

    /// Narrow to ℕ; `nullopt` when negative.
    [[nodiscard]] std::optional<Natural> to_natural() const noexcept {
        return Natural::make(value_);
    }

private:
    explicit Integer(std::int64_t v) noexcept : value_(v) {}
    std::int64_t value_;
};

/// ℝ: a finite double.
class Real {
public:
    [[nodiscard]] static std::optional<Real> make(double v) noexcept {
        if (!std::isfinite(v)) return std::nullopt;
        return Real{v};
    }

    [[nodiscard]] double value() const noexcept { return value_; }

private:
    explicit Real(double v) noexcept : value_(v) {}
    double value_;
};

/// ℂ: a pair of finite doubles.
class Complex {
public:
    [[nodiscard]] static std::optional<Complex> make(double re, double im) noexcept {
        auto r = Real::make(re);
        auto i = Real::make(im);
        if (!r || !i) return std::nullopt;
        return Complex{*r, *i};
    }

    [[nodiscard]] Real real() const noexcept { return re_; }
    [[nodiscard]] Real imag() const noexcept { return im_; }

private:
    Complex(Real re, Real im) noexcept : re_(re), im_(im) {}
    Real re_;
    Real im_;
};

// ─── Sequence Selector ────────────────────────────────────────────────────────

/// Basis sequence a table or a representation is built over.
enum class SequenceKind {
    Fibonacci,  ///< F(0)=0, F(1)=1
    Lucas,      ///< L(0)=2, L(1)=1
};

/// Short printable name, e.g. "F" or "L".
[[nodiscard]] constexpr const char* symbol(SequenceKind kind) noexcept {
    return kind == SequenceKind::Fibonacci ? "F" : "L";
}

} // namespace zeck
