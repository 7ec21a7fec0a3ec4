#pragma once
/**
 * @file  greedy_walk.hpp
 * @brief Shared greedy descent used by both decomposers (internal).
 *
 * The walk emits (index, value) for every term it takes and reports whether
 * the residual reached zero. Counting and full decomposition use the same
 * walk, so the count fast path cannot drift from the representation.
 */

#include "zeck/constants.hpp"
#include "zeck/sequences.hpp"

namespace zeck::decomposition::detail {

/// Zeckendorf descent: largest F(i) ≤ residual, then skip index i−1.
template <typename OnTerm>
bool zeckendorf_walk(const BigInt& n,
                     const sequences::SequenceTable& fib,
                     OnTerm&& on_term) {
    if (n == 0) return true;

    constexpr Index min_index = constants::ZECKENDORF_MIN_INDEX;
    auto start = fib.largest_index_at_most(n, min_index);
    if (!start) return false;

    BigInt residual = n;
    Index  i        = *start;
    while (true) {
        on_term(i, fib[i]);
        residual -= fib[i];
        if (residual == 0) return true;
        // The next admissible index is i−2; anything lower than F(2) cannot
        // absorb a positive residual.
        if (i < min_index + 2) return false;
        i -= 2;
        while (fib[i] > residual) {
            if (i == min_index) return false;
            --i;
        }
    }
}

/// Lucas descent: largest Lucas value ≤ residual, no index reused.
template <typename OnTerm>
bool lucas_walk(const BigInt& n,
                const sequences::SequenceTable& luc,
                OnTerm&& on_term) {
    BigInt residual = n;
    while (residual > 0) {
        Index i = 0;
        if (residual >= 3) {
            // Lucas values are strictly increasing from index 2 onward.
            auto found = luc.largest_index_at_most(residual, 2);
            if (!found) return false;
            i = *found;
        } else if (residual == 2) {
            i = 0;
        } else {
            i = 1;
        }
        on_term(i, luc[i]);
        residual -= luc[i];
    }
    return residual == 0;
}

} // namespace zeck::decomposition::detail
