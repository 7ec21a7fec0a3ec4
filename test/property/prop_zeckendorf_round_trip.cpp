/**
 * @file  prop_zeckendorf_round_trip.cpp
 * @brief Property: ∀ n ≥ 0, Σ decompose_zeckendorf(n).values = n, exactly.
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_zeckendorf_round_trip
 *
 * Inputs are drawn both from the 64-bit range and from a big-integer range
 * built as a random sum of Fibonacci terms, so values far past 2^64 are
 * covered.
 */

#include <rapidcheck.h>

#include "zeck/decomposition.hpp"
#include "zeck/sequences.hpp"

#include <cstdint>

using namespace zeck;
using namespace zeck::decomposition;

int main() {
    // ── Property 1: exact sum on 64-bit inputs ────────────────────────────────
    rc::check(
        "zeckendorf_round_trip: sum(values) == n for n in [0, 2^62)",
        []() {
            const auto raw = *rc::gen::inRange<std::int64_t>(0, std::int64_t{1} << 62);
            auto rep = decompose_zeckendorf(raw);
            RC_ASSERT(rep.has_value());
            RC_ASSERT(rep->sum() == BigInt{static_cast<long>(raw)});
            RC_ASSERT(is_valid(*rep));
        }
    );

    // ── Property 2: exact sum beyond 64 bits ──────────────────────────────────
    rc::check(
        "zeckendorf_round_trip: sum(values) == n for n up to F(400)",
        []() {
            const auto a = *rc::gen::inRange<std::int64_t>(2, 400);
            const auto b = *rc::gen::inRange<std::int64_t>(0, 1'000'000);
            const BigInt n = *sequences::fibonacci(a) + BigInt{static_cast<long>(b)};
            auto rep = decompose_zeckendorf(n);
            RC_ASSERT(rep.has_value());
            RC_ASSERT(rep->sum() == n);
        }
    );

    // ── Property 3: the binary word decodes back to n ─────────────────────────
    rc::check(
        "zeckendorf_round_trip: from_zeckendorf_binary(to_zeckendorf_binary(n)) == n",
        []() {
            const auto raw = *rc::gen::inRange<std::int64_t>(0, 1'000'000'000);
            auto rep = decompose_zeckendorf(raw);
            RC_ASSERT(rep.has_value());
            auto bits = to_zeckendorf_binary(*rep);
            RC_ASSERT(bits.has_value());
            auto back = from_zeckendorf_binary(*bits);
            RC_ASSERT(back.has_value());
            RC_ASSERT(*back == BigInt{static_cast<long>(raw)});
        }
    );

    return 0;
}
