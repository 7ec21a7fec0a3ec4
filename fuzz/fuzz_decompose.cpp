/**
 * @file  fuzz_decompose.cpp
 * @brief libFuzzer target for the Zeckendorf and Lucas decomposers.
 *
 * Build:
 *   cmake -DZECK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_decompose
 *
 * Run for 60 seconds:
 *   ./fuzz_decompose -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. For n ≥ 0 both decompositions exist, are valid, and sum to n.
 *   3. Zeckendorf indices are ≥ 2 and pairwise non-adjacent.
 *   4. The Lucas decomposition is a single term iff n is a Lucas number.
 *   5. For n < 0 both decomposers return nullopt.
 *
 * Fuzzer strategy:
 *   Up to 32 input bytes are read big-endian as the magnitude of n, so
 *   values reach far past 2^64. The first byte's low bit picks the sign.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "zeck/decomposition.hpp"
#include "zeck/sequences.hpp"

using namespace zeck;
using namespace zeck::decomposition;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;

    const bool negative = (data[0] & 1u) != 0;
    BigInt n = 0;
    const size_t limit = size < 33 ? size : 33;
    for (size_t i = 1; i < limit; ++i) {
        n <<= 8;
        n += static_cast<unsigned>(data[i]);
    }
    if (negative && n != 0) n = -n;

    const auto z = decompose_zeckendorf(n);
    const auto l = decompose_lucas(n);

    if (n < 0) {
        // Invariant 5
        assert(!z.has_value());
        assert(!l.has_value());
        return 0;
    }

    // Invariant 2
    assert(z.has_value());
    assert(l.has_value());
    assert(is_valid(*z));
    assert(is_valid(*l));
    assert(z->sum() == n);
    assert(l->sum() == n);

    // Invariant 3
    for (size_t k = 1; k < z->indices.size(); ++k) {
        assert(z->indices[k - 1] >= z->indices[k] + 2);
    }
    if (!z->indices.empty()) assert(z->indices.back() >= 2);

    // Invariant 4
    assert((l->count() == 1) == sequences::is_lucas_number(n));

    (void)z;
    (void)l;
    return 0;
}
