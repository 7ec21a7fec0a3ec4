/**
 * @file  fuzz_binary_word.cpp
 * @brief libFuzzer target for the Zeckendorf binary word parser.
 *
 * Build:
 *   cmake -DZECK_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_binary_word
 *
 * Run for 60 seconds:
 *   ./fuzz_binary_word -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Empty input, any byte other than '0'/'1', or "11" anywhere → nullopt.
 *   3. An accepted word decodes to n ≥ 0 whose Zeckendorf word equals the
 *      input with leading zeros stripped ("0" for n = 0).
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "zeck/decomposition.hpp"

using namespace zeck;
using namespace zeck::decomposition;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto value = from_zeckendorf_binary(input);

    // Invariant 2
    const bool well_formed = !input.empty() &&
                             input.find_first_not_of("01") == std::string_view::npos &&
                             input.find("11") == std::string_view::npos;
    assert(value.has_value() == well_formed);
    if (!value) return 0;

    // Invariant 3
    assert(*value >= 0);
    const auto rep = decompose_zeckendorf(*value);
    assert(rep.has_value());
    const auto word = to_zeckendorf_binary(*rep);
    assert(word.has_value());

    const auto first_one = input.find('1');
    const std::string expected = first_one == std::string_view::npos
        ? std::string{"0"}
        : std::string{input.substr(first_one)};
    assert(*word == expected);

    (void)word;
    return 0;
}
