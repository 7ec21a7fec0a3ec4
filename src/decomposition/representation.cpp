/// @file src/decomposition/representation.cpp
/// @brief Representation checks, formatting and Zeckendorf binary words.

#include "zeck/decomposition.hpp"
#include "zeck/constants.hpp"

#include <fmt/format.h>

namespace zeck::decomposition {

// ─── Representation::sum ──────────────────────────────────────────────────────

BigInt Representation::sum() const {
    BigInt total = 0;
    for (const auto& v : values) total += v;
    return total;
}

// ─── is_valid ─────────────────────────────────────────────────────────────────

bool is_valid(const Representation& rep,
              const sequences::SequenceTable& table) noexcept {
    if (rep.n < 0) return false;
    if (rep.indices.size() != rep.values.size()) return false;
    if (rep.indices.empty()) return rep.n == 0;
    if (table.kind() != rep.basis) return false;

    BigInt total = 0;
    for (std::size_t k = 0; k < rep.indices.size(); ++k) {
        const Index idx = rep.indices[k];
        if (idx >= table.size() || table[idx] != rep.values[k]) return false;
        if (k > 0) {
            const Index prev = rep.indices[k - 1];
            // Strictly decreasing and never adjacent.
            if (idx >= prev || prev - idx < 2) return false;
        }
        total += rep.values[k];
    }
    if (total != rep.n) return false;

    if (rep.basis == SequenceKind::Fibonacci) {
        return rep.indices.back() >= constants::ZECKENDORF_MIN_INDEX;
    }

    bool has_l0 = false;
    bool has_l2 = false;
    for (const Index idx : rep.indices) {
        has_l0 = has_l0 || idx == 0;
        has_l2 = has_l2 || idx == 2;
    }
    return !(has_l0 && has_l2);
}

bool is_valid(const Representation& rep) noexcept {
    if (rep.n < 0) return false;
    if (rep.indices.empty() && rep.values.empty()) return rep.n == 0;
    auto table = sequences::SequenceTable::up_to_value(rep.basis, rep.n);
    if (!table) return false;
    return is_valid(rep, *table);
}

// ─── to_string ────────────────────────────────────────────────────────────────

std::string to_string(const Representation& rep) {
    if (rep.indices.empty()) {
        return fmt::format("{} = 0", rep.n.get_str());
    }

    const char* sym = symbol(rep.basis);
    std::string terms;
    std::string values;
    for (std::size_t k = 0; k < rep.indices.size(); ++k) {
        if (k > 0) {
            terms  += " + ";
            values += " + ";
        }
        terms  += fmt::format("{}({})", sym, rep.indices[k]);
        values += rep.values[k].get_str();
    }
    return fmt::format("{} = {} = {}", rep.n.get_str(), terms, values);
}

// ─── Zeckendorf binary words ──────────────────────────────────────────────────

std::optional<std::string> to_zeckendorf_binary(const Representation& rep) {
    if (rep.basis != SequenceKind::Fibonacci) return std::nullopt;
    if (rep.indices.empty()) return std::string{"0"};

    const Index top = rep.indices.front();
    std::string bits(top - 1, '0');
    for (const Index idx : rep.indices) {
        bits[top - idx] = '1';
    }
    return bits;
}

std::optional<BigInt> from_zeckendorf_binary(std::string_view bits) noexcept {
    if (bits.empty()) return std::nullopt;

    for (std::size_t p = 0; p < bits.size(); ++p) {
        if (bits[p] != '0' && bits[p] != '1') return std::nullopt;
        if (p > 0 && bits[p] == '1' && bits[p - 1] == '1') return std::nullopt;
    }

    auto fib = sequences::SequenceTable::first(SequenceKind::Fibonacci,
                                               bits.size() + 2);
    if (!fib) return std::nullopt;

    BigInt value = 0;
    const std::size_t len = bits.size();
    for (std::size_t p = 0; p < len; ++p) {
        if (bits[p] == '1') value += (*fib)[len - p + 1];
    }
    return value;
}

} // namespace zeck::decomposition
