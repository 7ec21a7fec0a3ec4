/// @file src/equilibrium/watcher.cpp
/// @brief EquilibriumWatcher: one index per step over shared tables.

#include "zeck/equilibrium.hpp"
#include "zeck/decomposition.hpp"

#include <fmt/format.h>

#include <new>
#include <utility>

namespace zeck::equilibrium {

EquilibriumWatcher::EquilibriumWatcher(
        WatcherState state, std::int64_t limit,
        std::shared_ptr<const sequences::SequenceTable> fib,
        std::shared_ptr<const sequences::SequenceTable> luc) noexcept
    : state_(state), limit_(limit), fib_(std::move(fib)), luc_(std::move(luc)) {}

// ─── Factories ────────────────────────────────────────────────────────────────

std::optional<EquilibriumWatcher> EquilibriumWatcher::make(std::int64_t limit) noexcept {
    return resume(WatcherState{}, limit);
}

std::optional<EquilibriumWatcher>
EquilibriumWatcher::resume(const WatcherState& state, std::int64_t limit) noexcept {
    if (limit < 0 || limit > constants::MAX_RANGE_END) return std::nullopt;
    if (state.n < 0 || state.n > limit + 1) return std::nullopt;
    if (state.V < 0 || state.U < 0) return std::nullopt;

    auto fib = sequences::SequenceTable::up_to_value(SequenceKind::Fibonacci,
                                                     BigInt{static_cast<long>(limit)});
    auto luc = sequences::SequenceTable::up_to_value(SequenceKind::Lucas,
                                                     BigInt{static_cast<long>(limit + 1)});
    if (!fib || !luc) return std::nullopt;

    try {
        return EquilibriumWatcher{
            state, limit,
            std::make_shared<const sequences::SequenceTable>(std::move(*fib)),
            std::make_shared<const sequences::SequenceTable>(std::move(*luc))};
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

// ─── step ─────────────────────────────────────────────────────────────────────

std::optional<WatchEvent> EquilibriumWatcher::step() noexcept {
    const std::int64_t n = state_.n;
    if (n > limit_) return std::nullopt;

    const BigInt k{static_cast<long>(n)};
    const auto zk = decomposition::zeckendorf_count(k, *fib_);
    const auto lk = decomposition::lucas_count(k, *luc_);
    if (!zk || !lk) return std::nullopt;

    const auto z   = static_cast<std::int64_t>(*zk);
    const auto ell = static_cast<std::int64_t>(*lk);
    const std::int64_t V = state_.V + z;
    const std::int64_t U = state_.U + ell;

    WatchEvent event{
        .n         = n,
        .S         = V - U,
        .d         = z - ell,
        .point     = std::nullopt,
        .violation = std::nullopt,
    };

    const auto boundary = luc_->index_of(BigInt{static_cast<long>(n + 1)});
    try {
        if (event.S == 0 && boundary) {
            event.point = EquilibriumPoint{n, *boundary};
        } else if (event.S == 0) {
            event.violation = Violation{
                n, ViolationKind::ZeroOffBoundary,
                fmt::format("S({}) = 0 but {} is not a Lucas number", n, n + 1)};
        } else if (boundary) {
            event.violation = Violation{
                n, ViolationKind::BoundaryNotZero,
                fmt::format("{} = L({}) but S({}) = {}", n + 1, *boundary, n, event.S)};
        }
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }

    state_ = WatcherState{.n = n + 1, .V = V, .U = U};
    return event;
}

} // namespace zeck::equilibrium
