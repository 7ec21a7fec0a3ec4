/// @file src/main.cpp
/// @brief zeck CLI entry point.
///
/// Usage:
///   zeck --fib <n>            F(n) and the classical identities at n
///   zeck --lucas <n>          L(n)
///   zeck --zeckendorf <n>     Zeckendorf representation and binary word
///   zeck --lucas-repr <n>     Lucas representation
///   zeck --profile <N>        V, U, S, d for every index in [0, N]
///   zeck --scan <N>           Equilibrium report over [0, N]
///   zeck --verify <n>         Boundary check at a single index
///   zeck --phase <N>          Phase-space trajectory summary over [0, N]
///   zeck --help               Print usage
///
/// Modifiers: --shards <k>, --verbose.

#include "zeck/decomposition.hpp"
#include "zeck/divergence.hpp"
#include "zeck/equilibrium.hpp"
#include "zeck/phase_space.hpp"
#include "zeck/sequences.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  zeck --fib <n>            F(n) and identity checks\n"
        "  zeck --lucas <n>          L(n)\n"
        "  zeck --zeckendorf <n>     Zeckendorf representation of n\n"
        "  zeck --lucas-repr <n>     Lucas representation of n\n"
        "  zeck --profile <N>        Cumulative profile over [0, N]\n"
        "  zeck --scan <N>           Equilibrium scan over [0, N]\n"
        "  zeck --verify <n>         Check the Lucas boundary statement at n\n"
        "  zeck --phase <N>          Phase-space trajectory over [0, N]\n"
        "  zeck --help               Show this help\n"
        "\n"
        "Options:\n"
        "  --shards <k>              Parallel shards for --profile/--scan/--phase\n"
        "  --verbose                 Diagnostics on stderr\n"
    );
}

// ─── CLI Argument Parsing ─────────────────────────────────────────────────────

struct Args {
    std::string  mode;
    std::int64_t value   = 0;
    std::size_t  shards  = zeck::constants::DEFAULT_SHARDS;
    bool         verbose = false;
};

std::optional<std::int64_t> parse_int(std::string_view text) {
    std::int64_t out = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, out);
    if (ec != std::errc{} || ptr != end) return std::nullopt;
    return out;
}

std::optional<Args> parse_args(int argc, char* argv[]) {
    Args args;
    bool have_value = false;
    for (int i = 1; i < argc; ++i) {
        const std::string key(argv[i]);
        if (key == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (i + 1 >= argc) return std::nullopt;
        const auto val = parse_int(argv[i + 1]);
        if (!val) {
            fmt::print(stderr, "Error: '{}' is not an integer\n", argv[i + 1]);
            return std::nullopt;
        }
        ++i;
        if (key == "--shards") {
            if (*val < 1) return std::nullopt;
            args.shards = static_cast<std::size_t>(*val);
        } else if (key == "--fib" || key == "--lucas" || key == "--zeckendorf" ||
                   key == "--lucas-repr" || key == "--profile" || key == "--scan" ||
                   key == "--verify" || key == "--phase") {
            if (have_value) return std::nullopt;
            args.mode = key;
            args.value = *val;
            have_value = true;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", key);
            return std::nullopt;
        }
    }
    if (!have_value) return std::nullopt;
    return args;
}

// ─── Modes ────────────────────────────────────────────────────────────────────

int run_fib(const Args& args) {
    auto f = zeck::sequences::fibonacci(args.value);
    if (!f) {
        fmt::print(stderr, "Error: index must be non-negative\n");
        return 1;
    }
    fmt::print("F({}) = {}\n", args.value, f->get_str());

    if (auto ids = zeck::sequences::verify_identities(args.value)) {
        for (const auto& id : *ids) {
            fmt::print("  {:<22} {}\n", id.name, id.holds ? "holds" : "FAILS");
        }
    }
    return 0;
}

int run_lucas(const Args& args) {
    auto l = zeck::sequences::lucas(args.value);
    if (!l) {
        fmt::print(stderr, "Error: index must be non-negative\n");
        return 1;
    }
    fmt::print("L({}) = {}\n", args.value, l->get_str());
    return 0;
}

int run_zeckendorf(const Args& args) {
    auto rep = zeck::decomposition::decompose_zeckendorf(args.value);
    if (!rep) {
        fmt::print(stderr, "Error: cannot decompose {}\n", args.value);
        return 1;
    }
    fmt::print("{}\n", zeck::decomposition::to_string(*rep));
    fmt::print("z({}) = {}\n", args.value, rep->count());
    if (auto bits = zeck::decomposition::to_zeckendorf_binary(*rep)) {
        fmt::print("binary: {}\n", *bits);
    }
    return 0;
}

int run_lucas_repr(const Args& args) {
    auto rep = zeck::decomposition::decompose_lucas(args.value);
    if (!rep) {
        fmt::print(stderr, "Error: cannot decompose {}\n", args.value);
        return 1;
    }
    fmt::print("{}\n", zeck::decomposition::to_string(*rep));
    fmt::print("l({}) = {}\n", args.value, rep->count());
    return 0;
}

int run_profile(const Args& args) {
    const zeck::divergence::ProfileConfig config{
        .shards  = args.shards,
        .verbose = args.verbose,
    };
    auto profile = zeck::divergence::cumulative_profile(args.value, config);
    if (!profile) {
        fmt::print(stderr, "Error: range end must be in [0, {}]\n",
                   zeck::constants::MAX_RANGE_END);
        return 1;
    }

    fmt::print("{:>10} {:>4} {:>4} {:>12} {:>12} {:>8} {:>4}\n",
               "n", "z", "l", "V", "U", "S", "d");
    for (std::size_t i = 0; i < profile->size(); ++i) {
        fmt::print("{:>10} {:>4} {:>4} {:>12} {:>12} {:>8} {:>4}\n",
                   i, profile->z[i], profile->ell[i], profile->V[i],
                   profile->U[i], profile->S[i], profile->d[i]);
    }

    if (auto summary = zeck::divergence::summarize(*profile)) {
        fmt::print("mean V={:.3f} mean U={:.3f} S in [{}, {}] zeros={} positive={}\n",
                   summary->mean_V, summary->mean_U, summary->min_S,
                   summary->max_S, summary->zero_count, summary->positive_count);
    }
    return 0;
}

int run_scan(const Args& args) {
    zeck::equilibrium::ScanConfig config;
    config.shards  = args.shards;
    config.verbose = args.verbose;

    auto scan = zeck::equilibrium::find_equilibria(args.value, config);
    if (!scan) {
        fmt::print(stderr, "Error: range end must be in [0, {}]\n",
                   zeck::constants::MAX_RANGE_END);
        return 1;
    }
    fmt::print("{}", scan->to_report());
    return 0;
}

int run_verify(const Args& args) {
    auto check = zeck::equilibrium::verify_at(args.value);
    if (!check) {
        fmt::print(stderr, "Error: index must be in [0, {}]\n",
                   zeck::constants::MAX_RANGE_END);
        return 1;
    }
    fmt::print("{}\n", check->message);
    fmt::print("consistent: {}\n", check->consistent ? "yes" : "no");
    return check->consistent ? 0 : 2;
}

int run_phase(const Args& args) {
    const zeck::divergence::ProfileConfig config{
        .shards  = args.shards,
        .verbose = args.verbose,
    };
    auto profile = zeck::divergence::cumulative_profile(args.value, config);
    if (!profile) {
        fmt::print(stderr, "Error: range end must be in [0, {}]\n",
                   zeck::constants::MAX_RANGE_END);
        return 1;
    }
    auto traj = zeck::phase_space::PhaseTrajectory::from_profile(*profile, 0, args.value);
    if (!traj) {
        fmt::print(stderr, "Error: cannot build trajectory\n");
        return 1;
    }

    const auto slow = traj->slow_points();
    const auto& last = traj->points().back();
    fmt::print("points={} path_length={:.6f} slow_points={}\n",
               traj->size(), traj->path_length(), slow.size());
    fmt::print("end n={} coords=({:.6f}, {:.6f}, {:.6f})\n",
               last.n, last.coords.x(), last.coords.y(), last.coords.z());
    return 0;
}

int dispatch(const Args& args) {
    if (args.mode == "--fib")        return run_fib(args);
    if (args.mode == "--lucas")      return run_lucas(args);
    if (args.mode == "--zeckendorf") return run_zeckendorf(args);
    if (args.mode == "--lucas-repr") return run_lucas_repr(args);
    if (args.mode == "--profile")    return run_profile(args);
    if (args.mode == "--scan")       return run_scan(args);
    if (args.mode == "--verify")     return run_verify(args);
    if (args.mode == "--phase")      return run_phase(args);
    return 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string first(argv[1]);
    if (first == "--help" || first == "-h") {
        print_usage();
        return 0;
    }

    auto maybe_args = parse_args(argc, argv);
    if (!maybe_args) {
        print_usage();
        return 1;
    }

    try {
        if (maybe_args->verbose) {
            fmt::print(stderr, "[zeck] mode={} value={} shards={}\n",
                       maybe_args->mode, maybe_args->value, maybe_args->shards);
        }
        return dispatch(*maybe_args);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "[FATAL] {}\n", ex.what());
        return 1;
    }
}
