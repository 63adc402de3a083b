/// @file src/main.cpp
/// @brief tsig CLI entry point.
///
/// Usage:
///   tsig --analyze <summary.csv> [options]   Analyze one activity
///   tsig --baseline <history.csv> [--as-of T] Print the rolling baseline
///   tsig --help                              Print usage

#include "tsig/baseline.hpp"
#include "tsig/data_loader.hpp"
#include "tsig/engine.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace {

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  tsig --analyze <summary.csv> [options]    Analyze one activity\n"
        "  tsig --baseline <history.csv> [--as-of T] Print the rolling baseline\n"
        "  tsig --help                               Show this help\n"
        "\n"
        "Analyze options:\n"
        "  --streams <streams.csv>   Sample streams (time,distance,velocity,heart_rate,...)\n"
        "  --history <history.csv>   Past activities for the baseline\n"
        "  --as-of <epoch_s>         Baseline reference time (default: activity start)\n"
        "  --max-hr <bpm>            Athlete max heart rate\n"
        "  --rpe <1-10>              Perceived exertion\n"
        "  --pain <0-10>             Pain score\n"
        "  --pain-location <text>    Pain location\n"
        "  --sleep <1-5>             Sleep quality\n"
        "  --ill                     Report illness\n"
        "  --extreme-fatigue         Report extreme fatigue\n"
        "  --race                    Declare the activity a race\n"
        "  --verbose                 Trace pipeline stages to stderr\n"
        "\n"
        "Summary CSV format (header required):\n"
        "  type,distance_m,moving_time_s,elapsed_time_s,elevation_gain_m,avg_hr,max_hr,\n"
        "  avg_cadence,avg_speed_mps,start_time,user_intent\n"
    );
}

std::optional<int> parse_int(const std::string& s) {
    const auto v = tsig::core::DataLoader::parse_number(s);
    if (!v || std::floor(*v) != *v) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

struct AnalyzeArgs {
    std::string                summary_path;
    std::optional<std::string> streams_path;
    std::optional<std::string> history_path;
    std::optional<double>      as_of;
    tsig::UserProfile          profile;
    tsig::CheckIn              check_in;
    bool                       has_check_in = false;
    bool                       race = false;
    bool                       verbose = false;
};

/// Parse analyze options from argv[3..]. Returns false on a bad option.
bool parse_analyze_args(int argc, char* argv[], AnalyzeArgs& args) {
    for (int i = 3; i < argc; ++i) {
        const std::string opt(argv[i]);
        auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} requires a value\n", opt);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };
        auto int_value = [&]() -> std::optional<int> {
            const auto v = value();
            if (!v) return std::nullopt;
            const auto n = parse_int(*v);
            if (!n) fmt::print(stderr, "Error: {} expects an integer, got '{}'\n", opt, *v);
            return n;
        };

        if (opt == "--streams") {
            args.streams_path = value();
            if (!args.streams_path) return false;
        } else if (opt == "--history") {
            args.history_path = value();
            if (!args.history_path) return false;
        } else if (opt == "--as-of") {
            const auto v = value();
            args.as_of = v ? tsig::core::DataLoader::parse_number(*v) : std::nullopt;
            if (!args.as_of) return false;
        } else if (opt == "--max-hr") {
            const auto v = value();
            args.profile.max_hr = v ? tsig::core::DataLoader::parse_number(*v) : std::nullopt;
            if (!args.profile.max_hr) return false;
        } else if (opt == "--rpe") {
            args.check_in.rpe = int_value();
            if (!args.check_in.rpe) return false;
            args.has_check_in = true;
        } else if (opt == "--pain") {
            args.check_in.pain_score = int_value();
            if (!args.check_in.pain_score) return false;
            args.has_check_in = true;
        } else if (opt == "--pain-location") {
            args.check_in.pain_location = value();
            if (!args.check_in.pain_location) return false;
            args.has_check_in = true;
        } else if (opt == "--sleep") {
            args.check_in.sleep_quality = int_value();
            if (!args.check_in.sleep_quality) return false;
            args.has_check_in = true;
        } else if (opt == "--ill") {
            args.check_in.illness = true;
            args.has_check_in = true;
        } else if (opt == "--extreme-fatigue") {
            args.check_in.extreme_fatigue = true;
            args.has_check_in = true;
        } else if (opt == "--race") {
            args.race = true;
        } else if (opt == "--verbose") {
            args.verbose = true;
        } else {
            fmt::print(stderr, "Unknown option: {}\n", opt);
            return false;
        }
    }
    return true;
}

/// Analyze one activity and print the report.
/// Returns 0 on success, 1 on error.
int run_analyze(const AnalyzeArgs& args) {
    auto summary = tsig::core::DataLoader::load_summary(args.summary_path);
    if (!summary) {
        fmt::print(stderr, "Error: no valid summary row in '{}'\n", args.summary_path);
        return 1;
    }

    tsig::core::AnalysisRequest request{
        .summary       = *summary,
        .profile       = args.profile,
        .race_declared = args.race,
    };

    if (args.streams_path) {
        request.streams = tsig::core::DataLoader::load_streams(*args.streams_path);
        if (!request.streams) {
            fmt::print(stderr, "Error: no stream channels in '{}'\n", *args.streams_path);
            return 1;
        }
    }

    if (args.history_path) {
        const auto history = tsig::core::DataLoader::load_history(*args.history_path);
        if (!history) {
            fmt::print(stderr, "Error: cannot open file '{}'\n", *args.history_path);
            return 1;
        }
        // The activity itself is not part of its own baseline.
        const double as_of = args.as_of.value_or(summary->start_time - 1.0);
        request.baseline = tsig::baseline::BaselineAggregator::aggregate(*history, as_of);
    }

    if (args.has_check_in) {
        request.check_in = args.check_in;
    }

    const tsig::core::Engine engine(tsig::core::EngineConfig{.verbose = args.verbose});
    try {
        const auto metrics = engine.analyze(request);
        fmt::print("{}", metrics.to_string());
    } catch (const tsig::ValidationError& e) {
        fmt::print(stderr, "Validation error: {}\n", e.what());
        return 1;
    }
    return 0;
}

/// Aggregate a history file and print the baseline.
int run_baseline(const std::string& filepath, std::optional<double> as_of) {
    const auto history = tsig::core::DataLoader::load_history(filepath);
    if (!history) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    if (!as_of) {
        double latest = 0.0;
        for (const auto& e : *history) latest = std::max(latest, e.start_time);
        as_of = latest;
    }

    const auto b = tsig::baseline::BaselineAggregator::aggregate(*history, *as_of);
    auto show = [](const std::optional<double>& v) {
        return v ? fmt::format("{:.1f}", *v) : std::string{"-"};
    };
    fmt::print("Baseline as of {:.0f} ({} activities in 28 d{})\n", *as_of, b.sample_count,
               b.is_thin() ? ", thin" : "");
    fmt::print("  duration p50 / p80 : {} / {} s\n", show(b.duration_p50_s), show(b.duration_p80_s));
    fmt::print("  distance p50 / p80 : {} / {} m\n", show(b.distance_p50_m), show(b.distance_p80_m));
    fmt::print("  distance 7d / 28d  : {} / {} m\n", show(b.distance_7d_m), show(b.distance_28d_m));
    fmt::print("  load ratio         : {}\n", show(b.weekly_load_ratio()));
    fmt::print("  effort mean / sd   : {} / {}\n", show(b.effort_mean), show(b.effort_stddev));
    fmt::print("  threshold pace     : {} s/km\n", show(b.threshold_pace_s_per_km));
    fmt::print("  hard sessions 7d   : {}\n", b.hard_sessions_7d.value_or(0));
    fmt::print("  days since hard    : {}\n", show(b.days_since_last_hard));
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--analyze") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --analyze requires a summary CSV path\n");
            print_usage();
            return 1;
        }
        AnalyzeArgs args;
        args.summary_path = argv[2];
        if (!parse_analyze_args(argc, argv, args)) {
            print_usage();
            return 1;
        }
        return run_analyze(args);
    }

    if (mode == "--baseline") {
        if (argc < 3) {
            fmt::print(stderr, "Error: --baseline requires a history CSV path\n");
            print_usage();
            return 1;
        }
        std::optional<double> as_of;
        if (argc >= 5 && std::string(argv[3]) == "--as-of") {
            as_of = tsig::core::DataLoader::parse_number(argv[4]);
            if (!as_of) {
                fmt::print(stderr, "Error: --as-of expects a number\n");
                return 1;
            }
        }
        return run_baseline(std::string(argv[2]), as_of);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
