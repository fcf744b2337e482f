#include <sieve/cli/commands.hpp>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <iostream>

auto main(int argc, char** argv) -> int {
    CLI::App app{"sieve — clean tables and derive sequence statistics from CSV files"};
    app.set_version_flag("--version", "sieve 0.1.0");
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable verbose output");

    sieve::cli::CleanConfig clean_args;
    auto* clean = app.add_subcommand("clean", "Trim, drop incomplete rows and remove outliers");
    clean->add_option("input", clean_args.input, "Input CSV file")->required();
    clean->add_option("--nulls", clean_args.nulls,
                      "Comma-separated null tokens; <empty> marks empty cells as missing");
    clean->add_option("--trim", clean_args.trim, "Text columns to trim")->delimiter(',');
    clean->add_option("--require", clean_args.require, "Columns that must not be missing")
        ->delimiter(',');
    clean->add_option("--outliers", clean_args.outliers, "Numeric column to filter by IQR");
    clean->add_option("--factor", clean_args.factor, "IQR multiplier (default: 1.5)")
        ->needs("--outliers");

    sieve::cli::StatsConfig stats_args;
    bool zscore_flag = false;
    bool min_max_flag = false;
    auto* stats = app.add_subcommand("stats", "Derive a sequence from one numeric column");
    stats->add_option("input", stats_args.input, "Input CSV file")->required();
    stats->add_option("--nulls", stats_args.nulls,
                      "Comma-separated null tokens; <empty> marks empty cells as missing");
    stats->add_option("-c,--column", stats_args.column, "Numeric column")->required();
    auto* window = stats->add_option("--moving-average", stats_args.window,
                                     "Moving average with the given window");
    auto* zscore = stats->add_flag("--zscore", zscore_flag, "Z-score normalization");
    auto* min_max = stats->add_flag("--min-max", min_max_flag, "Min-max scaling to [0, 1]");
    window->excludes(zscore)->excludes(min_max);
    zscore->excludes(min_max);
    stats->callback([&] {
        if (window->count() == 0 && !zscore_flag && !min_max_flag) {
            throw CLI::RequiredError("--moving-average, --zscore or --min-max");
        }
        if (zscore_flag) {
            stats_args.statistic = sieve::cli::Statistic::ZScore;
        } else if (min_max_flag) {
            stats_args.statistic = sieve::cli::Statistic::MinMax;
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    if (clean->parsed()) {
        return sieve::cli::run_clean(clean_args, std::cout);
    }
    return sieve::cli::run_stats(stats_args, std::cout);
}
