#include <sieve/cli/commands.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace sieve;

auto write_csv(const char* name, const char* content) -> std::string {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

auto labels_of(const Table& table) -> std::vector<std::size_t> {
    std::vector<std::size_t> labels;
    for (std::size_t r = 0; r < table.rows(); ++r) {
        labels.push_back(table.label(r));
    }
    return labels;
}

// name:  "  a ", null, null, " b", "c "
// score: 10, 11, 12, 13, 20
auto make_scores() -> Table {
    Table table;
    table.add_column("name", Column<std::string>{"  a ", "", "", " b", "c "},
                     {true, false, false, true, true});
    table.add_column("score", Column<std::int64_t>{10, 11, 12, 13, 20});
    return table;
}

}  // namespace

// ─── clean ────────────────────────────────────────────────────────────────────

TEST_CASE("clean trims, then drops, then removes outliers", "[cli][clean]") {
    cli::CleanConfig config;
    config.trim = {"name"};
    config.require = {"name"};
    config.outliers = "score";

    auto result = cli::clean_table(make_scores(), config);

    // Quartiles over the surviving 10, 13, 20 give [4, 24], so 20 stays.
    REQUIRE(result.has_value());
    REQUIRE(labels_of(*result) == std::vector<std::size_t>{0, 3, 4});
    REQUIRE(std::get<Column<std::string>>(*result->find("name")) ==
            Column<std::string>{"a", "b", "c"});
    REQUIRE(std::get<Column<std::int64_t>>(*result->find("score")) ==
            Column<std::int64_t>{10, 13, 20});
}

TEST_CASE("clean without the drop step sees every score", "[cli][clean]") {
    cli::CleanConfig config;
    config.outliers = "score";

    auto result = cli::clean_table(make_scores(), config);

    // Quartiles over all five scores give [8, 16], so 20 goes.
    REQUIRE(result.has_value());
    REQUIRE(labels_of(*result) == std::vector<std::size_t>{0, 1, 2, 3});
}

TEST_CASE("clean with no steps returns the table unchanged", "[cli][clean]") {
    auto table = make_scores();

    auto result = cli::clean_table(table, cli::CleanConfig{});

    REQUIRE(result.has_value());
    REQUIRE(*result == table);
}

TEST_CASE("clean stops at the first failing step", "[cli][clean]") {
    cli::CleanConfig config;
    config.trim = {"score"};
    config.require = {"ghost"};

    auto result = cli::clean_table(make_scores(), config);

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("run_clean prints the cleaned table", "[cli][clean]") {
    cli::CleanConfig config;
    config.input = write_csv("sieve_cli_clean.csv", "name,score\n  a ,10\n,11\n,12\n b,13\nc ,20\n");
    config.nulls = "<empty>";
    config.trim = {"name"};
    config.require = {"name"};
    config.outliers = "score";
    std::ostringstream out;

    REQUIRE(cli::run_clean(config, out) == 0);
    REQUIRE(out.str() ==
            "   name  score\n"
            "-  ----  -----\n"
            "0  a     10   \n"
            "3  b     13   \n"
            "4  c     20   \n");
}

TEST_CASE("run_clean exits with 1 on errors", "[cli][clean]") {
    std::ostringstream out;

    SECTION("missing input file") {
        cli::CleanConfig config;
        config.input = (std::filesystem::temp_directory_path() / "sieve_cli_missing.csv").string();
        REQUIRE(cli::run_clean(config, out) == 1);
    }

    SECTION("unknown column") {
        cli::CleanConfig config;
        config.input = write_csv("sieve_cli_unknown.csv", "score\n1\n2\n");
        config.require = {"ghost"};
        REQUIRE(cli::run_clean(config, out) == 1);
    }

    REQUIRE(out.str().empty());
}

// ─── stats ────────────────────────────────────────────────────────────────────

TEST_CASE("stats reports unknown and text columns", "[cli][stats]") {
    auto table = make_scores();
    cli::StatsConfig config;
    config.statistic = cli::Statistic::ZScore;

    config.column = "ghost";
    auto missing = cli::derive_sequence(table, config);
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().kind == ErrorKind::ColumnNotFound);
    REQUIRE(missing.error().message == "stats: column not found: ghost");

    config.column = "name";
    auto text = cli::derive_sequence(table, config);
    REQUIRE_FALSE(text.has_value());
    REQUIRE(text.error().kind == ErrorKind::TypeMismatch);
}

TEST_CASE("stats applies the selected statistic", "[cli][stats]") {
    auto table = make_scores();
    cli::StatsConfig config;
    config.column = "score";

    SECTION("moving average") {
        config.window = 5;
        auto result = cli::derive_sequence(table, config);
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 1);
        REQUIRE((*result)[0] == 13.2);
    }

    SECTION("min-max") {
        config.statistic = cli::Statistic::MinMax;
        auto result = cli::derive_sequence(table, config);
        REQUIRE(result.has_value());
        REQUIRE((*result)[0] == 0.0);
        REQUIRE((*result)[4] == 1.0);
    }

    SECTION("z-score") {
        config.statistic = cli::Statistic::ZScore;
        auto result = cli::derive_sequence(table, config);
        REQUIRE(result.has_value());
        REQUIRE(result->size() == 5);
    }
}

TEST_CASE("run_stats prints missing cells as nan", "[cli][stats]") {
    cli::StatsConfig config;
    config.input = write_csv("sieve_cli_stats.csv", "id,age\n1,25\n2,\n3,35\n");
    config.nulls = "<empty>";
    config.column = "age";
    config.window = 1;
    std::ostringstream out;

    REQUIRE(cli::run_stats(config, out) == 0);
    REQUIRE(out.str() == "25\nnan\n35\n");
}

TEST_CASE("run_stats exits with 1 on errors", "[cli][stats]") {
    cli::StatsConfig config;
    config.input = write_csv("sieve_cli_stats_errors.csv", "id,city\n1,SCL\n2,LPZ\n");
    std::ostringstream out;

    SECTION("unknown column") {
        config.column = "ghost";
        config.window = 1;
        REQUIRE(cli::run_stats(config, out) == 1);
    }

    SECTION("text column") {
        config.column = "city";
        config.statistic = cli::Statistic::MinMax;
        REQUIRE(cli::run_stats(config, out) == 1);
    }

    SECTION("window out of range") {
        config.column = "id";
        config.window = 3;
        REQUIRE(cli::run_stats(config, out) == 1);
    }

    REQUIRE(out.str().empty());
}
