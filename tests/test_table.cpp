#include <sieve/core/table.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <stdexcept>
#include <vector>

namespace {

using namespace sieve;

auto make_table() -> Table {
    Table table;
    table.add_column("id", Column<std::int64_t>{1, 2, 3, 4});
    table.add_column("score", Column<double>{0.5, 0.0, 1.5, std::numeric_limits<double>::quiet_NaN()},
                     {true, false, true, true});
    table.add_column("tag", Column<std::string>{"a", "b", "c", "d"});
    return table;
}

}  // namespace

TEST_CASE("Table lookup by name", "[core][table]") {
    auto table = make_table();

    REQUIRE(table.rows() == 4);
    REQUIRE(table.columns.size() == 3);
    REQUIRE(table.find("id") != nullptr);
    REQUIRE(table.find("missing") == nullptr);
    REQUIRE(table.find_entry("tag")->name == "tag");
    REQUIRE(kind_of(*table.find("id")) == ColumnKind::Int);
    REQUIRE(kind_of(*table.find("score")) == ColumnKind::Double);
    REQUIRE(kind_of(*table.find("tag")) == ColumnKind::String);
    REQUIRE(is_numeric(ColumnKind::Double));
    REQUIRE_FALSE(is_numeric(ColumnKind::String));
}

TEST_CASE("Table reports missing cells from the bitmap and NaN", "[core][table]") {
    auto table = make_table();
    const auto* score = table.find_entry("score");

    REQUIRE_FALSE(is_null(*score, 0));
    REQUIRE(is_null(*score, 1));
    REQUIRE_FALSE(is_null(*score, 2));
    REQUIRE(is_null(*score, 3));
    REQUIRE_FALSE(is_null(*table.find_entry("id"), 1));
}

TEST_CASE("Table rejects columns of the wrong length", "[core][table]") {
    auto table = make_table();

    REQUIRE_THROWS_AS(table.add_column("short", Column<std::int64_t>{1, 2}), std::invalid_argument);
    REQUIRE_THROWS_AS(table.add_column("flags", Column<std::int64_t>{1, 2, 3, 4}, {true}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(table.set_labels({0, 1}), std::invalid_argument);
}

TEST_CASE("Table labels default to row positions", "[core][table]") {
    auto table = make_table();

    REQUIRE(table.label(0) == 0);
    REQUIRE(table.label(3) == 3);

    table.set_labels({10, 20, 30, 40});
    REQUIRE(table.label(2) == 30);
}

TEST_CASE("Table take keeps labels and validity of the selected rows", "[core][table]") {
    auto table = make_table();
    std::vector<std::size_t> rows{1, 3};

    auto taken = table.take(rows);

    REQUIRE(taken.rows() == 2);
    REQUIRE(taken.label(0) == 1);
    REQUIRE(taken.label(1) == 3);
    REQUIRE(std::get<Column<std::int64_t>>(*taken.find("id")) == Column<std::int64_t>{2, 4});
    REQUIRE(is_null(*taken.find_entry("score"), 0));
    REQUIRE(std::get<Column<std::string>>(*taken.find("tag")) == Column<std::string>{"b", "d"});

    // Taking from a taken table composes labels.
    std::vector<std::size_t> second{1};
    REQUIRE(taken.take(second).label(0) == 3);
}

TEST_CASE("Table equality compares values, missing markers and labels", "[core][table]") {
    auto a = make_table();
    auto b = make_table();

    REQUIRE(a == b);

    // Payload under a missing marker does not matter.
    std::get<Column<double>>(*b.find("score"))[1] = 42.0;
    REQUIRE(a == b);

    std::get<Column<std::string>>(*b.find("tag"))[0] = "z";
    REQUIRE_FALSE(a == b);

    auto c = make_table();
    c.set_labels({0, 1, 2, 5});
    REQUIRE_FALSE(a == c);
}

TEST_CASE("Table copies are independent", "[core][table]") {
    auto original = make_table();
    auto copy = original;

    std::get<Column<std::int64_t>>(*copy.find("id"))[0] = 100;

    REQUIRE(std::get<Column<std::int64_t>>(*original.find("id"))[0] == 1);
}
