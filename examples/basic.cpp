#include <sieve/io/print.hpp>
#include <sieve/sieve.hpp>

#include <fmt/core.h>

#include <iostream>

auto main() -> int {
    // A small table with padded names, a missing age and one implausible age.
    sieve::Table people;
    people.add_column("name", sieve::Column<std::string>{" Alice ", "Bob", "", " Carol  ", "Dan"},
                      {true, true, false, true, true});
    people.add_column("age", sieve::Column<std::int64_t>{25, 0, 35, 120, 31},
                      {true, false, true, true, true});
    people.add_column("city", sieve::Column<std::string>{"SCL", "LPZ", "SCL", "LPZ", "SCL"});

    fmt::print("=== Input ===\n");
    sieve::io::print(people, std::cout);

    auto cleaned = sieve::clean::trim_strings(people, {"name"})
                       .and_then([](const sieve::Table& t) {
                           return sieve::clean::drop_invalid_rows(t, {"name", "age"});
                       })
                       .and_then([](const sieve::Table& t) {
                           return sieve::clean::remove_outliers_iqr(t, "age");
                       });
    if (!cleaned) {
        fmt::print("error: {}\n", cleaned.error().format());
        return 1;
    }
    fmt::print("\n=== Cleaned ===\n");
    sieve::io::print(*cleaned, std::cout);

    fmt::print("\n=== Sequence statistics ===\n");
    if (auto ages = sieve::stats::min_max_scale(*cleaned->find_entry("age"))) {
        fmt::print("cleaned ages scaled: {} values\n", ages->size());
    }
    // The missing age reaches the statistic as NaN and is rejected.
    if (auto raw = sieve::stats::zscore(*people.find_entry("age")); !raw) {
        fmt::print("raw ages rejected: {}\n", raw.error().format());
    }

    sieve::stats::NdArray prices{100.5, 200.3, 50.0, 175.8, 320.1};

    if (auto avg = sieve::stats::moving_average(prices, 3)) {
        fmt::print("moving average (3): {} values, first {}\n", avg->size(), (*avg)[0]);
    }
    if (auto z = sieve::stats::zscore(prices)) {
        fmt::print("zscore: first {:.4f}\n", (*z)[0]);
    }
    if (auto scaled = sieve::stats::min_max_scale(prices)) {
        fmt::print("min-max: first {:.4f}\n", (*scaled)[0]);
    }

    auto flat = sieve::stats::moving_average(sieve::stats::NdArray::from_rows({{1, 2}, {3, 4}}), 2);
    if (!flat) {
        fmt::print("2-D input rejected: {}\n", flat.error().format());
    }
    return 0;
}
