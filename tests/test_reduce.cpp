#include <sieve/stats/reduce.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <vector>

using namespace sieve::stats;

TEST_CASE("sum and mean", "[stats][reduce]") {
    std::vector<double> v{1.0, 2.0, 3.0, 4.0};

    REQUIRE(sum(v) == 10.0);
    REQUIRE(mean(v) == 2.5);
    REQUIRE(std::isnan(mean(std::vector<double>{})));
}

TEST_CASE("stddev honours the divisor convention", "[stats][reduce]") {
    std::vector<double> v{10.0, 20.0, 30.0, 40.0, 50.0};

    REQUIRE(stddev(v) == Catch::Approx(std::sqrt(200.0)));
    REQUIRE(stddev(v, 1) == Catch::Approx(std::sqrt(250.0)));
    REQUIRE(stddev(std::vector<double>{5.0, 5.0, 5.0}) == 0.0);
    REQUIRE(std::isnan(stddev(std::vector<double>{1.0}, 1)));
}

TEST_CASE("quantile interpolates linearly between order statistics", "[stats][reduce]") {
    std::vector<double> v{20.0, 21.0, 19.0, 20.0, 22.0, 1000.0};

    // sorted: 19 20 20 21 22 1000
    REQUIRE(quantile(v, 0.0) == 19.0);
    REQUIRE(quantile(v, 1.0) == 1000.0);
    REQUIRE(quantile(v, 0.25) == Catch::Approx(20.0));
    REQUIRE(quantile(v, 0.75) == Catch::Approx(21.75));
    REQUIRE(quantile(v, 0.5) == Catch::Approx(20.5));
}

TEST_CASE("quantile edge cases", "[stats][reduce]") {
    std::vector<double> single{7.0};
    std::vector<double> with_nan{1.0, std::numeric_limits<double>::quiet_NaN()};

    REQUIRE(quantile(single, 0.25) == 7.0);
    REQUIRE(std::isnan(quantile(std::vector<double>{}, 0.5)));
    REQUIRE(std::isnan(quantile(single, 1.5)));
    REQUIRE(std::isnan(quantile(with_nan, 0.5)));
}

TEST_CASE("min and max", "[stats][reduce]") {
    std::vector<double> v{3.0, -1.0, 8.5};

    REQUIRE(min(v) == -1.0);
    REQUIRE(max(v) == 8.5);
    REQUIRE(std::isnan(min(std::vector<double>{})));
    REQUIRE(std::isnan(max(std::vector<double>{1.0, std::numeric_limits<double>::quiet_NaN()})));
}
