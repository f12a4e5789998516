#include <doctest/doctest.h>

#include <chrono>
#include <sstream>
#include <vector>

#include "Benchmark.h"
#include "Code.h"
#include "GuessRanker.h"

using namespace bulls_cows;
using namespace std::chrono_literals;


TEST_CASE("generated secrets are valid and reproducible") {
    const CodeSpace space;
    for (unsigned int seed = 0; seed < 50u; ++seed) {
        const Code secret = generate_secret(space, seed);
        REQUIRE(is_valid(secret, space));
        REQUIRE(secret == generate_secret(space, seed));
    }

    const auto symbols = randomize_symbols(10, 7);
    CHECK(symbols.size() == 10u);
    CHECK(symbol_set(symbols).count() == 10u);
}

TEST_CASE("solve finds the secret") {
    const Code secret{ 7, 2, 9, 0 };
    const auto [final_guess, nb_guesses] = solve(CodeSpace{}, RankerConfig{}, secret);
    CHECK(final_guess == secret);
    CHECK(nb_guesses >= 1u);
    CHECK(nb_guesses <= 10u);
}

TEST_CASE("guess statistics") {
    const auto statistics = compute_nb_guesses_statistics({ 4u, 5u, 6u });
    CHECK(statistics.get_total() == 15u);
    CHECK(statistics.get_mean() == doctest::Approx(5.0));
    CHECK(statistics.get_worst() == 6u);

    const auto none = compute_nb_guesses_statistics({});
    CHECK(none.get_total() == 0u);
    CHECK(none.get_mean() == 0.0);

    std::ostringstream stream;
    stream << statistics;
    CHECK(stream.str() == "Nb Guesses: Total: 15 Mean: 5 Worst: 6");
}

TEST_CASE("time statistics") {
    const auto statistics = compute_time_statistics({ 30us, 10us, 20us });
    CHECK(statistics.get_total() == 60us);
    CHECK(statistics.get_min() == 10us);
    CHECK(statistics.get_max() == 30us);

    const auto none = compute_time_statistics({});
    CHECK(none.get_min() == 0us);
    CHECK(none.get_max() == 0us);

    std::ostringstream stream;
    stream << statistics;
    CHECK(stream.str() == "Time: Total: 60us Min: 10us Max: 30us");
}

TEST_CASE("benchmark over a small space") {
    const auto report = run_benchmark(CodeSpace(3, 6), RankerConfig{}, 20, 42);
    CHECK(report.guesses.get_total() >= 20u);
    CHECK(report.guesses.get_worst() <= 8u);
    CHECK(report.guesses.get_mean() >= 1.0);
}

TEST_CASE("benchmark scoring the full space") {
    const auto report = run_benchmark(CodeSpace(3, 6), RankerConfig{ GuessPool::FullSpace, true }, 10, 1);
    CHECK(report.guesses.get_total() >= 10u);
    CHECK(report.guesses.get_worst() <= 8u);
}
