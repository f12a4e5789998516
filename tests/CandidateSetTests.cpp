#include <doctest/doctest.h>

#include <algorithm>
#include <vector>

#include "CandidateSet.h"
#include "Code.h"
#include "Errors.h"
#include "Feedback.h"
#include "FeedbackCalculator.h"

using namespace bulls_cows;


TEST_CASE("initialize generates every code with distinct symbols") {
    const auto candidates = CandidateSet::initialize();
    const auto& codes = candidates.codes();

    CHECK(candidates.size() == 5040u);
    CHECK(candidates.symbols().size() == 5040u);
    CHECK(candidates.space() == CodeSpace{});
    CHECK(codes.front() == Code{ 0, 1, 2, 3 });
    CHECK(codes.back() == Code{ 9, 8, 7, 6 });
    CHECK(std::ranges::is_sorted(codes));
    CHECK(std::ranges::adjacent_find(codes) == codes.end());
    CHECK(std::ranges::all_of(codes, [](const Code& code) { return is_valid(code, CodeSpace{}); }));
}

TEST_CASE("initialize is deterministic for small spaces") {
    const auto candidates = CandidateSet::initialize(CodeSpace(2, 3));
    const std::vector<Code> expected{ { 0, 1 }, { 0, 2 }, { 1, 0 }, { 1, 2 }, { 2, 0 }, { 2, 1 } };
    CHECK(candidates.codes() == expected);

    const auto single = CandidateSet::initialize(CodeSpace(1, 1));
    REQUIRE(single.size() == 1u);
    CHECK(single[0] == Code{ 0 });
}

TEST_CASE("filter keeps the codes giving the observed feedback") {
    const auto candidates = CandidateSet::initialize();
    const Code guess{ 0, 1, 2, 3 };

    SUBCASE("no common symbol") {
        const auto filtered = candidates.filter(guess, Feedback(0, 0));
        CHECK(filtered.size() == 360u);
        CHECK_FALSE(filtered.contains(Code{ 4, 5, 6, 0 }));
        CHECK(filtered.contains(Code{ 4, 5, 6, 7 }));
    }

    SUBCASE("win leaves the guess alone") {
        const auto filtered = candidates.filter(guess, Feedback(4, 0));
        REQUIRE(filtered.size() == 1u);
        CHECK(filtered[0] == guess);
    }

    SUBCASE("every class") {
        CHECK(candidates.filter(guess, Feedback(0, 4)).size() == 9u);
        CHECK(candidates.filter(guess, Feedback(2, 2)).size() == 6u);
        CHECK(candidates.filter(guess, Feedback(3, 0)).size() == 24u);
        CHECK(candidates.filter(guess, Feedback(0, 1)).size() == 1440u);
    }

    SUBCASE("impossible feedback yields nothing") {
        CHECK(candidates.filter(guess, Feedback(3, 1)).empty());
    }
}

TEST_CASE("filter never eliminates the true secret") {
    const auto candidates = CandidateSet::initialize();
    const std::vector<Code> guesses{ { 0, 1, 2, 3 }, { 9, 3, 5, 1 }, { 4, 5, 6, 7 } };

    for (size_t i = 0; i < candidates.size(); i += 53) {
        const Code& secret = candidates[i];
        for (const auto& guess : guesses) {
            const auto filtered = candidates.filter(guess, evaluate(secret, guess));
            REQUIRE(filtered.contains(secret));
            REQUIRE(filtered.size() <= candidates.size());
        }
    }
}

TEST_CASE("filter only narrows and keeps lexicographic order") {
    const auto candidates = CandidateSet::initialize();
    const Code guess{ 5, 0, 8, 2 };

    size_t total = 0;
    for (unsigned int bulls = 0; bulls <= 4u; ++bulls) {
        for (unsigned int cows = 0; bulls + cows <= 4u; ++cows) {
            const auto filtered = candidates.filter(guess, Feedback(bulls, cows));
            CHECK(filtered.size() <= candidates.size());
            CHECK(std::ranges::is_sorted(filtered.codes()));
            CHECK(std::ranges::all_of(filtered.codes(), [&](const Code& code) { return candidates.contains(code); }));
            total += filtered.size();
        }
    }

    // Feedback classes partition the set
    CHECK(total == candidates.size());
}

TEST_CASE("narrow reports a contradiction when nothing remains") {
    auto candidates = CandidateSet::initialize();
    const Code guess{ 0, 1, 2, 3 };

    candidates.narrow(guess, Feedback(1, 0));
    CHECK(candidates.size() == 480u);

    CHECK_THROWS_AS(candidates.narrow(guess, Feedback(2, 0)), Contradiction);
    CHECK(candidates.empty());
}
