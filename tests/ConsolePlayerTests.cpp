#include <doctest/doctest.h>

#include <sstream>
#include <string>

#include "Code.h"
#include "ConsolePlayer.h"
#include "GuessRanker.h"
#include "Session.h"
#include "Solver.h"

using namespace bulls_cows;

namespace {

struct Transcript {
    std::istringstream in;
    std::ostringstream out;
    Solver solver;
    ConsolePlayer player;

    explicit Transcript(const std::string& input)
        : in(input)
        , player(in, out, solver)
    {}

    bool says(const std::string& text) const { return out.str().find(text) != std::string::npos; }
};

}


TEST_CASE("instructions explain the feedback") {
    Transcript transcript("");
    transcript.player.present_instructions();
    CHECK(transcript.says("Think of a 4-digit number with unique digits."));
    CHECK(transcript.says("Bulls: correct digit in correct position"));
    CHECK(transcript.says("Cows: correct digit in wrong position"));
}

TEST_CASE("the console shows the state of each round") {
    Transcript transcript("win\n");
    CHECK(run_session(transcript.solver, transcript.player) == Outcome::Solved);

    CHECK(transcript.says("Current entropy: 12.2992 bits"));
    CHECK(transcript.says("Possible codes remaining: 5040"));
    CHECK(transcript.says("Attempt 1: Computer guesses 0123"));
    CHECK(transcript.says("Expected information gain: 2.7712 bits"));
    CHECK(transcript.says("Computer won in 1 attempts!"));
}

TEST_CASE("number formatting does not leak into the caller's stream") {
    Transcript transcript("");
    transcript.player.present_guess(GuessOption{ Code{ 0, 1, 2, 3 }, 2.77115216575502, true }, 1);

    std::ostringstream expected;
    expected << 1.5;
    transcript.out.str("");
    transcript.out << 1.5;
    CHECK(transcript.out.str() == expected.str());
    CHECK(transcript.out.str() == "1.5");
}

TEST_CASE("bad lines are asked again") {
    Transcript transcript("two bulls\n5 0\n-1 1\n4 0\n");
    CHECK(run_session(transcript.solver, transcript.player) == Outcome::Solved);

    CHECK(transcript.says("Invalid input. Please enter two numbers separated by space, or 'win'."));
    CHECK(transcript.says("Invalid feedback. Bulls and cows should be between 0 and 4, and their sum <= 4."));
    CHECK(transcript.says("Invalid feedback. Bulls and cows cannot be negative."));
    CHECK(transcript.solver.round() == 1u);
    CHECK(transcript.solver.solution() == Code{ 0, 1, 2, 3 });
}

TEST_CASE("the console reports inconsistent feedback") {
    Transcript transcript("0 0\n0 0\n");
    CHECK(run_session(transcript.solver, transcript.player) == Outcome::Contradiction);
    CHECK(transcript.says("Possible codes remaining: 360"));
    CHECK(transcript.says("Attempt 2: Computer guesses "));
    CHECK(transcript.says("Error: No possible codes remain. Please check your feedback."));
}

TEST_CASE("end of input abandons the session") {
    Transcript transcript("1 1\n");
    CHECK(run_session(transcript.solver, transcript.player) == Outcome::Abandoned);
    CHECK(transcript.says("Attempt 2: "));
    CHECK_FALSE(transcript.says("Computer won"));
    CHECK_FALSE(transcript.says("Error:"));
}

TEST_CASE("a deduced secret is announced") {
    Transcript transcript("");
    transcript.player.present_result(Outcome::Solved, Code{ 5, 6, 7, 8 });
    CHECK(transcript.says("Only one possibility remains: 5678"));
    CHECK(transcript.says("This must be your number!"));
}
