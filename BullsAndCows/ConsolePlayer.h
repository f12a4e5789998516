#pragma once

#include <iostream>
#include <optional>

#include "Code.h"
#include "Errors.h"
#include "Feedback.h"
#include "GuessRanker.h"
#include "Session.h"
#include "Solver.h"


namespace bulls_cows {

// Human holding the secret, answering on a text stream
class ConsolePlayer {
    std::istream& in;
    std::ostream& out;
    const Solver& solver;
public:
    ConsolePlayer(std::istream& in, std::ostream& out, const Solver& solver);

    void present_instructions();

    void present_guess(const GuessOption& option, unsigned int round);

    // Nothing once the input is exhausted
    std::optional<Feedback> request_feedback(const Code& guess);

    void reject_feedback(const InvalidFeedback& error);

    void present_result(Outcome outcome, const Code& code);
};

}
