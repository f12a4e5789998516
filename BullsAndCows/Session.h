#pragma once

#include <concepts>
#include <optional>

#include "Code.h"
#include "Errors.h"
#include "Feedback.h"
#include "GuessRanker.h"
#include "Solver.h"


namespace bulls_cows {

enum class Outcome {
    Solved,
    Contradiction,
    Abandoned, // the collaborator stopped answering
};

// Whoever holds the secret: shown each guess, answers with feedback (nothing to give up)
template<typename T>
concept Collaborator = requires(T collaborator, const GuessOption& option, const Code& code, const InvalidFeedback& error) {
    collaborator.present_guess(option, 1u);
    { collaborator.request_feedback(code) } -> std::same_as<std::optional<Feedback>>;
    collaborator.reject_feedback(error);
    collaborator.present_result(Outcome::Solved, code);
};


template<Collaborator C>
Outcome run_session(Solver& solver, C& collaborator) {
    while (solver.can_continue()) {
        const GuessOption& option = solver.next_guess();
        collaborator.present_guess(option, solver.round());

        while (true) {
            try {
                const std::optional<Feedback> feedback = collaborator.request_feedback(option.guess);
                if (!feedback) {
                    return Outcome::Abandoned;
                }
                solver.apply_feedback(*feedback);
                break;
            }
            catch (const InvalidFeedback& e) {
                collaborator.reject_feedback(e);
            }
        }
    }

    if (solver.state() == State::Solved) {
        collaborator.present_result(Outcome::Solved, solver.solution());
        return Outcome::Solved;
    }

    collaborator.present_result(Outcome::Contradiction, solver.last_guess());
    return Outcome::Contradiction;
}

}
