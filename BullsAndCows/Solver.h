#pragma once

#include <optional>
#include <string>

#include "CandidateSet.h"
#include "Code.h"
#include "Feedback.h"
#include "GuessRanker.h"


namespace bulls_cows {

enum class State {
    Init,
    AwaitingFeedback,
    Solved,
    Contradiction,
};

// Deduces a secret held by someone else, one ranked guess per round
class Solver {
    CodeSpace space;
    GuessRanker ranker;
    CandidateSet candidates_;
    State state_;
    unsigned int round_;
    std::optional<GuessOption> pending;
    Code last_guess_;
    Code solution_;
    std::string contradiction_;

public:
    explicit Solver(const CodeSpace& space = CodeSpace{}, RankerConfig config = {});

    // Guess of the current round. Ranked once per round, repeated until feedback is applied.
    const GuessOption& next_guess();

    // Narrows the candidates with the feedback for the pending guess and returns the new state.
    // Throws InvalidFeedback, leaving the round untouched, when the counts are out of range.
    State apply_feedback(const Feedback& feedback);

    bool can_continue() const;

    State state() const { return state_; }
    unsigned int round() const { return round_; }
    const CodeSpace& get_space() const { return space; }
    const CandidateSet& candidates() const { return candidates_; }
    const GuessRanker& get_ranker() const { return ranker; }

    // Last guess that received feedback, empty before the first one
    const Code& last_guess() const { return last_guess_; }

    // Secret once solved
    const Code& solution() const { return solution_; }

    // Why the session ended in contradiction
    const std::string& contradiction() const { return contradiction_; }

    // log2 of the number of remaining candidates
    double remaining_entropy() const;
};

}
