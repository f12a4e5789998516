#include "Solver.h"
#include "Errors.h"

#include <cmath>
#include <sstream>
#include <stdexcept>


namespace bulls_cows {

Solver::Solver(const CodeSpace& space, RankerConfig config)
    : space(space)
    , ranker(config)
    , candidates_(CandidateSet::initialize(space))
    , state_(State::Init)
    , round_(0)
{}

const GuessOption& Solver::next_guess() {
    if (!can_continue()) {
        throw std::logic_error("The session is over, no further guess can be made");
    }

    if (!pending) {
        pending = ranker.rank(candidates_);
        ++round_;
        state_ = State::AwaitingFeedback;
    }
    return *pending;
}

State Solver::apply_feedback(const Feedback& feedback) {
    if (!pending) {
        throw std::logic_error("Feedback received before any guess was made");
    }
    if (!feedback.is_valid(space.length())) {
        std::ostringstream message;
        message << "Bulls and cows should be between 0 and " << space.length() << ", and their sum <= " << space.length();
        throw InvalidFeedback(message.str());
    }

    last_guess_ = pending->guess;
    pending.reset();

    try {
        candidates_.narrow(last_guess_, feedback);
    }
    catch (const Contradiction& e) {
        contradiction_ = e.what();
        state_ = State::Contradiction;
        return state_;
    }

    if (feedback.is_win(space.length())) {
        solution_ = last_guess_;
        state_ = State::Solved;
    }
    else if (candidates_.size() == 1u) {
        solution_ = candidates_[0];
        state_ = State::Solved;
    }
    else {
        state_ = State::AwaitingFeedback;
    }

    return state_;
}

bool Solver::can_continue() const {
    return state_ == State::Init || state_ == State::AwaitingFeedback;
}

double Solver::remaining_entropy() const {
    return candidates_.empty() ? 0.0 : std::log2(static_cast<double>(candidates_.size()));
}

}
