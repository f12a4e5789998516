#include "ConsolePlayer.h"

#include <iomanip>
#include <string>


namespace bulls_cows {

ConsolePlayer::ConsolePlayer(std::istream& in, std::ostream& out, const Solver& solver)
    : in(in)
    , out(out)
    , solver(solver)
{}

void ConsolePlayer::present_instructions() {
    const auto& space = solver.get_space();
    out << "Think of a " << space.length() << "-digit number with unique digits.\n"
        << "For each guess, provide the number of bulls and cows.\n"
        << "Bulls: correct digit in correct position\n"
        << "Cows: correct digit in wrong position\n\n";
}

void ConsolePlayer::present_guess(const GuessOption& option, unsigned int round) {
    const auto flags = out.flags();
    const auto precision = out.precision();

    out << std::fixed << std::setprecision(4)
        << "\nCurrent entropy: " << solver.remaining_entropy() << " bits\n"
        << "Possible codes remaining: " << solver.candidates().size() << '\n'
        << "\nAttempt " << round << ": Computer guesses " << option.guess << '\n'
        << "Expected information gain: " << option.entropy << " bits\n";

    out.flags(flags);
    out.precision(precision);
}

std::optional<Feedback> ConsolePlayer::request_feedback(const Code& guess) {
    const unsigned int length = solver.get_space().length();

    std::string line;
    while (true) {
        out << "Enter feedback for " << guess << " as 'Bulls Cows' (or 'win' if correct): " << std::flush;
        if (!std::getline(in, line)) {
            out << '\n';
            return std::nullopt;
        }

        const auto input = parse_feedback(line);
        if (!input) {
            out << "Invalid input. Please enter two numbers separated by space, or 'win'.\n";
            continue;
        }
        if (input->win) {
            return Feedback(length, 0);
        }
        return make_feedback(input->bulls, input->cows, length);
    }
}

void ConsolePlayer::reject_feedback(const InvalidFeedback& error) {
    out << "Invalid feedback. " << error.what() << ".\n";
}

void ConsolePlayer::present_result(Outcome outcome, const Code& code) {
    switch (outcome) {
    case Outcome::Solved:
        if (code == solver.last_guess()) {
            out << "\nComputer won in " << solver.round() << " attempts!\n";
        }
        else {
            out << "\nOnly one possibility remains: " << code << '\n'
                << "This must be your number!\n";
        }
        break;
    case Outcome::Contradiction:
        out << "Error: No possible codes remain. Please check your feedback.\n";
        break;
    case Outcome::Abandoned:
        break;
    }
}

}
