#pragma once

#include <chrono>
#include <iostream>
#include <optional>
#include <tuple>
#include <vector>

#include "Code.h"
#include "Errors.h"
#include "Feedback.h"
#include "FeedbackCalculator.h"
#include "GuessRanker.h"
#include "Session.h"


namespace bulls_cows {

std::vector<Symbol> randomize_symbols(unsigned int alphabet_size, unsigned int seed);

Code generate_secret(const CodeSpace& space, unsigned int seed);


// Holds a known secret and always answers honestly
class SecretHolder {
    FeedbackCalculator feedback_calculator;
public:
    explicit SecretHolder(const Code& secret) : feedback_calculator(secret) {}

    void present_guess(const GuessOption&, unsigned int) {}
    std::optional<Feedback> request_feedback(const Code& guess) { return feedback_calculator.get_feedback(guess); }
    void reject_feedback(const InvalidFeedback&) {}
    void present_result(Outcome, const Code&) {}
};

// Final code and number of guesses the solver needed against secret
std::tuple<Code, unsigned int> solve(const CodeSpace& space, const RankerConfig& config, const Code& secret);


// Wall time of one solve, in microseconds
class Timer {
    std::chrono::steady_clock::time_point start;
public:
    Timer() : start(std::chrono::steady_clock::now()) {}

    std::chrono::microseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
    }
};


class TimeStatistics {
    std::chrono::microseconds total;
    std::chrono::microseconds min;
    std::chrono::microseconds max;

public:
    TimeStatistics(std::chrono::microseconds total,
        std::chrono::microseconds min,
        std::chrono::microseconds max)
    : total(total), min(min), max(max)
    {}

    std::chrono::microseconds get_total() const { return total; }
    std::chrono::microseconds get_min() const { return min; }
    std::chrono::microseconds get_max() const { return max; }
};

std::ostream& operator<<(std::ostream& stream, const TimeStatistics& statistics);

TimeStatistics compute_time_statistics(const std::vector<std::chrono::microseconds>& times);


class NbGuessStatistics {
    unsigned int total;
    double mean;
    unsigned int worst;
public:
    NbGuessStatistics(unsigned int total, double mean, unsigned int worst)
        : total(total), mean(mean), worst(worst)
    {}

    unsigned int get_total() const { return total; }
    double get_mean() const { return mean; }
    unsigned int get_worst() const { return worst; }
};

std::ostream& operator<<(std::ostream& stream, const NbGuessStatistics& statistics);

NbGuessStatistics compute_nb_guesses_statistics(const std::vector<unsigned int>& nb_guesses);


struct BenchmarkReport {
    TimeStatistics time;
    NbGuessStatistics guesses;
};

// Solves count pseudo-random secrets derived from seed. Throws Contradiction if a secret is missed.
BenchmarkReport run_benchmark(const CodeSpace& space, const RankerConfig& config, unsigned int count, unsigned int seed);

}
