#include "Benchmark.h"
#include "Solver.h"

#include <algorithm>
#include <iomanip>
#include <limits>
#include <numeric>
#include <random>
#include <ranges>
#include <sstream>


namespace bulls_cows {

std::vector<Symbol> randomize_symbols(unsigned int alphabet_size, unsigned int seed) {
    std::mt19937 rng(seed);
    std::vector<Symbol> symbols(alphabet_size);
    std::iota(symbols.begin(), symbols.end(), Symbol{ 0 });
    std::ranges::shuffle(symbols, rng);
    return symbols;
}

Code generate_secret(const CodeSpace& space, unsigned int seed) {
    auto symbols = randomize_symbols(space.alphabet_size(), seed);
    return { symbols.begin(), symbols.begin() + space.length() };
}

std::tuple<Code, unsigned int> solve(const CodeSpace& space, const RankerConfig& config, const Code& secret) {
    Solver solver(space, config);
    SecretHolder holder(secret);

    const Outcome outcome = run_session(solver, holder);
    if (outcome != Outcome::Solved) {
        std::ostringstream message;
        message << "Solver failed for secret: " << secret << " (" << solver.contradiction() << ')';
        throw Contradiction(message.str());
    }

    // A deduction that was never played still costs one more guess
    const unsigned int nb_guesses = solver.round() + (solver.solution() == solver.last_guess() ? 0u : 1u);
    return { solver.solution(), nb_guesses };
}


std::ostream& operator<<(std::ostream& stream, const TimeStatistics& statistics) {
    stream << "Time: "
        << "Total: " << statistics.get_total().count() << "us "
        << "Min: " << statistics.get_min().count() << "us "
        << "Max: " << statistics.get_max().count() << "us";

    return stream;
}

TimeStatistics compute_time_statistics(const std::vector<std::chrono::microseconds>& times)
{
    auto total = std::chrono::microseconds::zero();
    auto min = std::chrono::microseconds::max();
    auto max = std::chrono::microseconds::min();

    for (const auto t : times) {
        total += t;
        min = std::min(min, t);
        max = std::max(max, t);
    }

    if (times.empty()) {
        min = max = std::chrono::microseconds::zero();
    }

    return { total, min, max };
}


std::ostream& operator<<(std::ostream& stream, const NbGuessStatistics& statistics) {
    stream << std::setprecision(std::numeric_limits<double>::digits10)
        << "Nb Guesses: "
        << "Total: " << statistics.get_total() << ' '
        << "Mean: " << statistics.get_mean() << ' '
        << "Worst: " << statistics.get_worst();

    return stream;
}

NbGuessStatistics compute_nb_guesses_statistics(const std::vector<unsigned int>& nb_guesses) {
    if (nb_guesses.empty()) {
        return { 0u, 0.0, 0u };
    }

    const auto total = std::accumulate(nb_guesses.begin(), nb_guesses.end(), 0u);
    const auto mean = static_cast<double>(total) / nb_guesses.size();
    const auto worst = *std::ranges::max_element(nb_guesses);
    return { total, mean, worst };
}


BenchmarkReport run_benchmark(const CodeSpace& space, const RankerConfig& config, unsigned int count, unsigned int seed) {
    std::vector<std::chrono::microseconds> times;
    std::vector<unsigned int> all_nb_guesses;

    times.reserve(count);
    all_nb_guesses.reserve(count);

    for (auto j : std::views::iota(0u, count)) {
        const Code secret = generate_secret(space, seed + j);    // Pseudo-random secret

        Timer timer;
        auto [final_guess, nb_guesses] = solve(space, config, secret);
        const auto elapsed_time = timer.elapsed();

        if (final_guess != secret) {
            std::ostringstream message;
            message << "Error for secret: " << secret << ", solver found " << final_guess;
            throw Contradiction(message.str());
        }

        times.emplace_back(elapsed_time);
        all_nb_guesses.emplace_back(nb_guesses);
    }

    return { compute_time_statistics(times), compute_nb_guesses_statistics(all_nb_guesses) };
}

}
