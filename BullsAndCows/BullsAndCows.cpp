// BullsAndCows.cpp : This file contains the 'main' function. Program execution begins and ends there.
//

#include <cstdlib>
#include <exception>
#include <getopt.h>
#include <iostream>
#include <omp.h>
#include <string>

#include "Benchmark.h"
#include "Code.h"
#include "ConsolePlayer.h"
#include "GuessRanker.h"
#include "Session.h"
#include "Solver.h"


namespace {

struct Options {
    std::string mode = "play";
    unsigned int count = 100;
    unsigned int seed = 42;
    int threads = 0;
    bulls_cows::RankerConfig ranker;
};

void usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
        << "  -m MODE    play (you hold the secret) or bench (self-play), default play\n"
        << "  -n COUNT   number of secrets to solve in bench mode, default 100\n"
        << "  -s SEED    first seed of the bench secrets, default 42\n"
        << "  -f         score every code of the space, not only remaining candidates\n"
        << "  -t THREADS number of scoring threads, default all cores\n"
        << "  -h         show this help\n";
}

bool parse_unsigned(const char* text, unsigned int& value) {
    char* end = nullptr;
    const unsigned long parsed = std::strtoul(text, &end, 10);
    if (end == text || *end != '\0' || text[0] == '-') {
        return false;
    }
    value = static_cast<unsigned int>(parsed);
    return true;
}

int play(const Options& options) {
    bulls_cows::Solver solver(bulls_cows::CodeSpace{}, options.ranker);
    bulls_cows::ConsolePlayer player(std::cin, std::cout, solver);

    player.present_instructions();
    const auto outcome = bulls_cows::run_session(solver, player);
    return outcome == bulls_cows::Outcome::Contradiction ? 2 : 0;
}

int bench(const Options& options) {
    const auto report = bulls_cows::run_benchmark(bulls_cows::CodeSpace{}, options.ranker, options.count, options.seed);

    std::cout << report.time << '\n';
    std::cout << report.guesses << '\n';
    return 0;
}

}

int main(int argc, char* argv[]) {
    Options options;

    int opt;
    while ((opt = getopt(argc, argv, "m:n:s:ft:h")) != -1) {
        unsigned int value = 0;
        switch (opt) {
        case 'm': options.mode = optarg; break;
        case 'n':
            if (!parse_unsigned(optarg, options.count)) { usage(argv[0]); return 1; }
            break;
        case 's':
            if (!parse_unsigned(optarg, options.seed)) { usage(argv[0]); return 1; }
            break;
        case 'f': options.ranker.pool = bulls_cows::GuessPool::FullSpace; break;
        case 't':
            if (!parse_unsigned(optarg, value) || value == 0u) { usage(argv[0]); return 1; }
            options.threads = static_cast<int>(value);
            break;
        case 'h': usage(argv[0]); return 0;
        default: usage(argv[0]); return 1;
        }
    }

    if (optind != argc || (options.mode != "play" && options.mode != "bench")) {
        usage(argv[0]);
        return 1;
    }

    if (options.threads > 0) {
        omp_set_num_threads(options.threads);
    }

    try {
        return options.mode == "play" ? play(options) : bench(options);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
