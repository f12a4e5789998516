#include "GuessRanker.h"
#include "Errors.h"
#include "FeedbackCalculator.h"

#include <algorithm>
#include <cmath>
#include <cstddef>


namespace bulls_cows {

PartitionMap::PartitionMap(unsigned int length)
    : length(length)
    , counts(Feedback::slot_count(length), 0u)
    , total_(0)
{}

unsigned int PartitionMap::count(const Feedback& feedback) const {
    return feedback.is_valid(length) ? counts[feedback.index(length)] : 0u;
}

size_t PartitionMap::classes() const {
    return static_cast<size_t>(std::ranges::count_if(counts, [](unsigned int n) { return n > 0u; }));
}

double PartitionMap::entropy() const {
    if (total_ == 0u) {
        return 0.0;
    }

    const double inv_total = 1.0 / static_cast<double>(total_);
    double entropy = 0.0;
    for (unsigned int n : counts) {
        if (n > 0u) {
            const double p = n * inv_total;
            entropy -= p * std::log2(p);
        }
    }
    return entropy;
}


GuessRanker::GuessRanker(RankerConfig config)
    : config(config)
{}

PartitionMap GuessRanker::partition(const CandidateSet& candidates, const Code& guess) {
    PartitionMap partition_map(candidates.space().length());
    const FeedbackCalculator feedback_calculator(guess);

    const auto& codes = candidates.codes();
    const auto& symbols = candidates.symbols();
    for (size_t i = 0; i < codes.size(); ++i) {
        partition_map.add(feedback_calculator.get_feedback(codes[i], symbols[i]));
    }

    return partition_map;
}

double GuessRanker::score(const CandidateSet& candidates, const Code& guess) {
    return partition(candidates, guess).entropy();
}

std::vector<Code> GuessRanker::guess_pool(const CandidateSet& candidates) const {
    if (config.pool == GuessPool::FullSpace) {
        return CandidateSet::initialize(candidates.space()).codes();
    }
    return candidates.codes();
}

GuessOption GuessRanker::rank(const CandidateSet& candidates) const {
    if (candidates.size() <= 1u) {
        return rank(candidates, {});
    }
    return rank(candidates, guess_pool(candidates));
}

GuessOption GuessRanker::rank(const CandidateSet& candidates, const std::vector<Code>& pool) const {
    if (candidates.empty()) {
        throw Contradiction("No candidate is consistent with the feedback received");
    }
    if (candidates.size() == 1u) {
        return { candidates[0], 0.0, true };
    }

    const auto options = score_pool(candidates, pool);
    if (options.empty()) {
        return { candidates[0], score(candidates, candidates[0]), true };
    }
    return *std::ranges::min_element(options, [this](const auto& lhs, const auto& rhs) { return better(lhs, rhs); });
}

std::vector<GuessOption> GuessRanker::rank_all(const CandidateSet& candidates) const {
    return rank_all(candidates, guess_pool(candidates));
}

std::vector<GuessOption> GuessRanker::rank_all(const CandidateSet& candidates, const std::vector<Code>& pool) const {
    if (candidates.empty()) {
        throw Contradiction("No candidate is consistent with the feedback received");
    }

    auto options = score_pool(candidates, pool);
    std::ranges::sort(options, [this](const auto& lhs, const auto& rhs) { return better(lhs, rhs); });
    return options;
}

bool GuessRanker::better(const GuessOption& lhs, const GuessOption& rhs) const {
    if (std::abs(lhs.entropy - rhs.entropy) > tolerance)
        return lhs.entropy > rhs.entropy;
    if (config.prefer_candidates && lhs.is_candidate != rhs.is_candidate)
        return lhs.is_candidate;
    return lhs.guess < rhs.guess;
}

std::vector<GuessOption> GuessRanker::score_pool(const CandidateSet& candidates, const std::vector<Code>& pool) const {
    std::vector<GuessOption> options(pool.size());
    const auto& codes = candidates.codes();
    const std::ptrdiff_t pool_size = static_cast<std::ptrdiff_t>(pool.size());

    // Candidates stay in lexicographic order, membership is a binary search
#pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < pool_size; ++i) {
        const Code& guess = pool[i];
        options[i] = { guess, score(candidates, guess), std::ranges::binary_search(codes, guess) };
    }

    return options;
}

}
