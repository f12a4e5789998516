#pragma once

#include <vector>

#include "CandidateSet.h"
#include "Code.h"
#include "Feedback.h"


namespace bulls_cows {

// Count of candidates per feedback class for one hypothetical guess
class PartitionMap {
    unsigned int length;
    std::vector<unsigned int> counts;
    size_t total_;
public:
    explicit PartitionMap(unsigned int length);

    inline void add(const Feedback& feedback) {
        ++counts[feedback.index(length)];
        ++total_;
    }

    unsigned int count(const Feedback& feedback) const;
    size_t total() const { return total_; }

    // Number of non-empty feedback classes
    size_t classes() const;

    // Shannon entropy of the partition, in bits
    double entropy() const;
};


enum class GuessPool {
    Candidates, // only codes still consistent with the feedback
    FullSpace,  // every code of the space, including eliminated ones
};

struct RankerConfig {
    GuessPool pool = GuessPool::Candidates;
    bool prefer_candidates = true;
};

struct GuessOption {
    Code guess;
    double entropy;    // expected information gain in bits
    bool is_candidate; // guess could itself be the secret
};


class GuessRanker {
    RankerConfig config;
public:
    // Scores closer than this are ties
    static constexpr double tolerance = 1e-10;

    explicit GuessRanker(RankerConfig config = {});

    static PartitionMap partition(const CandidateSet& candidates, const Code& guess);

    static double score(const CandidateSet& candidates, const Code& guess);

    // Guesses the configured pool is made of
    std::vector<Code> guess_pool(const CandidateSet& candidates) const;

    // Best guess: highest entropy, then a member of candidates, then lexicographically smallest.
    // A single candidate is returned unscored. Throws Contradiction on an empty set.
    GuessOption rank(const CandidateSet& candidates) const;
    GuessOption rank(const CandidateSet& candidates, const std::vector<Code>& pool) const;

    // Every option of the pool, best first
    std::vector<GuessOption> rank_all(const CandidateSet& candidates) const;
    std::vector<GuessOption> rank_all(const CandidateSet& candidates, const std::vector<Code>& pool) const;

    bool better(const GuessOption& lhs, const GuessOption& rhs) const;

private:
    std::vector<GuessOption> score_pool(const CandidateSet& candidates, const std::vector<Code>& pool) const;
};

}
