#pragma once

#include <vector>

#include "Code.h"
#include "Feedback.h"


namespace bulls_cows {

// Codes not yet ruled out by observed feedback, stored with their symbol sets.
// Only ever narrows after initialization.
class CandidateSet {
    CodeSpace space_;
    std::vector<Code> codes_;
    std::vector<SymbolSet> symbols_;

    explicit CandidateSet(const CodeSpace& space) : space_(space) {}

public:
    // Every code of the space in lexicographic order
    static CandidateSet initialize(const CodeSpace& space = CodeSpace{});

    const CodeSpace& space() const { return space_; }
    size_t size() const { return codes_.size(); }
    bool empty() const { return codes_.empty(); }

    const std::vector<Code>& codes() const { return codes_; }
    const std::vector<SymbolSet>& symbols() const { return symbols_; }
    const Code& operator[](size_t i) const { return codes_[i]; }

    bool contains(const Code& code) const;

    // Candidates c with evaluate(c, guess) == observed. May be empty.
    CandidateSet filter(const Code& guess, const Feedback& observed) const;

    // Replaces the set by filter(guess, observed), throws Contradiction when nothing remains
    void narrow(const Code& guess, const Feedback& observed);

private:
    void add(const Code& code, const SymbolSet& symbols);
};

}
