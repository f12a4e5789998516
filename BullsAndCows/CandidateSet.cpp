#include "CandidateSet.h"
#include "Errors.h"
#include "FeedbackCalculator.h"

#include <algorithm>
#include <sstream>


namespace bulls_cows {

CandidateSet CandidateSet::initialize(const CodeSpace& space) {
    CandidateSet candidates(space);
    candidates.codes_.reserve(space.size());
    candidates.symbols_.reserve(space.size());

    const unsigned int colors = space.alphabet_size();
    const size_t last_position = space.length() - 1;

    Code code(space.length(), 0);
    SymbolSet code_symbols;
    size_t position = 0;

    while (true) {
        const Symbol symbol = code[position];
        if (symbol >= colors) {
            if (position == 0u) {
                break;
            }

            code_symbols.flip(code[--position]);
        }
        else if (!code_symbols.test(symbol)) {
            if (position == last_position) {
                code_symbols.flip(symbol);
                candidates.add(code, code_symbols);
                code_symbols.flip(symbol);
            }
            else {
                code_symbols.flip(symbol);
                code[++position] = 0;
                continue;
            }
        }

        ++code[position];
    }

    return candidates;
}

bool CandidateSet::contains(const Code& code) const {
    return std::ranges::find(codes_, code) != codes_.end();
}

CandidateSet CandidateSet::filter(const Code& guess, const Feedback& observed) const {
    CandidateSet result(space_);
    const FeedbackCalculator feedback_calculator(guess);

    for (size_t i = 0; i < codes_.size(); ++i) {
        if (feedback_calculator.get_feedback(codes_[i], symbols_[i]) == observed) {
            result.add(codes_[i], symbols_[i]);
        }
    }

    return result;
}

void CandidateSet::narrow(const Code& guess, const Feedback& observed) {
    *this = filter(guess, observed);

    if (empty()) {
        std::ostringstream message;
        message << "No possible codes remain after " << observed << " for " << guess;
        throw Contradiction(message.str());
    }
}

void CandidateSet::add(const Code& code, const SymbolSet& symbols) {
    codes_.push_back(code);
    symbols_.push_back(symbols);
}

}
