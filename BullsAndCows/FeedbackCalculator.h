#pragma once

#include <bit>
#include <cstdint>

#include "Code.h"
#include "Feedback.h"


namespace bulls_cows {

static inline std::uint8_t compare_and_count(const SymbolSet& lhs, const SymbolSet& rhs) {
    static_assert(sizeof(unsigned long) >= (max_alphabet_size / 8), "Unsigned long cannot hold bitset size, change to a larger type");
    return static_cast<std::uint8_t>(std::popcount((lhs & rhs).to_ulong()));
}

static inline std::uint8_t count_bulls(const Code& code, const Code& other) {
    std::uint8_t bulls = 0;
    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] == other[i]) {
            ++bulls;
        }
    }
    return bulls;
}

static inline std::uint8_t count_cows(const SymbolSet& code_symbols, const SymbolSet& other_symbols, std::uint8_t bulls) {
    return compare_and_count(code_symbols, other_symbols) - bulls;
}


// Bulls and cows of guess against secret. Both codes must hold distinct symbols.
Feedback evaluate(const Code& secret, const Code& guess);


// FeedbackCalculator: keeps the symbol set of a fixed code so that scoring it
// against many others only computes the other side
class FeedbackCalculator {
    Code secret;
    SymbolSet secret_symbols;
public:
    FeedbackCalculator() = default;

    explicit FeedbackCalculator(const Code& secret);

    void set_secret(const Code& secret);

    const Code& get_secret() const { return secret; }

    inline Feedback get_feedback(const Code& guess, const SymbolSet& guess_symbols) const {
        const std::uint8_t bulls = count_bulls(guess, secret);
        const std::uint8_t cows = count_cows(guess_symbols, secret_symbols, bulls);
        return { bulls, cows };
    }

    Feedback get_feedback(const Code& guess) const;
};

}
